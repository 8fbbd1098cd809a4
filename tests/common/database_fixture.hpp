/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>

#include <aegis/protocol/types.hpp>

#include <aegis/chain/account_object.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/operation_history_object.hpp>
#include <aegis/chain/database.hpp>

#include <iostream>

using namespace aegis::db;

extern uint32_t AEGIS_TESTING_GENESIS_TIMESTAMP;

#define PUSH_TX \
   aegis::chain::test::_push_transaction

#define AEGIS_REQUIRE_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "AEGIS_REQUIRE_THROW begin "           \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "AEGIS_REQUIRE_THROW end "             \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_SUCCESS( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   op.validate(); \
   op.field = temp; \
}

#define REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   AEGIS_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown"));                      \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all));                   \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what) );                                  \
      }                                                           \
   }                                                              \
}                                                                 \

#define PREP_ACTOR(name) \
   fc::ecc::private_key name ## _private_key = generate_private_key(BOOST_PP_STRINGIZE(name));   \
   aegis::chain::public_key_type name ## _public_key = name ## _private_key.get_public_key(); \
   BOOST_CHECK( name ## _public_key != public_key_type() );

#define ACTOR(name) \
   PREP_ACTOR(name) \
   const auto name = create_account(BOOST_PP_STRINGIZE(name), name ## _public_key); \
   aegis::chain::account_id_type name ## _id = name.get_id(); (void)name ## _id;

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

/// Core handed to the genesis account; every test's supply stays at this figure
#define AEGIS_TESTING_INITIAL_SUPPLY (int64_t(10000000000ll))

namespace aegis { namespace chain {

namespace test {
/// Pushes @p tx and checks that the total core supply did not change
processed_transaction _push_transaction( database& db, const signed_transaction& tx, uint32_t skip_flags = 0 );
} // namespace test

struct database_fixture {
   genesis_state_type genesis_state;
   chain::database db;
   signed_transaction trx;
   const fc::ecc::private_key init_account_priv_key;
   const public_key_type init_account_pub_key;
   account_id_type init_account;
   account_id_type treasury_account;

   database_fixture();
   virtual ~database_fixture();

   static fc::ecc::private_key generate_private_key( string seed );
   static task_id_type make_task( const string& name );
   static void verify_supply( const database& db, share_type expected = AEGIS_TESTING_INITIAL_SUPPLY );

   void sign( signed_transaction& trx, const fc::ecc::private_key& key );

   account_create_operation make_account( const string& name, const public_key_type& key = public_key_type() );
   const account_object& create_account( const string& name, const public_key_type& key = public_key_type() );

   void transfer( account_id_type from, account_id_type to, share_type amount );
   /// Sends @p amount from the genesis account
   void fund( account_id_type to, share_type amount );
   share_type get_balance( account_id_type account )const;

   escrow_create_operation make_escrow( account_id_type depositor, const task_id_type& task, account_id_type payee,
                                        const vector<account_id_type>& verifiers, uint8_t approvals_required,
                                        uint16_t marketplace_fee_bps, uint16_t verifier_fee_bps,
                                        share_type amount );
   const escrow_object& create_escrow( account_id_type depositor, const task_id_type& task, account_id_type payee,
                                       const vector<account_id_type>& verifiers, uint8_t approvals_required,
                                       uint16_t marketplace_fee_bps, uint16_t verifier_fee_bps,
                                       share_type amount );
   processed_transaction approve_release( account_id_type verifier, const task_id_type& task );
   processed_transaction approve_refund( account_id_type verifier, const task_id_type& task );

   /// History entries holding operations of type OpType, oldest first
   template<typename OpType>
   vector<OpType> get_history_ops()const
   {
      vector<OpType> result;
      for( const auto& oh : db.get_operation_history() )
         if( oh.op.which() == operation::tag<OpType>::value )
            result.push_back( oh.op.get<OpType>() );
      return result;
   }
};

} }

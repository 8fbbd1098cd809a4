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
#include <boost/test/unit_test.hpp>

#include <aegis/chain/account_object.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/global_property_object.hpp>

#include <fc/crypto/digest.hpp>

#include "database_fixture.hpp"

using namespace aegis::chain::test;

uint32_t AEGIS_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace aegis { namespace chain {

database_fixture::database_fixture()
   : init_account_priv_key( generate_private_key("init0") ),
     init_account_pub_key( init_account_priv_key.get_public_key() )
{ try {
   genesis_state.initial_timestamp = time_point_sec( AEGIS_TESTING_GENESIS_TIMESTAMP );
   genesis_state.initial_accounts.emplace_back( "init0", init_account_pub_key );

   genesis_state_type::initial_balance_type handout;
   handout.owner_name = "init0";
   handout.amount = AEGIS_TESTING_INITIAL_SUPPLY;
   genesis_state.initial_balances.push_back( handout );

   db.open( [this]{ return genesis_state; } );

   init_account = db.get_account_by_name( "init0" ).get_id();
   treasury_account = db.get_treasury_account();
   verify_supply( db );
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   // If we're unwinding due to an exception, don't do any more checks.
   // This way, boost test's last checkpoint tells us approximately where the error was.
   if( !std::uncaught_exception() )
   {
      BOOST_CHECK_EQUAL( db.get_total_supply().value, AEGIS_TESTING_INITIAL_SUPPLY );
   }
}

fc::ecc::private_key database_fixture::generate_private_key(string seed)
{
   return fc::ecc::private_key::regenerate(fc::sha256::hash(seed));
}

task_id_type database_fixture::make_task( const string& name )
{
   return fc::sha256::hash( name );
}

void database_fixture::verify_supply( const database& db, share_type expected )
{ try {
   const share_type total = db.get_total_supply();
   FC_ASSERT( total == expected, "Core supply changed: ${t} != ${e}", ("t", total)("e", expected) );
   for( const auto& b : db.get_index_type< primary_index<account_balance_index> >().indices() )
      FC_ASSERT( b.balance >= 0, "Negative balance of ${a}", ("a", b.owner) );
   for( const auto& e : db.get_index_type< primary_index<escrow_index> >().indices() )
      FC_ASSERT( e.is_funded() ? e.amount > 0 : e.amount == 0, "Bad locked amount in ${e}", ("e", e) );
} FC_CAPTURE_AND_RETHROW() }

void database_fixture::sign(signed_transaction& trx, const fc::ecc::private_key& key)
{
   trx.sign( key, db.get_chain_id() );
}

account_create_operation database_fixture::make_account( const string& name, const public_key_type& key )
{
   account_create_operation create_account;
   create_account.registrar = init_account;
   create_account.name = name;
   create_account.key = key;
   return create_account;
}

const account_object& database_fixture::create_account( const string& name, const public_key_type& key )
{
   trx.operations.clear();
   trx.operations.push_back( make_account( name, key ) );
   trx.validate();
   processed_transaction ptx = PUSH_TX(db, trx, ~0);
   auto& result = db.get<account_object>( ptx.operation_results[0].get<object_id_type>() );
   trx.operations.clear();
   return result;
}

void database_fixture::transfer( account_id_type from, account_id_type to, share_type amount )
{ try {
   trx.operations.clear();
   transfer_operation op;
   op.from = from;
   op.to = to;
   op.amount = amount;
   trx.operations.push_back( op );
   trx.validate();
   PUSH_TX(db, trx, ~0);
   trx.operations.clear();
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void database_fixture::fund( account_id_type to, share_type amount )
{
   transfer( init_account, to, amount );
}

share_type database_fixture::get_balance( account_id_type account )const
{
   return db.get_balance( account );
}

escrow_create_operation database_fixture::make_escrow( account_id_type depositor, const task_id_type& task,
                                                       account_id_type payee, const vector<account_id_type>& verifiers,
                                                       uint8_t approvals_required, uint16_t marketplace_fee_bps,
                                                       uint16_t verifier_fee_bps, share_type amount )
{
   escrow_create_operation op;
   op.depositor = depositor;
   op.task_id = task;
   op.payee = payee;
   op.verifiers = verifiers;
   op.approvals_required = approvals_required;
   op.marketplace_fee_bps = marketplace_fee_bps;
   op.verifier_fee_bps = verifier_fee_bps;
   op.amount = amount;
   return op;
}

const escrow_object& database_fixture::create_escrow( account_id_type depositor, const task_id_type& task,
                                                      account_id_type payee, const vector<account_id_type>& verifiers,
                                                      uint8_t approvals_required, uint16_t marketplace_fee_bps,
                                                      uint16_t verifier_fee_bps, share_type amount )
{ try {
   trx.operations.clear();
   trx.operations.push_back( make_escrow( depositor, task, payee, verifiers, approvals_required,
                                          marketplace_fee_bps, verifier_fee_bps, amount ) );
   trx.validate();
   processed_transaction ptx = PUSH_TX(db, trx, ~0);
   const escrow_object& result = db.get<escrow_object>( ptx.operation_results[0].get<object_id_type>() );
   trx.operations.clear();
   return result;
} FC_CAPTURE_AND_RETHROW( (depositor)(task)(payee)(verifiers)(approvals_required)(amount) ) }

processed_transaction database_fixture::approve_release( account_id_type verifier, const task_id_type& task )
{
   trx.operations.clear();
   escrow_approve_release_operation op;
   op.verifier = verifier;
   op.task_id = task;
   trx.operations.push_back( op );
   processed_transaction ptx = PUSH_TX(db, trx, ~0);
   trx.operations.clear();
   return ptx;
}

processed_transaction database_fixture::approve_refund( account_id_type verifier, const task_id_type& task )
{
   trx.operations.clear();
   escrow_approve_refund_operation op;
   op.verifier = verifier;
   op.task_id = task;
   trx.operations.push_back( op );
   processed_transaction ptx = PUSH_TX(db, trx, ~0);
   trx.operations.clear();
   return ptx;
}

namespace test {

processed_transaction _push_transaction( database& db, const signed_transaction& tx, uint32_t skip_flags /* = 0 */ )
{ try {
   const share_type supply_before = db.get_total_supply();
   auto pt = db.push_transaction( tx, skip_flags );
   database_fixture::verify_supply( db, supply_before );
   return pt;
} FC_CAPTURE_AND_RETHROW((tx)) }

} // aegis::chain::test

} } // aegis::chain

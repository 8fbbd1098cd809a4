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
#include <aegis/chain/types.hpp>
#include <aegis/db/generic_index.hpp>

namespace aegis { namespace chain {
   using namespace aegis::db;

   /**
    * @brief Tracks the core balance of a single account
    * @ingroup object
    * @ingroup implementation
    *
    * Balances are only created once an account first receives value.
    */
   class account_balance_object : public abstract_object<account_balance_object,
                                     implementation_ids, impl_account_balance_object_type>
   {
      public:
         account_id_type   owner;
         share_type        balance;

         void  adjust_balance( share_type delta );
   };


   /**
    * @brief This class represents an account on the object graph
    * @ingroup object
    * @ingroup protocol
    *
    * Accounts are the principals of the ledger: depositors, payees, verifiers and the treasury.
    * An account acts through the single key it was registered with; the null account has no key
    * and cannot act at all.
    */
   class account_object : public aegis::db::abstract_object<account_object, protocol_ids, account_object_type>
   {
      public:
         /// The account's name. This name must be unique among all account names on the ledger.
         string            name;
         /// Key whose signature authorizes operations on behalf of this account
         public_key_type   key;
   };

   struct by_owner;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>,
                         member< account_balance_object, account_id_type, &account_balance_object::owner > >
      >
   > account_balance_object_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_balance_object, account_balance_object_multi_index_type> account_balance_index;

   struct by_name{};

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member<account_object, string, &account_object::name> >
      >
   > account_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_object, account_multi_index_type> account_index;

}}

AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::account_object)
AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::account_balance_object)

FC_REFLECT_DERIVED( aegis::chain::account_object,
                    (aegis::db::object),
                    (name)(key) )

FC_REFLECT_DERIVED( aegis::chain::account_balance_object,
                    (aegis::db::object),
                    (owner)(balance) )

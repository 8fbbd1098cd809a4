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
#include <aegis/chain/database.hpp>

#include <aegis/chain/account_object.hpp>
#include <aegis/chain/global_property_object.hpp>

namespace aegis { namespace chain {

void database::init_genesis(const genesis_state_type& genesis_state)
{ try {
   FC_ASSERT( genesis_state.max_core_supply > 0 && genesis_state.max_core_supply <= AEGIS_MAX_SHARE_SUPPLY,
              "Invalid core supply ${s}", ("s", genesis_state.max_core_supply) );
   FC_ASSERT( is_valid_name( genesis_state.treasury_account_name ),
              "Invalid treasury account name ${n}", ("n", genesis_state.treasury_account_name) );
   genesis_state.initial_parameters.validate();

   struct undo_inhibitor {
      explicit undo_inhibitor(undo_database& udb) : udb(udb) { udb.disable(); }
      ~undo_inhibitor() { udb.enable(); }
      undo_inhibitor(const undo_inhibitor&) = delete;
   private:
      undo_database& udb;
   };
   undo_inhibitor inhibitor(_undo_db);

   // The null account takes the first id and never gets a key
   FC_ASSERT( create<account_object>([](account_object& a) {
       a.name = AEGIS_NULL_ACCOUNT_NAME;
   }).get_id() == AEGIS_NULL_ACCOUNT );

   for( const auto& account : genesis_state.initial_accounts )
   {
      FC_ASSERT( is_valid_name( account.name ), "Invalid genesis account name ${n}", ("n", account.name) );
      FC_ASSERT( find_account_by_name( account.name ) == nullptr,
                 "Duplicate genesis account ${n}", ("n", account.name) );
      FC_ASSERT( !account.key.is_null(), "Genesis account ${n} has no key", ("n", account.name) );
      create<account_object>([&account](account_object& a) {
         a.name = account.name;
         a.key  = account.key;
      });
   }

   const account_object* treasury = find_account_by_name( genesis_state.treasury_account_name );
   if( treasury == nullptr )
   {
      treasury = &create<account_object>([&genesis_state](account_object& a) {
         a.name = genesis_state.treasury_account_name;
      });
   }
   const account_id_type treasury_id = treasury->get_id();

   const chain_id_type chain_id = genesis_state.compute_chain_id();
   create<global_property_object>([&genesis_state,&chain_id,treasury_id](global_property_object& p) {
      p.parameters       = genesis_state.initial_parameters;
      p.treasury_account = treasury_id;
      p.chain_id         = chain_id;
   });
   create<dynamic_global_property_object>([](dynamic_global_property_object&) {});

   share_type total_allocation;
   for( const auto& handout : genesis_state.initial_balances )
   {
      FC_ASSERT( handout.amount > 0, "Genesis balance of ${n} must be positive", ("n", handout.owner_name) );
      total_allocation += handout.amount;
      FC_ASSERT( total_allocation <= genesis_state.max_core_supply,
                 "Genesis balances exceed the core supply of ${s}", ("s", genesis_state.max_core_supply) );
      adjust_balance( get_account_by_name( handout.owner_name ).get_id(), handout.amount );
   }

   ilog( "Initialized genesis with ${a} accounts, ${t} allocated, treasury ${treasury}",
         ("a", genesis_state.initial_accounts.size())("t", total_allocation)("treasury", treasury_id) );
} FC_CAPTURE_AND_RETHROW() }

} }

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

#include <aegis/protocol/chain_parameters.hpp>
#include <aegis/chain/types.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/filesystem.hpp>

#include <string>
#include <vector>

namespace aegis { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string(),
                           const public_key_type& key = public_key_type())
         : name(name),
           key(key)
      {}
      string name;
      public_key_type key;
   };
   struct initial_balance_type {
      /// Must correspond to one of the initial accounts or the treasury
      string owner_name;
      share_type amount;
   };

   time_point_sec                           initial_timestamp;
   share_type                               max_core_supply = AEGIS_MAX_SHARE_SUPPLY;
   chain_parameters                         initial_parameters;
   vector<initial_account_type>             initial_accounts;
   vector<initial_balance_type>             initial_balances;
   /// Created without a key when it is not among the initial accounts
   string                                   treasury_account_name = AEGIS_DEFAULT_TREASURY_ACCOUNT_NAME;

   /**
    * Get the chain_id corresponding to this genesis state.
    *
    * This is the SHA256 serialization of the genesis_state.
    */
   chain_id_type compute_chain_id() const;
};

/// Reads a genesis state from a JSON file
genesis_state_type load_genesis_state( const fc::path& genesis_file );

} } // namespace aegis::chain

FC_REFLECT( aegis::chain::genesis_state_type::initial_account_type, (name)(key) )

FC_REFLECT( aegis::chain::genesis_state_type::initial_balance_type, (owner_name)(amount) )

FC_REFLECT( aegis::chain::genesis_state_type,
            (initial_timestamp)(max_core_supply)(initial_parameters)(initial_accounts)
            (initial_balances)(treasury_account_name) )

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
#include <aegis/protocol/operations.hpp>

#include <functional>

namespace aegis { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * All transactions are sets of operations that must be applied atomically.  If any operation
    * fails, including a payout refused by its recipient, none of the transaction's effects remain.
    *
    * Signatures commit to the chain id as well as the packed transaction, so a transaction signed
    * for one ledger cannot be replayed on another.
    *
    * @{
    */

   /**
    *  @brief groups operations that should be applied atomically
    */
   struct transaction
   {
      vector<operation>  operations;

      /// Calculate the digest of the packed transaction
      digest_type         digest()const;
      void                validate() const;
      /// Digest that is signed: the chain id followed by the packed transaction
      digest_type         sig_digest( const chain_id_type& chain_id )const;

      /// visit all operations
      template<typename Visitor>
      void visit( Visitor&& visitor )const
      {
         for( auto& op : operations )
            op.visit( std::forward<Visitor>( visitor ) );
      }

      void get_required_authorities( flat_set<account_id_type>& active )const;
   };

   /**
    *  @brief adds a signature to a transaction
    */
   struct signed_transaction : public transaction
   {
      signed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      /** signs and appends to signatures */
      const signature_type& sign( const private_key_type& key, const chain_id_type& chain_id );

      /** returns signature but does not append */
      signature_type sign( const private_key_type& key, const chain_id_type& chain_id )const;

      /**
       *  Checks that the key of every account whose authority the operations require signed
       *  the transaction, and that no other key did.
       *
       *  @param get_key returns the signing key registered for an account
       */
      void verify_authority( const chain_id_type& chain_id,
                             const std::function<public_key_type(account_id_type)>& get_key )const;

      /// Recovers the keys that produced @ref signatures; a key may sign only once
      flat_set<public_key_type> get_signature_keys( const chain_id_type& chain_id )const;

      vector<signature_type> signatures;

      /// Removes all operations and signatures
      void clear() { operations.clear(); signatures.clear(); }
   };

   void verify_authority( const vector<operation>& ops, const flat_set<public_key_type>& sigs,
                          const std::function<public_key_type(account_id_type)>& get_key );

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *
    *  The index in operation_results corresponds to the same index in operations.  Operations
    *  that create an object return its id, all others return void_result.
    */
   struct processed_transaction : public signed_transaction
   {
      processed_transaction( const signed_transaction& trx = signed_transaction() )
         : signed_transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // aegis::protocol

FC_REFLECT( aegis::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( aegis::protocol::signed_transaction, (aegis::protocol::transaction), (signatures) )
FC_REFLECT_DERIVED( aegis::protocol::processed_transaction, (aegis::protocol::signed_transaction),
                    (operation_results) )

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
#include <aegis/protocol/transaction.hpp>
#include <aegis/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>


namespace aegis { namespace protocol {

digest_type transaction::digest()const
{
   digest_type::encoder enc;
   fc::raw::pack( enc, *this );
   return enc.result();
}

digest_type transaction::sig_digest( const chain_id_type& chain_id )const
{
   digest_type::encoder enc;
   fc::raw::pack( enc, chain_id );
   fc::raw::pack( enc, *this );
   return enc.result();
}

void transaction::validate() const
{
   FC_ASSERT( operations.size() > 0, "A transaction must have at least one operation", ("trx",*this) );
   for( const auto& op : operations )
      operation_validate(op);
}

void transaction::get_required_authorities( flat_set<account_id_type>& active )const
{
   for( const auto& op : operations )
      operation_get_required_authorities( op, active );
}

const signature_type& signed_transaction::sign( const private_key_type& key, const chain_id_type& chain_id )
{
   signatures.push_back( key.sign_compact( sig_digest( chain_id ) ) );
   return signatures.back();
}

signature_type signed_transaction::sign( const private_key_type& key, const chain_id_type& chain_id )const
{
   return key.sign_compact( sig_digest( chain_id ) );
}

flat_set<public_key_type> signed_transaction::get_signature_keys( const chain_id_type& chain_id )const
{ try {
   auto d = sig_digest( chain_id );
   flat_set<public_key_type> result;
   result.reserve( signatures.size() );
   for( const auto& sig : signatures )
   {
      AEGIS_ASSERT(
         result.insert( fc::ecc::public_key( sig, d ) ).second,
         tx_duplicate_sig,
         "Duplicate Signature detected", ("sig",sig) );
   }
   return result;
} FC_CAPTURE_AND_RETHROW() }

void verify_authority( const vector<operation>& ops, const flat_set<public_key_type>& sigs,
                       const std::function<public_key_type(account_id_type)>& get_key )
{ try {
   flat_set<account_id_type> required_active;
   for( const auto& op : ops )
      operation_get_required_authorities( op, required_active );

   flat_set<public_key_type> used;
   for( const auto& id : required_active )
   {
      const public_key_type key = get_key( id );
      AEGIS_ASSERT( !key.is_null() && sigs.find( key ) != sigs.end(),
                    tx_missing_active_auth, "Missing Active Authority ${id}", ("id",id) );
      used.insert( key );
   }

   AEGIS_ASSERT( used.size() == sigs.size(),
                 tx_irrelevant_sig,
                 "Unnecessary signature(s) detected",
                 ("sigs",sigs.size())("used",used.size()) );
} FC_CAPTURE_AND_RETHROW( (ops)(sigs) ) }

void signed_transaction::verify_authority( const chain_id_type& chain_id,
                                           const std::function<public_key_type(account_id_type)>& get_key )const
{ try {
   aegis::protocol::verify_authority( operations, get_signature_keys( chain_id ), get_key );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // aegis::protocol

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
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/exceptions.hpp>

namespace aegis { namespace chain {

share_type database::get_balance( account_id_type owner )const
{
   const auto& index = get_index_type< primary_index<account_balance_index> >().indices().get<by_owner>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      return 0;
   return itr->balance;
}

void database::adjust_balance( account_id_type account, share_type delta )
{ try {
   if( delta == 0 )
      return;

   FC_ASSERT( find( account ) != nullptr, "Unknown account ${a}", ("a", account) );

   const auto& index = get_index_type< primary_index<account_balance_index> >().indices().get<by_owner>();
   auto itr = index.find( account );
   if( itr == index.end() )
   {
      FC_ASSERT( delta > 0, "Insufficient Balance: ${a}'s balance of 0 is less than required ${r}",
                 ("a", account)("r", -delta) );
      create<account_balance_object>( [account,delta]( account_balance_object& b ) {
         b.owner = account;
         b.balance = delta;
      });
   } else {
      if( delta < 0 )
         FC_ASSERT( itr->balance >= -delta, "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                    ("a", account)("b", itr->balance)("r", -delta) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.adjust_balance( delta );
      });
   }

} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::push_value( account_id_type to, share_type amount )
{ try {
   adjust_balance( to, amount );

   auto itr = _value_receivers.find( to );
   if( itr == _value_receivers.end() )
      return;

   // the receiver may unregister itself while it runs
   std::shared_ptr<value_receiver> receiver = itr->second;
   try {
      receiver->on_value_received( *this, to, amount );
   } catch( const fc::exception& e ) {
      wlog( "Account ${to} rejected ${amount}: ${e}", ("to", to)("amount", amount)("e", e.to_detail_string()) );
      FC_THROW_EXCEPTION( value_transfer_failed, "Transfer of ${amount} to ${to} failed",
                          ("to", to)("amount", amount) );
   } catch( const std::exception& e ) {
      wlog( "Account ${to} rejected ${amount}: ${e}", ("to", to)("amount", amount)("e", e.what()) );
      FC_THROW_EXCEPTION( value_transfer_failed, "Transfer of ${amount} to ${to} failed",
                          ("to", to)("amount", amount) );
   } catch( ... ) {
      wlog( "Account ${to} rejected ${amount} with an unknown exception", ("to", to)("amount", amount) );
      FC_THROW_EXCEPTION( value_transfer_failed, "Transfer of ${amount} to ${to} failed",
                          ("to", to)("amount", amount) );
   }
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

share_type database::get_total_supply()const
{
   share_type total;
   for( const auto& b : get_index_type< primary_index<account_balance_index> >().indices() )
      total += b.balance;
   for( const auto& e : get_index_type< primary_index<escrow_index> >().indices() )
      total += e.amount;
   return total;
}

void database::register_value_receiver( account_id_type account, std::shared_ptr<value_receiver> receiver )
{
   FC_ASSERT( receiver != nullptr );
   FC_ASSERT( find( account ) != nullptr, "Unknown account ${a}", ("a", account) );
   _value_receivers[account] = std::move( receiver );
}

void database::unregister_value_receiver( account_id_type account )
{
   _value_receivers.erase( account );
}

} }

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

#include <aegis/chain/db_with.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/escrow_payout.hpp>
#include <aegis/chain/exceptions.hpp>

namespace aegis { namespace chain {

const escrow_object* database::find_escrow( const task_id_type& task_id )const
{
   const auto& escrows_by_task = get_index_type< primary_index<escrow_index> >().indices().get<by_task_id>();
   auto itr = escrows_by_task.find( task_id );
   if( itr == escrows_by_task.end() )
      return nullptr;
   return &*itr;
}

escrow_object database::get_escrow( const task_id_type& task_id )const
{
   const escrow_object* escrow = find_escrow( task_id );
   if( escrow == nullptr )
      return escrow_object();
   return *escrow;
}

vector<account_id_type> database::get_escrow_verifiers( const task_id_type& task_id )const
{
   const escrow_object* escrow = find_escrow( task_id );
   if( escrow == nullptr )
      return vector<account_id_type>();
   return escrow->verifiers;
}

const escrow_verifier_object* database::find_escrow_verifier( escrow_id_type escrow, account_id_type verifier )const
{
   const auto& idx = get_index_type< primary_index<escrow_verifier_index> >().indices().get<by_escrow_verifier>();
   auto itr = idx.find( boost::make_tuple( escrow, verifier ) );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

bool database::has_escrow_approval( const task_id_type& task_id, account_id_type verifier, escrow_path path )const
{
   const escrow_object* escrow = find_escrow( task_id );
   if( escrow == nullptr )
      return false;
   const escrow_verifier_object* v = find_escrow_verifier( escrow->get_id(), verifier );
   if( v == nullptr )
      return false;
   return path == escrow_path::release ? v->approved_release : v->approved_refund;
}

void database::finalize_escrow( const escrow_object& escrow, escrow_path path )
{ try {
   FC_ASSERT( escrow.is_funded(), "Escrow ${id} was already finalized", ("id", escrow.id) );

   const bool is_release = ( path == escrow_path::release );
   const escrow_id_type escrow_id = escrow.get_id();
   const task_id_type task_id = escrow.task_id;
   const account_id_type principal_to = is_release ? escrow.payee : escrow.depositor;
   const uint8_t approvals = is_release ? escrow.release_approvals : escrow.refund_approvals;

   const escrow_split split = is_release
         ? calculate_escrow_release_split( escrow.amount, escrow.marketplace_fee_bps, escrow.verifier_fee_bps )
         : calculate_escrow_refund_split( escrow.amount, escrow.verifier_fee_bps );

   vector<account_id_type> approvers;
   for( const auto& verifier : escrow.verifiers )
   {
      const escrow_verifier_object* v = find_escrow_verifier( escrow_id, verifier );
      if( v != nullptr && ( is_release ? v->approved_release : v->approved_refund ) )
         approvers.push_back( verifier );
   }

   // Terminal state is recorded before any value leaves the escrow
   modify( escrow, [is_release]( escrow_object& e ) {
      e.status = is_release ? escrow_status::released : escrow_status::refunded;
      e.amount = 0;
   });

   const account_id_type treasury = get_treasury_account();
   {
      detail::escrow_payout_guard guard( _escrow_payout_in_progress );

      if( split.principal > 0 )
         push_value( principal_to, split.principal );
      if( split.marketplace_fee > 0 )
         push_value( treasury, split.marketplace_fee );

      if( approvers.empty() )
      {
         if( split.verifier_fee > 0 )
            push_value( treasury, split.verifier_fee );
      }
      else
      {
         const vector<share_type> shares = split_verifier_fee( split.verifier_fee, approvers.size() );
         for( size_t i = 0; i < approvers.size(); ++i )
            if( shares[i] > 0 )
               push_value( approvers[i], shares[i] );
      }
   }

   if( is_release )
   {
      escrow_released_operation vop;
      vop.task_id           = task_id;
      vop.payee             = principal_to;
      vop.payee_amount      = split.principal;
      vop.marketplace_fee   = split.marketplace_fee;
      vop.verifier_fee_paid = split.verifier_fee;
      vop.approvals         = approvals;
      push_applied_operation( vop );
   }
   else
   {
      escrow_refunded_operation vop;
      vop.task_id           = task_id;
      vop.depositor         = principal_to;
      vop.refund_amount     = split.principal;
      vop.verifier_fee_paid = split.verifier_fee;
      vop.approvals         = approvals;
      push_applied_operation( vop );
   }

   const auto& idx = get_index_type< primary_index<escrow_verifier_index> >().indices().get<by_escrow_verifier>();
   auto itr = idx.lower_bound( boost::make_tuple( escrow_id ) );
   while( itr != idx.end() && itr->escrow == escrow_id )
   {
      const escrow_verifier_object& v = *itr;
      ++itr;
      remove( v );
   }
   modify( escrow, []( escrow_object& e ) {
      e.verifiers.clear();
   });

   ilog( "Escrow for task ${task} ${how}: ${principal} to ${to}, marketplace fee ${m}, verifier fee ${v} to ${n} verifiers",
         ("task", task_id)("how", is_release ? "released" : "refunded")("principal", split.principal)
         ("to", principal_to)("m", split.marketplace_fee)("v", split.verifier_fee)("n", approvers.size()) );
} FC_CAPTURE_AND_RETHROW( (escrow)(path) ) }

} }

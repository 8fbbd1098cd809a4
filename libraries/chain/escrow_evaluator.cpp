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
#include <aegis/chain/escrow_evaluator.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/exceptions.hpp>

namespace aegis { namespace chain {

      void_result escrow_create_evaluator::do_evaluate(const escrow_create_operation& o)
      { try {
         const database& d = db();

         AEGIS_ASSERT( !d.is_escrow_payout_in_progress(), escrow_reentrancy_active,
                       "Cannot fund an escrow while a payout is in progress", ("task", o.task_id) );

         AEGIS_ASSERT( d.find_escrow( o.task_id ) == nullptr, escrow_create_already_exists,
                       "Task ${task} already has an escrow", ("task", o.task_id) );

         o.validate();

         FC_ASSERT( d.find( o.depositor ) != nullptr, "Depositor ${a} does not exist", ("a", o.depositor) );
         FC_ASSERT( d.find( o.payee ) != nullptr, "Payee ${a} does not exist", ("a", o.payee) );
         for( const auto& verifier : o.verifiers )
            FC_ASSERT( d.find( verifier ) != nullptr, "Verifier ${a} does not exist", ("a", verifier) );

         const auto max_verifiers = d.get_chain_parameters().max_escrow_verifiers;
         AEGIS_ASSERT( o.verifiers.size() <= max_verifiers, escrow_invalid_verifier_configuration,
                       "${n} verifiers exceed the limit of ${max}", ("n", o.verifiers.size())("max", max_verifiers) );

         const share_type balance = d.get_balance( o.depositor );
         AEGIS_ASSERT( balance >= o.amount, escrow_create_insufficient_balance,
                       "Depositor ${a} holds ${b}, cannot lock ${amount}",
                       ("a", o.depositor)("b", balance)("amount", o.amount) );

         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      object_id_type escrow_create_evaluator::do_apply(const escrow_create_operation& o)
      { try {
         database& d = db();

         d.adjust_balance( o.depositor, -o.amount );

         const escrow_object& esc = d.create<escrow_object>([&]( escrow_object& esc ) {
            esc.task_id              = o.task_id;
            esc.depositor            = o.depositor;
            esc.payee                = o.payee;
            esc.amount               = o.amount;
            esc.marketplace_fee_bps  = o.marketplace_fee_bps;
            esc.verifier_fee_bps     = o.verifier_fee_bps;
            esc.status               = escrow_status::funded;
            esc.approvals_required   = o.approvals_required;
            esc.verifiers            = o.verifiers;
         });

         const escrow_id_type escrow_id = esc.get_id();
         for( const auto& verifier : o.verifiers )
         {
            d.create<escrow_verifier_object>([&]( escrow_verifier_object& v ) {
               v.escrow   = escrow_id;
               v.verifier = verifier;
            });
         }

         dlog( "Escrow ${id} funded for task ${task} with ${amount}",
               ("id", esc.id)("task", o.task_id)("amount", o.amount) );
         return esc.id;

      } FC_CAPTURE_AND_RETHROW( (o) ) }

      template<typename OperationType>
      void_result escrow_approve_evaluator<OperationType>::do_evaluate(const OperationType& o)
      { try {
         const database& d = this->db();

         AEGIS_ASSERT( !d.is_escrow_payout_in_progress(), escrow_reentrancy_active,
                       "Cannot approve an escrow while a payout is in progress", ("task", o.task_id) );

         _escrow = d.find_escrow( o.task_id );
         AEGIS_ASSERT( _escrow != nullptr && _escrow->is_funded(), escrow_invalid_state,
                       "Escrow for task ${task} is not awaiting approvals",
                       ("task", o.task_id)("status", _escrow ? _escrow->status : escrow_status::uninitialized) );

         const escrow_verifier_object* ver = d.find_escrow_verifier( _escrow->get_id(), o.verifier );
         AEGIS_ASSERT( ver != nullptr, escrow_unauthorized,
                       "${who} is not a verifier of task ${task}", ("who", o.verifier)("task", o.task_id) );

         const bool already_approved = ( o.path() == escrow_path::release ) ? ver->approved_release
                                                                            : ver->approved_refund;
         AEGIS_ASSERT( !already_approved, escrow_already_approved,
                       "${who} already approved ${path} of task ${task}",
                       ("who", o.verifier)("path", o.path())("task", o.task_id) );

         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      template<typename OperationType>
      void_result escrow_approve_evaluator<OperationType>::do_apply(const OperationType& o)
      { try {
         database& d = this->db();
         const escrow_object& escrow = *_escrow;
         const escrow_path path = o.path();

         d.modify( *d.find_escrow_verifier( escrow.get_id(), o.verifier ), [path]( escrow_verifier_object& v )
         {
            if( path == escrow_path::release )
               v.approved_release = true;
            else
               v.approved_refund = true;
         });

         uint8_t approvals = 0;
         d.modify( escrow, [path,&approvals]( escrow_object& esc )
         {
            if( path == escrow_path::release )
               approvals = ++esc.release_approvals;
            else
               approvals = ++esc.refund_approvals;
         });

         d.push_applied_operation( escrow_approved_operation( o.task_id, o.verifier, path,
                                                              approvals, escrow.approvals_required ) );

         if( approvals >= escrow.approvals_required )
            d.finalize_escrow( escrow, path );

         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      template class escrow_approve_evaluator<escrow_approve_release_operation>;
      template class escrow_approve_evaluator<escrow_approve_refund_operation>;

} } // aegis::chain

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
#include <aegis/protocol/base.hpp>

namespace aegis { namespace protocol {

      /// The two independent approval tracks of an escrow
      enum escrow_path
      {
         release = 0, ///< pay the payee, net of marketplace and verifier fees
         refund  = 1  ///< return the deposit to the depositor, net of the verifier fee
      };

      /**
       *  Locks @ref amount of the depositor's balance for the task identified by @ref task_id.
       *
       *  The funds are held until @ref approvals_required of the listed verifiers agree on either
       *  releasing them to the payee or refunding them to the depositor.  Whichever path reaches
       *  the quorum first finalizes the escrow; the other path can no longer be approved.
       *
       *  Fee rates are in basis points of the locked amount (see AEGIS_100_PERCENT).  On release
       *  the marketplace fee goes to the treasury and the verifier fee is shared between the
       *  verifiers that approved the release.  On refund only the verifier fee is taken, shared
       *  between the verifiers that approved the refund.
       *
       *  A task identifier can be funded only once, even after its escrow has been finalized.
       */
      struct escrow_create_operation : public base_operation
      {
         account_id_type           depositor;
         task_id_type              task_id;
         account_id_type           payee;
         vector<account_id_type>   verifiers;
         uint8_t                   approvals_required = 1;
         uint16_t                  marketplace_fee_bps = 0;
         uint16_t                  verifier_fee_bps = 0;
         share_type                amount;

         void validate()const;
         void get_required_active_authorities( flat_set<account_id_type>& a )const{ a.insert(depositor); }
      };

      /**
       *  Casts @ref verifier's vote to release the escrow of @ref task_id to its payee.
       *  The vote that completes the quorum also performs the payout.
       */
      struct escrow_approve_release_operation : public base_operation
      {
         account_id_type   verifier;
         task_id_type      task_id;

         escrow_path path()const { return escrow_path::release; }
         void get_required_active_authorities( flat_set<account_id_type>& a )const{ a.insert(verifier); }
      };

      /**
       *  Casts @ref verifier's vote to refund the escrow of @ref task_id to its depositor.
       *  The vote that completes the quorum also performs the refund.
       */
      struct escrow_approve_refund_operation : public base_operation
      {
         account_id_type   verifier;
         task_id_type      task_id;

         escrow_path path()const { return escrow_path::refund; }
         void get_required_active_authorities( flat_set<account_id_type>& a )const{ a.insert(verifier); }
      };

      /**
       *  @ingroup operations
       *  Virtual op recording an accepted approval and the progress of its path.
       */
      struct escrow_approved_operation : public virtual_operation
      {
         escrow_approved_operation(){}
         escrow_approved_operation( const task_id_type& t, account_id_type v, escrow_path p, uint8_t n, uint8_t req )
            :task_id(t),verifier(v),path(p),approvals(n),approvals_required(req){}

         task_id_type      task_id;
         account_id_type   verifier;
         escrow_path       path = escrow_path::release;
         uint8_t           approvals = 0;
         uint8_t           approvals_required = 0;
      };

      /**
       *  @ingroup operations
       *  Virtual op emitted when an escrow is released; carries every amount that was paid out.
       */
      struct escrow_released_operation : public virtual_operation
      {
         task_id_type      task_id;
         account_id_type   payee;
         share_type        payee_amount;
         share_type        marketplace_fee;
         share_type        verifier_fee_paid;
         uint8_t           approvals = 0;
      };

      /**
       *  @ingroup operations
       *  Virtual op emitted when an escrow is refunded to its depositor.
       */
      struct escrow_refunded_operation : public virtual_operation
      {
         task_id_type      task_id;
         account_id_type   depositor;
         share_type        refund_amount;
         share_type        verifier_fee_paid;
         uint8_t           approvals = 0;
      };

} } // aegis::protocol

FC_REFLECT_ENUM( aegis::protocol::escrow_path, (release)(refund) )

FC_REFLECT( aegis::protocol::escrow_create_operation,
            (depositor)(task_id)(payee)(verifiers)(approvals_required)
            (marketplace_fee_bps)(verifier_fee_bps)(amount) )
FC_REFLECT( aegis::protocol::escrow_approve_release_operation, (verifier)(task_id) )
FC_REFLECT( aegis::protocol::escrow_approve_refund_operation, (verifier)(task_id) )
FC_REFLECT( aegis::protocol::escrow_approved_operation,
            (task_id)(verifier)(path)(approvals)(approvals_required) )
FC_REFLECT( aegis::protocol::escrow_released_operation,
            (task_id)(payee)(payee_amount)(marketplace_fee)(verifier_fee_paid)(approvals) )
FC_REFLECT( aegis::protocol::escrow_refunded_operation,
            (task_id)(depositor)(refund_amount)(verifier_fee_paid)(approvals) )

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
#include <aegis/db/object.hpp>
#include <aegis/db/generic_index.hpp>

namespace aegis { namespace chain {
      using namespace aegis::db;

      /// Lifecycle of an escrow; released and refunded are terminal
      enum escrow_status
      {
         uninitialized = 0, ///< no escrow was ever funded for the task
         funded        = 1,
         released      = 2,
         refunded      = 3
      };

      /**
       * Value locked for a task until its verifiers reach a quorum on release or refund.
       *
       * The object outlives its payout: once finalized it keeps its terminal status with a zero
       * amount, which is what keeps the task identifier from being funded a second time.
       */
      class escrow_object : public aegis::db::abstract_object<escrow_object, protocol_ids, escrow_object_type> {
         public:
            task_id_type              task_id;
            account_id_type           depositor;
            account_id_type           payee;
            share_type                amount;
            uint16_t                  marketplace_fee_bps = 0;
            uint16_t                  verifier_fee_bps = 0;
            escrow_status             status = escrow_status::uninitialized;
            uint8_t                   approvals_required = 0;
            uint8_t                   release_approvals = 0;
            uint8_t                   refund_approvals = 0;
            /// In the order given at creation; payouts follow this order
            vector<account_id_type>   verifiers;

            bool is_funded()const { return status == escrow_status::funded; }
      };

      /**
       * Membership and votes of one verifier on one escrow.  Removed once the escrow is finalized.
       */
      class escrow_verifier_object : public aegis::db::abstract_object<escrow_verifier_object,
                                        implementation_ids, impl_escrow_verifier_object_type> {
         public:
            escrow_id_type    escrow;
            account_id_type   verifier;
            bool              approved_release = false;
            bool              approved_refund = false;
      };

      struct by_task_id;
      typedef multi_index_container<
         escrow_object,
         indexed_by<
            ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
            ordered_unique< tag< by_task_id >,
               member< escrow_object, task_id_type, &escrow_object::task_id >
            >
         >
      > escrow_object_index_type;

      typedef generic_index< escrow_object, escrow_object_index_type > escrow_index;

      struct by_escrow_verifier;
      typedef multi_index_container<
         escrow_verifier_object,
         indexed_by<
            ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
            ordered_unique< tag< by_escrow_verifier >,
               composite_key< escrow_verifier_object,
                  member< escrow_verifier_object, escrow_id_type,  &escrow_verifier_object::escrow >,
                  member< escrow_verifier_object, account_id_type, &escrow_verifier_object::verifier >
               >
            >
         >
      > escrow_verifier_object_index_type;

      typedef generic_index< escrow_verifier_object, escrow_verifier_object_index_type > escrow_verifier_index;

   } }

AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::escrow_object)
AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::escrow_verifier_object)

FC_REFLECT_ENUM( aegis::chain::escrow_status, (uninitialized)(funded)(released)(refunded) )

FC_REFLECT_DERIVED( aegis::chain::escrow_object, (aegis::db::object),
                    (task_id)(depositor)(payee)(amount)(marketplace_fee_bps)(verifier_fee_bps)(status)
                    (approvals_required)(release_approvals)(refund_approvals)(verifiers) )
FC_REFLECT_DERIVED( aegis::chain::escrow_verifier_object, (aegis::db::object),
                    (escrow)(verifier)(approved_release)(approved_refund) )

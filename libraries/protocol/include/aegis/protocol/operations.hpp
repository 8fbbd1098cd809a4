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
#include <aegis/protocol/account.hpp>
#include <aegis/protocol/transfer.hpp>
#include <aegis/protocol/escrow.hpp>

namespace aegis { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ transfer_operation,
            /*  1 */ account_create_operation,
            /*  2 */ escrow_create_operation,
            /*  3 */ escrow_approve_release_operation,
            /*  4 */ escrow_approve_refund_operation,
            /*  5 */ escrow_approved_operation,        // VIRTUAL
            /*  6 */ escrow_released_operation,        // VIRTUAL
            /*  7 */ escrow_refunded_operation         // VIRTUAL
         > operation;

   /// @} // operations group

   /**
    *  Appends the accounts whose active authority must sign @p op to @p active.
    */
   void operation_get_required_authorities( const operation& op, flat_set<account_id_type>& active );

   void operation_validate( const operation& op );

} } // aegis::protocol

FC_REFLECT_TYPENAME( aegis::protocol::operation )

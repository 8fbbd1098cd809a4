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

#include <aegis/protocol/types.hpp>
#include <aegis/protocol/exceptions.hpp>

namespace aegis { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the shared ledger state.
    *
    *  An operation can be thought of like a function that will modify the shared
    *  state of the ledger.  The members of each struct are like function arguments
    *  and each operation can potentially generate a return value.
    *
    *  Operations are grouped into transactions (@ref transaction) to ensure that they
    *  occur in a particular order and that all operations apply successfully or no
    *  operations apply.
    *
    *  @subsection defined_authority Explicit Authority
    *
    *    Each operation contains enough information to know which accounts must authorize
    *    it, so that signatures can be checked before any state is touched.
    *
    *  @subsection virtual_operations Virtual Operations
    *
    *    Some operations are never submitted by users.  They are produced by the ledger while
    *    applying another operation and only appear in the operation history, where they
    *    record state transitions (approval progress, escrow payouts) that off-chain
    *    indexers need.
    *
    *  @{
    */

   struct void_result{};
   typedef fc::static_variant<void_result,object_id_type> operation_result;

   struct base_operation
   {
      void get_required_active_authorities( flat_set<account_id_type>& )const{}
      void validate()const{}
   };

   /// Base of every operation the ledger produces on its own.
   struct virtual_operation : public base_operation
   {
      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   ///@}

} } // aegis::protocol

FC_REFLECT( aegis::protocol::void_result, )
FC_REFLECT_TYPENAME( aegis::protocol::operation_result )

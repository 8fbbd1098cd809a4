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

#include <fc/exception/exception.hpp>
#include <aegis/protocol/exceptions.hpp>
#include <aegis/protocol/operations.hpp>
#include <aegis/chain/types.hpp>

#define AEGIS_DECLARE_OP_BASE_EXCEPTIONS( op_name )                   \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      aegis::chain::operation_validate_exception,                     \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      aegis::chain::operation_evaluate_exception,                     \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
      )

#define AEGIS_IMPLEMENT_OP_BASE_EXCEPTIONS( op_name )                 \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _validate_exception,                                 \
      aegis::chain::operation_validate_exception,                     \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _evaluate_exception,                                 \
      aegis::chain::operation_evaluate_exception,                     \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define AEGIS_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      aegis::chain::op_name ## _evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum                                                     \
      )

#define AEGIS_IMPLEMENT_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _ ## exc_name,                                       \
      aegis::chain::op_name ## _evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace aegis { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     aegis::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception,aegis::chain::chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception, aegis::chain::chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, aegis::chain::chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      aegis::chain::chain_exception, 3070000 )

   AEGIS_DECLARE_OP_BASE_EXCEPTIONS( escrow_create );
   AEGIS_DECLARE_OP_EVALUATE_EXCEPTION( already_exists, escrow_create, 1 )
   AEGIS_DECLARE_OP_EVALUATE_EXCEPTION( insufficient_balance, escrow_create, 2 )

   /// Failures of the approval state machine and payout engine
   FC_DECLARE_DERIVED_EXCEPTION( escrow_exception,             aegis::chain::chain_exception, 3110000 )

   FC_DECLARE_DERIVED_EXCEPTION( escrow_invalid_state,         aegis::chain::escrow_exception, 3110001 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_unauthorized,          aegis::chain::escrow_exception, 3110002 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_already_approved,      aegis::chain::escrow_exception, 3110003 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_reentrancy_active,     aegis::chain::escrow_exception, 3110004 )

   /// A recipient refused value credited to it
   FC_DECLARE_DERIVED_EXCEPTION( value_transfer_failed,        aegis::chain::chain_exception, 3120000 )

} } // aegis::chain

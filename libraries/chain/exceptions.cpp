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
#include <aegis/chain/exceptions.hpp>

namespace aegis { namespace chain {

   // Internal exceptions

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "blockchain exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000,
                                   "transaction processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception,  chain_exception, 3040000,
                                   "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000,
                                   "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,       chain_exception, 3070000, "undo database exception" )

   AEGIS_IMPLEMENT_OP_BASE_EXCEPTIONS( escrow_create );
   AEGIS_IMPLEMENT_OP_EVALUATE_EXCEPTION( already_exists, escrow_create, 1,
                                          "an escrow was already funded for this task" )
   AEGIS_IMPLEMENT_OP_EVALUATE_EXCEPTION( insufficient_balance, escrow_create, 2,
                                          "the depositor cannot cover the escrow amount" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_exception,          chain_exception, 3110000, "escrow exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_invalid_state,      escrow_exception, 3110001,
                                   "escrow is not awaiting approvals" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_unauthorized,       escrow_exception, 3110002,
                                   "account is not a verifier of this escrow" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_already_approved,   escrow_exception, 3110003,
                                   "verifier already approved this path" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_reentrancy_active,  escrow_exception, 3110004,
                                   "escrow operation attempted while a payout is in progress" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( value_transfer_failed,     chain_exception, 3120000,
                                   "recipient rejected a value transfer" )

} } // aegis::chain

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
#include <aegis/protocol/exceptions.hpp>

namespace aegis { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception,      protocol_exception, 4010000,
                                   "transaction validation exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_missing_active_auth,     transaction_exception, 4010001,
                                   "missing required active authority" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_irrelevant_sig,          transaction_exception, 4010004,
                                   "irrelevant signature included" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_duplicate_sig,           transaction_exception, 4010005,
                                   "duplicate signature included" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_validate_exception,  protocol_exception, 4020000,
                                   "escrow parameter validation exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_zero_address,                    escrow_validate_exception, 4020001,
                                   "null account supplied where a principal is required" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_invalid_amount,                  escrow_validate_exception, 4020002,
                                   "escrow amount must be positive" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_invalid_fee_configuration,       escrow_validate_exception, 4020003,
                                   "invalid escrow fee configuration" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_invalid_verifier_configuration,  escrow_validate_exception, 4020004,
                                   "invalid escrow verifier configuration" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_duplicate_verifier,              escrow_validate_exception, 4020005,
                                   "duplicate escrow verifier" )

} } // aegis::protocol

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

#define AEGIS_ASSERT( expr, exc_type, FORMAT, ... )                   \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace aegis { namespace protocol {

   FC_DECLARE_EXCEPTION( protocol_exception, 4000000 )

   FC_DECLARE_DERIVED_EXCEPTION( transaction_exception,             aegis::protocol::protocol_exception, 4010000 )

   FC_DECLARE_DERIVED_EXCEPTION( tx_missing_active_auth,            aegis::protocol::transaction_exception, 4010001 )
   FC_DECLARE_DERIVED_EXCEPTION( tx_irrelevant_sig,                 aegis::protocol::transaction_exception, 4010004 )
   FC_DECLARE_DERIVED_EXCEPTION( tx_duplicate_sig,                  aegis::protocol::transaction_exception, 4010005 )

   /// Stateless escrow parameter checks performed by escrow_create_operation::validate()
   FC_DECLARE_DERIVED_EXCEPTION( escrow_validate_exception,         aegis::protocol::protocol_exception, 4020000 )

   FC_DECLARE_DERIVED_EXCEPTION( escrow_zero_address,                     aegis::protocol::escrow_validate_exception, 4020001 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_invalid_amount,                   aegis::protocol::escrow_validate_exception, 4020002 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_invalid_fee_configuration,        aegis::protocol::escrow_validate_exception, 4020003 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_invalid_verifier_configuration,   aegis::protocol::escrow_validate_exception, 4020004 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_duplicate_verifier,               aegis::protocol::escrow_validate_exception, 4020005 )

} } // aegis::protocol

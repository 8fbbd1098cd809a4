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
#include <aegis/protocol/escrow.hpp>

namespace aegis { namespace protocol {

      void escrow_create_operation::validate()const
      {
         AEGIS_ASSERT( depositor != AEGIS_NULL_ACCOUNT, escrow_zero_address,
                       "The null account cannot fund an escrow", ("task", task_id) );
         AEGIS_ASSERT( payee != AEGIS_NULL_ACCOUNT, escrow_zero_address,
                       "Escrow payee must not be the null account", ("task", task_id) );
         AEGIS_ASSERT( amount > 0, escrow_invalid_amount,
                       "Escrow amount must be positive", ("amount", amount) );
         AEGIS_ASSERT( uint32_t(marketplace_fee_bps) + verifier_fee_bps <= AEGIS_100_PERCENT,
                       escrow_invalid_fee_configuration,
                       "Marketplace fee ${m} and verifier fee ${v} exceed ${max} basis points",
                       ("m", marketplace_fee_bps)("v", verifier_fee_bps)("max", AEGIS_100_PERCENT) );
         AEGIS_ASSERT( !verifiers.empty() && verifiers.size() <= AEGIS_MAX_ESCROW_VERIFIERS,
                       escrow_invalid_verifier_configuration,
                       "An escrow needs between 1 and ${max} verifiers, got ${n}",
                       ("max", AEGIS_MAX_ESCROW_VERIFIERS)("n", verifiers.size()) );
         AEGIS_ASSERT( approvals_required >= 1 && approvals_required <= verifiers.size(),
                       escrow_invalid_verifier_configuration,
                       "Quorum ${q} is outside [1, ${n}]", ("q", approvals_required)("n", verifiers.size()) );

         flat_set<account_id_type> seen;
         seen.reserve( verifiers.size() );
         for( const auto& who : verifiers )
         {
            AEGIS_ASSERT( who != AEGIS_NULL_ACCOUNT, escrow_zero_address,
                          "Escrow verifiers must not be the null account", ("task", task_id) );
            AEGIS_ASSERT( seen.insert( who ).second, escrow_duplicate_verifier,
                          "Verifier ${who} is listed more than once", ("who", who) );
         }
      }

} } // aegis::protocol

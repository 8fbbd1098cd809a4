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
#include <aegis/chain/escrow_payout.hpp>

#include <fc/uint128.hpp>

namespace aegis { namespace chain {

share_type calculate_bps_fee( share_type amount, uint16_t bps )
{ try {
   FC_ASSERT( amount >= 0, "Cannot take a fee from a negative amount" );
   FC_ASSERT( bps <= AEGIS_100_PERCENT, "Fee rate above 100%" );
   fc::uint128_t a( amount.value );
   a *= bps;
   a /= AEGIS_100_PERCENT;
   return static_cast<int64_t>( a );
} FC_CAPTURE_AND_RETHROW( (amount)(bps) ) }

escrow_split calculate_escrow_release_split( share_type amount, uint16_t marketplace_fee_bps,
                                             uint16_t verifier_fee_bps )
{ try {
   FC_ASSERT( uint32_t(marketplace_fee_bps) + verifier_fee_bps <= AEGIS_100_PERCENT );
   escrow_split split;
   split.marketplace_fee = calculate_bps_fee( amount, marketplace_fee_bps );
   split.verifier_fee    = calculate_bps_fee( amount, verifier_fee_bps );
   split.principal       = amount - split.marketplace_fee - split.verifier_fee;
   return split;
} FC_CAPTURE_AND_RETHROW( (amount)(marketplace_fee_bps)(verifier_fee_bps) ) }

escrow_split calculate_escrow_refund_split( share_type amount, uint16_t verifier_fee_bps )
{ try {
   escrow_split split;
   split.marketplace_fee = 0;
   split.verifier_fee    = calculate_bps_fee( amount, verifier_fee_bps );
   split.principal       = amount - split.verifier_fee;
   return split;
} FC_CAPTURE_AND_RETHROW( (amount)(verifier_fee_bps) ) }

vector<share_type> split_verifier_fee( share_type total_fee, size_t count )
{
   FC_ASSERT( total_fee >= 0 );
   if( count == 0 )
      return vector<share_type>();

   const int64_t n = static_cast<int64_t>( count );
   const int64_t base = total_fee.value / n;
   const int64_t remainder = total_fee.value % n;

   vector<share_type> shares( count, share_type( base ) );
   for( int64_t i = 0; i < remainder; ++i )
      shares[i] += 1;
   return shares;
}

} } // aegis::chain

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

namespace aegis { namespace chain {

   /// How a finalized escrow's locked amount is divided
   struct escrow_split
   {
      /// paid to the payee on release or back to the depositor on refund
      share_type principal;
      /// paid to the treasury, always zero on refund
      share_type marketplace_fee;
      /// shared by the verifiers that approved the winning path
      share_type verifier_fee;
   };

   /**
    * @return floor( amount * bps / AEGIS_100_PERCENT ), computed without intermediate overflow
    */
   share_type calculate_bps_fee( share_type amount, uint16_t bps );

   escrow_split calculate_escrow_release_split( share_type amount, uint16_t marketplace_fee_bps,
                                                uint16_t verifier_fee_bps );
   escrow_split calculate_escrow_refund_split( share_type amount, uint16_t verifier_fee_bps );

   /**
    * Divides @p total_fee between @p count recipients.  Everyone gets the floor of the even share
    * and the first total_fee % count recipients get one more unit, so the shares always sum to
    * @p total_fee.
    */
   vector<share_type> split_verifier_fee( share_type total_fee, size_t count );

} } // aegis::chain

FC_REFLECT( aegis::chain::escrow_split, (principal)(marketplace_fee)(verifier_fee) )

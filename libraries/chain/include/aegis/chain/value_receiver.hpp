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
   class database;

   /**
    *  Code attached to an account that runs whenever the account is credited through
    *  database::push_value(), i.e. by a transfer or an escrow payout.
    *
    *  The credit is already applied when on_value_received() runs.  Throwing refuses the
    *  value and makes the whole transaction fail.  An implementation may also submit
    *  further transactions to @p db; escrow operations are rejected while a payout is
    *  in progress.
    */
   class value_receiver
   {
      public:
         virtual ~value_receiver(){}

         virtual void on_value_received( database& db, account_id_type receiver, share_type amount ) = 0;
   };

} } // aegis::chain

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

namespace aegis { namespace protocol {

   /**
    * @ingroup operations
    *
    * @brief Transfers core value from one account to another
    *
    * The recipient is credited through the same path as escrow payouts, so a recipient
    * with a registered value receiver may refuse the transfer.
    */
   struct transfer_operation : public base_operation
   {
      /// Account to transfer value from
      account_id_type  from;
      /// Account to transfer value to
      account_id_type  to;
      share_type       amount;

      void validate()const;
      void get_required_active_authorities( flat_set<account_id_type>& a )const{ a.insert(from); }
   };

} } // aegis::protocol

FC_REFLECT( aegis::protocol::transfer_operation, (from)(to)(amount) )

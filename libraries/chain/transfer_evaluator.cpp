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
#include <aegis/chain/transfer_evaluator.hpp>
#include <aegis/chain/account_object.hpp>
#include <aegis/chain/database.hpp>
#include <aegis/chain/exceptions.hpp>

namespace aegis { namespace chain {
void_result transfer_evaluator::do_evaluate( const transfer_operation& op )
{ try {
   const database& d = db();

   FC_ASSERT( d.find( op.from ) != nullptr, "Sender ${a} does not exist", ("a", op.from) );
   FC_ASSERT( d.find( op.to ) != nullptr, "Recipient ${a} does not exist", ("a", op.to) );
   FC_ASSERT( op.to != AEGIS_NULL_ACCOUNT, "Value cannot be sent to the null account" );

   bool sufficient_balance = d.get_balance( op.from ) >= op.amount;
   FC_ASSERT( sufficient_balance,
              "Insufficient Balance: ${balance}, unable to transfer '${total_transfer}' from account '${a}' to '${t}'",
              ("a",op.from(d).name)("t",op.to(d).name)("total_transfer",op.amount)("balance",d.get_balance(op.from)) );

   return void_result();
}  FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_evaluator::do_apply( const transfer_operation& o )
{ try {
   db().adjust_balance( o.from, -o.amount );
   db().push_value( o.to, o.amount );
   return void_result();
}  FC_CAPTURE_AND_RETHROW( (o) ) }

} } // aegis::chain

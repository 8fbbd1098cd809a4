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
#include <aegis/chain/database.hpp>

#include <aegis/chain/account_object.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/global_property_object.hpp>
#include <aegis/chain/operation_history_object.hpp>

#include <aegis/chain/account_evaluator.hpp>
#include <aegis/chain/escrow_evaluator.hpp>
#include <aegis/chain/transfer_evaluator.hpp>

namespace aegis { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<transfer_evaluator>();
   register_evaluator<account_create_evaluator>();
   register_evaluator<escrow_create_evaluator>();
   register_evaluator<escrow_approve_release_evaluator>();
   register_evaluator<escrow_approve_refund_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<escrow_index> >();
   add_index< primary_index<operation_history_index> >();

   //Implementation object indexes
   add_index< primary_index<global_property_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<escrow_verifier_index> >();
}

} }

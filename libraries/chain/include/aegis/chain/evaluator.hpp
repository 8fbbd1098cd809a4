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
#include <aegis/chain/exceptions.hpp>
#include <aegis/chain/transaction_evaluation_state.hpp>
#include <aegis/protocol/operations.hpp>

namespace aegis { namespace chain {

   class database;

   /**
    * Checks one operation against the ledger and then applies it.
    *
    * Stateless checks belong in the operation's validate(), which runs before any evaluator.
    * do_evaluate() only reads state; do_apply() performs the changes.
    */
   class generic_evaluator
   {
   public:
      virtual ~generic_evaluator(){}

      virtual int get_type()const = 0;

      operation_result start_evaluate( transaction_evaluation_state& eval_state, const operation& op );

      virtual operation_result evaluate( const operation& op ) = 0;
      virtual operation_result apply( const operation& op ) = 0;

      database& db()const;

   protected:
      transaction_evaluation_state*    trx_state = nullptr;
   };

   /// Creates a fresh evaluator for every operation of one type
   class op_evaluator
   {
   public:
      virtual ~op_evaluator(){}
      virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
   public:
      virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op ) override
      {
         T eval;
         return eval.start_evaluate( eval_state, op );
      }
   };

   /**
    * Dispatches to DerivedEvaluator::do_evaluate() and do_apply() with the concrete
    * DerivedEvaluator::operation_type.
    */
   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
   public:
      virtual int get_type()const override
      {
         return operation::tag<typename DerivedEvaluator::operation_type>::value;
      }

      virtual operation_result evaluate( const operation& o ) final override
      {
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();
         return static_cast<DerivedEvaluator*>(this)->do_evaluate( op );
      }

      virtual operation_result apply( const operation& o ) final override
      {
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();
         return static_cast<DerivedEvaluator*>(this)->do_apply( op );
      }
   };
} }

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
#include <aegis/chain/evaluator.hpp>

namespace aegis { namespace chain {

      class escrow_object;

      class escrow_create_evaluator : public evaluator<escrow_create_evaluator>
      {
      public:
         typedef escrow_create_operation operation_type;

         void_result do_evaluate( const escrow_create_operation& o );
         object_id_type do_apply( const escrow_create_operation& o );
      };

      /**
       * Records one verifier vote on one path and finalizes the escrow when the vote completes
       * the quorum.  Release and refund are independent tracks handled by the same logic.
       */
      template<typename OperationType>
      class escrow_approve_evaluator : public evaluator<escrow_approve_evaluator<OperationType>>
      {
      public:
         typedef OperationType operation_type;

         void_result do_evaluate( const OperationType& o );
         void_result do_apply( const OperationType& o );

      private:
         const escrow_object* _escrow = nullptr;
      };

      typedef escrow_approve_evaluator<escrow_approve_release_operation> escrow_approve_release_evaluator;
      typedef escrow_approve_evaluator<escrow_approve_refund_operation>  escrow_approve_refund_evaluator;

   } } // aegis::chain

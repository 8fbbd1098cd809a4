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
#include <aegis/protocol/operations.hpp>
#include <aegis/chain/types.hpp>
#include <aegis/db/generic_index.hpp>

namespace aegis { namespace chain {
   using namespace aegis::db;

   /**
    * @brief tracks the history of all logical operations on ledger state
    * @ingroup object
    * @ingroup implementation
    *
    *  All operations and virtual operations result in the creation of an
    *  operation_history_object.  Each real or virtual operation is assigned a
    *  unique ID / sequence number that it can be referenced by.  History entries
    *  are created inside the transaction's undo session, so a rejected transaction
    *  leaves no entries behind.
    *
    *  @note  this object is READ ONLY it can never be modified
    */
   class operation_history_object : public abstract_object<operation_history_object,
                                       protocol_ids, operation_history_object_type>
   {
      public:
         operation_history_object( const operation& o ):op(o){}
         operation_history_object(){}

         operation         op;
         operation_result  result;
         /** the transaction that caused this operation, counted from genesis */
         uint32_t          trx_num = 0;
         /** the operation within the transaction */
         uint16_t          op_in_trx = 0;
         /** any virtual operations implied by operation in transaction */
         uint16_t          virtual_op = 0;
   };

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      operation_history_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > operation_history_multi_index_type;

   typedef generic_index<operation_history_object, operation_history_multi_index_type> operation_history_index;

} } // aegis::chain

AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::operation_history_object)

FC_REFLECT_DERIVED( aegis::chain::operation_history_object, (aegis::db::object),
                    (op)(result)(trx_num)(op_in_trx)(virtual_op) )

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
#include <aegis/chain/db_with.hpp>

#include <aegis/chain/account_object.hpp>
#include <aegis/chain/evaluator.hpp>
#include <aegis/chain/global_property_object.hpp>
#include <aegis/chain/operation_history_object.hpp>
#include <aegis/chain/transaction_evaluation_state.hpp>

namespace aegis { namespace chain {

processed_transaction database::push_transaction( const signed_transaction& trx, uint32_t skip )
{ try {
   // A value_receiver may push a transaction while another one is being applied; the position
   // counters of the outer transaction are restored once the nested one is done.
   struct history_position_restorer {
      explicit history_position_restorer(database& db)
         : db(db), trx_num(db._current_trx_num), op_in_trx(db._current_op_in_trx),
           virtual_op(db._current_virtual_op) {}
      ~history_position_restorer()
      {
         db._current_trx_num    = trx_num;
         db._current_op_in_trx  = op_in_trx;
         db._current_virtual_op = virtual_op;
      }
      history_position_restorer(const history_position_restorer&) = delete;
   private:
      database& db;
      uint32_t  trx_num;
      uint16_t  op_in_trx;
      uint16_t  virtual_op;
   };
   history_position_restorer restorer(*this);

   processed_transaction result;
   detail::with_skip_flags( *this, skip, [&]()
   {
      // The session is discarded by its destructor if _apply_transaction fails.
      auto session = _undo_db.start_undo_session();
      result = _apply_transaction( trx );
      if( _undo_db.active_sessions() > 1 )
         session.merge();
      else
         session.commit();
   } );
   return result;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::_apply_transaction( const signed_transaction& trx )
{ try {
   uint32_t skip = get_skip_flags();

   trx.validate();

   const chain_parameters& params = get_chain_parameters();
   FC_ASSERT( trx.operations.size() <= params.max_operations_per_transaction,
              "Transaction has ${n} operations, limit is ${max}",
              ("n", trx.operations.size())("max", params.max_operations_per_transaction) );

   if( !(skip & skip_transaction_signatures) )
   {
      auto get_key = [this]( account_id_type id ) -> public_key_type {
         const account_object* account = find( id );
         return account != nullptr ? account->key : public_key_type();
      };
      trx.verify_authority( get_chain_id(), get_key );
   }

   const dynamic_global_property_object& dgp = get_dynamic_global_properties();
   _current_trx_num = dgp.transaction_count;
   modify( dgp, []( dynamic_global_property_object& p ) {
      ++p.transaction_count;
   });

   transaction_evaluation_state eval_state(this);
   eval_state._trx = &trx;
   eval_state.operation_results.reserve( trx.operations.size() );

   //Finally process the operations
   processed_transaction ptrx(trx);
   _current_op_in_trx = 0;
   for( const auto& op : ptrx.operations )
   {
      _current_virtual_op = 0;
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );
      ++_current_op_in_trx;
   }
   ptrx.operation_results = std::move( eval_state.operation_results );

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   FC_ASSERT( i_which >= 0 && uint64_t( i_which ) < _operation_evaluators.size(), "Negative or unknown operation tag" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ i_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   auto op_id = push_applied_operation( op );
   auto result = eval->evaluate( eval_state, op );
   set_applied_operation_result( op_id, result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_history_id_type database::push_applied_operation( const operation& op )
{
   const operation_history_object& oh = create<operation_history_object>( [this,&op]( operation_history_object& h ) {
      h.op         = op;
      h.trx_num    = _current_trx_num;
      h.op_in_trx  = _current_op_in_trx;
      h.virtual_op = _current_virtual_op++;
   });
   return oh.get_id();
}

void database::set_applied_operation_result( operation_history_id_type op_id, const operation_result& result )
{
   modify( get( op_id ), [&result]( operation_history_object& h ) {
      h.result = result;
   });
}

vector<operation_history_object> database::get_operation_history()const
{
   vector<operation_history_object> history;
   const auto& idx = get_index_type< primary_index<operation_history_index> >().indices();
   history.reserve( idx.size() );
   for( const auto& oh : idx )
      history.push_back( oh );
   return history;
}

} }

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
#include <aegis/chain/global_property_object.hpp>
#include <aegis/chain/node_property_object.hpp>
#include <aegis/chain/account_object.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/operation_history_object.hpp>
#include <aegis/chain/genesis_state.hpp>
#include <aegis/chain/evaluator.hpp>
#include <aegis/chain/value_receiver.hpp>

#include <aegis/db/object_database.hpp>

#include <aegis/protocol/transaction.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace aegis { namespace chain {
   using aegis::db::abstract_object;
   using aegis::db::object;

   /**
    *   @class database
    *   @brief tracks the ledger state in an extensible manner
    *
    *   Every change goes through push_transaction(), which applies all operations of a
    *   transaction inside one undo session.  Either the whole transaction applies or,
    *   on any exception, none of it does.
    *
    *   The database is not thread safe; callers serialize access.
    */
   class database : public db::object_database
   {
      public:
         //////////////////// db_management.cpp ////////////////////

         database();
         ~database();

         enum validation_steps
         {
            skip_nothing                = 0,
            skip_transaction_signatures = 1 << 1,  ///< used by trusted local callers and tests
         };

         /**
          * @brief Open a database, initializing it from the genesis state
          *
          * @param genesis_loader A callable object which returns the genesis state to initialize a new database
          */
         void open( const std::function<genesis_state_type()>& genesis_loader );

         /**
          * @brief Drops all state.  The database must be opened again before use.
          */
         void close();

         //////////////////// db_transaction.cpp ////////////////////

         /**
          * Validates, authorizes and applies @p trx atomically.
          *
          * May be called again from a value_receiver while a transaction is being applied; the nested
          * transaction then becomes part of the outer one and is undone with it.
          */
         processed_transaction push_transaction( const signed_transaction& trx, uint32_t skip = skip_nothing );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         /**
          *  This method is used to track applied operations during the evaluation of a transaction.
          *  Virtual operations pushed by evaluators land in the history right after the operation
          *  that caused them.
          *
          *  @return the id of the history entry
          */
         operation_history_id_type push_applied_operation( const operation& op );
         void set_applied_operation_result( operation_history_id_type op_id, const operation_result& r );

         /// All history entries, oldest first
         vector<operation_history_object> get_operation_history()const;

         node_property_object& node_properties();
         const node_property_object& get_node_properties()const;

         uint32_t get_skip_flags()const { return get_node_properties().skip_flags; }

         //////////////////// db_getter.cpp ////////////////////

         const chain_id_type&                   get_chain_id()const;
         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const chain_parameters&                get_chain_parameters()const;
         account_id_type                        get_treasury_account()const;

         const account_object* find_account_by_name( const string& name )const;
         const account_object& get_account_by_name( const string& name )const;

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance
          * @param owner Account whose balance should be retrieved
          * @return owner's balance, zero when the account never held value
          */
         share_type get_balance( account_id_type owner )const;

         /**
          * @brief Adjust a particular account's balance
          * @param account ID of account whose balance should be adjusted
          * @param delta Amount to adjust balance by; the result may not be negative
          */
         void adjust_balance( account_id_type account, share_type delta );

         /**
          * @brief Credits @p amount to @p to and notifies its value_receiver, if any
          *
          * This is the only way value reaches an account after genesis.  If the receiver
          * rejects the value, value_transfer_failed naming @p to is thrown.
          */
         void push_value( account_id_type to, share_type amount );

         /// Sum of all balances plus all value locked in escrows
         share_type get_total_supply()const;

         void register_value_receiver( account_id_type account, std::shared_ptr<value_receiver> receiver );
         void unregister_value_receiver( account_id_type account );

         //////////////////// db_escrow.cpp ////////////////////

         const escrow_object* find_escrow( const task_id_type& task_id )const;
         /// @return the escrow of @p task_id, or a default record with status uninitialized
         escrow_object        get_escrow( const task_id_type& task_id )const;
         /// @return the verifiers in creation order; empty when absent or finalized
         vector<account_id_type> get_escrow_verifiers( const task_id_type& task_id )const;
         const escrow_verifier_object* find_escrow_verifier( escrow_id_type escrow, account_id_type verifier )const;
         bool has_escrow_approval( const task_id_type& task_id, account_id_type verifier, escrow_path path )const;

         /**
          * Pays out @p escrow along @p path and makes it terminal.
          *
          * The escrow is marked released or refunded with a zero amount before any value moves.
          * The principal goes to the payee (release) or the depositor (refund), the marketplace
          * fee to the treasury, and the verifier fee is split between the verifiers that approved
          * @p path in verifier-list order.  Afterwards the escrow's verifier objects are removed.
          */
         void finalize_escrow( const escrow_object& escrow, escrow_path path );

         /// True while finalize_escrow() is moving value
         bool is_escrow_payout_in_progress()const { return _escrow_payout_in_progress; }

         //////////////////// db_init.cpp ////////////////////

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();

         //////////////////// db_genesis.cpp ////////////////////

         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

      private:
         processed_transaction _apply_transaction( const signed_transaction& trx );

         vector< std::unique_ptr<op_evaluator> >  _operation_evaluators;

         node_property_object              _node_property_object;

         flat_map< account_id_type, std::shared_ptr<value_receiver> > _value_receivers;

         bool                              _escrow_payout_in_progress = false;

         uint32_t                          _current_trx_num      = 0;
         uint16_t                          _current_op_in_trx    = 0;
         uint16_t                          _current_virtual_op   = 0;
   };

} }

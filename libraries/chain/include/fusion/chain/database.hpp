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

#include <fusion/chain/global_property_object.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/fill_object.hpp>
#include <fusion/chain/resolver_object.hpp>
#include <fusion/chain/pending_transfer_object.hpp>
#include <fusion/chain/destination_chain_object.hpp>
#include <fusion/chain/account_balance_object.hpp>
#include <fusion/chain/genesis_state.hpp>
#include <fusion/chain/evaluator.hpp>

#include <fusion/protocol/fee.hpp>

#include <fusion/db/object_database.hpp>
#include <fusion/db/object.hpp>
#include <fusion/db/simple_index.hpp>

#include <fc/log/logger.hpp>

#include <functional>

namespace fusion { namespace chain {
   using fusion::db::abstract_object;
   using fusion::db::object;
   class op_evaluator;

   /// Counters reported by database::get_engine_statistics
   struct engine_statistics
   {
      time_point_sec time;
      uint64_t       orders_created   = 0;
      uint64_t       orders_completed = 0;
      uint64_t       orders_cancelled = 0;
      uint64_t       orders_failed    = 0;
      share_type     total_volume;
      uint64_t       active_orders      = 0;
      uint64_t       pending_transfers  = 0;
      uint64_t       enabled_resolvers  = 0;
   };

   /**
    *   @class database
    *   @brief tracks the settlement engine state in an extensible manner
    *
    *   Every change goes through push_operation() or advance_time(), each of which runs inside an undo
    *   session so that a failure leaves no trace.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Open a database, creating a new one if necessary
          *
          * Opens a database in the specified directory. If no initialized database is found, genesis_loader is called
          * and its return value is used as the genesis state when initializing the new database
          *
          * genesis_loader will not be called if an existing database is found.
          *
          * @param data_dir Path to open or create database in
          * @param genesis_loader A callable object which returns the genesis state to initialize new databases on
          */
         void open( const fc::path& data_dir, std::function<genesis_state_type()> genesis_loader );

         /**
          * @brief wipe Delete database from disk
          *
          * Will close the database before wiping. Database will be closed when this function returns.
          */
         void wipe( const fc::path& data_dir );
         /// Flushes the state to the data directory the database was opened from
         void close();

         //////////////////// db_init.cpp ////////////////////
         /// Reset the object graph in-memory
         void initialize_indexes();
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );
      private:
         void initialize_evaluators();
         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < static_cast<int64_t>(_operation_evaluators.size()),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         //////////////////// db_getter.cpp ////////////////////
      public:
         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const engine_parameters&               get_parameters()const;

         time_point_sec head_time()const;

         /// Returns the order with its stage refreshed to the current time
         const order_object&            get_order( order_id_type id );
         vector<fill_object>            get_fills( order_id_type order )const;
         const order_object*            find_order_by_hashlock( const hashlock_type& hashlock )const;
         /// Orders @p party created or receives, ordered by id
         vector<order_object>           get_orders_by_party( const address_type& party )const;
         /// Orders that are not in a terminal status
         vector<order_object>           get_active_orders()const;
         vector<resolver_object>        get_resolvers_by_priority()const;
         const resolver_object*         find_resolver( const address_type& resolver )const;
         const destination_chain_object* find_destination_chain( const chain_id_type& chain_id )const;
         const pending_transfer_object* find_pending_transfer( uint64_t sequence )const;
         const pending_transfer_object& get_pending_transfer( uint64_t sequence )const;
         /// Total amount released to @p owner in @p denom
         asset                          get_released_balance( const address_type& owner, const string& denom )const;
         engine_statistics              get_engine_statistics()const;

         /// The stage of @p o at the current time, without persisting it
         order_stage current_stage( const order_object& o )const;
         /// True if @p addr is on the order's whitelist or an enabled registered resolver
         bool is_privileged_resolver( const order_object& o, const address_type& addr )const;
         /// True if @p addr may settle @p o (withdraw it or fill it) at the current time
         bool can_withdraw( const order_object& o, const address_type& addr )const;
         /**
          * True if @p caller may cancel @p o at the current time. Without a caller, true if anyone at all
          * may cancel it.
          */
         bool can_cancel( const order_object& o, const optional<address_type>& caller = optional<address_type>() )const;

         /// Fee and payout of settling @p o by @p settler
         settlement_fee compute_fee( const order_object& o, const address_type& settler )const;

         //////////////////// db_balance.cpp ////////////////////
      public:
         /**
          * @brief Instruct the host ledger to release escrowed funds
          *
          * Emits a funds_released_operation and adds @p amount to the released balance of @p to.
          * A zero amount is skipped.
          */
         void release_funds( const order_object& o, const address_type& to, const asset& amount, release_reason reason );
         /// Returns a posted safety deposit to its depositor
         void return_safety_deposit( const order_object& o );
         /// Releases a settlement fee to the settler, or to the treasury when the receiver settles itself
         void release_settlement_fee( const order_object& o, const address_type& settler, share_type fee );

         //////////////////// db_update.cpp ////////////////////
      public:
         /**
          * Moves the engine clock to @p new_time, which may not lie in the past. Pending transfers that timed out
          * are failed and the stages of all orders are brought up to date.
          */
         void advance_time( time_point_sec new_time );

         /// Persists the current stage of @p o and returns it. Terminal orders are left alone.
         order_stage refresh_stage( const order_object& o );

         /// Finalizes the cross-chain transfer of @p transfer and removes it
         void finalize_transfer( const pending_transfer_object& transfer, ack_outcome outcome );

         /// Moves @p o to a terminal status and updates the engine counters
         void set_terminal_status( const order_object& o, order_status status );

      private:
         void clear_expired_transfers();
         void update_order_stages();

         //////////////////// db_operation.cpp ////////////////////
      public:
         /**
          * Validates and applies @p op inside an undo session. On failure every change is undone and the
          * exception propagates; on success the changes are kept.
          */
         operation_result push_operation( const operation& op );

         /// Virtual operations emitted by the engine since the last clear_applied_operations()
         const vector<operation>& get_applied_operations()const { return _applied_ops; }
         void clear_applied_operations() { _applied_ops.clear(); }
         void push_applied_operation( const operation& op );

      private:
         operation_result apply_operation( const operation& op );

         vector< std::unique_ptr<op_evaluator> > _operation_evaluators;
         vector<operation>                       _applied_ops;
   };

} }

FC_REFLECT( fusion::chain::engine_statistics,
            (time)(orders_created)(orders_completed)(orders_cancelled)(orders_failed)(total_volume)
            (active_orders)(pending_transfers)(enabled_resolvers) )

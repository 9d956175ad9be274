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
#include <fusion/chain/database.hpp>

#include <fusion/chain/global_property_object.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/fill_object.hpp>
#include <fusion/chain/resolver_object.hpp>
#include <fusion/chain/pending_transfer_object.hpp>
#include <fusion/chain/destination_chain_object.hpp>
#include <fusion/chain/account_balance_object.hpp>

#include <fusion/chain/order_evaluator.hpp>
#include <fusion/chain/fill_evaluator.hpp>
#include <fusion/chain/settlement_evaluator.hpp>
#include <fusion/chain/resolver_evaluator.hpp>
#include <fusion/chain/global_parameters_evaluator.hpp>

#include <fusion/protocol/operations.hpp>

namespace fusion { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );
   register_evaluator<order_create_evaluator>();
   register_evaluator<fill_create_evaluator>();
   register_evaluator<order_withdraw_evaluator>();
   register_evaluator<fill_withdraw_evaluator>();
   register_evaluator<order_cancel_evaluator>();
   register_evaluator<fill_refund_evaluator>();
   register_evaluator<settlement_ack_evaluator>();
   register_evaluator<safety_deposit_post_evaluator>();
   register_evaluator<resolver_register_evaluator>();
   register_evaluator<resolver_update_evaluator>();
   register_evaluator<destination_chain_update_evaluator>();
   register_evaluator<engine_parameters_update_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( FUSION_MAX_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<order_index> >();
   add_index< primary_index<fill_index> >();
   add_index< primary_index<resolver_index> >();
   add_index< primary_index<pending_transfer_index> >();
   add_index< primary_index<destination_chain_index> >();

   //Implementation object indexes
   add_index< primary_index<simple_index<global_property_object        >> >();
   add_index< primary_index<simple_index<dynamic_global_property_object>> >();
   add_index< primary_index<account_balance_index> >();
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   genesis_state.validate();

   _undo_db.disable();

   create<global_property_object>( [&genesis_state]( global_property_object& p ) {
      p.parameters = genesis_state.initial_parameters;
   });
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
   });

   for( const auto& r : genesis_state.initial_resolvers )
   {
      create<resolver_object>( [&r,&genesis_state]( resolver_object& o ) {
         o.resolver         = r.resolver;
         o.priority         = r.priority;
         o.fee_discount_bps = r.fee_discount_bps;
         o.enabled          = r.enabled;
         o.registered       = genesis_state.initial_timestamp;
      });
   }

   for( const auto& c : genesis_state.initial_destination_chains )
   {
      create<destination_chain_object>( [&c]( destination_chain_object& o ) {
         o.chain_id           = c.chain_id;
         o.name               = c.name;
         o.channel            = c.channel;
         o.is_active          = c.is_active;
         o.fee_multiplier_bps = c.fee_multiplier_bps;
      });
   }

   _undo_db.enable();
   ilog( "Initialized engine at ${t} with ${r} resolvers and ${c} destination chains",
         ("t",genesis_state.initial_timestamp)("r",genesis_state.initial_resolvers.size())
         ("c",genesis_state.initial_destination_chains.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }

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
#include <fusion/chain/resolver_evaluator.hpp>

namespace fusion {
   namespace chain {

      void_result resolver_register_evaluator::do_evaluate( const resolver_register_operation& o )
      { try {
         const database& d = db();
         FUSION_ASSERT( o.admin == d.get_parameters().admin, resolver_register_unauthorized,
                        "${a} is not the engine admin", ("a",o.admin) );
         FUSION_ASSERT( d.find_resolver( o.resolver ) == nullptr, resolver_register_already_registered,
                        "Resolver ${r} is already registered", ("r",o.resolver) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      object_id_type resolver_register_evaluator::do_apply( const resolver_register_operation& o )
      { try {
         database& d = db();
         const auto now = d.head_time();
         const auto& resolver = d.create<resolver_object>( [&o,now]( resolver_object& r ) {
            r.resolver         = o.resolver;
            r.priority         = o.priority;
            r.fee_discount_bps = o.fee_discount_bps;
            r.enabled          = o.enabled;
            r.registered       = now;
         });
         ilog( "Resolver ${r} registered with priority ${p}", ("r",o.resolver)("p",o.priority) );
         return resolver.id;
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result resolver_update_evaluator::do_evaluate( const resolver_update_operation& o )
      { try {
         const database& d = db();
         FUSION_ASSERT( o.admin == d.get_parameters().admin, resolver_update_unauthorized,
                        "${a} is not the engine admin", ("a",o.admin) );
         resolver_obj = d.find_resolver( o.resolver );
         FUSION_ASSERT( resolver_obj != nullptr, resolver_update_unknown_resolver,
                        "Resolver ${r} is not registered", ("r",o.resolver) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result resolver_update_evaluator::do_apply( const resolver_update_operation& o )
      { try {
         db().modify( *resolver_obj, [&o]( resolver_object& r ) {
            if( o.priority.valid() )
               r.priority = *o.priority;
            if( o.fee_discount_bps.valid() )
               r.fee_discount_bps = *o.fee_discount_bps;
            if( o.enabled.valid() )
               r.enabled = *o.enabled;
         });
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result destination_chain_update_evaluator::do_evaluate( const destination_chain_update_operation& o )
      { try {
         const database& d = db();
         FUSION_ASSERT( o.admin == d.get_parameters().admin, destination_chain_update_unauthorized,
                        "${a} is not the engine admin", ("a",o.admin) );
         chain_obj = d.find_destination_chain( o.chain_id );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      object_id_type destination_chain_update_evaluator::do_apply( const destination_chain_update_operation& o )
      { try {
         database& d = db();
         auto update = [&o]( destination_chain_object& c ) {
            c.chain_id           = o.chain_id;
            c.name               = o.name;
            c.channel            = o.channel;
            c.is_active          = o.is_active;
            c.fee_multiplier_bps = o.fee_multiplier_bps;
         };
         if( chain_obj == nullptr )
            chain_obj = &d.create<destination_chain_object>( update );
         else
            d.modify( *chain_obj, update );

         ilog( "Destination chain ${c} over channel ${ch} is ${state}",
               ("c",o.chain_id)("ch",o.channel)("state",o.is_active ? "active" : "inactive") );
         return chain_obj->id;
      } FC_CAPTURE_AND_RETHROW( (o) ) }

   } // namespace chain
} // namespace fusion

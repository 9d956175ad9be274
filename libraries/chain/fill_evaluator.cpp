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
#include <fusion/chain/fill_evaluator.hpp>

#include <fusion/protocol/secret.hpp>

#include <algorithm>

namespace fusion {
   namespace chain {

      void_result fill_create_evaluator::do_evaluate( const fill_create_operation& o )
      { try {
         database& d = db();
         order_obj = &d.get( o.order );
         const order_stage stage = d.refresh_stage( *order_obj );

         FUSION_ASSERT( order_obj->allow_partial_fills, fill_create_partial_fills_disabled,
                        "Order ${o} does not accept partial fills", ("o",o.order) );
         FUSION_ASSERT( order_obj->status == order_status::open, fill_create_order_not_open,
                        "Order ${o} is ${s}", ("o",o.order)("s",order_obj->status) );
         FUSION_ASSERT( stage != order_stage::pending, fill_create_order_not_final,
                        "Order ${o} is still in its finality period", ("o",o.order) );
         FUSION_ASSERT( !is_cancellation_stage( stage ), fill_create_order_expired,
                        "timelock expired", ("o",o.order)("stage",stage) );
         FUSION_ASSERT( d.can_withdraw( *order_obj, o.filler ), fill_create_unauthorized,
                        "${f} may not fill order ${o} during stage ${s}", ("f",o.filler)("o",o.order)("s",stage) );

         FUSION_ASSERT( o.amount >= order_obj->min_fill_amount, fill_create_amount_below_minimum,
                        "Fill amount ${a} is below the minimum of ${m}", ("a",o.amount)("m",order_obj->min_fill_amount) );
         FUSION_ASSERT( o.amount <= order_obj->remaining_amount, fill_create_amount_exceeds_remaining,
                        "Fill amount ${a} exceeds the remaining ${r}", ("a",o.amount)("r",order_obj->remaining_amount) );

         if( order_obj->secret_policy == secret_policy_type::per_fill )
            FUSION_ASSERT( o.hashlock.valid(), fill_create_hashlock_mismatch,
                           "Order ${o} requires a hashlock on every fill", ("o",o.order) );
         else
            FUSION_ASSERT( !o.hashlock.valid(), fill_create_hashlock_mismatch,
                           "Fills of order ${o} share the order's hashlock", ("o",o.order) );

         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      object_id_type fill_create_evaluator::do_apply( const fill_create_operation& o )
      { try {
         database& d = db();
         const auto now = d.head_time();

         const fill_object& fill = d.create<fill_object>( [&o,now]( fill_object& f ) {
            f.order    = o.order;
            f.filler   = o.filler;
            f.amount   = o.amount;
            f.status   = fill_status::pending;
            f.created  = now;
            f.hashlock = o.hashlock;
         });

         d.modify( *order_obj, [&o]( order_object& obj ) {
            obj.remaining_amount -= o.amount;
            obj.filled_amount    += o.amount;
            ++obj.fill_count;
            if( obj.remaining_amount == 0 )
               obj.status = order_status::fully_committed;
         });

         ilog( "Fill ${f} of ${a} committed to order ${o} by ${filler}, ${r} remaining",
               ("f",fill.id)("a",o.amount)("o",o.order)("filler",o.filler)("r",order_obj->remaining_amount) );
         return fill.id;
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result fill_withdraw_evaluator::do_evaluate( const fill_withdraw_operation& o )
      { try {
         database& d = db();
         fill_obj  = &d.get( o.fill );
         order_obj = &d.get( fill_obj->order );
         const order_stage stage = d.refresh_stage( *order_obj );

         FUSION_ASSERT( o.caller == order_obj->receiver, fill_withdraw_unauthorized,
                        "Only the receiver ${r} may withdraw fill ${f}", ("r",order_obj->receiver)("f",o.fill) );
         FUSION_ASSERT( !order_obj->is_terminal(), fill_withdraw_order_terminal,
                        "Order ${o} is ${s}", ("o",order_obj->id)("s",order_obj->status) );
         FUSION_ASSERT( !is_cancellation_stage( stage ), fill_withdraw_order_expired,
                        "timelock expired", ("o",order_obj->id)("stage",stage) );
         FUSION_ASSERT( fill_obj->status == fill_status::pending, fill_withdraw_fill_not_pending,
                        "Fill ${f} is ${s}", ("f",o.fill)("s",fill_obj->status) );

         validate_secret_size( o.secret, d.get_parameters().max_preimage_size );
         const auto& hashlock = order_obj->settlement_hashlock( fill_obj->hashlock );
         FUSION_ASSERT( verify_secret( o.secret, hashlock ), fill_withdraw_invalid_secret,
                        "Provided secret does not match the hashlock of fill ${f}", ("f",o.fill) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result fill_withdraw_evaluator::do_apply( const fill_withdraw_operation& o )
      { try {
         database& d = db();
         const fill_object& fill = *fill_obj;
         const order_object& order = *order_obj;

         d.modify( fill, [&o]( fill_object& f ) {
            f.status          = fill_status::completed;
            f.revealed_secret = o.secret;
         });
         if( order.secret_policy == secret_policy_type::per_order && !order.revealed_secret.valid() )
            d.modify( order, [&o]( order_object& obj ) {
               obj.revealed_secret = o.secret;
            });

         // the receiver is paid from the filler's funds, the filler takes the matching share of the escrow
         d.release_funds( order, order.receiver, order.amount( fill.amount ), release_reason::fill_payout );
         d.release_funds( order, fill.filler, order.amount( fill.amount ), release_reason::fill_settlement );

         if( order.remaining_amount == 0 )
         {
            const auto fills = d.get_fills( order.id );
            const bool all_completed = std::all_of( fills.begin(), fills.end(), []( const fill_object& f ) {
               return f.status == fill_status::completed;
            });
            if( all_completed )
            {
               d.return_safety_deposit( order );
               d.modify( order, [&o]( order_object& obj ) {
                  obj.settled_by = o.caller;
               });
               d.set_terminal_status( order, order_status::completed );
               ilog( "Order ${o} completed through ${n} fills", ("o",order.id)("n",fills.size()) );
            }
         }

         ilog( "Fill ${f} of order ${o} withdrawn: ${a} to ${r}",
               ("f",fill.id)("o",order.id)("a",fill.amount)("r",order.receiver) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result fill_refund_evaluator::do_evaluate( const fill_refund_operation& o )
      { try {
         database& d = db();
         fill_obj  = &d.get( o.fill );
         order_obj = &d.get( fill_obj->order );
         d.refresh_stage( *order_obj );

         const bool expired = order_obj->status == order_status::cancelled
                              || order_obj->status == order_status::failed
                              || is_cancellation_stage( compute_stage( d.head_time(), order_obj->boundaries ) );
         FUSION_ASSERT( expired, fill_refund_order_not_expired,
                        "Order ${o} has not expired", ("o",order_obj->id) );
         FUSION_ASSERT( o.caller == fill_obj->filler, fill_refund_unauthorized,
                        "Only the filler ${f} may refund fill ${id}", ("f",fill_obj->filler)("id",o.fill) );
         FUSION_ASSERT( fill_obj->status == fill_status::pending, fill_refund_fill_not_pending,
                        "Fill ${f} is ${s}", ("f",o.fill)("s",fill_obj->status) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result fill_refund_evaluator::do_apply( const fill_refund_operation& o )
      { try {
         database& d = db();
         const fill_object& fill = *fill_obj;
         const order_object& order = *order_obj;

         d.release_funds( order, fill.filler, order.amount( fill.amount ), release_reason::fill_refund );
         d.modify( fill, []( fill_object& f ) {
            f.status = fill_status::refunded;
         });

         if( !order.is_terminal() )
         {
            const share_type amount = fill.amount;
            d.modify( order, [amount]( order_object& obj ) {
               obj.remaining_amount += amount;
               obj.filled_amount    -= amount;
               if( obj.status == order_status::fully_committed )
                  obj.status = order_status::open;
            });
         }
         else
         {
            // the cancel already returned the uncommitted remainder, this share of the escrow follows it
            d.release_funds( order, order.sender, order.amount( fill.amount ), release_reason::refund );
            const share_type amount = fill.amount;
            d.modify( order, [amount]( order_object& obj ) {
               obj.refunded_amount += amount;
            });
         }

         ilog( "Fill ${f} of order ${o} refunded: ${a} to ${filler}",
               ("f",fill.id)("o",order.id)("a",fill.amount)("filler",fill.filler) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

   } // namespace chain
} // namespace fusion

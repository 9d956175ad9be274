/*
 * Copyright (c) 2018 jmjatlanta and contributors.
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
#include <fusion/chain/order_evaluator.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/pending_transfer_object.hpp>

#include <fusion/protocol/secret.hpp>

namespace fusion {
   namespace chain {
      namespace detail
      {
         /// Stage checks shared by every settlement path of an order
         template<typename NotFinal, typename Expired>
         void check_settlement_stage( order_stage stage, const order_object& o )
         {
            FUSION_ASSERT( stage != order_stage::pending, NotFinal,
                           "Order ${o} is still in its finality period", ("o",o.id) );
            FUSION_ASSERT( !is_cancellation_stage( stage ), Expired,
                           "timelock expired", ("o",o.id)("stage",stage) );
         }
      } // end of fusion::chain::detail

      void_result order_create_evaluator::do_evaluate( const order_create_operation& o )
      { try {
         const database& d = db();
         const auto& params = d.get_parameters();

         const uint64_t duration = timelock_duration( o.timelock );
         FUSION_ASSERT( duration >= params.min_timelock && duration <= params.max_timelock, invalid_timelock,
                        "Timelock duration ${d} must lie in [${min}, ${max}]",
                        ("d",duration)("min",params.min_timelock)("max",params.max_timelock) );
         boundaries = build_schedule( d.head_time(), o.timelock );
         validate_schedule( boundaries );

         FUSION_ASSERT( o.allowed_resolvers.size() <= params.max_whitelist_size, order_create_whitelist_too_large,
                        "Resolver whitelist exceeds ${max} entries", ("max",params.max_whitelist_size) );

         FUSION_ASSERT( d.find_order_by_hashlock( o.hashlock ) == nullptr, order_create_duplicate_hashlock,
                        "An order with hashlock ${h} already exists", ("h",o.hashlock) );

         if( o.destination.valid() )
         {
            const auto* dest = d.find_destination_chain( o.destination->chain_id );
            FUSION_ASSERT( dest != nullptr && dest->is_active, order_create_unknown_destination,
                           "Destination chain ${c} is not configured or not active", ("c",o.destination->chain_id) );
         }

         if( !o.allow_partial_fills )
            min_fill_amount = o.amount.amount;
         else if( o.min_fill_amount.valid() )
            min_fill_amount = *o.min_fill_amount;
         else
            min_fill_amount = std::max( share_type(1), o.amount.amount / FUSION_DEFAULT_MIN_FILL_DIVISOR );

         if( o.safety_deposit.valid() )
            safety_deposit_amount = o.safety_deposit->amount;
         else if( o.require_safety_deposit )
            safety_deposit_amount = std::max( share_type(1), o.amount.amount / FUSION_DEFAULT_SAFETY_DEPOSIT_DIVISOR );
         else
            safety_deposit_amount = 0;

         fee_bps = o.fee_bps.valid() ? *o.fee_bps : params.protocol_fee_bps;

         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      object_id_type order_create_evaluator::do_apply( const order_create_operation& o )
      { try {
         database& d = db();
         const auto now = d.head_time();

         const order_object& order = d.create<order_object>( [&o,now,this]( order_object& obj ) {
            obj.sender                = o.sender;
            obj.receiver              = o.receiver;
            obj.taker                 = o.taker.valid() ? *o.taker : o.receiver;
            obj.allowed_resolvers     = o.allowed_resolvers;
            obj.total_amount          = o.amount;
            obj.remaining_amount      = o.amount.amount;
            obj.filled_amount         = 0;
            obj.min_fill_amount       = min_fill_amount;
            obj.allow_partial_fills   = o.allow_partial_fills;
            obj.fee_bps               = fee_bps;
            obj.safety_deposit_amount = safety_deposit_amount;
            obj.hashlock              = o.hashlock;
            obj.secret_policy         = o.secret_policy;
            obj.created               = now;
            obj.boundaries            = boundaries;
            obj.stage                 = compute_stage( now, boundaries );
            obj.next_stage_change     = next_stage_change( now, boundaries );
            obj.status                = order_status::open;
            obj.destination           = o.destination;
         });

         d.modify( d.get_dynamic_global_properties(), [&o]( dynamic_global_property_object& dgp ) {
            ++dgp.orders_created;
            dgp.total_volume += o.amount.amount;
         });

         ilog( "Order ${id} created by ${s} for ${r}: ${a}", ("id",order.id)("s",o.sender)("r",o.receiver)("a",o.amount) );
         return order.id;
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result order_withdraw_evaluator::do_evaluate( const order_withdraw_operation& o )
      { try {
         database& d = db();
         order_obj = &d.get( o.order );
         const order_stage stage = d.refresh_stage( *order_obj );

         FUSION_ASSERT( order_obj->status != order_status::in_flight, order_withdraw_transfer_in_flight,
                        "Order ${o} is already settling on ${c}", ("o",o.order)("c",order_obj->destination) );
         FUSION_ASSERT( !order_obj->is_terminal(), order_withdraw_order_terminal,
                        "Order ${o} is ${s}", ("o",o.order)("s",order_obj->status) );
         FUSION_ASSERT( order_obj->fill_count == 0, order_withdraw_order_has_fills,
                        "Order ${o} has fills and settles through them", ("o",o.order) );
         detail::check_settlement_stage<order_withdraw_order_not_final, order_withdraw_order_expired>( stage, *order_obj );

         validate_secret_size( o.secret, d.get_parameters().max_preimage_size );
         FUSION_ASSERT( verify_secret( o.secret, order_obj->hashlock ), order_withdraw_invalid_secret,
                        "Provided secret does not match the hashlock of order ${o}", ("o",o.order) );

         FUSION_ASSERT( d.can_withdraw( *order_obj, o.withdrawer ), order_withdraw_unauthorized,
                        "${w} may not settle order ${o} during stage ${s}",
                        ("w",o.withdrawer)("o",o.order)("s",stage) );

         if( order_obj->is_cross_chain() )
         {
            destination_obj = d.find_destination_chain( order_obj->destination->chain_id );
            FC_ASSERT( destination_obj != nullptr, "Destination chain ${c} is no longer configured",
                       ("c",order_obj->destination->chain_id) );
         }

         fee = d.compute_fee( *order_obj, o.withdrawer );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      operation_result order_withdraw_evaluator::do_apply( const order_withdraw_operation& o )
      { try {
         database& d = db();
         const order_object& order = *order_obj;

         d.modify( order, [&o]( order_object& obj ) {
            obj.revealed_secret = o.secret;
            obj.settled_by      = o.withdrawer;
         });

         if( order.is_cross_chain() )
         {
            const auto& dgp = d.get_dynamic_global_properties();
            const uint64_t sequence = dgp.next_transfer_sequence;
            d.modify( dgp, []( dynamic_global_property_object& p ) {
               ++p.next_transfer_sequence;
            });

            const auto timeout = d.head_time() + d.get_parameters().ack_timeout_seconds;
            const auto& transfer = d.create<pending_transfer_object>(
               [&order,&o,sequence,timeout,this]( pending_transfer_object& t ) {
                  t.sequence  = sequence;
                  t.order     = order.id;
                  t.chain_id  = order.destination->chain_id;
                  t.channel   = destination_obj->channel;
                  t.recipient = order.destination->recipient;
                  t.amount    = order.amount( fee.payout );
                  t.fee       = order.amount( fee.fee );
                  t.settler   = o.withdrawer;
                  t.timeout   = timeout;
            });

            d.modify( order, [sequence]( order_object& obj ) {
               obj.transfer_sequence = sequence;
               obj.status            = order_status::in_flight;
            });

            ilog( "Order ${o} settling on ${c} with sequence ${s}, payout ${p}",
                  ("o",order.id)("c",order.destination->chain_id)("s",sequence)("p",fee.payout) );
            return transfer.id;
         }

         const share_type settled = order.remaining_amount;
         d.release_funds( order, order.receiver, order.amount( fee.payout ), release_reason::payout );
         d.release_settlement_fee( order, o.withdrawer, fee.fee );
         d.return_safety_deposit( order );

         d.modify( order, [settled]( order_object& obj ) {
            obj.filled_amount   += settled;
            obj.remaining_amount = 0;
         });
         d.set_terminal_status( order, order_status::completed );

         ilog( "Order ${o} settled by ${w}: payout ${p}, fee ${f}",
               ("o",order.id)("w",o.withdrawer)("p",fee.payout)("f",fee.fee) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result order_cancel_evaluator::do_evaluate( const order_cancel_operation& o )
      { try {
         database& d = db();
         order_obj = &d.get( o.order );
         const order_stage stage = d.refresh_stage( *order_obj );

         FUSION_ASSERT( order_obj->status != order_status::completed, order_cancel_order_already_completed,
                        "Order ${o} is already completed", ("o",o.order) );
         FUSION_ASSERT( order_obj->status != order_status::cancelled, order_cancel_order_already_cancelled,
                        "Order ${o} is already cancelled", ("o",o.order) );
         FUSION_ASSERT( order_obj->status != order_status::in_flight, order_cancel_transfer_in_flight,
                        "Order ${o} is settling on another chain", ("o",o.order) );

         if( !d.can_cancel( *order_obj, o.caller ) )
         {
            const bool expired = order_obj->status == order_status::failed
                                 || is_cancellation_stage( compute_stage( d.head_time(), order_obj->boundaries ) );
            FUSION_ASSERT( expired, order_cancel_order_not_expired,
                           "Order ${o} can not be cancelled during stage ${s}", ("o",o.order)("s",stage) );
            FC_THROW_EXCEPTION( order_cancel_unauthorized, "${c} may not cancel order ${o} during stage ${s}",
                                ("c",o.caller)("o",o.order)("s",stage) );
         }
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result order_cancel_evaluator::do_apply( const order_cancel_operation& o )
      { try {
         database& d = db();
         const order_object& order = *order_obj;
         const share_type refund = order.remaining_amount;

         d.release_funds( order, order.sender, order.amount( refund ), release_reason::refund );
         d.return_safety_deposit( order );

         d.modify( order, [&o,refund]( order_object& obj ) {
            obj.cancelled_by    = o.caller;
            obj.refunded_amount = refund;
         });
         d.set_terminal_status( order, order_status::cancelled );

         ilog( "Order ${o} cancelled by ${c}, ${a} refunded to ${s}",
               ("o",order.id)("c",o.caller)("a",refund)("s",order.sender) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result safety_deposit_post_evaluator::do_evaluate( const safety_deposit_post_operation& o )
      { try {
         database& d = db();
         order_obj = &d.get( o.order );
         d.refresh_stage( *order_obj );

         FUSION_ASSERT( !order_obj->is_terminal() && order_obj->status != order_status::in_flight,
                        safety_deposit_post_order_not_open, "Order ${o} is ${s}", ("o",o.order)("s",order_obj->status) );
         FUSION_ASSERT( order_obj->safety_deposit_amount > 0, safety_deposit_post_not_required,
                        "Order ${o} does not require a safety deposit", ("o",o.order) );
         FUSION_ASSERT( !order_obj->deposit.valid(), safety_deposit_post_already_posted,
                        "A safety deposit was already posted for order ${o} by ${d}",
                        ("o",o.order)("d",order_obj->deposit->depositor) );
         FC_ASSERT( o.amount.denom == order_obj->total_amount.denom,
                    "Safety deposit must be paid in ${d}", ("d",order_obj->total_amount.denom) );
         FUSION_ASSERT( o.amount.amount >= order_obj->safety_deposit_amount, safety_deposit_post_insufficient_amount,
                        "Safety deposit of ${a} is below the required ${r}",
                        ("a",o.amount.amount)("r",order_obj->safety_deposit_amount) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result safety_deposit_post_evaluator::do_apply( const safety_deposit_post_operation& o )
      { try {
         db().modify( *order_obj, [&o]( order_object& obj ) {
            posted_deposit deposit;
            deposit.depositor = o.depositor;
            deposit.amount    = o.amount;
            obj.deposit = deposit;
         });
         ilog( "Safety deposit of ${a} posted for order ${o} by ${d}", ("a",o.amount)("o",o.order)("d",o.depositor) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

   } // namespace chain
} // namespace fusion

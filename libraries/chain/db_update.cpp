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

namespace fusion { namespace chain {

void database::advance_time( time_point_sec new_time )
{ try {
   const auto now = head_time();
   FUSION_ASSERT( new_time >= now, time_moved_backwards, "Engine time can not move backwards",
                  ("now",now)("new_time",new_time) );

   auto session = _undo_db.start_undo_session();
   const auto applied_size = _applied_ops.size();
   try {
      modify( get_dynamic_global_properties(), [new_time]( dynamic_global_property_object& dgp ) {
         dgp.time = new_time;
      });
      clear_expired_transfers();
      update_order_stages();
      session.commit();
   } catch( const fc::exception& ) {
      _applied_ops.resize( applied_size );
      throw;
   }
} FC_CAPTURE_AND_RETHROW( (new_time) ) }

void database::clear_expired_transfers()
{ try {
   const auto now = head_time();
   const auto& index = get_index_type<pending_transfer_index>().indices().get<by_timeout>();
   while( !index.empty() && index.begin()->timeout <= now )
   {
      const pending_transfer_object& transfer = *index.begin();
      wlog( "Cross-chain transfer ${s} of order ${o} timed out at ${t}",
            ("s",transfer.sequence)("o",transfer.order)("t",transfer.timeout) );
      finalize_transfer( transfer, ack_outcome::timeout );
   }
} FC_CAPTURE_AND_RETHROW() }

void database::update_order_stages()
{
   const auto now = head_time();
   const auto& index = get_index_type<order_index>().indices().get<by_next_stage_change>();
   // refresh_stage moves every order it touches past now, so the loop ends
   while( !index.empty() && index.begin()->next_stage_change <= now )
      refresh_stage( *index.begin() );
}

order_stage database::refresh_stage( const order_object& o )
{
   if( o.is_terminal() )
   {
      if( o.next_stage_change != time_point_sec::maximum() )
         modify( o, []( order_object& obj ) { obj.next_stage_change = time_point_sec::maximum(); } );
      return o.stage;
   }

   const auto now = head_time();
   const auto stage = compute_stage( now, o.boundaries );
   const auto next = next_stage_change( now, o.boundaries );
   if( stage != o.stage || next != o.next_stage_change )
   {
      dlog( "Order ${o} moves from stage ${from} to ${to}", ("o",o.id)("from",o.stage)("to",stage) );
      modify( o, [stage,next]( order_object& obj ) {
         obj.stage = stage;
         obj.next_stage_change = next;
      });
   }
   return stage;
}

void database::set_terminal_status( const order_object& o, order_status status )
{
   FC_ASSERT( chain::is_terminal( status ), "Status ${s} is not terminal", ("s",status) );
   // a failed order may still be refunded, every other terminal status is final
   FC_ASSERT( !o.is_terminal() || ( o.status == order_status::failed && status == order_status::cancelled ),
              "Order ${o} is already ${s}", ("o",o.id)("s",o.status) );

   const auto previous = o.status;
   modify( o, [status]( order_object& obj ) {
      obj.status = status;
      obj.next_stage_change = time_point_sec::maximum();
   });
   modify( get_dynamic_global_properties(), [status,previous]( dynamic_global_property_object& dgp ) {
      if( previous == order_status::failed )
         --dgp.orders_failed;
      switch( status )
      {
         case order_status::completed: ++dgp.orders_completed; break;
         case order_status::cancelled: ++dgp.orders_cancelled; break;
         case order_status::failed:    ++dgp.orders_failed;    break;
         default: break;
      }
   });
}

void database::finalize_transfer( const pending_transfer_object& transfer, ack_outcome outcome )
{ try {
   const order_object& o = get( transfer.order );
   const uint64_t sequence = transfer.sequence;

   if( outcome == ack_outcome::success )
   {
      release_settlement_fee( o, transfer.settler, transfer.fee.amount );
      return_safety_deposit( o );
      modify( o, []( order_object& obj ) {
         obj.filled_amount   += obj.remaining_amount;
         obj.remaining_amount = 0;
      });
      set_terminal_status( o, order_status::completed );
      ilog( "Cross-chain transfer ${s} of order ${o} completed", ("s",sequence)("o",o.id) );
   }
   else
   {
      set_terminal_status( o, order_status::failed );
      ilog( "Cross-chain transfer ${s} of order ${o} failed: ${r}", ("s",sequence)("o",o.id)("r",outcome) );
   }

   remove( transfer );
} FC_CAPTURE_AND_RETHROW( (outcome) ) }

} }

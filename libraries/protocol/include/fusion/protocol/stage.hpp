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
#include <fusion/protocol/types.hpp>

namespace fusion { namespace protocol {

   /**
    * Resolution stages of an order, in the order they occur. Each stage decides who may withdraw and
    * who may cancel; see database::can_withdraw and database::can_cancel.
    */
   enum class order_stage : uint8_t
   {
      pending              = 0, ///< finality period, nobody may act
      taker_exclusive      = 1,
      private_resolver     = 2,
      public_resolver      = 3,
      private_cancellation = 4,
      public_cancellation  = 5
   };

   inline bool is_cancellation_stage( order_stage s )
   {
      return s == order_stage::private_cancellation || s == order_stage::public_cancellation;
   }

   /** The order is in @ref stage until (not including) @ref ends_at */
   struct stage_boundary
   {
      stage_boundary() = default;
      stage_boundary( time_point_sec e, order_stage s ):ends_at(e),stage(s){}

      time_point_sec ends_at;
      order_stage    stage = order_stage::pending;
   };

   using stage_schedule = vector<stage_boundary>;

   /// Every duration is in seconds and must be non-zero
   struct stage_durations
   {
      uint32_t finality_delay                = 0;
      uint32_t taker_exclusive_duration      = 0;
      uint32_t private_resolver_duration     = 0;
      uint32_t public_resolver_duration      = 0;
      uint32_t private_cancellation_duration = 0;

      uint64_t total()const;
      void     validate()const;
   };

   /// An order that can be settled by anyone until it expires, and refunded afterwards
   struct single_timelock
   {
      uint32_t seconds = 0;
   };

   using timelock_type = static_variant<single_timelock, stage_durations>;

   /**
    * Returns the stage of the first boundary that ends after @p now, or public_cancellation once every
    * boundary has passed. At exactly ends_at the following stage applies.
    */
   order_stage compute_stage( time_point_sec now, const stage_schedule& boundaries );

   /// The time at which the stage computed for @p now changes, or time_point_sec::maximum()
   time_point_sec next_stage_change( time_point_sec now, const stage_schedule& boundaries );

   /// Throws invalid_timelock unless the boundaries are non-empty and strictly increasing
   void validate_schedule( const stage_schedule& boundaries );

   stage_schedule build_schedule( time_point_sec created, const stage_durations& durations );
   stage_schedule build_schedule( time_point_sec created, const single_timelock& timelock );
   stage_schedule build_schedule( time_point_sec created, const timelock_type& timelock );

   /// Total lock duration in seconds, checked against the engine's min/max timelock
   uint64_t timelock_duration( const timelock_type& timelock );

} } // fusion::protocol

FC_REFLECT_ENUM( fusion::protocol::order_stage,
                 (pending)
                 (taker_exclusive)
                 (private_resolver)
                 (public_resolver)
                 (private_cancellation)
                 (public_cancellation) )
FC_REFLECT( fusion::protocol::stage_boundary, (ends_at)(stage) )
FC_REFLECT( fusion::protocol::stage_durations,
            (finality_delay)
            (taker_exclusive_duration)
            (private_resolver_duration)
            (public_resolver_duration)
            (private_cancellation_duration) )
FC_REFLECT( fusion::protocol::single_timelock, (seconds) )
FC_REFLECT_TYPENAME( fusion::protocol::timelock_type )

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
#include <fusion/protocol/stage.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <limits>

namespace fusion { namespace protocol {

uint64_t stage_durations::total()const
{
   return uint64_t(finality_delay) + taker_exclusive_duration + private_resolver_duration
        + public_resolver_duration + private_cancellation_duration;
}

void stage_durations::validate()const
{
   FUSION_ASSERT( finality_delay > 0 && taker_exclusive_duration > 0 && private_resolver_duration > 0
                  && public_resolver_duration > 0 && private_cancellation_duration > 0,
                  invalid_timelock, "Every stage duration must be positive", ("durations",*this) );
}

order_stage compute_stage( time_point_sec now, const stage_schedule& boundaries )
{
   for( const auto& b : boundaries )
      if( now < b.ends_at )
         return b.stage;
   return order_stage::public_cancellation;
}

time_point_sec next_stage_change( time_point_sec now, const stage_schedule& boundaries )
{
   for( const auto& b : boundaries )
      if( now < b.ends_at )
         return b.ends_at;
   return time_point_sec::maximum();
}

void validate_schedule( const stage_schedule& boundaries )
{
   FUSION_ASSERT( !boundaries.empty(), invalid_timelock, "An order needs at least one stage boundary", );
   for( size_t i = 1; i < boundaries.size(); ++i )
   {
      FUSION_ASSERT( boundaries[i-1].ends_at < boundaries[i].ends_at, invalid_timelock,
                     "Stage boundaries must be strictly increasing", ("boundaries",boundaries) );
      FUSION_ASSERT( boundaries[i-1].stage < boundaries[i].stage, invalid_timelock,
                     "Stages must follow each other in order", ("boundaries",boundaries) );
   }
}

namespace {
   time_point_sec add_seconds( time_point_sec t, uint64_t seconds )
   {
      uint64_t result = uint64_t(t.sec_since_epoch()) + seconds;
      FUSION_ASSERT( result < time_point_sec::maximum().sec_since_epoch(), invalid_timelock,
                     "Timelock overflows the time range", ("start",t)("seconds",seconds) );
      return time_point_sec( static_cast<uint32_t>(result) );
   }
}

stage_schedule build_schedule( time_point_sec created, const stage_durations& durations )
{
   durations.validate();
   stage_schedule result;
   result.reserve( 5 );
   auto t = add_seconds( created, durations.finality_delay );
   result.emplace_back( t, order_stage::pending );
   t = add_seconds( t, durations.taker_exclusive_duration );
   result.emplace_back( t, order_stage::taker_exclusive );
   t = add_seconds( t, durations.private_resolver_duration );
   result.emplace_back( t, order_stage::private_resolver );
   t = add_seconds( t, durations.public_resolver_duration );
   result.emplace_back( t, order_stage::public_resolver );
   t = add_seconds( t, durations.private_cancellation_duration );
   result.emplace_back( t, order_stage::private_cancellation );
   return result;
}

stage_schedule build_schedule( time_point_sec created, const single_timelock& timelock )
{
   FUSION_ASSERT( timelock.seconds > 0, invalid_timelock, "Timelock must be positive", );
   // the refund window never closes, so public_cancellation is never reached
   return stage_schedule{ stage_boundary( add_seconds( created, timelock.seconds ), order_stage::public_resolver ),
                          stage_boundary( time_point_sec::maximum(), order_stage::private_cancellation ) };
}

stage_schedule build_schedule( time_point_sec created, const timelock_type& timelock )
{
   if( timelock.is_type<single_timelock>() )
      return build_schedule( created, timelock.get<single_timelock>() );
   return build_schedule( created, timelock.get<stage_durations>() );
}

uint64_t timelock_duration( const timelock_type& timelock )
{
   if( timelock.is_type<single_timelock>() )
      return timelock.get<single_timelock>().seconds;
   return timelock.get<stage_durations>().total();
}

} } // fusion::protocol

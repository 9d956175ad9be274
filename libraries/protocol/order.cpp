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
#include <fusion/protocol/order.hpp>
#include <fusion/protocol/engine_parameters.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace fusion { namespace protocol {

   void destination_info::validate()const
   {
      FUSION_ASSERT( !chain_id.empty() && chain_id.size() <= FUSION_MAX_CHAIN_ID_LENGTH, invalid_address,
                     "Invalid destination chain id", ("chain_id",chain_id) );
      validate_address( recipient, "destination recipient" );
      FUSION_ASSERT( !token.empty() && token.size() <= FUSION_MAX_DENOM_LENGTH, invalid_amount,
                     "Invalid destination token", ("token",token) );
   }

   void order_create_operation::validate()const
   {
      validate_address( sender, "sender" );
      validate_address( receiver, "receiver" );
      if( taker.valid() )
         validate_address( *taker, "taker" );
      amount.validate_positive();

      FUSION_ASSERT( hashlock != hashlock_type(), invalid_hashlock, "Hashlock must be set", );

      if( timelock.is_type<stage_durations>() )
         timelock.get<stage_durations>().validate();
      else
         FUSION_ASSERT( timelock.get<single_timelock>().seconds > 0, invalid_timelock,
                        "Timelock must be positive", );

      if( min_fill_amount.valid() )
      {
         FC_ASSERT( allow_partial_fills, "A minimum fill amount requires partial fills" );
         FUSION_ASSERT( *min_fill_amount > 0 && *min_fill_amount <= amount.amount, invalid_amount,
                        "Minimum fill amount must lie in (0, amount]",
                        ("min_fill_amount",*min_fill_amount)("amount",amount) );
      }
      FC_ASSERT( secret_policy == secret_policy_type::per_order || allow_partial_fills,
                 "A per fill secret policy requires partial fills" );

      if( safety_deposit.valid() )
      {
         safety_deposit->validate_positive();
         FC_ASSERT( safety_deposit->denom == amount.denom, "Safety deposit must be paid in the order's denom" );
      }

      for( const auto& r : allowed_resolvers )
         validate_address( r, "resolver" );

      if( fee_bps.valid() )
         FUSION_ASSERT( *fee_bps <= FUSION_100_PERCENT, invalid_fee, "Fee can not exceed 100%",
                        ("fee_bps",*fee_bps) );

      if( destination.valid() )
      {
         destination->validate();
         FC_ASSERT( !allow_partial_fills, "Cross-chain orders can not be partially filled" );
      }
   }

   void order_withdraw_operation::validate()const
   {
      validate_address( withdrawer, "withdrawer" );
      FUSION_ASSERT( !secret.empty(), invalid_secret_size, "Secret must not be empty", );
   }

   void order_cancel_operation::validate()const
   {
      validate_address( caller, "caller" );
   }

   void safety_deposit_post_operation::validate()const
   {
      validate_address( depositor, "depositor" );
      amount.validate_positive();
   }

} } // fusion::protocol

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::order_create_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::order_withdraw_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::order_cancel_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::safety_deposit_post_operation )

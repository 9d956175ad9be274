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
#include <fusion/protocol/resolver.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace fusion { namespace protocol {

   void resolver_register_operation::validate()const
   {
      validate_address( admin, "admin" );
      validate_address( resolver, "resolver" );
      FUSION_ASSERT( fee_discount_bps <= FUSION_100_PERCENT, invalid_fee, "Fee discount can not exceed 100%",
                     ("fee_discount_bps",fee_discount_bps) );
   }

   void resolver_update_operation::validate()const
   {
      validate_address( admin, "admin" );
      validate_address( resolver, "resolver" );
      FC_ASSERT( priority.valid() || fee_discount_bps.valid() || enabled.valid(), "Nothing to update" );
      if( fee_discount_bps.valid() )
         FUSION_ASSERT( *fee_discount_bps <= FUSION_100_PERCENT, invalid_fee, "Fee discount can not exceed 100%",
                        ("fee_discount_bps",*fee_discount_bps) );
   }

   void destination_chain_update_operation::validate()const
   {
      validate_address( admin, "admin" );
      FUSION_ASSERT( !chain_id.empty() && chain_id.size() <= FUSION_MAX_CHAIN_ID_LENGTH, invalid_address,
                     "Invalid chain id", ("chain_id",chain_id) );
      FC_ASSERT( name.size() <= FUSION_MAX_NAME_LENGTH, "Chain name is too long" );
      FC_ASSERT( !channel.empty() && channel.size() <= FUSION_MAX_CHANNEL_LENGTH, "Invalid channel",
                 ("channel",channel) );
      FUSION_ASSERT( fee_multiplier_bps <= FUSION_100_PERCENT, invalid_fee, "Fee multiplier can not exceed 100%",
                     ("fee_multiplier_bps",fee_multiplier_bps) );
   }

   void engine_parameters_update_operation::validate()const
   {
      validate_address( admin, "admin" );
      new_parameters.validate();
   }

} } // fusion::protocol

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::resolver_register_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::resolver_update_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::destination_chain_update_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::engine_parameters_update_operation )

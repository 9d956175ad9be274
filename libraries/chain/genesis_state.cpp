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
#include <fusion/chain/genesis_state.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace fusion { namespace chain {

void genesis_state_type::validate()const
{
   initial_parameters.validate();

   std::set<address_type> resolvers;
   for( const auto& r : initial_resolvers )
   {
      validate_address( r.resolver, "resolver" );
      FUSION_ASSERT( r.fee_discount_bps <= FUSION_100_PERCENT, invalid_fee,
                     "Resolver fee discount exceeds 100%", ("resolver",r.resolver)("discount",r.fee_discount_bps) );
      FC_ASSERT( resolvers.insert( r.resolver ).second, "Duplicate genesis resolver ${r}", ("r",r.resolver) );
   }

   std::set<chain_id_type> chains;
   for( const auto& c : initial_destination_chains )
   {
      FC_ASSERT( !c.chain_id.empty() && c.chain_id.size() <= FUSION_MAX_CHAIN_ID_LENGTH,
                 "Invalid destination chain id ${c}", ("c",c.chain_id) );
      FC_ASSERT( !c.channel.empty() && c.channel.size() <= FUSION_MAX_CHANNEL_LENGTH,
                 "Invalid channel for destination chain ${c}", ("c",c.chain_id) );
      FUSION_ASSERT( c.fee_multiplier_bps <= FUSION_100_PERCENT, invalid_fee,
                     "Destination fee exceeds 100%", ("chain",c.chain_id) );
      FC_ASSERT( chains.insert( c.chain_id ).second, "Duplicate genesis destination chain ${c}", ("c",c.chain_id) );
   }
}

} } // fusion::chain

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::genesis_state_type::initial_resolver_type )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::genesis_state_type::initial_destination_chain_type )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::genesis_state_type )

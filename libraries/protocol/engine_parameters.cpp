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
#include <fusion/protocol/engine_parameters.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace fusion { namespace protocol {

   void validate_address( const address_type& a, const char* role )
   {
      FUSION_ASSERT( !a.empty(), invalid_address, "The ${r} address must not be empty", ("r",role) );
      FUSION_ASSERT( a.size() <= FUSION_MAX_ADDRESS_LENGTH, invalid_address,
                     "The ${r} address is too long", ("r",role)("address",a) );
   }

   void engine_parameters::validate()const
   {
      validate_address( admin, "admin" );
      validate_address( treasury, "treasury" );
      validate_address( ack_relayer, "ack relayer" );

      FUSION_ASSERT( min_timelock > 0, invalid_parameters, "Minimum timelock must be positive", );
      FUSION_ASSERT( min_timelock <= max_timelock, invalid_parameters,
                     "Minimum timelock must not exceed the maximum timelock",
                     ("min",min_timelock)("max",max_timelock) );
      FUSION_ASSERT( protocol_fee_bps <= FUSION_100_PERCENT, invalid_parameters,
                     "Protocol fee can not exceed 100%", ("fee_bps",protocol_fee_bps) );
      FUSION_ASSERT( ack_timeout_seconds > 0, invalid_parameters, "Ack timeout must be positive", );
      FUSION_ASSERT( max_preimage_size > 0, invalid_parameters, "Maximum preimage size must be positive", );
   }

} } // fusion::protocol

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::engine_parameters )

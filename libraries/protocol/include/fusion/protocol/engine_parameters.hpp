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

   struct engine_parameters
   {
      address_type admin;                    ///< may register resolvers and update these parameters
      address_type treasury     = FUSION_TREASURY_ADDRESS; ///< receives fees when the receiver settles its own order
      address_type ack_relayer;              ///< the only address allowed to deliver settlement acks

      uint32_t min_timelock        = FUSION_DEFAULT_MIN_TIMELOCK;        ///< shortest total lock, in seconds
      uint32_t max_timelock        = FUSION_DEFAULT_MAX_TIMELOCK;        ///< longest total lock, in seconds
      uint16_t protocol_fee_bps    = FUSION_DEFAULT_PROTOCOL_FEE_BPS;    ///< fee of orders that do not set their own
      uint32_t ack_timeout_seconds = FUSION_DEFAULT_ACK_TIMEOUT_SECONDS; ///< a pending transfer times out after this
      uint32_t max_preimage_size   = FUSION_DEFAULT_MAX_PREIMAGE_SIZE;
      uint16_t max_whitelist_size  = FUSION_DEFAULT_MAX_WHITELIST_SIZE;

      void validate()const;
   };

   /// Throws invalid_address unless @p a is non-empty and at most FUSION_MAX_ADDRESS_LENGTH characters
   void validate_address( const address_type& a, const char* role );

} }  // fusion::protocol

FC_REFLECT( fusion::protocol::engine_parameters,
            (admin)
            (treasury)
            (ack_relayer)
            (min_timelock)
            (max_timelock)
            (protocol_fee_bps)
            (ack_timeout_seconds)
            (max_preimage_size)
            (max_whitelist_size)
          )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::engine_parameters )

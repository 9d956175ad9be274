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
#include <fusion/protocol/base.hpp>

namespace fusion { namespace protocol {

   enum class ack_outcome : uint8_t
   {
      success = 0,
      failure = 1,
      timeout = 2
   };

   /**
    * Delivered by the cross-chain messaging layer once the transfer started by an order withdrawal
    * has completed, failed or timed out. Delivery is at least once; acks for a sequence that is no
    * longer pending are ignored.
    */
   struct settlement_ack_operation : public base_operation
   {
      address_type relayer;
      uint64_t     sequence = 0;
      ack_outcome  outcome  = ack_outcome::success;

      void validate()const;
   };

   enum class release_reason : uint8_t
   {
      payout         = 0, ///< settled amount to the receiver
      fee            = 1, ///< settlement fee to the settler or the treasury
      refund         = 2, ///< remaining amount back to the sender
      fill_payout    = 3, ///< fill amount to the receiver
      fill_refund    = 4, ///< fill amount back to the filler
      deposit_return = 5, ///< safety deposit back to its depositor
      fill_settlement = 6 ///< the sender's escrowed share of a withdrawn fill to its filler
   };

   /**
    * @brief virtual op instructing the host ledger to release escrowed funds
    *
    * Emitted by the engine for every fund movement; it is never pushed by users.
    */
   struct funds_released_operation : public base_operation
   {
      funds_released_operation() = default;
      funds_released_operation( order_id_type o, address_type t, asset a, release_reason r )
      :order(o),to(std::move(t)),amount(std::move(a)),reason(r){}

      order_id_type  order;
      address_type   to;
      asset          amount;
      release_reason reason = release_reason::payout;

      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

} } // fusion::protocol

FC_REFLECT_ENUM( fusion::protocol::ack_outcome, (success)(failure)(timeout) )
FC_REFLECT_ENUM( fusion::protocol::release_reason,
                 (payout)(fee)(refund)(fill_payout)(fill_refund)(deposit_return)(fill_settlement) )

FC_REFLECT( fusion::protocol::settlement_ack_operation, (relayer)(sequence)(outcome) )
FC_REFLECT( fusion::protocol::funds_released_operation, (order)(to)(amount)(reason) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::settlement_ack_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::funds_released_operation )

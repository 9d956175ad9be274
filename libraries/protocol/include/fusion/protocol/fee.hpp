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

   /// amount * bps / 10000, truncated toward zero
   share_type cut_fee( share_type amount, uint32_t bps );

   struct settlement_fee
   {
      share_type fee;
      share_type payout;
   };

   /**
    * Splits a settled amount into the settler's fee and the receiver's payout.
    *
    * The fee is @p fee_bps of the amount, plus @p cross_chain_bps for orders that settle on another
    * chain. A registered resolver settling the order then gets @p discount_bps of that fee waived.
    * payout = amount - fee; no remainder is redistributed.
    */
   settlement_fee compute_settlement_fee( share_type amount, uint32_t fee_bps,
                                          uint32_t cross_chain_bps = 0, uint32_t discount_bps = 0 );

} } // fusion::protocol

FC_REFLECT( fusion::protocol::settlement_fee, (fee)(payout) )

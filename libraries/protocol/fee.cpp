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
#include <fusion/protocol/fee.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/uint128.hpp>

namespace fusion { namespace protocol {

share_type cut_fee( share_type amount, uint32_t bps )
{
   FUSION_ASSERT( amount.value >= 0, invalid_amount, "Negative amount", ("amount",amount) );
   if( amount == 0 || bps == 0 )
      return 0;
   if( bps == FUSION_100_PERCENT )
      return amount;

   fc::uint128_t r = amount.value;
   r *= bps;
   r /= FUSION_100_PERCENT;
   return static_cast<int64_t>(r);
}

settlement_fee compute_settlement_fee( share_type amount, uint32_t fee_bps, uint32_t cross_chain_bps,
                                       uint32_t discount_bps )
{
   FUSION_ASSERT( fee_bps <= FUSION_100_PERCENT && cross_chain_bps <= FUSION_100_PERCENT
                  && discount_bps <= FUSION_100_PERCENT, invalid_fee, "Basis points above 100%",
                  ("fee_bps",fee_bps)("cross_chain_bps",cross_chain_bps)("discount_bps",discount_bps) );
   settlement_fee result;
   result.fee = cut_fee( amount, fee_bps ) + cut_fee( amount, cross_chain_bps );
   if( discount_bps > 0 )
      result.fee -= cut_fee( result.fee, discount_bps );
   if( result.fee > amount )
      result.fee = amount;
   result.payout = amount - result.fee;
   return result;
}

} } // fusion::protocol

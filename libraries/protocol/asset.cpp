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
#include <fusion/protocol/asset.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace fusion { namespace protocol {

void asset::validate_positive()const
{
   FUSION_ASSERT( !denom.empty() && denom.size() <= FUSION_MAX_DENOM_LENGTH, invalid_amount,
                  "Invalid denom", ("denom",denom) );
   FUSION_ASSERT( amount > 0, invalid_amount, "Amount must be positive", ("amount",amount) );
   FUSION_ASSERT( amount <= FUSION_MAX_SHARE_SUPPLY, invalid_amount, "Amount exceeds the maximum supply",
                  ("amount",amount) );
}

} } // fusion::protocol

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::asset )

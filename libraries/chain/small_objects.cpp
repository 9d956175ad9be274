/*
 * Copyright (c) 2019 BitShares Blockchain Foundation, and contributors.
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
#include <fusion/chain/global_property_object.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/fill_object.hpp>
#include <fusion/chain/resolver_object.hpp>
#include <fusion/chain/pending_transfer_object.hpp>
#include <fusion/chain/destination_chain_object.hpp>
#include <fusion/chain/account_balance_object.hpp>

#include <fc/io/raw.hpp>

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::order_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::fill_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::resolver_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::pending_transfer_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::destination_chain_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::global_property_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::dynamic_global_property_object )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::chain::account_balance_object )

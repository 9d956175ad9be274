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

#define FUSION_100_PERCENT                                    10000
#define FUSION_1_PERCENT                                      (FUSION_100_PERCENT/100)

#define FUSION_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)

#define FUSION_MAX_ADDRESS_LENGTH                             128
#define FUSION_MAX_DENOM_LENGTH                               128
#define FUSION_MAX_CHAIN_ID_LENGTH                            64
#define FUSION_MAX_CHANNEL_LENGTH                             64
#define FUSION_MAX_NAME_LENGTH                                63

#define FUSION_HASHLOCK_HEX_LENGTH                            64

/** engine parameter defaults, used when a genesis file does not override them */
#define FUSION_DEFAULT_MIN_TIMELOCK                           (60*60)          ///< 1 hour
#define FUSION_DEFAULT_MAX_TIMELOCK                           (60*60*24*30)    ///< 30 days
#define FUSION_DEFAULT_PROTOCOL_FEE_BPS                       (30)             ///< 0.3%
#define FUSION_DEFAULT_ACK_TIMEOUT_SECONDS                    (600)            ///< 10 minutes
#define FUSION_DEFAULT_MAX_PREIMAGE_SIZE                      (1024)
#define FUSION_DEFAULT_MAX_WHITELIST_SIZE                     (64)

/** an order without an explicit minimum fill accepts fills of at least a tenth of its total */
#define FUSION_DEFAULT_MIN_FILL_DIVISOR                       10
/** a required safety deposit without an explicit amount is 5% of the total */
#define FUSION_DEFAULT_SAFETY_DEPOSIT_DIVISOR                 20

#define FUSION_MAX_UNDO_HISTORY                               256

#define FUSION_TREASURY_ADDRESS                               "fusion-treasury"

/** maximum nesting depth when converting JSON to engine types */
#define FUSION_MAX_NESTED_OBJECTS                             (200)

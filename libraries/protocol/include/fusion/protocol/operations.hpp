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
#include <fusion/protocol/order.hpp>
#include <fusion/protocol/fill.hpp>
#include <fusion/protocol/settlement.hpp>
#include <fusion/protocol/resolver.hpp>

namespace fusion { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ order_create_operation,
            /*  1 */ fill_create_operation,
            /*  2 */ order_withdraw_operation,
            /*  3 */ fill_withdraw_operation,
            /*  4 */ order_cancel_operation,
            /*  5 */ fill_refund_operation,
            /*  6 */ settlement_ack_operation,
            /*  7 */ safety_deposit_post_operation,
            /*  8 */ resolver_register_operation,
            /*  9 */ resolver_update_operation,
            /* 10 */ destination_chain_update_operation,
            /* 11 */ engine_parameters_update_operation,
            /* 12 */ funds_released_operation              // VIRTUAL
         > operation;

   void operation_validate( const operation& op );

   /// true for operations the engine emits itself and that can not be pushed
   bool is_virtual_operation( const operation& op );

} } // fusion::protocol

FC_REFLECT_TYPENAME( fusion::protocol::operation )

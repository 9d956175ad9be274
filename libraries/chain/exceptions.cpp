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
#include <fusion/chain/exceptions.hpp>

namespace fusion { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "settlement engine exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception, chain_exception, 3040000, "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,      chain_exception, 3070000, "undo database exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( time_moved_backwards,         chain_exception, 3080000, "time can only move forward" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( virtual_operation_pushed,     operation_validate_exception, 3040001,
                                   "virtual operations can not be pushed" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( order_create );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( duplicate_hashlock, order_create, 1, "an order with this hashlock already exists" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unknown_destination, order_create, 2, "destination chain is unknown or inactive" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( whitelist_too_large, order_create, 3, "too many allowed resolvers" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( fill_create );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( partial_fills_disabled, fill_create, 1, "order does not allow partial fills" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_not_open, fill_create, 2, "order is not open" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, fill_create, 3, "filler is not authorized in the current stage" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( amount_below_minimum, fill_create, 4, "fill amount is below the minimum" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( amount_exceeds_remaining, fill_create, 5, "fill amount exceeds the remaining amount" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_not_final, fill_create, 6, "order is still in its finality period" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_expired, fill_create, 7, "timelock expired" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( hashlock_mismatch, fill_create, 8, "fill hashlock does not match the secret policy" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( order_withdraw );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( invalid_secret, order_withdraw, 1, "invalid secret" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, order_withdraw, 2, "withdrawer is not authorized in the current stage" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_expired, order_withdraw, 3, "timelock expired" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_not_final, order_withdraw, 4, "order is still in its finality period" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_terminal, order_withdraw, 5, "order is already finalized" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( transfer_in_flight, order_withdraw, 6, "a cross-chain transfer is in flight" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_has_fills, order_withdraw, 7, "order with fills settles through its fills" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( fill_withdraw );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( invalid_secret, fill_withdraw, 1, "invalid secret" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, fill_withdraw, 2, "only the receiver can withdraw a fill" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_expired, fill_withdraw, 3, "timelock expired" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( fill_not_pending, fill_withdraw, 4, "fill is not pending" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_terminal, fill_withdraw, 5, "order is already finalized" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( order_cancel );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_already_completed, order_cancel, 1, "order already completed" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_already_cancelled, order_cancel, 2, "order already cancelled" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( transfer_in_flight, order_cancel, 3, "a cross-chain transfer is in flight" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_not_expired, order_cancel, 4, "timelock not expired" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, order_cancel, 5, "caller is not authorized in the current stage" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( fill_refund );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_not_expired, fill_refund, 1, "timelock not expired" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, fill_refund, 2, "only the filler can refund a fill" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( fill_not_pending, fill_refund, 3, "fill is not pending" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( settlement_ack );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized_relayer, settlement_ack, 1, "acks are only accepted from the relayer" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( safety_deposit_post );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_required, safety_deposit_post, 1, "order does not require a safety deposit" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( already_posted, safety_deposit_post, 2, "safety deposit already posted" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( insufficient_amount, safety_deposit_post, 3, "insufficient safety deposit" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( order_not_open, safety_deposit_post, 4, "order is not open" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( resolver_register );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, resolver_register, 1, "only the admin can register resolvers" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( already_registered, resolver_register, 2, "resolver already registered" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( resolver_update );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, resolver_update, 1, "only the admin can update resolvers" )
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unknown_resolver, resolver_update, 2, "resolver not registered" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( destination_chain_update );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, destination_chain_update, 1, "only the admin can update destination chains" )

   FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( engine_parameters_update );
   FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, engine_parameters_update, 1, "only the admin can update engine parameters" )

} } // fusion::chain

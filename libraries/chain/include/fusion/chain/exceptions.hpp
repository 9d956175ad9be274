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

#include <fc/exception/exception.hpp>
#include <fusion/protocol/exceptions.hpp>
#include <fusion/protocol/operations.hpp>
#include <fusion/chain/types.hpp>

#define FUSION_DECLARE_OP_BASE_EXCEPTIONS( op_name )                  \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      fusion::chain::operation_validate_exception,                    \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      fusion::chain::operation_evaluate_exception,                    \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
      )

#define FUSION_IMPLEMENT_OP_BASE_EXCEPTIONS( op_name )                \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _validate_exception,                                 \
      fusion::chain::operation_validate_exception,                    \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _evaluate_exception,                                 \
      fusion::chain::operation_evaluate_exception,                    \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define FUSION_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      fusion::chain::op_name ## _evaluate_exception,                  \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum                                                     \
      )

#define FUSION_IMPLEMENT_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _ ## exc_name,                                       \
      fusion::chain::op_name ## _evaluate_exception,                  \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace fusion { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception, chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      chain_exception, 3070000 )

   FC_DECLARE_DERIVED_EXCEPTION( time_moved_backwards,         chain_exception, 3080000 )
   FC_DECLARE_DERIVED_EXCEPTION( virtual_operation_pushed,     operation_validate_exception, 3040001 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( order_create );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( duplicate_hashlock, order_create, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unknown_destination, order_create, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( whitelist_too_large, order_create, 3 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( fill_create );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( partial_fills_disabled, fill_create, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_not_open, fill_create, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, fill_create, 3 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( amount_below_minimum, fill_create, 4 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( amount_exceeds_remaining, fill_create, 5 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_not_final, fill_create, 6 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_expired, fill_create, 7 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( hashlock_mismatch, fill_create, 8 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( order_withdraw );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( invalid_secret, order_withdraw, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, order_withdraw, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_expired, order_withdraw, 3 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_not_final, order_withdraw, 4 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_terminal, order_withdraw, 5 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( transfer_in_flight, order_withdraw, 6 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_has_fills, order_withdraw, 7 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( fill_withdraw );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( invalid_secret, fill_withdraw, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, fill_withdraw, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_expired, fill_withdraw, 3 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( fill_not_pending, fill_withdraw, 4 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_terminal, fill_withdraw, 5 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( order_cancel );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_already_completed, order_cancel, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_already_cancelled, order_cancel, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( transfer_in_flight, order_cancel, 3 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_not_expired, order_cancel, 4 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, order_cancel, 5 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( fill_refund );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_not_expired, fill_refund, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, fill_refund, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( fill_not_pending, fill_refund, 3 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( settlement_ack );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized_relayer, settlement_ack, 1 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( safety_deposit_post );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( not_required, safety_deposit_post, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( already_posted, safety_deposit_post, 2 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( insufficient_amount, safety_deposit_post, 3 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( order_not_open, safety_deposit_post, 4 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( resolver_register );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, resolver_register, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( already_registered, resolver_register, 2 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( resolver_update );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, resolver_update, 1 )
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unknown_resolver, resolver_update, 2 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( destination_chain_update );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, destination_chain_update, 1 )

   FUSION_DECLARE_OP_BASE_EXCEPTIONS( engine_parameters_update );
   FUSION_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, engine_parameters_update, 1 )

} } // fusion::chain

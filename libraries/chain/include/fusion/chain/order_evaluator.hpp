/*
 * Copyright (c) 2018 jmjatlanta and contributors.
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
#include <fusion/chain/evaluator.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/destination_chain_object.hpp>

namespace fusion {
   namespace chain {

      class order_create_evaluator : public evaluator<order_create_evaluator>
      {
         public:
            typedef order_create_operation operation_type;

            void_result do_evaluate( const order_create_operation& o );
            object_id_type do_apply( const order_create_operation& o );

         private:
            stage_schedule boundaries;
            share_type     min_fill_amount;
            share_type     safety_deposit_amount;
            uint16_t       fee_bps = 0;
      };

      class order_withdraw_evaluator : public evaluator<order_withdraw_evaluator>
      {
         public:
            typedef order_withdraw_operation operation_type;

            void_result do_evaluate( const order_withdraw_operation& o );
            operation_result do_apply( const order_withdraw_operation& o );

            const order_object*             order_obj = nullptr;
            const destination_chain_object* destination_obj = nullptr;
            settlement_fee                  fee;
      };

      class order_cancel_evaluator : public evaluator<order_cancel_evaluator>
      {
         public:
            typedef order_cancel_operation operation_type;

            void_result do_evaluate( const order_cancel_operation& o );
            void_result do_apply( const order_cancel_operation& o );

            const order_object* order_obj = nullptr;
      };

      class safety_deposit_post_evaluator : public evaluator<safety_deposit_post_evaluator>
      {
         public:
            typedef safety_deposit_post_operation operation_type;

            void_result do_evaluate( const safety_deposit_post_operation& o );
            void_result do_apply( const safety_deposit_post_operation& o );

            const order_object* order_obj = nullptr;
      };

   } // namespace chain
} // namespace fusion

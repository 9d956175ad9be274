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

   /**
    * Commits part of an order's remaining amount to a filler. Only orders created with
    * allow_partial_fills accept fills.
    */
   struct fill_create_operation : public base_operation
   {
      order_id_type           order;
      address_type            filler;
      share_type              amount;
      /// required under the per_fill secret policy, rejected otherwise
      optional<hashlock_type> hashlock;

      void validate()const;
   };

   /// The order's receiver claims a pending fill with the secret
   struct fill_withdraw_operation : public base_operation
   {
      fill_id_type  fill;
      address_type  caller;
      secret_type   secret;

      void validate()const;
   };

   /// The filler takes back a pending fill once the order expired
   struct fill_refund_operation : public base_operation
   {
      fill_id_type  fill;
      address_type  caller;

      void validate()const;
   };

} } // fusion::protocol

FC_REFLECT( fusion::protocol::fill_create_operation, (order)(filler)(amount)(hashlock) )
FC_REFLECT( fusion::protocol::fill_withdraw_operation, (fill)(caller)(secret) )
FC_REFLECT( fusion::protocol::fill_refund_operation, (fill)(caller) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::fill_create_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::fill_withdraw_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::fill_refund_operation )

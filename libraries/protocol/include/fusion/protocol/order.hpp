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
#include <fusion/protocol/asset.hpp>
#include <fusion/protocol/stage.hpp>

namespace fusion { namespace protocol {

   /// Which hashlock a fill withdrawal is checked against
   enum class secret_policy_type : uint8_t
   {
      per_order = 0, ///< one secret shared by the order and all of its fills
      per_fill  = 1  ///< every fill commits to its own hashlock
   };

   /// Settlement leg of an order that pays out on another chain
   struct destination_info
   {
      chain_id_type chain_id;
      address_type  recipient;
      string        token;

      void validate()const;
   };

   /**
    * @brief Locks an amount behind a hashlock and a timelock schedule
    *
    * The funds are escrowed by the host ledger before this operation is pushed. The resulting order
    * can be settled with the secret while a settlement stage is active, and refunded to the sender
    * once a cancellation stage is reached.
    */
   struct order_create_operation : public base_operation
   {
      address_type                sender;
      address_type                receiver;
      /// may settle during the taker exclusive stage, defaults to the receiver
      optional<address_type>      taker;
      asset                       amount;
      hashlock_type               hashlock;
      timelock_type               timelock;

      bool                        allow_partial_fills = false;
      /// defaults to a tenth of the amount
      optional<share_type>        min_fill_amount;
      secret_policy_type          secret_policy = secret_policy_type::per_order;

      /// explicit safety deposit a resolver has to post
      optional<asset>             safety_deposit;
      /// require the default safety deposit when no explicit one is given
      bool                        require_safety_deposit = false;

      flat_set<address_type>      allowed_resolvers;
      /// defaults to the engine's protocol fee
      optional<uint16_t>          fee_bps;
      optional<destination_info>  destination;

      void validate()const;
   };

   /**
    * @brief Settles a whole order by revealing its secret
    *
    * For a cross-chain order this only starts the transfer on the destination chain; the order is
    * finalized by a settlement_ack_operation.
    */
   struct order_withdraw_operation : public base_operation
   {
      order_id_type order;
      address_type  withdrawer;
      secret_type   secret;

      void validate()const;
   };

   struct order_cancel_operation : public base_operation
   {
      order_id_type order;
      address_type  caller;

      void validate()const;
   };

   struct safety_deposit_post_operation : public base_operation
   {
      order_id_type order;
      address_type  depositor;
      asset         amount;

      void validate()const;
   };

} } // fusion::protocol

FC_REFLECT_ENUM( fusion::protocol::secret_policy_type, (per_order)(per_fill) )
FC_REFLECT( fusion::protocol::destination_info, (chain_id)(recipient)(token) )

FC_REFLECT( fusion::protocol::order_create_operation,
            (sender)(receiver)(taker)(amount)(hashlock)(timelock)
            (allow_partial_fills)(min_fill_amount)(secret_policy)
            (safety_deposit)(require_safety_deposit)
            (allowed_resolvers)(fee_bps)(destination) )
FC_REFLECT( fusion::protocol::order_withdraw_operation, (order)(withdrawer)(secret) )
FC_REFLECT( fusion::protocol::order_cancel_operation, (order)(caller) )
FC_REFLECT( fusion::protocol::safety_deposit_post_operation, (order)(depositor)(amount) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::order_create_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::order_withdraw_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::order_cancel_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::safety_deposit_post_operation )

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
#include <fusion/protocol/engine_parameters.hpp>

namespace fusion { namespace protocol {

   struct resolver_register_operation : public base_operation
   {
      address_type admin;
      address_type resolver;
      /// higher priorities are listed first, advisory only
      uint32_t     priority         = 0;
      uint16_t     fee_discount_bps = 0;
      bool         enabled          = true;

      void validate()const;
   };

   struct resolver_update_operation : public base_operation
   {
      address_type       admin;
      address_type       resolver;
      optional<uint32_t> priority;
      optional<uint16_t> fee_discount_bps;
      optional<bool>     enabled;

      void validate()const;
   };

   /// Creates the destination chain or replaces its settings
   struct destination_chain_update_operation : public base_operation
   {
      address_type  admin;
      chain_id_type chain_id;
      string        name;
      string        channel;
      bool          is_active          = true;
      uint16_t      fee_multiplier_bps = 0;

      void validate()const;
   };

   struct engine_parameters_update_operation : public base_operation
   {
      address_type      admin;
      engine_parameters new_parameters;

      void validate()const;
   };

} } // fusion::protocol

FC_REFLECT( fusion::protocol::resolver_register_operation,
            (admin)(resolver)(priority)(fee_discount_bps)(enabled) )
FC_REFLECT( fusion::protocol::resolver_update_operation,
            (admin)(resolver)(priority)(fee_discount_bps)(enabled) )
FC_REFLECT( fusion::protocol::destination_chain_update_operation,
            (admin)(chain_id)(name)(channel)(is_active)(fee_multiplier_bps) )
FC_REFLECT( fusion::protocol::engine_parameters_update_operation, (admin)(new_parameters) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::resolver_register_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::resolver_update_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::destination_chain_update_operation )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::engine_parameters_update_operation )

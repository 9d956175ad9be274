/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:
 *
 * 1. Any modified source or binaries are used only with the BitShares network.
 *
 * 2. Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
 *
 * 3. Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 */
#pragma once

#include <fusion/chain/types.hpp>
#include <fusion/protocol/engine_parameters.hpp>

#include <string>
#include <vector>

namespace fusion { namespace chain {
using std::string;
using std::vector;

/**
 * The initial state of a new engine database, read from a JSON file by the node. An existing database
 * is never re-initialized from it.
 */
struct genesis_state_type {
   struct initial_resolver_type {
      address_type resolver;
      uint32_t     priority = 0;
      uint16_t     fee_discount_bps = 0;
      bool         enabled = true;
   };
   struct initial_destination_chain_type {
      chain_id_type chain_id;
      string        name;
      string        channel;
      bool          is_active = true;
      uint16_t      fee_multiplier_bps = 0;
   };

   time_point_sec                          initial_timestamp;
   engine_parameters                       initial_parameters;
   vector<initial_resolver_type>           initial_resolvers;
   vector<initial_destination_chain_type>  initial_destination_chains;

   void validate()const;
};

} } // namespace fusion::chain

FC_REFLECT(fusion::chain::genesis_state_type::initial_resolver_type,
           (resolver)(priority)(fee_discount_bps)(enabled))

FC_REFLECT(fusion::chain::genesis_state_type::initial_destination_chain_type,
           (chain_id)(name)(channel)(is_active)(fee_multiplier_bps))

FC_REFLECT(fusion::chain::genesis_state_type,
           (initial_timestamp)(initial_parameters)(initial_resolvers)(initial_destination_chains))

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::genesis_state_type::initial_resolver_type )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::genesis_state_type::initial_destination_chain_type )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::genesis_state_type )

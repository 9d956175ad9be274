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

#include <fusion/chain/types.hpp>
#include <fusion/db/generic_index.hpp>

namespace fusion { namespace chain {

   /// A chain orders may settle on, and the channel transfers to it are sent through
   class destination_chain_object : public fusion::db::abstract_object<destination_chain_object,
                                                                       protocol_ids, destination_chain_object_type>
   {
      public:
         chain_id_type chain_id;
         string        name;
         string        channel;
         bool          is_active = true;
         /// added to the settlement fee of orders settling on this chain
         uint16_t      fee_multiplier_bps = 0;
   };

   struct by_chain_id;
   using destination_chain_multi_index_type = multi_index_container<
      destination_chain_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_chain_id >,
            member< destination_chain_object, chain_id_type, &destination_chain_object::chain_id > >
      >
   >;

   using destination_chain_index = generic_index< destination_chain_object, destination_chain_multi_index_type >;

} } // fusion::chain

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::destination_chain_object)

FC_REFLECT_DERIVED( fusion::chain::destination_chain_object, (fusion::db::object),
                    (chain_id)(name)(channel)(is_active)(fee_multiplier_bps) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::destination_chain_object )

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

#include <boost/multi_index/composite_key.hpp>

namespace fusion { namespace chain {

   /**
    * @brief A globally registered resolver
    *
    * An enabled resolver may settle and cancel any order during the private stages, in addition to
    * the resolvers an order allows itself. Its fee discount reduces the fee of orders it settles.
    */
   class resolver_object : public fusion::db::abstract_object<resolver_object, protocol_ids, resolver_object_type>
   {
      public:
         address_type   resolver;
         uint32_t       priority = 0;
         uint16_t       fee_discount_bps = 0;
         bool           enabled = true;
         time_point_sec registered;
   };

   struct by_address;
   struct by_priority;
   using resolver_multi_index_type = multi_index_container<
      resolver_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_address >, member< resolver_object, address_type, &resolver_object::resolver > >,
         ordered_unique< tag< by_priority >,
            composite_key< resolver_object,
               member< resolver_object, uint32_t, &resolver_object::priority >,
               member< object, object_id_type, &object::id > >,
            composite_key_compare< std::greater< uint32_t >, std::less< object_id_type > > >
      >
   >;

   using resolver_index = generic_index< resolver_object, resolver_multi_index_type >;

} } // fusion::chain

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::resolver_object)

FC_REFLECT_DERIVED( fusion::chain::resolver_object, (fusion::db::object),
                    (resolver)(priority)(fee_discount_bps)(enabled)(registered) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::resolver_object )

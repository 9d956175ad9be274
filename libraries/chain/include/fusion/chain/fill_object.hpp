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

   enum class fill_status : uint8_t
   {
      pending   = 0,
      completed = 1,
      refunded  = 2
   };

   /**
    * @brief A part of an order's amount committed by one filler
    *
    * The filler backs a fill with its own funds, in exchange for the same share of the sender's escrow.
    * Fills are never removed. A completed fill pays the filler's funds to the receiver and the escrowed
    * share to the filler; a refunded one returns the filler's funds and leaves the share with the order,
    * or with the sender once the order is cancelled.
    */
   class fill_object : public fusion::db::abstract_object<fill_object, protocol_ids, fill_object_type>
   {
      public:
         order_id_type           order;
         address_type            filler;
         share_type              amount;
         fill_status             status = fill_status::pending;
         time_point_sec          created;
         optional<hashlock_type> hashlock;
         optional<secret_type>   revealed_secret;
   };

   struct by_order;
   using fill_multi_index_type = multi_index_container<
      fill_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_order >,
            composite_key< fill_object,
               member< fill_object, order_id_type, &fill_object::order >,
               member< object, object_id_type, &object::id > > >
      >
   >;

   using fill_index = generic_index< fill_object, fill_multi_index_type >;

} } // fusion::chain

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::fill_object)

FC_REFLECT_ENUM( fusion::chain::fill_status, (pending)(completed)(refunded) )
FC_REFLECT_DERIVED( fusion::chain::fill_object, (fusion::db::object),
                    (order)(filler)(amount)(status)(created)(hashlock)(revealed_secret) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::fill_object )

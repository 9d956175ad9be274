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
#include <fusion/protocol/asset.hpp>
#include <fusion/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace fusion { namespace chain {

   /**
    * @brief A cross-chain transfer started by an order withdrawal
    *
    * It is removed when the messaging layer acknowledges the transfer, or when its timeout passes.
    * The sequence joins the ack to the order.
    */
   class pending_transfer_object : public fusion::db::abstract_object<pending_transfer_object,
                                                                      protocol_ids, pending_transfer_object_type>
   {
      public:
         uint64_t        sequence = 0;
         order_id_type   order;
         chain_id_type   chain_id;
         string          channel;
         address_type    recipient;
         asset           amount;  ///< payout delivered on the destination chain
         asset           fee;
         address_type    settler;
         time_point_sec  timeout;
   };

   struct by_sequence;
   struct by_timeout;
   using pending_transfer_multi_index_type = multi_index_container<
      pending_transfer_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_sequence >,
            member< pending_transfer_object, uint64_t, &pending_transfer_object::sequence > >,
         ordered_unique< tag< by_timeout >,
            composite_key< pending_transfer_object,
               member< pending_transfer_object, time_point_sec, &pending_transfer_object::timeout >,
               member< object, object_id_type, &object::id > > >
      >
   >;

   using pending_transfer_index = generic_index< pending_transfer_object, pending_transfer_multi_index_type >;

} } // fusion::chain

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::pending_transfer_object)

FC_REFLECT_DERIVED( fusion::chain::pending_transfer_object, (fusion::db::object),
                    (sequence)(order)(chain_id)(channel)(recipient)(amount)(fee)(settler)(timeout) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::pending_transfer_object )

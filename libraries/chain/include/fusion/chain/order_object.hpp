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

#include <fusion/protocol/order.hpp>
#include <fusion/chain/types.hpp>
#include <fusion/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace fusion { namespace chain {

   enum class order_status : uint8_t
   {
      open            = 0,
      fully_committed = 1, ///< the whole amount is committed to fills that await settlement
      in_flight       = 2, ///< settled locally, waiting for the cross-chain ack
      completed       = 3,
      cancelled       = 4,
      failed          = 5  ///< the cross-chain transfer failed or timed out, refundable
   };

   inline bool is_terminal( order_status s )
   {
      return s == order_status::completed || s == order_status::cancelled || s == order_status::failed;
   }

   struct posted_deposit
   {
      address_type depositor;
      asset        amount;
   };

   /**
    * @brief database object to store swap orders
    *
    * Orders are never removed. Once completed or cancelled an order stays in the database for audit
    * and lookup by hashlock.
    *
    * filled_amount + remaining_amount == total_amount.amount holds after every operation.
    */
   class order_object : public fusion::db::abstract_object<order_object, protocol_ids, order_object_type>
   {
      public:
         address_type               sender;
         address_type               receiver;
         address_type               taker;
         flat_set<address_type>     allowed_resolvers;

         asset                      total_amount;
         share_type                 remaining_amount;
         share_type                 filled_amount;
         share_type                 min_fill_amount;
         bool                       allow_partial_fills = false;
         uint16_t                   fee_bps = 0;

         share_type                 safety_deposit_amount;
         optional<posted_deposit>   deposit;

         hashlock_type              hashlock;
         optional<secret_type>      revealed_secret;
         secret_policy_type         secret_policy = secret_policy_type::per_order;

         time_point_sec             created;
         stage_schedule             boundaries;
         order_stage                stage = order_stage::pending;
         time_point_sec             next_stage_change;

         order_status               status = order_status::open;
         uint32_t                   fill_count = 0;

         optional<destination_info> destination;
         optional<uint64_t>         transfer_sequence;

         optional<address_type>     settled_by;
         optional<address_type>     cancelled_by;
         share_type                 refunded_amount;

         bool is_terminal()const    { return chain::is_terminal( status ); }
         bool is_cross_chain()const { return destination.valid(); }
         asset amount( share_type a )const { return asset( a, total_amount.denom ); }

         /// the hashlock a withdrawal of @p fill_hashlock's fill is verified against
         const hashlock_type& settlement_hashlock( const optional<hashlock_type>& fill_hashlock )const
         {
            if( secret_policy == secret_policy_type::per_fill && fill_hashlock.valid() )
               return *fill_hashlock;
            return hashlock;
         }
   };

   struct by_hashlock;
   struct by_sender;
   struct by_receiver;
   struct by_status;
   struct by_next_stage_change;
   using order_multi_index_type = multi_index_container<
      order_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_hashlock >, member< order_object, hashlock_type, &order_object::hashlock > >,
         ordered_unique< tag< by_sender >,
            composite_key< order_object,
               member< order_object, address_type, &order_object::sender >,
               member< object, object_id_type, &object::id > > >,
         ordered_unique< tag< by_receiver >,
            composite_key< order_object,
               member< order_object, address_type, &order_object::receiver >,
               member< object, object_id_type, &object::id > > >,
         ordered_unique< tag< by_status >,
            composite_key< order_object,
               member< order_object, order_status, &order_object::status >,
               member< object, object_id_type, &object::id > > >,
         ordered_unique< tag< by_next_stage_change >,
            composite_key< order_object,
               member< order_object, time_point_sec, &order_object::next_stage_change >,
               member< object, object_id_type, &object::id > > >
      >
   >;

   using order_index = generic_index< order_object, order_multi_index_type >;

} } // fusion::chain

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::order_object)

FC_REFLECT_ENUM( fusion::chain::order_status,
                 (open)(fully_committed)(in_flight)(completed)(cancelled)(failed) )
FC_REFLECT( fusion::chain::posted_deposit, (depositor)(amount) )
FC_REFLECT_DERIVED( fusion::chain::order_object, (fusion::db::object),
                    (sender)(receiver)(taker)(allowed_resolvers)
                    (total_amount)(remaining_amount)(filled_amount)(min_fill_amount)(allow_partial_fills)(fee_bps)
                    (safety_deposit_amount)(deposit)
                    (hashlock)(revealed_secret)(secret_policy)
                    (created)(boundaries)(stage)(next_stage_change)
                    (status)(fill_count)
                    (destination)(transfer_sequence)
                    (settled_by)(cancelled_by)(refunded_amount) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::order_object )

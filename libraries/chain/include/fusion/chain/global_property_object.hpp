/*
 * Copyright (c) 2015, Cryptonomex, Inc.
 * All rights reserved.
 *
 * This source code is provided for evaluation in private test networks only, until September 8, 2015. After this date, this license expires and
 * the code may not be used, modified or distributed for any purpose. Redistribution and use in source and binary forms, with or without modification,
 * are permitted until September 8, 2015, provided that the following conditions are met:
 *
 * 1. The code and/or derivative works are used only for private test networks consisting of no more than 10 P2P nodes.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#pragma once
#include <fusion/protocol/engine_parameters.hpp>
#include <fusion/chain/types.hpp>
#include <fusion/db/object.hpp>

namespace fusion { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains the engine parameters
    * @ingroup object
    * @ingroup implementation
    *
    * The values here are set by the admin through engine_parameters_update_operation.
    */
   class global_property_object : public fusion::db::abstract_object<global_property_object,
                                                                     implementation_ids, impl_global_property_object_type>
   {
      public:
         engine_parameters parameters;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state information
    * @ingroup object
    * @ingroup implementation
    *
    * The values here are calculated during normal operation and reflect the current time of the host
    * ledger and the engine's counters.
    */
   class dynamic_global_property_object : public fusion::db::abstract_object<dynamic_global_property_object,
                                                  implementation_ids, impl_dynamic_global_property_object_type>
   {
      public:
         time_point_sec time;
         /// sequence assigned to the next cross-chain transfer
         uint64_t       next_transfer_sequence = 1;

         uint64_t       orders_created   = 0;
         uint64_t       orders_completed = 0;
         uint64_t       orders_cancelled = 0;
         uint64_t       orders_failed    = 0;
         /// sum of the amounts of all created orders, regardless of denom
         share_type     total_volume;
   };
}}

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::global_property_object)
FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::dynamic_global_property_object)

FC_REFLECT_DERIVED( fusion::chain::dynamic_global_property_object, (fusion::db::object),
                    (time)
                    (next_transfer_sequence)
                    (orders_created)
                    (orders_completed)
                    (orders_cancelled)
                    (orders_failed)
                    (total_volume)
                  )

FC_REFLECT_DERIVED( fusion::chain::global_property_object, (fusion::db::object),
                    (parameters)
                  )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::dynamic_global_property_object )
FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::global_property_object )

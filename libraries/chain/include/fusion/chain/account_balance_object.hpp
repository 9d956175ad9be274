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
    * @brief Tracks the funds released to an address in one denom
    * @ingroup object
    * @ingroup implementation
    *
    * The engine does not hold tokens, so this is a running total of the release instructions given to
    * the host ledger rather than a spendable balance.
    */
   class account_balance_object : public fusion::db::abstract_object<account_balance_object,
                                                                     implementation_ids, impl_account_balance_object_type>
   {
      public:
         address_type owner;
         string       denom;
         share_type   released;

         asset get_released()const { return asset( released, denom ); }
   };

   struct by_owner_denom;
   using account_balance_multi_index_type = multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_owner_denom >,
            composite_key< account_balance_object,
               member< account_balance_object, address_type, &account_balance_object::owner >,
               member< account_balance_object, string, &account_balance_object::denom > > >
      >
   >;

   using account_balance_index = generic_index< account_balance_object, account_balance_multi_index_type >;

} } // fusion::chain

FUSION_MAP_OBJECT_ID_TO_TYPE(fusion::chain::account_balance_object)

FC_REFLECT_DERIVED( fusion::chain::account_balance_object, (fusion::db::object),
                    (owner)(denom)(released) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::chain::account_balance_object )

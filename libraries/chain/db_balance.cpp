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
#include <fusion/chain/database.hpp>

namespace fusion { namespace chain {

void database::release_funds( const order_object& o, const address_type& to, const asset& amount,
                              release_reason reason )
{ try {
   FC_ASSERT( amount.amount >= 0, "Can not release a negative amount", ("amount",amount) );
   if( amount.amount == 0 )
      return;

   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner_denom>();
   auto itr = index.find( boost::make_tuple( to, amount.denom ) );
   if( itr == index.end() )
   {
      create<account_balance_object>( [&to,&amount]( account_balance_object& b ) {
         b.owner    = to;
         b.denom    = amount.denom;
         b.released = amount.amount;
      });
   }
   else
   {
      modify( *itr, [&amount]( account_balance_object& b ) {
         b.released += amount.amount;
      });
   }

   push_applied_operation( funds_released_operation( o.id, to, amount, reason ) );
} FC_CAPTURE_AND_RETHROW( (o.id)(to)(amount)(reason) ) }

void database::return_safety_deposit( const order_object& o )
{
   if( !o.deposit.valid() )
      return;
   const posted_deposit deposit = *o.deposit;
   release_funds( o, deposit.depositor, deposit.amount, release_reason::deposit_return );
   modify( o, []( order_object& obj ) {
      obj.deposit.reset();
   });
}

void database::release_settlement_fee( const order_object& o, const address_type& settler, share_type fee )
{
   const address_type& to = settler == o.receiver ? get_parameters().treasury : settler;
   release_funds( o, to, o.amount( fee ), release_reason::fee );
}

} }

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

#include <algorithm>

namespace fusion { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get( dynamic_global_property_id_type() );
}

const engine_parameters& database::get_parameters()const
{
   return get_global_properties().parameters;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const order_object& database::get_order( order_id_type id )
{
   const auto& o = get( id );
   refresh_stage( o );
   return o;
}

vector<fill_object> database::get_fills( order_id_type order )const
{
   vector<fill_object> result;
   const auto& idx = get_index_type<fill_index>().indices().get<by_order>();
   for( auto itr = idx.lower_bound( order ); itr != idx.end() && itr->order == order; ++itr )
      result.push_back( *itr );
   return result;
}

const order_object* database::find_order_by_hashlock( const hashlock_type& hashlock )const
{
   const auto& idx = get_index_type<order_index>().indices().get<by_hashlock>();
   auto itr = idx.find( hashlock );
   return itr == idx.end() ? nullptr : &*itr;
}

vector<order_object> database::get_orders_by_party( const address_type& party )const
{
   std::map<object_id_type, const order_object*> found;
   const auto& by_snd = get_index_type<order_index>().indices().get<by_sender>();
   for( auto itr = by_snd.lower_bound( party ); itr != by_snd.end() && itr->sender == party; ++itr )
      found[itr->id] = &*itr;
   const auto& by_rcv = get_index_type<order_index>().indices().get<by_receiver>();
   for( auto itr = by_rcv.lower_bound( party ); itr != by_rcv.end() && itr->receiver == party; ++itr )
      found[itr->id] = &*itr;

   vector<order_object> result;
   result.reserve( found.size() );
   for( const auto& item : found )
      result.push_back( *item.second );
   return result;
}

vector<order_object> database::get_active_orders()const
{
   vector<order_object> result;
   const auto& idx = get_index_type<order_index>().indices().get<by_status>();
   for( auto s : { order_status::open, order_status::fully_committed, order_status::in_flight } )
      for( auto itr = idx.lower_bound( s ); itr != idx.end() && itr->status == s; ++itr )
         result.push_back( *itr );
   std::sort( result.begin(), result.end(),
              []( const order_object& a, const order_object& b ) { return a.id < b.id; } );
   return result;
}

vector<resolver_object> database::get_resolvers_by_priority()const
{
   const auto& idx = get_index_type<resolver_index>().indices().get<by_priority>();
   return vector<resolver_object>( idx.begin(), idx.end() );
}

const resolver_object* database::find_resolver( const address_type& resolver )const
{
   const auto& idx = get_index_type<resolver_index>().indices().get<by_address>();
   auto itr = idx.find( resolver );
   return itr == idx.end() ? nullptr : &*itr;
}

const destination_chain_object* database::find_destination_chain( const chain_id_type& chain_id )const
{
   const auto& idx = get_index_type<destination_chain_index>().indices().get<by_chain_id>();
   auto itr = idx.find( chain_id );
   return itr == idx.end() ? nullptr : &*itr;
}

const pending_transfer_object* database::find_pending_transfer( uint64_t sequence )const
{
   const auto& idx = get_index_type<pending_transfer_index>().indices().get<by_sequence>();
   auto itr = idx.find( sequence );
   return itr == idx.end() ? nullptr : &*itr;
}

const pending_transfer_object& database::get_pending_transfer( uint64_t sequence )const
{
   const auto* transfer = find_pending_transfer( sequence );
   FUSION_ASSERT( transfer != nullptr, database_query_exception, "No pending transfer with sequence ${s}",
                  ("s",sequence) );
   return *transfer;
}

asset database::get_released_balance( const address_type& owner, const string& denom )const
{
   const auto& idx = get_index_type<account_balance_index>().indices().get<by_owner_denom>();
   auto itr = idx.find( boost::make_tuple( owner, denom ) );
   if( itr == idx.end() )
      return asset( 0, denom );
   return itr->get_released();
}

engine_statistics database::get_engine_statistics()const
{
   const auto& dgp = get_dynamic_global_properties();
   engine_statistics result;
   result.time             = dgp.time;
   result.orders_created   = dgp.orders_created;
   result.orders_completed = dgp.orders_completed;
   result.orders_cancelled = dgp.orders_cancelled;
   result.orders_failed    = dgp.orders_failed;
   result.total_volume     = dgp.total_volume;

   const auto& by_stat = get_index_type<order_index>().indices().get<by_status>();
   for( auto s : { order_status::open, order_status::fully_committed, order_status::in_flight } )
      result.active_orders += std::distance( by_stat.lower_bound( s ), by_stat.upper_bound( s ) );

   result.pending_transfers = get_index_type<pending_transfer_index>().indices().size();
   for( const auto& r : get_index_type<resolver_index>().indices() )
      if( r.enabled )
         ++result.enabled_resolvers;
   return result;
}

order_stage database::current_stage( const order_object& o )const
{
   if( o.is_terminal() )
      return o.stage;
   return compute_stage( head_time(), o.boundaries );
}

bool database::is_privileged_resolver( const order_object& o, const address_type& addr )const
{
   if( o.allowed_resolvers.find( addr ) != o.allowed_resolvers.end() )
      return true;
   const auto* r = find_resolver( addr );
   return r != nullptr && r->enabled;
}

bool database::can_withdraw( const order_object& o, const address_type& addr )const
{
   if( o.is_terminal() || o.status == order_status::in_flight )
      return false;
   switch( current_stage( o ) )
   {
      case order_stage::taker_exclusive:
         return addr == o.taker;
      case order_stage::private_resolver:
         return addr == o.taker || is_privileged_resolver( o, addr );
      case order_stage::public_resolver:
         return true;
      default:
         return false;
   }
}

bool database::can_cancel( const order_object& o, const optional<address_type>& caller )const
{
   order_stage stage = current_stage( o );
   if( o.status == order_status::failed )
   {
      // the transfer failed, the sender gets the funds back whatever the stage
      if( !caller.valid() || *caller == o.sender )
         return true;
      stage = compute_stage( head_time(), o.boundaries );
   }
   else if( o.is_terminal() || o.status == order_status::in_flight )
      return false;

   switch( stage )
   {
      case order_stage::private_cancellation:
         return !caller.valid() || *caller == o.sender || is_privileged_resolver( o, *caller );
      case order_stage::public_cancellation:
         return true;
      default:
         return false;
   }
}

settlement_fee database::compute_fee( const order_object& o, const address_type& settler )const
{
   uint32_t cross_chain_bps = 0;
   if( o.is_cross_chain() )
   {
      const auto* dest = find_destination_chain( o.destination->chain_id );
      if( dest != nullptr )
         cross_chain_bps = dest->fee_multiplier_bps;
   }
   uint32_t discount_bps = 0;
   const auto* r = find_resolver( settler );
   if( r != nullptr && r->enabled )
      discount_bps = r->fee_discount_bps;
   return compute_settlement_fee( o.remaining_amount, o.fee_bps, cross_chain_bps, discount_bps );
}

} }

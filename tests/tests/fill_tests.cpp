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
#include <boost/test/unit_test.hpp>

#include <fusion/chain/database.hpp>
#include <fusion/chain/exceptions.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/fill_object.hpp>

#include "../common/database_fixture.hpp"

using namespace fusion::chain;
using namespace fusion::chain::test;

namespace {
   const address_type filler_one = "fusion1filler1";
   const address_type filler_two = "fusion1filler2";

   single_timelock hour_lock()
   {
      single_timelock lock;
      lock.seconds = 3600;
      return lock;
   }
}

BOOST_FIXTURE_TEST_SUITE( fill_tests, database_fixture )

BOOST_AUTO_TEST_CASE( two_fills_complete_an_order )
{ try {
   const auto secret = make_secret( "partial" );
   auto op = make_order_op( 1000, secret, hour_lock() );
   op.allow_partial_fills = true;
   op.min_fill_amount     = 100;
   const order_id_type id = create_order( op ).id;

   const fill_id_type first = create_fill( id, filler_one, 400 ).id;
   BOOST_CHECK_EQUAL( db.get( id ).remaining_amount.value, 600 );
   BOOST_CHECK_EQUAL( db.get( id ).filled_amount.value, 400 );
   BOOST_CHECK( db.get( id ).status == order_status::open );

   const fill_id_type second = create_fill( id, filler_two, 600 ).id;
   BOOST_CHECK_EQUAL( db.get( id ).remaining_amount.value, 0 );
   BOOST_CHECK( db.get( id ).status == order_status::fully_committed );
   BOOST_CHECK_EQUAL( db.get( id ).fill_count, 2u );

   withdraw_fill( first, bob, secret );
   BOOST_CHECK( db.get( first ).status == fill_status::completed );
   BOOST_CHECK( db.get( id ).status == order_status::fully_committed );
   BOOST_REQUIRE( db.get( id ).revealed_secret.valid() );
   BOOST_CHECK( *db.get( id ).revealed_secret == secret );

   withdraw_fill( second, bob, secret );
   const order_object& o = db.get( id );
   BOOST_CHECK( o.status == order_status::completed );
   BOOST_CHECK_EQUAL( o.remaining_amount.value, 0 );
   BOOST_CHECK_EQUAL( o.filled_amount.value, 1000 );
   BOOST_CHECK_EQUAL( released( bob ).value, 1000 );
   BOOST_CHECK_EQUAL( released_ops( release_reason::fill_payout ).size(), 2u );
   // each filler takes its share of the sender's escrow
   BOOST_CHECK_EQUAL( released( filler_one ).value, 400 );
   BOOST_CHECK_EQUAL( released( filler_two ).value, 600 );
   BOOST_CHECK_EQUAL( released_ops( release_reason::fill_settlement ).size(), 2u );
   BOOST_CHECK_EQUAL( released( alice ).value, 0 );

   const auto fills = db.get_fills( id );
   BOOST_REQUIRE_EQUAL( fills.size(), 2u );
   BOOST_CHECK( fills[0].id == first );
   BOOST_CHECK_EQUAL( fills[0].filler, filler_one );
   BOOST_CHECK( fills[1].id == second );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_completed, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( order_stays_open_until_fully_settled )
{ try {
   const auto secret = make_secret( "interleaved" );
   auto op = make_order_op( 1000, secret, hour_lock() );
   op.allow_partial_fills = true;
   const order_id_type id = create_order( op ).id;

   const fill_id_type first = create_fill( id, filler_one, 400 ).id;
   withdraw_fill( first, bob, secret );
   BOOST_CHECK( db.get( id ).status == order_status::open );

   const fill_id_type second = create_fill( id, filler_two, 600 ).id;
   BOOST_CHECK( db.get( id ).status == order_status::fully_committed );
   withdraw_fill( second, bob, secret );
   BOOST_CHECK( db.get( id ).status == order_status::completed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_create_rejections )
{ try {
   const auto secret = make_secret( "rejections" );
   FUSION_REQUIRE_THROW( create_fill( create_order( 1000, make_secret( "whole" ), hour_lock() ).id, filler_one, 1000 ),
                         fill_create_partial_fills_disabled );

   auto op = make_order_op( 1000, secret, hour_lock() );
   op.allow_partial_fills = true;
   op.min_fill_amount     = 100;
   const order_id_type id = create_order( op ).id;

   FUSION_REQUIRE_THROW( create_fill( id, filler_one, 99 ), fill_create_amount_below_minimum );
   create_fill( id, filler_one, 100 );
   FUSION_REQUIRE_THROW( create_fill( id, filler_one, 901 ), fill_create_amount_exceeds_remaining );
   FUSION_REQUIRE_THROW( create_fill( id, filler_one, 100, hash_secret( make_secret( "own" ) ) ),
                         fill_create_hashlock_mismatch );
   create_fill( id, filler_two, 900 );
   FUSION_REQUIRE_THROW( create_fill( id, filler_two, 100 ), fill_create_order_not_open );

   generate_seconds( 3600 );
   auto late = make_order_op( 1000, make_secret( "late" ), hour_lock() );
   late.allow_partial_fills = true;
   const order_id_type late_id = create_order( late ).id;
   generate_seconds( 3600 );
   FUSION_REQUIRE_THROW( create_fill( late_id, filler_one, 500 ), fill_create_order_expired );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fills_follow_the_stage_schedule )
{ try {
   auto op = make_order_op( 1000, make_secret( "staged fills" ) );
   op.allow_partial_fills = true;
   const order_object& o = create_order( op );
   const order_id_type id = o.id;

   FUSION_REQUIRE_THROW( create_fill( id, bob, 500 ), fill_create_order_not_final );

   set_time_since( o, 600 );
   FUSION_REQUIRE_THROW( create_fill( id, filler_one, 500 ), fill_create_unauthorized );
   create_fill( id, bob, 200 );

   set_time_since( db.get( id ), 1800 );
   create_fill( id, filler_one, 300 );

   set_time_since( db.get( id ), 2400 );
   FUSION_REQUIRE_THROW( create_fill( id, filler_two, 500 ), fill_create_order_expired );
   BOOST_CHECK_EQUAL( db.get( id ).remaining_amount.value, 500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_withdraw_rejections )
{ try {
   const auto secret = make_secret( "fill secret" );
   auto op = make_order_op( 1000, secret, hour_lock() );
   op.allow_partial_fills = true;
   const order_id_type id = create_order( op ).id;
   const fill_id_type fill = create_fill( id, filler_one, 500 ).id;

   FUSION_REQUIRE_THROW( withdraw_fill( fill, filler_one, secret ), fill_withdraw_unauthorized );
   FUSION_REQUIRE_THROW( withdraw_fill( fill, bob, make_secret( "nope" ) ), fill_withdraw_invalid_secret );
   // the whole order can no longer be withdrawn once it has fills
   FUSION_REQUIRE_THROW( withdraw( id, bob, secret ), order_withdraw_order_has_fills );

   withdraw_fill( fill, bob, secret );
   FUSION_REQUIRE_THROW( withdraw_fill( fill, bob, secret ), fill_withdraw_fill_not_pending );
   FUSION_REQUIRE_THROW( refund_fill( fill, filler_one ), fill_refund_order_not_expired );
   BOOST_CHECK_EQUAL( released( bob ).value, 500 );

   const fill_id_type late = create_fill( id, filler_two, 500 ).id;
   generate_seconds( 3600 );
   FUSION_REQUIRE_THROW( withdraw_fill( late, bob, secret ), fill_withdraw_order_expired );
   refund_fill( late, filler_two );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( expired_fill_goes_back_to_its_filler )
{ try {
   auto op = make_order_op( 1000, make_secret( "refund" ), hour_lock() );
   op.allow_partial_fills = true;
   const order_id_type id = create_order( op ).id;
   const fill_id_type fill = create_fill( id, filler_one, 1000 ).id;
   BOOST_CHECK( db.get( id ).status == order_status::fully_committed );

   FUSION_REQUIRE_THROW( refund_fill( fill, filler_one ), fill_refund_order_not_expired );
   generate_seconds( 3600 );
   FUSION_REQUIRE_THROW( refund_fill( fill, carol ), fill_refund_unauthorized );

   refund_fill( fill, filler_one );
   BOOST_CHECK( db.get( fill ).status == fill_status::refunded );
   BOOST_CHECK_EQUAL( released( filler_one ).value, 1000 );
   BOOST_CHECK( db.get( id ).status == order_status::open );
   BOOST_CHECK_EQUAL( db.get( id ).remaining_amount.value, 1000 );
   BOOST_CHECK_EQUAL( db.get( id ).filled_amount.value, 0 );
   FUSION_REQUIRE_THROW( refund_fill( fill, filler_one ), fill_refund_fill_not_pending );

   cancel( id, alice );
   BOOST_CHECK_EQUAL( released( alice ).value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fills_refundable_after_cancel )
{ try {
   auto op = make_order_op( 1000, make_secret( "cancelled fills" ), hour_lock() );
   op.allow_partial_fills = true;
   const order_id_type id = create_order( op ).id;
   const fill_id_type fill = create_fill( id, filler_one, 400 ).id;

   generate_seconds( 3600 );
   cancel( id, alice );
   BOOST_CHECK_EQUAL( released( alice ).value, 600 );
   BOOST_CHECK_EQUAL( db.get( id ).refunded_amount.value, 600 );

   refund_fill( fill, filler_one );
   BOOST_CHECK_EQUAL( released( filler_one ).value, 400 );
   // the fill's share of the escrow follows the cancelled remainder back to the sender
   BOOST_CHECK_EQUAL( released( alice ).value, 1000 );
   BOOST_CHECK_EQUAL( db.get( id ).refunded_amount.value, 1000 );
   BOOST_CHECK_EQUAL( db.get( id ).remaining_amount.value, 600 );
   BOOST_CHECK_EQUAL( db.get( id ).filled_amount.value, 400 );
   BOOST_CHECK( db.get( id ).status == order_status::cancelled );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( refund_and_cancel_release_the_same_totals_in_either_order )
{ try {
   auto op = make_order_op( 1000, make_secret( "refund first" ), hour_lock() );
   op.allow_partial_fills = true;
   const order_id_type refund_first = create_order( op ).id;
   op.hashlock = hash_secret( make_secret( "cancel first" ) );
   const order_id_type cancel_first = create_order( op ).id;

   const fill_id_type fill_a = create_fill( refund_first, filler_one, 400 ).id;
   const fill_id_type fill_b = create_fill( cancel_first, filler_two, 400 ).id;
   generate_seconds( 3600 );

   refund_fill( fill_a, filler_one );
   cancel( refund_first, alice );

   cancel( cancel_first, alice );
   refund_fill( fill_b, filler_two );

   const auto total_to = [this]( order_id_type order, const address_type& to ) {
      share_type total = 0;
      for( const auto& r : released_ops() )
         if( r.order == order && r.to == to )
            total += r.amount.amount;
      return total.value;
   };
   BOOST_CHECK_EQUAL( total_to( refund_first, alice ), 1000 );
   BOOST_CHECK_EQUAL( total_to( cancel_first, alice ), 1000 );
   BOOST_CHECK_EQUAL( total_to( refund_first, filler_one ), 400 );
   BOOST_CHECK_EQUAL( total_to( cancel_first, filler_two ), 400 );
   BOOST_CHECK_EQUAL( released( alice ).value, 2000 );
   BOOST_CHECK_EQUAL( released( bob ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( per_fill_secrets )
{ try {
   const auto s1 = make_secret( "first filler" );
   const auto s2 = make_secret( "second filler" );
   auto op = make_order_op( 1000, make_secret( "order secret" ), hour_lock() );
   op.allow_partial_fills = true;
   op.secret_policy       = secret_policy_type::per_fill;
   const order_id_type id = create_order( op ).id;

   FUSION_REQUIRE_THROW( create_fill( id, filler_one, 500 ), fill_create_hashlock_mismatch );
   const fill_id_type first  = create_fill( id, filler_one, 500, hash_secret( s1 ) ).id;
   const fill_id_type second = create_fill( id, filler_two, 500, hash_secret( s2 ) ).id;

   FUSION_REQUIRE_THROW( withdraw_fill( first, bob, make_secret( "order secret" ) ), fill_withdraw_invalid_secret );
   FUSION_REQUIRE_THROW( withdraw_fill( second, bob, s1 ), fill_withdraw_invalid_secret );
   withdraw_fill( first, bob, s1 );
   withdraw_fill( second, bob, s2 );

   BOOST_CHECK( db.get( id ).status == order_status::completed );
   BOOST_CHECK( !db.get( id ).revealed_secret.valid() );
   BOOST_CHECK( *db.get( second ).revealed_secret == s2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

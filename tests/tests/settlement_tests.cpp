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
#include <fusion/chain/pending_transfer_object.hpp>

#include "../common/database_fixture.hpp"

using namespace fusion::chain;
using namespace fusion::chain::test;

namespace {
   struct cross_chain_fixture : database_fixture
   {
      const secret_type secret = make_secret( "cross chain" );

      cross_chain_fixture()
      {
         add_destination_chain( "neutron-1", 25 );
      }

      order_id_type create_cross_chain_order( const secret_type& s, share_type amount = 10000 )
      {
         single_timelock lock;
         lock.seconds = 3600;
         auto op = make_order_op( amount, s, lock );
         destination_info dest;
         dest.chain_id  = "neutron-1";
         dest.recipient = "neutron1bob";
         dest.token     = "ibc/uatom";
         op.destination = dest;
         return create_order( op ).id;
      }

      uint64_t settle( order_id_type id, const address_type& settler, const secret_type& s )
      {
         const auto result = withdraw( id, settler, s );
         const auto& transfer = db.get<pending_transfer_object>( result.get<object_id_type>() );
         return transfer.sequence;
      }
   };
}

BOOST_FIXTURE_TEST_SUITE( settlement_tests, cross_chain_fixture )

BOOST_AUTO_TEST_CASE( withdraw_starts_a_transfer )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   BOOST_CHECK( db.get( id ).is_cross_chain() );

   db.clear_applied_operations();
   const uint64_t sequence = settle( id, carol, secret );
   BOOST_CHECK_EQUAL( sequence, 1u );

   const order_object& o = db.get( id );
   BOOST_CHECK( o.status == order_status::in_flight );
   BOOST_REQUIRE( o.transfer_sequence.valid() );
   BOOST_CHECK_EQUAL( *o.transfer_sequence, sequence );
   BOOST_CHECK( o.revealed_secret.valid() );

   const pending_transfer_object& transfer = db.get_pending_transfer( sequence );
   BOOST_CHECK( transfer.order == id );
   BOOST_CHECK_EQUAL( transfer.chain_id, "neutron-1" );
   BOOST_CHECK_EQUAL( transfer.channel, "channel-7" );
   BOOST_CHECK_EQUAL( transfer.recipient, "neutron1bob" );
   // 0.3% protocol fee plus the chain's 0.25% surcharge
   BOOST_CHECK( transfer.amount == asset( 9945, denom ) );
   BOOST_CHECK( transfer.fee == asset( 55, denom ) );
   BOOST_CHECK_EQUAL( transfer.settler, carol );
   BOOST_CHECK( transfer.timeout == db.head_time() + db.get_parameters().ack_timeout_seconds );

   // nothing is released before the ack
   BOOST_CHECK( released_ops().empty() );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().pending_transfers, 1u );

   const uint64_t next = settle( create_cross_chain_order( make_secret( "another" ) ), carol, make_secret( "another" ) );
   BOOST_CHECK_EQUAL( next, 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( in_flight_orders_are_locked )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   settle( id, carol, secret );

   FUSION_REQUIRE_THROW( withdraw( id, bob, secret ), order_withdraw_transfer_in_flight );
   FUSION_REQUIRE_THROW( cancel( id, alice ), order_cancel_transfer_in_flight );
   BOOST_CHECK( !db.can_withdraw( db.get( id ), bob ) );
   BOOST_CHECK( !db.can_cancel( db.get( id ), alice ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cross_chain_orders_take_no_fills )
{ try {
   auto op = make_order_op( 10000, make_secret( "partial remote" ) );
   destination_info dest;
   dest.chain_id  = "neutron-1";
   dest.recipient = "neutron1bob";
   dest.token     = "ibc/uatom";
   op.destination         = dest;
   op.allow_partial_fills = true;
   FUSION_REQUIRE_THROW( create_order( op ), fc::assert_exception );

   const order_id_type id = create_cross_chain_order( secret );
   FUSION_REQUIRE_THROW( create_fill( id, carol, 1000 ), fill_create_partial_fills_disabled );
   settle( id, carol, secret );
   FUSION_REQUIRE_THROW( create_fill( id, carol, 1000 ), fill_create_partial_fills_disabled );
   BOOST_CHECK( db.get_fills( id ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( success_ack_completes_the_order )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   const uint64_t sequence = settle( id, carol, secret );

   db.clear_applied_operations();
   ack( sequence, ack_outcome::success );

   const order_object& o = db.get( id );
   BOOST_CHECK( o.status == order_status::completed );
   BOOST_CHECK_EQUAL( o.remaining_amount.value, 0 );
   BOOST_CHECK_EQUAL( o.filled_amount.value, 10000 );
   BOOST_CHECK( db.find_pending_transfer( sequence ) == nullptr );
   BOOST_CHECK_EQUAL( released( carol ).value, 55 );
   BOOST_CHECK_EQUAL( released_ops( release_reason::fee ).size(), 1u );

   // acks are delivered at least once
   db.clear_applied_operations();
   ack( sequence, ack_outcome::success );
   ack( sequence, ack_outcome::timeout );
   BOOST_CHECK( released_ops().empty() );
   BOOST_CHECK( db.get( id ).status == order_status::completed );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_completed, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( timeout_ack_lets_the_sender_refund )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   const uint64_t sequence = settle( id, carol, secret );

   ack( sequence, ack_outcome::timeout );
   BOOST_CHECK( db.get( id ).status == order_status::failed );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_failed, 1u );
   BOOST_CHECK( db.find_pending_transfer( sequence ) == nullptr );

   ack( sequence, ack_outcome::timeout );
   BOOST_CHECK( db.get( id ).status == order_status::failed );

   BOOST_CHECK( db.can_cancel( db.get( id ), alice ) );
   BOOST_CHECK( !db.can_cancel( db.get( id ), carol ) );
   FUSION_REQUIRE_THROW( cancel( id, carol ), order_cancel_unauthorized );
   FUSION_REQUIRE_THROW( withdraw( id, bob, secret ), order_withdraw_order_terminal );

   cancel( id, alice );
   BOOST_CHECK( db.get( id ).status == order_status::cancelled );
   BOOST_CHECK_EQUAL( released( alice ).value, 10000 );
   BOOST_CHECK_EQUAL( released( carol ).value, 0 );

   const auto stats = db.get_engine_statistics();
   BOOST_CHECK_EQUAL( stats.orders_failed, 0u );
   BOOST_CHECK_EQUAL( stats.orders_cancelled, 1u );

   FUSION_REQUIRE_THROW( cancel( id, alice ), order_cancel_order_already_cancelled );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_order_refundable_by_anyone_once_expired )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   ack( settle( id, carol, secret ), ack_outcome::failure );
   BOOST_CHECK( db.get( id ).status == order_status::failed );

   generate_seconds( 3600 );
   // the single timelock has no public cancellation stage, registered resolvers may still cancel
   register_resolver( resolver );
   cancel( id, resolver );
   BOOST_CHECK_EQUAL( released( alice ).value, 10000 );
   BOOST_CHECK_EQUAL( released( resolver ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unacknowledged_transfer_times_out )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   const uint64_t sequence = settle( id, carol, secret );
   const auto timeout = db.get_pending_transfer( sequence ).timeout;

   db.advance_time( timeout - 1 );
   BOOST_CHECK( db.get( id ).status == order_status::in_flight );

   db.advance_time( timeout );
   BOOST_CHECK( db.get( id ).status == order_status::failed );
   BOOST_CHECK( db.find_pending_transfer( sequence ) == nullptr );

   // a late success ack changes nothing
   ack( sequence, ack_outcome::success );
   BOOST_CHECK( db.get( id ).status == order_status::failed );
   BOOST_CHECK_EQUAL( released( carol ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( only_the_relayer_may_ack )
{ try {
   const order_id_type id = create_cross_chain_order( secret );
   const uint64_t sequence = settle( id, carol, secret );

   settlement_ack_operation op;
   op.relayer  = carol;
   op.sequence = sequence;
   op.outcome  = ack_outcome::success;
   FUSION_REQUIRE_THROW( db.push_operation( op ), settlement_ack_unauthorized_relayer );
   op.sequence = 999;
   FUSION_REQUIRE_THROW( db.push_operation( op ), settlement_ack_unauthorized_relayer );
   BOOST_CHECK( db.get( id ).status == order_status::in_flight );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( success_ack_returns_safety_deposit )
{ try {
   single_timelock lock;
   lock.seconds = 3600;
   auto op = make_order_op( 10000, secret, lock );
   destination_info dest;
   dest.chain_id  = "neutron-1";
   dest.recipient = "neutron1bob";
   dest.token     = "ibc/uatom";
   op.destination    = dest;
   op.safety_deposit = asset( 100, denom );
   const order_id_type id = create_order( op ).id;
   post_safety_deposit( id, resolver, 100 );

   const uint64_t sequence = settle( id, resolver, secret );
   BOOST_CHECK( db.get( id ).deposit.valid() );
   ack( sequence, ack_outcome::success );
   BOOST_CHECK( !db.get( id ).deposit.valid() );
   BOOST_CHECK_EQUAL( released( resolver ).value, 155 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

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

#include <fusion/chain/account_balance_object.hpp>
#include <fusion/chain/database.hpp>
#include <fusion/chain/exceptions.hpp>
#include <fusion/chain/global_property_object.hpp>
#include <fusion/chain/order_object.hpp>
#include <fusion/chain/pending_transfer_object.hpp>

#include <fc/io/json.hpp>

#include <limits>

#include "../common/database_fixture.hpp"

using namespace fusion::chain;
using namespace fusion::chain::test;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_session_rolls_back )
{ try {
   {
      auto session = db._undo_db.start_undo_session();
      create_order( 1000, make_secret( "undone" ) );
      register_resolver( resolver );
      BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_created, 1u );
      session.undo();
   }
   BOOST_CHECK( db.find_order_by_hashlock( hash_secret( make_secret( "undone" ) ) ) == nullptr );
   BOOST_CHECK( db.find_resolver( resolver ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_created, 0u );

   {
      // leaving the scope without a commit undoes too
      auto session = db._undo_db.start_undo_session();
      generate_seconds( 100 );
   }
   BOOST_CHECK( db.head_time() == genesis_time() );

   {
      auto session = db._undo_db.start_undo_session();
      create_order( 1000, make_secret( "kept" ) );
      session.commit();
   }
   BOOST_CHECK( db.find_order_by_hashlock( hash_secret( make_secret( "kept" ) ) ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( committed_sessions_leave_no_undo_state )
{ try {
   const order_id_type id = create_order( 1000, make_secret( "committed" ) ).id;
   generate_seconds( 700 );
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );

   // changes made outside any session are not recorded
   BOOST_CHECK( db.get_order( id ).stage == order_stage::taker_exclusive );
   db.modify( db.get( id ), []( order_object& o ) { o.stage = order_stage::pending; } );
   BOOST_CHECK( db.get( id ).stage == order_stage::pending );
   // the refresh on lookup puts the stage right, again without an undo state
   BOOST_CHECK( db.get_order( id ).stage == order_stage::taker_exclusive );
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );

   {
      auto session = db._undo_db.start_undo_session();
      create_order( 1000, make_secret( "nested" ) );
      BOOST_CHECK_EQUAL( db._undo_db.size(), 1u );
      session.undo();
   }
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );
   BOOST_CHECK( db.find_order_by_hashlock( hash_secret( make_secret( "nested" ) ) ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operation_changes_nothing )
{ try {
   const auto secret = make_secret( "atomic" );
   const order_object& o = create_order( 1000, secret );
   const order_id_type id = o.id;
   set_time_since( o, 1200 );

   const auto before = fc::json::to_string( fc::variant( db.get( id ), FUSION_MAX_NESTED_OBJECTS ) );
   db.clear_applied_operations();

   // the stage refresh done while evaluating is undone with the rest
   FUSION_REQUIRE_THROW( withdraw( id, carol, secret ), order_withdraw_unauthorized );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( db.get( id ), FUSION_MAX_NESTED_OBJECTS ) ), before );
   BOOST_CHECK( db.get_applied_operations().empty() );
   BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( state_survives_reopen )
{ try {
   register_resolver( resolver, 3, 200 );
   add_destination_chain( "neutron-1", 25 );
   const auto secret = make_secret( "persisted" );
   const order_id_type id = create_order( 1000, secret ).id;

   single_timelock lock;
   lock.seconds = 3600;
   auto op = make_order_op( 500, make_secret( "remote" ), lock );
   destination_info dest;
   dest.chain_id  = "neutron-1";
   dest.recipient = "neutron1bob";
   dest.token     = "ibc/uatom";
   op.destination = dest;
   const order_id_type remote = create_order( op ).id;
   withdraw( remote, carol, make_secret( "remote" ) );
   generate_seconds( 30 );

   const auto before = fc::json::to_string( fc::variant( db.get( id ), FUSION_MAX_NESTED_OBJECTS ) );
   const auto now = db.head_time();
   reopen();

   BOOST_CHECK( db.head_time() == now );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( db.get( id ), FUSION_MAX_NESTED_OBJECTS ) ), before );
   BOOST_CHECK( db.find_order_by_hashlock( hash_secret( secret ) ) != nullptr );
   BOOST_REQUIRE( db.find_resolver( resolver ) != nullptr );
   BOOST_CHECK_EQUAL( db.find_resolver( resolver )->fee_discount_bps, 200 );
   BOOST_REQUIRE( db.find_destination_chain( "neutron-1" ) != nullptr );
   BOOST_CHECK( db.get( remote ).status == order_status::in_flight );
   BOOST_REQUIRE( db.find_pending_transfer( 1 ) != nullptr );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().next_transfer_sequence, 2u );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_created, 2u );

   // the engine carries on where it stopped
   ack( 1, ack_outcome::success );
   BOOST_CHECK( db.get( remote ).status == order_status::completed );
   const order_id_type next = create_order( 10, make_secret( "after reopen" ) ).id;
   BOOST_CHECK( next > remote );
   set_time_since( db.get( id ), 600 );
   withdraw( id, bob, secret );
   BOOST_CHECK( db.get( id ).status == order_status::completed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( flushed_state_is_visible_without_close )
{ try {
   create_order( 1000, make_secret( "flushed" ) );
   generate_seconds( 100 );
   db.flush();
   create_order( 1000, make_secret( "unflushed" ) );

   // a second engine opened on the same directory sees what was flushed, as a restarted node would
   bool loader_called = false;
   database restarted;
   restarted.open( data_dir->path(), [this,&loader_called]{ loader_called = true; return genesis_state; } );
   BOOST_CHECK( !loader_called );
   BOOST_CHECK( restarted.head_time() == genesis_time() + 100 );
   BOOST_CHECK( restarted.find_order_by_hashlock( hash_secret( make_secret( "flushed" ) ) ) != nullptr );
   BOOST_CHECK( restarted.find_order_by_hashlock( hash_secret( make_secret( "unflushed" ) ) ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_state_is_loaded )
{ try {
   genesis_state_type genesis;
   genesis.initial_timestamp              = time_point_sec( 1600000000 );
   genesis.initial_parameters.admin       = admin;
   genesis.initial_parameters.ack_relayer = relayer;
   genesis.initial_parameters.protocol_fee_bps = 50;

   genesis_state_type::initial_resolver_type r;
   r.resolver = resolver;
   r.priority = 4;
   r.fee_discount_bps = 1000;
   genesis.initial_resolvers.push_back( r );

   genesis_state_type::initial_destination_chain_type c;
   c.chain_id = "osmosis-1";
   c.name     = "Osmosis";
   c.channel  = "channel-141";
   genesis.initial_destination_chains.push_back( c );

   // the genesis state round trips through its json form
   const auto json = fc::json::to_string( fc::variant( genesis, FUSION_MAX_NESTED_OBJECTS ) );
   const auto loaded = fc::json::from_string( json ).as<genesis_state_type>( FUSION_MAX_NESTED_OBJECTS );

   fc::temp_directory dir( fc::temp_directory_path() );
   database other;
   other.open( dir.path(), [&loaded]{ return loaded; } );

   BOOST_CHECK( other.head_time() == time_point_sec( 1600000000 ) );
   BOOST_CHECK_EQUAL( other.get_parameters().protocol_fee_bps, 50 );
   BOOST_REQUIRE( other.find_resolver( resolver ) != nullptr );
   BOOST_CHECK_EQUAL( other.find_resolver( resolver )->priority, 4u );
   BOOST_REQUIRE( other.find_destination_chain( "osmosis-1" ) != nullptr );
   BOOST_CHECK_EQUAL( other.find_destination_chain( "osmosis-1" )->channel, "channel-141" );
   other.close();

   // an existing database ignores the genesis loader
   bool loader_called = false;
   database again;
   again.open( dir.path(), [&loader_called,&loaded]{ loader_called = true; return loaded; } );
   BOOST_CHECK( !loader_called );
   BOOST_CHECK( again.find_resolver( resolver ) != nullptr );
   again.close();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invalid_genesis_is_rejected )
{ try {
   genesis_state_type genesis;
   genesis.initial_timestamp              = genesis_time();
   genesis.initial_parameters.admin       = admin;
   genesis.initial_parameters.ack_relayer = relayer;
   genesis.validate();

   genesis_state_type::initial_resolver_type r;
   r.resolver = resolver;
   genesis.initial_resolvers.push_back( r );
   genesis.initial_resolvers.push_back( r );
   FUSION_REQUIRE_THROW( genesis.validate(), fc::assert_exception );
   genesis.initial_resolvers.pop_back();

   genesis.initial_parameters.admin.clear();
   FUSION_REQUIRE_THROW( genesis.validate(), invalid_address );
   genesis.initial_parameters.admin = admin;

   genesis_state_type::initial_destination_chain_type c;
   c.chain_id = "osmosis-1";
   c.channel  = "channel-141";
   c.fee_multiplier_bps = FUSION_100_PERCENT + 1;
   genesis.initial_destination_chains.push_back( c );
   FUSION_REQUIRE_THROW( genesis.validate(), invalid_fee );

   fc::temp_directory dir( fc::temp_directory_path() );
   database other;
   FUSION_REQUIRE_THROW( other.open( dir.path(), [&genesis]{ return genesis; } ), invalid_fee );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( engine_statistics )
{ try {
   register_resolver( resolver );
   register_resolver( carol );
   resolver_update_operation update;
   update.admin    = admin;
   update.resolver = carol;
   update.enabled  = false;
   db.push_operation( update );

   const auto secret = make_secret( "done" );
   const order_object& done = create_order( 1000, secret );
   const order_id_type done_id = done.id;
   const order_id_type cancelled = create_order( 2000, make_secret( "cancelled" ) ).id;
   create_order( 3000, make_secret( "open" ) );

   set_time_since( done, 600 );
   withdraw( done_id, bob, secret );
   set_time_since( db.get( done_id ), 2400 );
   cancel( cancelled, alice );

   const auto stats = db.get_engine_statistics();
   BOOST_CHECK( stats.time == db.head_time() );
   BOOST_CHECK_EQUAL( stats.orders_created, 3u );
   BOOST_CHECK_EQUAL( stats.orders_completed, 1u );
   BOOST_CHECK_EQUAL( stats.orders_cancelled, 1u );
   BOOST_CHECK_EQUAL( stats.orders_failed, 0u );
   BOOST_CHECK_EQUAL( stats.total_volume.value, 6000 );
   BOOST_CHECK_EQUAL( stats.active_orders, 1u );
   BOOST_CHECK_EQUAL( stats.pending_transfers, 0u );
   BOOST_CHECK_EQUAL( stats.enabled_resolvers, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( counter_overflow_rejects_the_operation )
{ try {
   const auto secret = make_secret( "near the limit" );
   const order_id_type id = create_order( 1000, secret ).id;
   set_time_since( db.get( id ), 600 );
   withdraw( id, bob, secret );
   BOOST_REQUIRE_EQUAL( released( bob ).value, 997 );

   const auto almost_max = std::numeric_limits<int64_t>::max() - 500;
   db.modify( db.get_dynamic_global_properties(), [almost_max]( dynamic_global_property_object& dgp ) {
      dgp.total_volume = almost_max;
   });
   FUSION_REQUIRE_THROW( create_order( 1000, make_secret( "volume" ) ), fc::overflow_exception );
   BOOST_CHECK( db.find_order_by_hashlock( hash_secret( make_secret( "volume" ) ) ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().total_volume.value, almost_max );

   db.modify( db.get_dynamic_global_properties(), []( dynamic_global_property_object& dgp ) {
      dgp.total_volume = 0;
   });
   const auto& balances = db.get_index_type<account_balance_index>().indices().get<by_owner_denom>();
   db.modify( *balances.find( boost::make_tuple( bob, denom ) ), [almost_max]( account_balance_object& b ) {
      b.released = almost_max;
   });
   const auto other = make_secret( "balance" );
   const order_id_type next = create_order( 1000, other ).id;
   set_time_since( db.get( next ), 600 );
   FUSION_REQUIRE_THROW( withdraw( next, bob, other ), fc::overflow_exception );
   BOOST_CHECK( db.get( next ).status == order_status::open );
   BOOST_CHECK_EQUAL( released( bob ).value, almost_max );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( advance_time_refreshes_every_order )
{ try {
   const order_id_type a = create_order( 1000, make_secret( "a" ) ).id;
   generate_seconds( 700 );
   const order_id_type b = create_order( 1000, make_secret( "b" ) ).id;

   BOOST_CHECK( db.get( a ).stage == order_stage::taker_exclusive );
   BOOST_CHECK( db.get( b ).stage == order_stage::pending );

   generate_seconds( 1800 );
   // no lookup through get_order, the clock alone moved the stages
   BOOST_CHECK( db.get( a ).stage == order_stage::private_cancellation );
   BOOST_CHECK( db.get( b ).stage == order_stage::public_resolver );
   BOOST_CHECK( db.get( a ).next_stage_change == db.get( a ).created + 3600 );

   // standing still is fine, going back is not
   generate_seconds( 0 );
   FUSION_REQUIRE_THROW( db.advance_time( db.head_time() - 1 ), time_moved_backwards );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

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

#include <fusion/protocol/operations.hpp>
#include <fusion/protocol/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace fusion::chain;
using namespace fusion::chain::test;

BOOST_FIXTURE_TEST_SUITE( operation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( order_create_validation )
{ try {
   auto op = make_order_op( 1000, make_secret( "s" ) );
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, sender, "", invalid_address );
   REQUIRE_OP_VALIDATION_FAILURE( op, receiver, std::string( FUSION_MAX_ADDRESS_LENGTH + 1, 'r' ), invalid_address );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( 0, denom ), invalid_amount );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( -5, denom ), invalid_amount );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( 1000, "" ), invalid_amount );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( FUSION_MAX_SHARE_SUPPLY + 1, denom ), invalid_amount );
   REQUIRE_OP_VALIDATION_FAILURE( op, hashlock, hashlock_type(), invalid_hashlock );
   REQUIRE_OP_VALIDATION_FAILURE( op, timelock, timelock_type( single_timelock() ), invalid_timelock );
   REQUIRE_OP_VALIDATION_FAILURE( op, fee_bps, optional<uint16_t>( FUSION_100_PERCENT + 1 ), invalid_fee );
   REQUIRE_OP_VALIDATION_FAILURE( op, taker, optional<address_type>( address_type() ), invalid_address );

   // a minimum fill needs partial fills and must lie within the amount
   REQUIRE_OP_VALIDATION_FAILURE( op, min_fill_amount, optional<share_type>( 100 ), fc::assert_exception );
   op.allow_partial_fills = true;
   REQUIRE_OP_VALIDATION_FAILURE( op, min_fill_amount, optional<share_type>( 0 ), invalid_amount );
   REQUIRE_OP_VALIDATION_FAILURE( op, min_fill_amount, optional<share_type>( 1001 ), invalid_amount );
   op.min_fill_amount = 1000;
   op.validate();

   // cross-chain orders settle as a whole
   destination_info dest;
   dest.chain_id  = "neutron-1";
   dest.recipient = "neutron1bob";
   dest.token     = "untrn";
   op.destination = dest;
   FUSION_REQUIRE_THROW( op.validate(), fc::assert_exception );
   op.allow_partial_fills = false;
   op.min_fill_amount.reset();
   op.validate();
   op.destination->recipient.clear();
   FUSION_REQUIRE_THROW( op.validate(), invalid_address );
   op.destination.reset();

   op.secret_policy = secret_policy_type::per_fill;
   FUSION_REQUIRE_THROW( op.validate(), fc::assert_exception );
   op.secret_policy = secret_policy_type::per_order;

   op.safety_deposit = asset( 10, "uosmo" );
   FUSION_REQUIRE_THROW( op.validate(), fc::assert_exception );
   op.safety_deposit = asset( 10, denom );
   op.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( settlement_operation_validation )
{ try {
   order_withdraw_operation withdraw;
   withdraw.withdrawer = bob;
   withdraw.secret     = make_secret( "s" );
   withdraw.validate();
   REQUIRE_OP_VALIDATION_FAILURE( withdraw, secret, secret_type(), invalid_secret_size );
   REQUIRE_OP_VALIDATION_FAILURE( withdraw, withdrawer, "", invalid_address );

   fill_create_operation fill;
   fill.filler = carol;
   fill.amount = 10;
   fill.validate();
   REQUIRE_OP_VALIDATION_FAILURE( fill, amount, 0, invalid_amount );
   REQUIRE_OP_VALIDATION_FAILURE( fill, hashlock, optional<hashlock_type>( hashlock_type() ), invalid_hashlock );

   settlement_ack_operation ack;
   ack.relayer = relayer;
   ack.validate();
   REQUIRE_OP_VALIDATION_FAILURE( ack, relayer, "", invalid_address );

   resolver_update_operation update;
   update.admin    = admin;
   update.resolver = resolver;
   FUSION_REQUIRE_THROW( update.validate(), fc::assert_exception );
   update.enabled = false;
   update.validate();
   REQUIRE_OP_VALIDATION_FAILURE( update, fee_discount_bps, optional<uint16_t>( FUSION_100_PERCENT + 1 ), invalid_fee );

   destination_chain_update_operation chain;
   chain.admin    = admin;
   chain.chain_id = "neutron-1";
   chain.channel  = "channel-0";
   chain.validate();
   REQUIRE_OP_VALIDATION_FAILURE( chain, chain_id, "", invalid_address );
   REQUIRE_OP_VALIDATION_FAILURE( chain, channel, "", fc::assert_exception );
   REQUIRE_OP_VALIDATION_FAILURE( chain, fee_multiplier_bps, FUSION_100_PERCENT + 1, invalid_fee );

   engine_parameters_update_operation params;
   params.admin          = admin;
   params.new_parameters = db.get_parameters();
   params.validate();
   params.new_parameters.min_timelock = params.new_parameters.max_timelock + 1;
   FUSION_REQUIRE_THROW( params.validate(), invalid_parameters );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( virtual_operations_can_not_be_pushed )
{ try {
   funds_released_operation op( order_id_type(), bob, asset( 10, denom ), release_reason::payout );
   BOOST_CHECK( is_virtual_operation( op ) );
   BOOST_CHECK( !is_virtual_operation( make_order_op( 10, make_secret( "s" ) ) ) );
   FUSION_REQUIRE_THROW( db.push_operation( op ), virtual_operation_pushed );
   BOOST_CHECK_EQUAL( released( bob ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invalid_operations_leave_no_trace )
{ try {
   auto op = make_order_op( 1000, make_secret( "s" ) );
   op.amount.amount = 0;
   FUSION_REQUIRE_THROW( db.push_operation( op ), invalid_amount );
   BOOST_CHECK( db.find_order_by_hashlock( op.hashlock ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_engine_statistics().orders_created, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operations_round_trip_through_json )
{ try {
   auto op = make_order_op( 1000, make_secret( "s" ) );
   op.allow_partial_fills = true;
   op.allowed_resolvers.insert( resolver );

   const std::string json = fc::json::to_string( fc::variant( operation( op ), FUSION_MAX_NESTED_OBJECTS ) );
   const auto parsed = fc::json::from_string( json ).as<operation>( FUSION_MAX_NESTED_OBJECTS );
   BOOST_REQUIRE( parsed.is_type<order_create_operation>() );
   const auto& back = parsed.get<order_create_operation>();
   BOOST_CHECK( back.hashlock == op.hashlock );
   BOOST_CHECK( back.amount == op.amount );
   BOOST_CHECK( back.allowed_resolvers == op.allowed_resolvers );
   BOOST_CHECK( back.timelock.is_type<stage_durations>() );
   BOOST_CHECK_EQUAL( back.timelock.get<stage_durations>().total(), 3600u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

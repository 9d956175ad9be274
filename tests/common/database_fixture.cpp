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

#include <fusion/chain/order_object.hpp>
#include <fusion/chain/fill_object.hpp>

#include "database_fixture.hpp"

uint32_t FUSION_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace fusion { namespace chain {

namespace test {

secret_type make_secret( const string& s )
{
   return secret_type( s.begin(), s.end() );
}

stage_durations default_durations()
{
   stage_durations d;
   d.finality_delay                = 600;
   d.taker_exclusive_duration      = 600;
   d.private_resolver_duration     = 600;
   d.public_resolver_duration      = 600;
   d.private_cancellation_duration = 1200;
   return d;
}

} // fusion::chain::test

database_fixture::database_fixture()
{ try {
   const auto& mhz = boost::unit_test::framework::master_test_suite();
   for( int i = 1; i < mhz.argc; i++ )
   {
      const std::string arg = mhz.argv[i];
      if( arg == "--record-assert-trip" )
         fc::enable_record_assert_trip = true;
   }

   genesis_state.initial_timestamp              = genesis_time();
   genesis_state.initial_parameters.admin       = admin;
   genesis_state.initial_parameters.ack_relayer = relayer;

   data_dir = fc::temp_directory( fc::temp_directory_path() );
   db.open( data_dir->path(), [this]{ return genesis_state; } );
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   try {
      // If we're unwinding due to an exception, don't do any more checks.
      // This way, boost test's last checkpoint tells us approximately where the error was.
      if( !std::uncaught_exception() )
         verify_order_accounting();
      db.close();
   } catch( const fc::exception& ex ) {
      BOOST_FAIL( std::string("fc::exception in ~database_fixture: ") + ex.to_detail_string() );
   } catch( const std::exception& ex ) {
      BOOST_FAIL( std::string("std::exception in ~database_fixture:") + ex.what() );
   }
}

void database_fixture::reopen()
{
   db.close();
   db.open( data_dir->path(), [this]{ return genesis_state; } );
}

void database_fixture::generate_seconds( uint32_t seconds )
{
   db.advance_time( db.head_time() + seconds );
}

void database_fixture::set_time_since( const order_object& o, uint32_t offset )
{
   db.advance_time( o.created + offset );
}

void database_fixture::verify_order_accounting()const
{
   for( const order_object& o : db.get_index_type<order_index>().indices() )
   {
      BOOST_CHECK_GE( o.remaining_amount.value, 0 );
      BOOST_CHECK_GE( o.filled_amount.value, 0 );
      BOOST_CHECK_EQUAL( (o.remaining_amount + o.filled_amount).value, o.total_amount.amount.value );
      if( o.revealed_secret.valid() && o.secret_policy == secret_policy_type::per_order )
         BOOST_CHECK( verify_secret( *o.revealed_secret, o.hashlock ) );
   }
   for( const fill_object& f : db.get_index_type<fill_index>().indices() )
      BOOST_CHECK_GT( f.amount.value, 0 );
}

order_create_operation database_fixture::make_order_op( share_type amount, const secret_type& secret,
                                                        const timelock_type& timelock )const
{
   order_create_operation op;
   op.sender   = alice;
   op.receiver = bob;
   op.amount   = asset( amount, denom );
   op.hashlock = hash_secret( secret );
   op.timelock = timelock;
   return op;
}

const order_object& database_fixture::create_order( const order_create_operation& op )
{ try {
   const auto result = db.push_operation( op );
   return db.get<order_object>( result.get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (op) ) }

const order_object& database_fixture::create_order( share_type amount, const secret_type& secret,
                                                    const timelock_type& timelock )
{
   return create_order( make_order_op( amount, secret, timelock ) );
}

const fill_object& database_fixture::create_fill( order_id_type order, const address_type& filler, share_type amount,
                                                  const optional<hashlock_type>& hashlock )
{ try {
   fill_create_operation op;
   op.order    = order;
   op.filler   = filler;
   op.amount   = amount;
   op.hashlock = hashlock;
   const auto result = db.push_operation( op );
   return db.get<fill_object>( result.get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (order)(filler)(amount)(hashlock) ) }

operation_result database_fixture::withdraw( order_id_type order, const address_type& withdrawer,
                                             const secret_type& secret )
{
   order_withdraw_operation op;
   op.order      = order;
   op.withdrawer = withdrawer;
   op.secret     = secret;
   return db.push_operation( op );
}

void database_fixture::withdraw_fill( fill_id_type fill, const address_type& caller, const secret_type& secret )
{
   fill_withdraw_operation op;
   op.fill   = fill;
   op.caller = caller;
   op.secret = secret;
   db.push_operation( op );
}

void database_fixture::refund_fill( fill_id_type fill, const address_type& caller )
{
   fill_refund_operation op;
   op.fill   = fill;
   op.caller = caller;
   db.push_operation( op );
}

void database_fixture::cancel( order_id_type order, const address_type& caller )
{
   order_cancel_operation op;
   op.order  = order;
   op.caller = caller;
   db.push_operation( op );
}

void database_fixture::post_safety_deposit( order_id_type order, const address_type& depositor, share_type amount )
{
   safety_deposit_post_operation op;
   op.order     = order;
   op.depositor = depositor;
   op.amount    = asset( amount, denom );
   db.push_operation( op );
}

void database_fixture::ack( uint64_t sequence, ack_outcome outcome )
{
   settlement_ack_operation op;
   op.relayer  = relayer;
   op.sequence = sequence;
   op.outcome  = outcome;
   db.push_operation( op );
}

const resolver_object& database_fixture::register_resolver( const address_type& addr, uint32_t priority,
                                                            uint16_t fee_discount_bps )
{ try {
   resolver_register_operation op;
   op.admin            = admin;
   op.resolver         = addr;
   op.priority         = priority;
   op.fee_discount_bps = fee_discount_bps;
   db.push_operation( op );
   const auto* r = db.find_resolver( addr );
   FC_ASSERT( r != nullptr );
   return *r;
} FC_CAPTURE_AND_RETHROW( (addr)(priority)(fee_discount_bps) ) }

const destination_chain_object& database_fixture::add_destination_chain( const chain_id_type& chain_id,
                                                                         uint16_t fee_multiplier_bps )
{ try {
   destination_chain_update_operation op;
   op.admin              = admin;
   op.chain_id           = chain_id;
   op.name               = chain_id;
   op.channel            = "channel-7";
   op.fee_multiplier_bps = fee_multiplier_bps;
   const auto result = db.push_operation( op );
   return db.get<destination_chain_object>( result.get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (chain_id)(fee_multiplier_bps) ) }

share_type database_fixture::released( const address_type& owner )const
{
   return db.get_released_balance( owner, denom ).amount;
}

vector<funds_released_operation> database_fixture::released_ops( optional<release_reason> reason )const
{
   vector<funds_released_operation> result;
   for( const auto& op : db.get_applied_operations() )
   {
      if( !op.is_type<funds_released_operation>() )
         continue;
      const auto& released = op.get<funds_released_operation>();
      if( !reason.valid() || released.reason == *reason )
         result.push_back( released );
   }
   return result;
}

} } // fusion::chain

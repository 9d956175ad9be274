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

#include <fusion/chain/database.hpp>
#include <fusion/chain/exceptions.hpp>
#include <fusion/protocol/secret.hpp>
#include <fusion/protocol/fee.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>

#include <boost/test/unit_test.hpp>

#include <iostream>

extern uint32_t FUSION_TESTING_GENESIS_TIMESTAMP;

#define FUSION_REQUIRE_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "FUSION_REQUIRE_THROW begin "          \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "FUSION_REQUIRE_THROW end "            \
         << req_throw_info << std::endl;                  \
}

#define FUSION_CHECK_THROW( expr, exc_type )              \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "FUSION_CHECK_THROW begin "            \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "FUSION_CHECK_THROW end "              \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   FUSION_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}

#define REQUIRE_EXCEPTION_WITH_TEXT( expr, exc_text )             \
{                                                                 \
   try                                                            \
   {                                                              \
      expr;                                                       \
      BOOST_FAIL( std::string("Expected an exception with \"") +  \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown") );                     \
   }                                                              \
   catch( const fc::exception& ex )                               \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all) );                  \
      if( what.find(exc_text) == std::string::npos )              \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what) );                                  \
      }                                                           \
   }                                                              \
}

namespace fusion { namespace chain { namespace test {

/// Preimage made of the characters of @p s
secret_type make_secret( const string& s );

/// Five stages totalling an hour: 600s each, and 1200s of private cancellation
stage_durations default_durations();

} // fusion::chain::test

struct database_fixture
{
   const address_type admin    = "fusion1admin";
   const address_type relayer  = "fusion1relayer";
   const address_type alice    = "fusion1alice";    // sender
   const address_type bob      = "fusion1bob";      // receiver
   const address_type carol    = "fusion1carol";    // nobody in particular
   const address_type resolver = "fusion1resolver";
   const string       denom    = "uatom";

   genesis_state_type genesis_state;
   chain::database db;
   optional<fc::temp_directory> data_dir;

   database_fixture();
   virtual ~database_fixture();

   static time_point_sec genesis_time() { return time_point_sec( FUSION_TESTING_GENESIS_TIMESTAMP ); }

   /// Closes the database and opens it again from the data directory
   void reopen();

   void generate_seconds( uint32_t seconds );
   /// Moves the clock to @p offset seconds after @p o was created
   void set_time_since( const order_object& o, uint32_t offset );

   /// Checks filled + remaining == total and that no amount went negative, for every order and fill
   void verify_order_accounting()const;

   order_create_operation make_order_op( share_type amount, const secret_type& secret,
                                         const timelock_type& timelock = test::default_durations() )const;
   const order_object& create_order( const order_create_operation& op );
   const order_object& create_order( share_type amount, const secret_type& secret,
                                     const timelock_type& timelock = test::default_durations() );

   const fill_object& create_fill( order_id_type order, const address_type& filler, share_type amount,
                                   const optional<hashlock_type>& hashlock = optional<hashlock_type>() );
   operation_result withdraw( order_id_type order, const address_type& withdrawer, const secret_type& secret );
   void withdraw_fill( fill_id_type fill, const address_type& caller, const secret_type& secret );
   void refund_fill( fill_id_type fill, const address_type& caller );
   void cancel( order_id_type order, const address_type& caller );
   void post_safety_deposit( order_id_type order, const address_type& depositor, share_type amount );
   void ack( uint64_t sequence, ack_outcome outcome );

   const resolver_object& register_resolver( const address_type& addr, uint32_t priority = 0,
                                             uint16_t fee_discount_bps = 0 );
   const destination_chain_object& add_destination_chain( const chain_id_type& chain_id,
                                                          uint16_t fee_multiplier_bps = 0 );

   share_type released( const address_type& owner )const;
   /// funds_released operations emitted since the last clear, optionally only those of @p reason
   vector<funds_released_operation> released_ops( optional<release_reason> reason = optional<release_reason>() )const;
};

} } // fusion::chain

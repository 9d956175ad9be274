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
#include <fusion/protocol/secret.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/filesystem.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

using namespace fusion::chain;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Hack to log messages to console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n"); // This is needed, otherwise the next message will cover it
}

namespace {

   genesis_state_type create_example_genesis()
   {
      genesis_state_type genesis;
      genesis.initial_timestamp = fc::time_point_sec( fc::time_point::now() );
      genesis.initial_parameters.admin       = "fusion-admin";
      genesis.initial_parameters.ack_relayer = "fusion-relayer";

      genesis_state_type::initial_resolver_type resolver;
      resolver.resolver = "resolver-0";
      resolver.priority = 100;
      genesis.initial_resolvers.push_back( resolver );

      genesis_state_type::initial_destination_chain_type chain;
      chain.chain_id = "neutron-1";
      chain.name     = "Neutron";
      chain.channel  = "channel-0";
      genesis.initial_destination_chains.push_back( chain );
      return genesis;
   }

   template<typename T>
   void print( const T& value )
   {
      std::cout << fc::json::to_pretty_string( fc::variant( value, FUSION_MAX_NESTED_OBJECTS ) ) << "\n";
   }

   order_id_type parse_order_id( const std::string& s )
   {
      return fc::variant( s ).as<order_id_type>( 1 );
   }

   void run_query( database& db, const std::vector<std::string>& args )
   {
      FC_ASSERT( !args.empty(), "Missing query name" );
      const std::string& name = args[0];
      auto arg = [&args,&name]( size_t i ) -> const std::string& {
         FC_ASSERT( args.size() > i, "Query ${q} needs ${n} arguments", ("q",name)("n",i) );
         return args[i];
      };

      if( name == "order" )
         print( db.get_order( parse_order_id( arg(1) ) ) );
      else if( name == "fills" )
         print( db.get_fills( parse_order_id( arg(1) ) ) );
      else if( name == "hashlock" )
      {
         const auto* o = db.find_order_by_hashlock( hashlock_from_hex( arg(1) ) );
         FUSION_ASSERT( o != nullptr, database_query_exception, "No order with hashlock ${h}", ("h",arg(1)) );
         print( *o );
      }
      else if( name == "party" )
         print( db.get_orders_by_party( arg(1) ) );
      else if( name == "active" )
         print( db.get_active_orders() );
      else if( name == "resolvers" )
         print( db.get_resolvers_by_priority() );
      else if( name == "transfer" )
         print( db.get_pending_transfer( fc::variant( arg(1) ).as_uint64() ) );
      else if( name == "balance" )
         print( db.get_released_balance( arg(1), arg(2) ) );
      else if( name == "stats" )
         print( db.get_engine_statistics() );
      else if( name == "parameters" )
         print( db.get_parameters() );
      else if( name == "can-withdraw" )
         print( db.can_withdraw( db.get_order( parse_order_id( arg(1) ) ), arg(2) ) );
      else if( name == "can-cancel" )
      {
         const auto& o = db.get_order( parse_order_id( arg(1) ) );
         optional<address_type> caller;
         if( args.size() > 2 )
            caller = args[2];
         print( db.can_cancel( o, caller ) );
      }
      else
         FC_THROW( "Unknown query ${q}", ("q",name) );
   }

   void apply_operations( database& db, const std::vector<operation>& ops )
   {
      for( const auto& op : ops )
      {
         fc::mutable_variant_object result;
         result( "result", fc::variant( db.push_operation( op ), FUSION_MAX_NESTED_OBJECTS ) );
         // every reported operation is on disk, even if a later one fails
         db.flush();
         result( "released", fc::variant( db.get_applied_operations(), FUSION_MAX_NESTED_OBJECTS ) );
         db.clear_applied_operations();
         std::cout << fc::json::to_pretty_string( fc::variant( result ) ) << "\n";
      }
   }

} // anonymous namespace

/// The main program
int main( int argc, char** argv ) {
   try {
      bpo::options_description app_options("Fusion Settlement Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("fusion_node_data_dir"),
                    "Directory containing the engine database")
            ("genesis-json", bpo::value<boost::filesystem::path>(),
                    "File to read the Genesis State from when the database is created")
            ("create-genesis-json", bpo::value<boost::filesystem::path>(),
                    "Path to write an example Genesis State to")
            ("time,t", bpo::value<std::string>(),
                    "Advance the engine clock to this ISO time (e.g. 2026-01-01T00:00:00) before applying operations")
            ("apply,a", bpo::value<boost::filesystem::path>(),
                    "JSON file with an array of operations to apply in order")
            ("operation,o", bpo::value<std::vector<std::string>>()->composing(),
                    "An operation as JSON, may be given several times")
            ("query,q", bpo::value<std::vector<std::string>>()->multitoken(),
                    "Query to answer after applying operations: order <id> | fills <id> | hashlock <hex> | "
                    "party <address> | active | resolvers | transfer <sequence> | balance <address> <denom> | "
                    "stats | parameters | can-withdraw <id> <address> | can-cancel <id> [address]")
            ("wipe", "Delete the engine database before opening it");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
         bpo::notify( options );
      }
      catch (const boost::program_options::error& e)
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      if( options.count("create-genesis-json") > 0 )
      {
         fc::path genesis_out = options.at("create-genesis-json").as<boost::filesystem::path>();
         fc::json::save_to_file( create_example_genesis(), genesis_out );
         std::cerr << "Created example genesis state in file " << genesis_out.generic_string() << "\n";
         return EXIT_SUCCESS;
      }

      fc::path data_dir = options.at("data-dir").as<boost::filesystem::path>();
      if( data_dir.is_relative() )
         data_dir = fc::current_path() / data_dir;

      database db;
      if( options.count("wipe") > 0 )
         db.wipe( data_dir );

      db.open( data_dir, [&options] {
         ilog( "Initializing database..." );
         if( options.count("genesis-json") > 0 )
            return fc::json::from_file( options.at("genesis-json").as<boost::filesystem::path>() )
                  .as<genesis_state_type>( FUSION_MAX_NESTED_OBJECTS );
         return create_example_genesis();
      });

      if( options.count("time") > 0 )
      {
         db.advance_time( fc::time_point_sec::from_iso_string( options.at("time").as<std::string>() ) );
         db.flush();
      }
      db.clear_applied_operations();

      if( options.count("apply") > 0 )
      {
         auto ops = fc::json::from_file( options.at("apply").as<boost::filesystem::path>() )
                       .as<std::vector<operation>>( FUSION_MAX_NESTED_OBJECTS );
         apply_operations( db, ops );
      }
      if( options.count("operation") > 0 )
      {
         std::vector<operation> ops;
         for( const auto& s : options.at("operation").as<std::vector<std::string>>() )
            ops.push_back( fc::json::from_string( s ).as<operation>( FUSION_MAX_NESTED_OBJECTS ) );
         apply_operations( db, ops );
      }

      if( options.count("query") > 0 )
         run_query( db, options.at("query").as<std::vector<std::string>>() );

      db.close();
      return EXIT_SUCCESS;
   }
   catch( const fc::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e", e.to_detail_string()) );
      std::cerr << e.to_detail_string() << "\n";
      return EXIT_FAILURE;
   }
}

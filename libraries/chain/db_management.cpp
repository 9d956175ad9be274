/*
 * Copyright (c) 2015, Cryptonomex, Inc.
 * All rights reserved.
 *
 * This source code is provided for evaluation in private test networks only, until September 8, 2015. After this date, this license expires and
 * the code may not be used, modified or distributed for any purpose. Redistribution and use in source and binary forms, with or without modification,
 * are permitted until September 8, 2015, provided that the following conditions are met:
 *
 * 1. The code and/or derivative works are used only for private test networks consisting of no more than 10 P2P nodes.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#include <fusion/chain/database.hpp>

#include <functional>

namespace fusion { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database() = default;

void database::open( const fc::path& data_dir, std::function<genesis_state_type()> genesis_loader )
{ try {
   object_database::open( data_dir );

   if( !find( global_property_id_type() ) )
      init_genesis( genesis_loader() );

   ilog( "Engine database opened at ${t}: ${n} orders created, ${p} transfers pending",
         ("t",head_time())("n",get_dynamic_global_properties().orders_created)
         ("p",get_index_type<pending_transfer_index>().indices().size()) );
} FC_CAPTURE_LOG_AND_RETHROW( (data_dir) ) }

void database::wipe( const fc::path& data_dir )
{
   ilog( "Wiping database" );
   close();
   object_database::wipe( data_dir );
}

void database::close()
{
   FC_ASSERT( _undo_db.active_sessions() == 0, "Can not close the database while an undo session is active" );
   if( !get_data_dir().string().empty() && find( global_property_id_type() ) )
      object_database::flush();
   object_database::close();
}

} }

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
#include <fusion/chain/global_parameters_evaluator.hpp>
#include <fusion/chain/database.hpp>

namespace fusion { namespace chain {

void_result engine_parameters_update_evaluator::do_evaluate( const engine_parameters_update_operation& o )
{ try {
   FUSION_ASSERT( o.admin == db().get_parameters().admin, engine_parameters_update_unauthorized,
                  "${a} is not the engine admin", ("a",o.admin) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result engine_parameters_update_evaluator::do_apply( const engine_parameters_update_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&o]( global_property_object& p ) {
      p.parameters = o.new_parameters;
   });
   ilog( "Engine parameters updated by ${a}: ${p}", ("a",o.admin)("p",o.new_parameters) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // fusion::chain

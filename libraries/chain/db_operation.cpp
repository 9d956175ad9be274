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
#include <fusion/chain/evaluator.hpp>

namespace fusion { namespace chain {

operation_result database::push_operation( const operation& op )
{ try {
   FUSION_ASSERT( !is_virtual_operation( op ), virtual_operation_pushed,
                  "Virtual operations are emitted by the engine and can not be pushed", ("op",op) );
   operation_validate( op );

   auto session = _undo_db.start_undo_session();
   const auto old_applied_ops_size = _applied_ops.size();
   try {
      auto result = apply_operation( op );
      session.commit();
      return result;
   } catch( const fc::exception& e ) {
      _applied_ops.resize( old_applied_ops_size );
      dlog( "Operation rejected: ${e}", ("e",e.to_string()) );
      throw;
   }
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_operation( const operation& op )
{ try {
   const int64_t i_which = op.which();
   FC_ASSERT( i_which >= 0, "Negative operation tag" );
   FC_ASSERT( static_cast<uint64_t>(i_which) < _operation_evaluators.size() && _operation_evaluators[i_which],
              "No registered evaluator for operation ${w}", ("w",i_which) );
   return _operation_evaluators[i_which]->evaluate( *this, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back( op );
}

} }

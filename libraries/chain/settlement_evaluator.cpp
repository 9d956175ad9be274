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
#include <fusion/chain/settlement_evaluator.hpp>

namespace fusion {
   namespace chain {

      void_result settlement_ack_evaluator::do_evaluate( const settlement_ack_operation& o )
      { try {
         const database& d = db();
         FUSION_ASSERT( o.relayer == d.get_parameters().ack_relayer, settlement_ack_unauthorized_relayer,
                        "${r} is not the ack relayer", ("r",o.relayer) );

         transfer_obj = d.find_pending_transfer( o.sequence );
         if( transfer_obj == nullptr )
            wlog( "Ignoring ack ${outcome} for sequence ${s}, no transfer is pending",
                  ("outcome",o.outcome)("s",o.sequence) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result settlement_ack_evaluator::do_apply( const settlement_ack_operation& o )
      { try {
         if( transfer_obj != nullptr )
            db().finalize_transfer( *transfer_obj, o.outcome );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

   } // namespace chain
} // namespace fusion

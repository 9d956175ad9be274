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
#include <fusion/protocol/fill.hpp>
#include <fusion/protocol/engine_parameters.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace fusion { namespace protocol {

   void fill_create_operation::validate()const
   {
      validate_address( filler, "filler" );
      FUSION_ASSERT( amount > 0, invalid_amount, "Fill amount must be positive", ("amount",amount) );
      if( hashlock.valid() )
         FUSION_ASSERT( *hashlock != hashlock_type(), invalid_hashlock, "Fill hashlock must be set", );
   }

   void fill_withdraw_operation::validate()const
   {
      validate_address( caller, "caller" );
      FUSION_ASSERT( !secret.empty(), invalid_secret_size, "Secret must not be empty", );
   }

   void fill_refund_operation::validate()const
   {
      validate_address( caller, "caller" );
   }

} } // fusion::protocol

FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::fill_create_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::fill_withdraw_operation )
FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION( fusion::protocol::fill_refund_operation )

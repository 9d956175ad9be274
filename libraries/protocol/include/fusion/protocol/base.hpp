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

#include <fusion/protocol/types.hpp>
#include <fusion/protocol/asset.hpp>

namespace fusion { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the state of the settlement engine.
    *
    *  An operation can be thought of like a function that will modify the shared state of the
    *  engine. The members of each struct are like function arguments and each operation can
    *  potentially generate a return value.
    *
    *  Operations carry the address of the party performing them. Authenticating that party is the
    *  job of the host ledger adapter; the engine only checks that the party is entitled to act.
    *
    *  @{
    */

   struct void_result{};
   using operation_result = fc::static_variant<void_result,object_id_type>;

   struct base_operation
   {
      void validate()const{}
   };

   ///@}

} } // fusion::protocol

FC_REFLECT_TYPENAME( fusion::protocol::operation_result )
FC_REFLECT( fusion::protocol::void_result, )

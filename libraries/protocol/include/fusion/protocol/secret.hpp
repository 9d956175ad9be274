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

namespace fusion { namespace protocol {

   /** The canonical hash of a secret: SHA-256 over the raw preimage bytes */
   hashlock_type hash_secret( const secret_type& secret );

   /**
    * @return true iff sha256(secret) equals the hashlock over the full 32 byte digest.
    * Has no side effects.
    */
   bool verify_secret( const secret_type& secret, const hashlock_type& hashlock );

   /// Parses a 64 character hex digest, throws invalid_hashlock otherwise
   hashlock_type hashlock_from_hex( const string& hex );

   /// Throws invalid_secret_size unless 0 < secret.size() <= max_size
   void validate_secret_size( const secret_type& secret, uint32_t max_size );

} } // fusion::protocol

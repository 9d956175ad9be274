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
#include <fusion/protocol/secret.hpp>
#include <fusion/protocol/exceptions.hpp>

#include <cctype>

namespace fusion { namespace protocol {

hashlock_type hash_secret( const secret_type& secret )
{
   return fc::sha256::hash( secret.data(), static_cast<uint32_t>(secret.size()) );
}

bool verify_secret( const secret_type& secret, const hashlock_type& hashlock )
{
   return hash_secret( secret ) == hashlock;
}

hashlock_type hashlock_from_hex( const string& hex )
{
   FUSION_ASSERT( hex.size() == FUSION_HASHLOCK_HEX_LENGTH, invalid_hashlock,
                  "Hashlock must be ${n} hex characters", ("n",FUSION_HASHLOCK_HEX_LENGTH)("hashlock",hex) );
   for( char c : hex )
      FUSION_ASSERT( std::isxdigit( static_cast<unsigned char>(c) ), invalid_hashlock,
                     "Hashlock is not hex encoded", ("hashlock",hex) );
   return hashlock_type( hex );
}

void validate_secret_size( const secret_type& secret, uint32_t max_size )
{
   FUSION_ASSERT( !secret.empty(), invalid_secret_size, "Secret must not be empty", );
   FUSION_ASSERT( secret.size() <= max_size, invalid_secret_size,
                  "Secret of ${s} bytes exceeds the maximum of ${m}", ("s",secret.size())("m",max_size) );
}

} } // fusion::protocol

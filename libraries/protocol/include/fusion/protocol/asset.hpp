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

   /**
    * An amount of a host ledger token. The denom is the host's identifier for the token
    * (a bank denom, an ERC20 address, a policy id) and is compared verbatim.
    */
   struct asset
   {
      asset( share_type a = 0, string d = string() )
      :amount(a),denom(std::move(d)){}

      share_type    amount;
      string        denom;

      asset& operator += ( const asset& o )
      {
         FC_ASSERT( denom == o.denom, "Denom mismatch: ${a} vs ${b}", ("a",denom)("b",o.denom) );
         amount += o.amount;
         return *this;
      }
      asset& operator -= ( const asset& o )
      {
         FC_ASSERT( denom == o.denom, "Denom mismatch: ${a} vs ${b}", ("a",denom)("b",o.denom) );
         amount -= o.amount;
         return *this;
      }
      asset operator -()const { return asset( -amount, denom ); }

      friend bool operator == ( const asset& a, const asset& b )
      {
         return std::tie( a.denom, a.amount ) == std::tie( b.denom, b.amount );
      }
      friend bool operator != ( const asset& a, const asset& b )
      {
         return !(a == b);
      }
      friend bool operator < ( const asset& a, const asset& b )
      {
         FC_ASSERT( a.denom == b.denom );
         return a.amount < b.amount;
      }
      friend bool operator <= ( const asset& a, const asset& b ) { return !(b < a); }
      friend bool operator >  ( const asset& a, const asset& b ) { return (b < a); }
      friend bool operator >= ( const asset& a, const asset& b ) { return !(a < b); }

      friend asset operator - ( const asset& a, const asset& b )
      {
         FC_ASSERT( a.denom == b.denom );
         return asset( a.amount - b.amount, a.denom );
      }
      friend asset operator + ( const asset& a, const asset& b )
      {
         FC_ASSERT( a.denom == b.denom );
         return asset( a.amount + b.amount, a.denom );
      }

      /// Throws unless the denom is well formed and the amount lies in (0, FUSION_MAX_SHARE_SUPPLY]
      void validate_positive()const;
   };

} }

FC_REFLECT( fusion::protocol::asset, (amount)(denom) )

FUSION_DECLARE_EXTERNAL_SERIALIZATION( fusion::protocol::asset )

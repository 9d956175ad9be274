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
#include <memory>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <cstdint>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/elem.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/container/flat_fwd.hpp>
#include <fc/io/varint.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <fc/io/datastream.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/static_variant.hpp>

#include <fusion/protocol/object_id.hpp>
#include <fusion/protocol/config.hpp>

#define FUSION_EXTERNAL_SERIALIZATION(ext, type) \
namespace fc { \
   ext template void from_variant( const variant& v, type& vo, uint32_t max_depth ); \
   ext template void to_variant( const type& v, variant& vo, uint32_t max_depth ); \
namespace raw { \
   ext template void pack< datastream<size_t>, type >( datastream<size_t>& s, const type& tx, uint32_t _max_depth ); \
   ext template void pack< sha256::encoder, type >( sha256::encoder& s, const type& tx, uint32_t _max_depth ); \
   ext template void pack< datastream<char*>, type >( datastream<char*>& s, const type& tx, uint32_t _max_depth ); \
   ext template void unpack< datastream<const char*>, type >( datastream<const char*>& s, type& tx, uint32_t _max_depth ); \
} } // fc::raw

#define FUSION_DECLARE_EXTERNAL_SERIALIZATION(type) FUSION_EXTERNAL_SERIALIZATION(extern, type)
#define FUSION_IMPLEMENT_EXTERNAL_SERIALIZATION(type) FUSION_EXTERNAL_SERIALIZATION(/*not extern*/, type)

#define FUSION_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define FUSION_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define FUSION_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            FUSION_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define FUSION_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(fusion::id_namespace::name)

/**
 * Declares the object type enum of one id space together with a typed id alias per object:
 * FUSION_DEFINE_IDS(protocol, protocol_ids, , (null)(order)) gives order_object_type and order_id_type.
 */
#define FUSION_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace fusion { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(FUSION_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(FUSION_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(fusion::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(FUSION_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(FUSION_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(FUSION_NAME_TO_ID_TYPE, , names_seq))

namespace fusion { namespace protocol {
using namespace fusion::db;

using std::map;
using std::vector;
using std::string;
using std::deque;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;
using std::tie;
using std::make_pair;

using fc::variant_object;
using fc::variant;
using fc::enum_type;
using fc::optional;
using fc::unsigned_int;
using fc::time_point_sec;
using fc::time_point;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

/// Addresses are opaque strings owned by the host ledger, e.g. a bech32 account or a hex EVM address
using address_type  = string;
using chain_id_type = string;
using share_type    = safe<int64_t>;

/// SHA-256 digest of the secret preimage
using hashlock_type = fc::sha256;
/// The revealed preimage, opaque bytes
using secret_type   = vector<char>;

enum reserved_spaces {
    relative_protocol_ids = 0,
    protocol_ids          = 1,
    implementation_ids    = 2
};

inline bool is_relative( object_id_type o ) { return o.space() == 0; }

} }  // fusion::protocol

/// Object types in the Protocol Space (enum object_type (1.x.x))
FUSION_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                  /* 1.0.x  */ (null) // no data
                  /* 1.1.x  */ (base) // no data
                  /* 1.2.x  */ (order)
                  /* 1.3.x  */ (fill)
                  /* 1.4.x  */ (resolver)
                  /* 1.5.x  */ (pending_transfer)
                  /* 1.6.x  */ (destination_chain))

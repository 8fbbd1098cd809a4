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
#include <cstdint>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/io/varint.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/crypto/elliptic.hpp>
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

#include <aegis/protocol/object_id.hpp>
#include <aegis/protocol/config.hpp>

#define AEGIS_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define AEGIS_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define AEGIS_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            AEGIS_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define AEGIS_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(aegis::id_namespace::name)

/// Declares the object_type enum of an id space together with one typed id alias per entry
#define AEGIS_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace aegis { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(AEGIS_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(AEGIS_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(aegis::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(AEGIS_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(AEGIS_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(AEGIS_NAME_TO_ID_TYPE, , names_seq))

namespace aegis { namespace protocol {
using namespace aegis::db;

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;
using std::make_pair;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::unsigned_int;
using fc::time_point_sec;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

struct void_t{};

using private_key_type = fc::ecc::private_key;
using chain_id_type = fc::sha256;
using digest_type = fc::sha256;
using signature_type = fc::ecc::compact_signature;
using share_type = safe<int64_t>;

/// Opaque caller-chosen identifier of the task an escrow is held for
using task_id_type = fc::sha256;

enum reserved_spaces {
    relative_protocol_ids = 0,
    protocol_ids          = 1,
    implementation_ids    = 2
};

struct public_key_type {
    struct binary_key {
        binary_key() = default;
        uint32_t check = 0;
        fc::ecc::public_key_data data;
    };
    fc::ecc::public_key_data key_data;
    public_key_type();
    public_key_type(const fc::ecc::public_key_data& data);
    public_key_type(const fc::ecc::public_key& pubkey);
    explicit public_key_type(const std::string& base58str);
    operator fc::ecc::public_key_data() const;
    operator fc::ecc::public_key() const;
    explicit operator std::string() const;
    /// true for the all-zero key of accounts that cannot sign
    bool is_null() const;
    friend bool operator == (const public_key_type& p1, const fc::ecc::public_key& p2);
    friend bool operator == (const public_key_type& p1, const public_key_type& p2);
    friend bool operator != (const public_key_type& p1, const public_key_type& p2);
    friend bool operator < (const public_key_type& p1, const public_key_type& p2)
    { return p1.key_data < p2.key_data; }
};

} }  // aegis::protocol

namespace fc {
void to_variant(const aegis::protocol::public_key_type& var,  fc::variant& vo, uint32_t max_depth = 2);
void from_variant(const fc::variant& var,  aegis::protocol::public_key_type& vo, uint32_t max_depth = 2);
}

/// Object types in the Protocol Space (enum object_type (1.x.x))
AEGIS_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                 /* 1.0.x  */ (null) // no data
                 /* 1.1.x  */ (base) // no data
                 /* 1.2.x  */ (account)
                 /* 1.3.x  */ (escrow)
                 /* 1.4.x  */ (operation_history)
                )

FC_REFLECT(aegis::protocol::public_key_type, (key_data))
FC_REFLECT(aegis::protocol::public_key_type::binary_key, (data)(check))

FC_REFLECT_TYPENAME(aegis::protocol::share_type)
FC_REFLECT(aegis::protocol::void_t,)

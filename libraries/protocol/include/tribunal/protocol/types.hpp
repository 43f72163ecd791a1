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

#include <fc/container/flat.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <fc/io/datastream.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/static_variant.hpp>

#include <tribunal/protocol/object_id.hpp>
#include <tribunal/protocol/config.hpp>

namespace tribunal { namespace protocol {
using namespace tribunal::db;

using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::pair;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::unsigned_int;
using fc::time_point_sec;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

enum reserved_spaces {
    protocol_ids       = 1,
    implementation_ids = 2
};

/// Types in the protocol space (1.x.x); 1.0 and 1.1 are left unused
enum object_type {
    account_object_type    = 2,
    escrow_object_type     = 3,
    dispute_object_type    = 4,
    arbitrator_object_type = 5
};

using account_id_type    = object_id<protocol_ids, account_object_type>;
using escrow_id_type     = object_id<protocol_ids, escrow_object_type>;
using dispute_id_type    = object_id<protocol_ids, dispute_object_type>;
using arbitrator_id_type = object_id<protocol_ids, arbitrator_object_type>;

using digest_type = fc::sha256;
using share_type = safe<int64_t>;

/// Which algorithm picks the arbitrator of a freshly revealed dispute
enum arbitrator_selection_strategy
{
   /// highest reputation * success rate * participation, ties broken by the seed
   reputation_weighted = 0,
   /// seed modulo the number of eligible arbitrators
   seeded_hash         = 1
};

} }  // tribunal::protocol

FC_REFLECT_TYPENAME(tribunal::protocol::share_type)
FC_REFLECT_ENUM(tribunal::protocol::arbitrator_selection_strategy, (reputation_weighted)(seeded_hash))

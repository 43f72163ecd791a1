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

#include <tribunal/protocol/types.hpp>

#include <tribunal/db/generic_index.hpp>

namespace tribunal { namespace chain {

using namespace protocol;

/// Types in the implementation space (2.x.x), never referenced by operations
enum impl_object_type {
    impl_global_property_object_type         = 0,
    impl_dynamic_global_property_object_type = 1,
    impl_account_balance_object_type         = 2,
    impl_dispute_commitment_object_type      = 3
};

using global_property_id_type         = object_id<implementation_ids, impl_global_property_object_type>;
using dynamic_global_property_id_type = object_id<implementation_ids, impl_dynamic_global_property_object_type>;
using account_balance_id_type         = object_id<implementation_ids, impl_account_balance_object_type>;
using dispute_commitment_id_type      = object_id<implementation_ids, impl_dispute_commitment_object_type>;

} }

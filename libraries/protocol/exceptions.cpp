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
#include <tribunal/protocol/exceptions.hpp>

namespace tribunal { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception,   protocol_exception, 4010000,
                                   "transaction validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_empty,                transaction_exception, 4010001,
                                   "transaction contains no operations" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_virtual_operation,    transaction_exception, 4010002,
                                   "virtual operations can not be submitted" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( validation_exception,    protocol_exception, 4100000, "validation error" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_address,         validation_exception, 4100001, "invalid address" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_amount,          validation_exception, 4100002, "invalid amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_duration,        validation_exception, 4100003, "invalid duration" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_commitment,      validation_exception, 4100004, "invalid commitment" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_parameters,      validation_exception, 4100005, "invalid parameters" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_note,            validation_exception, 4100006, "invalid resolution note" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_rating,          invalid_amount,       4100007, "rating must be 1-5" )

} } // tribunal::protocol

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
#include <tribunal/protocol/operations.hpp>

namespace tribunal { namespace protocol {

struct operation_validator
{
   using result_type = void;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

struct operation_actor_visitor
{
   using result_type = account_id_type;
   template<typename T>
   account_id_type operator()( const T& v )const { return v.actor(); }
};

struct operation_is_virtual_visitor
{
   using result_type = bool;
   template<typename T>
   bool operator()( const T& )const { return T::is_virtual; }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

account_id_type operation_actor( const operation& op )
{
   return op.visit( operation_actor_visitor() );
}

bool operation_is_virtual( const operation& op )
{
   return op.visit( operation_is_virtual_visitor() );
}

} } // tribunal::protocol

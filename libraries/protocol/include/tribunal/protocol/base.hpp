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
#include <tribunal/protocol/exceptions.hpp>

namespace tribunal { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @ingroup protocol
    *
    *  Every change to the escrow and arbitration state is made by an operation.
    *  Operations are data: validate() performs the checks that need no database
    *  state, the matching evaluator performs the rest and applies the change.
    *
    *  Each real operation names the account on whose behalf it is submitted,
    *  returned by actor(). Virtual operations are never submitted, they are
    *  produced while applying real operations and published as events.
    *  @{
    */

   struct void_result{};
   using operation_result = fc::static_variant<void_result, object_id_type>;

   struct base_operation
   {
      static constexpr bool is_virtual = false;

      virtual ~base_operation() = default;
      virtual void validate()const {}
   };

   /**
    * Base for operations that only appear in the applied operation log.
    */
   struct base_virtual_operation : public base_operation
   {
      static constexpr bool is_virtual = true;

      void validate()const override
      {
         FC_THROW_EXCEPTION( tx_virtual_operation, "virtual operations can not be submitted" );
      }
   };

   ///@}

} } // tribunal::protocol

FC_REFLECT_TYPENAME( tribunal::protocol::operation_result )
FC_REFLECT( tribunal::protocol::void_result, )

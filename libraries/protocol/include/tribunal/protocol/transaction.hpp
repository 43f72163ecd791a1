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
#include <tribunal/protocol/operations.hpp>

namespace tribunal { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * A transaction is an ordered list of operations that are applied as one unit: either every
    * operation is applied or, if any of them fails, the state is left exactly as it was before.
    */

   /**
    * @brief groups a set of operations that must be applied atomically
    * @ingroup transactions
    */
   class transaction
   {
   public:
      virtual ~transaction() = default;

      vector<operation>  operations;

      /// @throws tx_empty if there are no operations, tx_virtual_operation if one of them is virtual
      virtual void validate() const;

      void clear() { operations.clear(); }
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *  @ingroup transactions
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

} } // tribunal::protocol

FC_REFLECT( tribunal::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( tribunal::protocol::processed_transaction, (tribunal::protocol::transaction), (operation_results) )

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

namespace tribunal { namespace chain {

   class database;

   /// Type-erased entry of the evaluator table, one per operation tag
   class op_evaluator
   {
      public:
         virtual ~op_evaluator() = default;
         virtual operation_result evaluate( database& d, const operation& op ) = 0;
   };

   /**
    * Base of the per-operation evaluators. do_evaluate checks the operation against the current
    * state and may cache what it looked up in members; do_apply then makes the changes.
    * Checks that need no state are done by the operation's validate() before this runs.
    */
   template<typename DerivedEvaluator>
   class evaluator
   {
      public:
         operation_result evaluate_and_apply( database& d, const operation& o )
         {
            _db = &d;
            auto& self = static_cast<DerivedEvaluator&>( *this );
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();
            self.do_evaluate( op );
            return self.do_apply( op );
         }

         database& db()const { return *_db; }

      private:
         database* _db = nullptr;
   };

   /// Runs a fresh EvaluatorType for every operation, so cached lookups never outlive it
   template<typename EvaluatorType>
   class op_evaluator_impl : public op_evaluator
   {
      public:
         operation_result evaluate( database& d, const operation& op ) override
         {
            EvaluatorType eval;
            return eval.evaluate_and_apply( d, op );
         }
   };

} } // tribunal::chain

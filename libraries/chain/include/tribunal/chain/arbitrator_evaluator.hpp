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
#include <tribunal/chain/evaluator.hpp>

#include <tribunal/protocol/arbitrator.hpp>

namespace tribunal { namespace chain {

   class arbitrator_object;

   class arbitrator_register_evaluator : public evaluator<arbitrator_register_evaluator>
   {
      public:
         using operation_type = arbitrator_register_operation;

         void_result do_evaluate( const arbitrator_register_operation& op );
         object_id_type do_apply( const arbitrator_register_operation& op ) const;

         /// set when a deactivated arbitrator registers again
         const arbitrator_object* _existing = nullptr;
         uint32_t _reputation = 0;
         uint32_t _participation_index = 0;
   };

   class arbitrator_refresh_evaluator : public evaluator<arbitrator_refresh_evaluator>
   {
      public:
         using operation_type = arbitrator_refresh_operation;

         void_result do_evaluate( const arbitrator_refresh_operation& op );
         void_result do_apply( const arbitrator_refresh_operation& op ) const;

         const arbitrator_object* _arbitrator = nullptr;
   };

   class arbitrator_deactivate_evaluator : public evaluator<arbitrator_deactivate_evaluator>
   {
      public:
         using operation_type = arbitrator_deactivate_operation;

         void_result do_evaluate( const arbitrator_deactivate_operation& op );
         void_result do_apply( const arbitrator_deactivate_operation& op ) const;

         const arbitrator_object* _arbitrator = nullptr;
   };

} } // tribunal::chain

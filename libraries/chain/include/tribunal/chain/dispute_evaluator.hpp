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

#include <tribunal/protocol/dispute.hpp>

namespace tribunal { namespace chain {

   class escrow_object;
   class dispute_object;
   class dispute_commitment_object;

   class dispute_commit_evaluator : public evaluator<dispute_commit_evaluator>
   {
      public:
         using operation_type = dispute_commit_operation;

         void_result do_evaluate( const dispute_commit_operation& op );
         object_id_type do_apply( const dispute_commit_operation& op ) const;

         const escrow_object* _escrow = nullptr;
   };

   class dispute_reveal_evaluator : public evaluator<dispute_reveal_evaluator>
   {
      public:
         using operation_type = dispute_reveal_operation;

         void_result do_evaluate( const dispute_reveal_operation& op );
         object_id_type do_apply( const dispute_reveal_operation& op ) const;

         const escrow_object*             _escrow = nullptr;
         const dispute_commitment_object* _commitment = nullptr;
   };

   class dispute_rule_evaluator : public evaluator<dispute_rule_evaluator>
   {
      public:
         using operation_type = dispute_rule_operation;

         void_result do_evaluate( const dispute_rule_operation& op );
         void_result do_apply( const dispute_rule_operation& op ) const;

         const dispute_object* _dispute = nullptr;
   };

   /**
    * Records a party's rating of the arbitrator. The arbitrator's reputation changes only when
    * the second party rates: the average of both ratings is then passed to
    * database::apply_rating. A dispute rated by one party alone never changes the reputation.
    */
   class dispute_rate_evaluator : public evaluator<dispute_rate_evaluator>
   {
      public:
         using operation_type = dispute_rate_operation;

         void_result do_evaluate( const dispute_rate_operation& op );
         void_result do_apply( const dispute_rate_operation& op ) const;

         const escrow_object*  _escrow = nullptr;
         const dispute_object* _dispute = nullptr;
   };

} } // tribunal::chain

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

#include <tribunal/protocol/escrow.hpp>

namespace tribunal { namespace chain {

   class escrow_object;
   class dispute_object;

   class escrow_create_evaluator : public evaluator<escrow_create_evaluator>
   {
      public:
         using operation_type = escrow_create_operation;

         void_result do_evaluate( const escrow_create_operation& op ) const;
         object_id_type do_apply( const escrow_create_operation& op ) const;
   };

   class escrow_release_evaluator : public evaluator<escrow_release_evaluator>
   {
      public:
         using operation_type = escrow_release_operation;

         void_result do_evaluate( const escrow_release_operation& op );
         void_result do_apply( const escrow_release_operation& op ) const;

         const escrow_object* _escrow = nullptr;
   };

   class escrow_refund_evaluator : public evaluator<escrow_refund_evaluator>
   {
      public:
         using operation_type = escrow_refund_operation;

         void_result do_evaluate( const escrow_refund_operation& op );
         void_result do_apply( const escrow_refund_operation& op ) const;

         const escrow_object* _escrow = nullptr;
   };

   class escrow_vote_evaluator : public evaluator<escrow_vote_evaluator>
   {
      public:
         using operation_type = escrow_vote_operation;

         void_result do_evaluate( const escrow_vote_operation& op );
         void_result do_apply( const escrow_vote_operation& op ) const;

         const escrow_object*  _escrow = nullptr;
         const dispute_object* _dispute = nullptr;
   };

} } // tribunal::chain

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
#include <tribunal/chain/admin_evaluator.hpp>

#include <tribunal/chain/global_property_object.hpp>

#include <tribunal/chain/database.hpp>
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/guards.hpp>

namespace tribunal { namespace chain {

void_result parameters_update_evaluator::do_evaluate( const parameters_update_operation& op ) const
{ try {
   const database& d = db();

   check_admin( d, op.admin );

   if( op.new_parameters.marketplace_fee_basis > 0 )
      TRIBUNAL_ASSERT( d.find( op.new_parameters.marketplace_fee_account ) != nullptr, invalid_parameters,
                       "Marketplace fee account ${a} does not exist",
                       ("a",op.new_parameters.marketplace_fee_account) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result parameters_update_evaluator::do_apply( const parameters_update_operation& op ) const
{ try {
   database& d = db();

   d.modify( d.get_global_properties(), [&op]( global_property_object& p ) {
      p.parameters = op.new_parameters;
   });

   ilog( "Parameters updated: ${p}", ("p",op.new_parameters) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pause_update_evaluator::do_evaluate( const pause_update_operation& op ) const
{ try {
   check_admin( db(), op.admin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pause_update_evaluator::do_apply( const pause_update_operation& op ) const
{ try {
   database& d = db();

   d.modify( d.get_global_properties(), [&op]( global_property_object& p ) {
      p.paused = op.paused;
   });

   ilog( op.paused ? "System paused by ${a}" : "System resumed by ${a}", ("a",op.admin) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tribunal::chain

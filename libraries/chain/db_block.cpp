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
#include <tribunal/chain/database.hpp>
#include <tribunal/chain/evaluator.hpp>
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/global_property_object.hpp>
#include <tribunal/chain/guards.hpp>

namespace tribunal { namespace chain {

processed_transaction database::push_transaction( const transaction& trx )
{ try {
   processed_transaction ptrx( trx );
   {
      scoped_reentrancy_lock lock( _applying_transaction );
      trx.validate();

      _applied_ops.clear();
      _current_op_in_trx = 0;

      auto session = _undo_db.start_undo_session();
      ptrx.operation_results.reserve( trx.operations.size() );

      try
      {
         for( const auto& op : trx.operations )
         {
            ptrx.operation_results.emplace_back( apply_operation( op ) );
            ++_current_op_in_trx;
         }
      }
      catch( const fc::exception& e )
      {
         dlog( "Transaction rejected: ${e}", ("e",e.to_string()) );
         _applied_ops.clear();
         throw;
      }

      modify( get_dynamic_global_properties(), []( dynamic_global_property_object& dgp ) {
         ++dgp.applied_transactions;
      });
      session.commit();
   }

   notify_applied_transaction( ptrx );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::push_operation( const operation& op )
{
   transaction trx;
   trx.operations.push_back( op );
   return push_transaction( trx ).operation_results.front();
}

operation_result database::apply_operation( const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   std::unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   _current_virtual_op = 0;
   auto op_id = push_applied_operation( op );
   auto result = eval->evaluate( *this, op );
   set_applied_operation_result( op_id, result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back(op);
   operation_history_object& oh = *(_applied_ops.back());
   oh.trx_in_log   = get_dynamic_global_properties().applied_transactions;
   oh.op_in_trx    = _current_op_in_trx;
   oh.virtual_op   = _current_virtual_op++;
   return _applied_ops.size() - 1;
}

void database::set_applied_operation_result( uint32_t op_id, const operation_result& result )
{
   FC_ASSERT( op_id < _applied_ops.size(), "Unknown applied operation ${id}", ("id",op_id) );
   if( _applied_ops[op_id] )
      _applied_ops[op_id]->result = result;
   else
   {
      elog( "Could not set operation result (op_id=${id})", ("id", op_id) );
   }
}

const vector<optional< operation_history_object > >& database::get_applied_operations() const
{
   return _applied_ops;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

void database::advance_time( uint32_t seconds )
{
   set_head_time( head_time() + seconds );
}

void database::set_head_time( time_point_sec new_time )
{ try {
   FC_ASSERT( !_applying_transaction, "Time can not move while a transaction is applied" );
   FC_ASSERT( new_time >= head_time(), "Time can only move forward", ("head",head_time())("new",new_time) );
   // outside of any undo session, time never rolls back
   modify( get_dynamic_global_properties(), [new_time]( dynamic_global_property_object& dgp ) {
      dgp.time = new_time;
   });
} FC_CAPTURE_AND_RETHROW( (new_time) ) }

} }

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
#include <tribunal/chain/escrow_evaluator.hpp>

#include <tribunal/chain/account_object.hpp>
#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/dispute_object.hpp>
#include <tribunal/chain/escrow_object.hpp>

#include <tribunal/chain/database.hpp>
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/guards.hpp>

namespace tribunal { namespace chain {

void_result escrow_create_evaluator::do_evaluate( const escrow_create_operation& op ) const
{ try {
   const database& d = db();
   const chain_parameters& params = d.get_global_properties().parameters;

   check_not_paused( d );

   TRIBUNAL_ASSERT( d.find( op.buyer ) != nullptr, invalid_address, "Buyer ${b} does not exist", ("b",op.buyer) );
   TRIBUNAL_ASSERT( d.find( op.seller ) != nullptr, invalid_address, "Seller ${s} does not exist", ("s",op.seller) );
   TRIBUNAL_ASSERT( op.duration >= params.min_escrow_duration && op.duration <= params.max_escrow_duration,
                    invalid_duration, "Escrow duration ${d} is outside of [${min}, ${max}]",
                    ("d",op.duration)("min",params.min_escrow_duration)("max",params.max_escrow_duration) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type escrow_create_evaluator::do_apply( const escrow_create_operation& op ) const
{ try {
   database& d = db();
   const chain_parameters& params = d.get_global_properties().parameters;
   const time_point_sec now = d.head_time();

   d.deposit_to_custody( op.buyer, op.amount );

   const auto& new_escrow = d.create<escrow_object>( [&op,&params,now]( escrow_object& e ) {
      e.buyer = op.buyer;
      e.seller = op.seller;
      e.amount = op.amount;
      e.dispute_stake_required = params.required_dispute_stake( op.amount );
      e.created_at = now;
      e.expiry = now + op.duration;
      e.arbitrator_eligible_at = now + params.arbitrator_delay;
   });

   d.push_applied_operation( escrow_created_operation( new_escrow.get_id(), op.buyer, op.seller,
                                                      op.amount, new_escrow.expiry ) );
   return new_escrow.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

/// Checks shared by release and refund of an undisputed escrow
static const escrow_object& settleable_escrow( const database& d, escrow_id_type id, account_id_type caller )
{
   const escrow_object& escrow = d.get_escrow( id );
   TRIBUNAL_ASSERT( !escrow.resolved, already_resolved, "Escrow ${e} is already resolved", ("e",id) );
   TRIBUNAL_ASSERT( escrow.is_party( caller ), not_participant,
                    "Account ${a} is not a party of escrow ${e}", ("a",caller)("e",id) );
   TRIBUNAL_ASSERT( !escrow.disputed, already_disputed,
                    "Escrow ${e} is disputed and can only be resolved by vote or ruling", ("e",id) );
   return escrow;
}

void_result escrow_release_evaluator::do_evaluate( const escrow_release_operation& op )
{ try {
   _escrow = &settleable_escrow( db(), op.escrow, op.caller );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result escrow_release_evaluator::do_apply( const escrow_release_operation& op ) const
{ try {
   // only the buyer can hand the funds to the seller
   if( op.caller == _escrow->buyer )
      db().pay_out_escrow( *_escrow, true );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result escrow_refund_evaluator::do_evaluate( const escrow_refund_operation& op )
{ try {
   const database& d = db();
   _escrow = &settleable_escrow( d, op.escrow, op.caller );

   if( op.caller == _escrow->buyer )
      TRIBUNAL_ASSERT( _escrow->is_expired( d.head_time() ), escrow_not_expired,
                       "Escrow ${e} expires at ${x}", ("e",op.escrow)("x",_escrow->expiry) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result escrow_refund_evaluator::do_apply( const escrow_refund_operation& op ) const
{ try {
   db().pay_out_escrow( *_escrow, false );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result escrow_vote_evaluator::do_evaluate( const escrow_vote_operation& op )
{ try {
   const database& d = db();

   _escrow = &d.get_escrow( op.escrow );
   TRIBUNAL_ASSERT( !_escrow->resolved, already_resolved, "Escrow ${e} is already resolved", ("e",op.escrow) );
   TRIBUNAL_ASSERT( _escrow->disputed, not_disputed, "Escrow ${e} is not disputed", ("e",op.escrow) );

   const bool is_arbitrator = _escrow->arbitrator.valid() && *_escrow->arbitrator == op.voter;
   TRIBUNAL_ASSERT( _escrow->is_party( op.voter ) || is_arbitrator, not_participant,
                    "Account ${a} can not vote on escrow ${e}", ("a",op.voter)("e",op.escrow) );
   if( is_arbitrator )
      TRIBUNAL_ASSERT( d.is_registered_arbitrator( op.voter ), arbitrator_inactive,
                       "Arbitrator ${a} has been deactivated", ("a",op.voter) );

   TRIBUNAL_ASSERT( !_escrow->has_voted( op.voter ), already_voted,
                    "Account ${a} already voted on escrow ${e}", ("a",op.voter)("e",op.escrow) );

   _dispute = &d.get_dispute_by_escrow( op.escrow );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result escrow_vote_evaluator::do_apply( const escrow_vote_operation& op ) const
{ try {
   database& d = db();

   d.modify( *_escrow, [&op]( escrow_object& e ) {
      e.votes[op.voter] = op.release;
      if( op.release )
         ++e.release_votes;
      else
         ++e.refund_votes;
   });
   if( _dispute->status == dispute_assigned )
      d.modify( *_dispute, []( dispute_object& dispute ) {
         dispute.status = dispute_voting;
      });

   d.push_applied_operation( vote_cast_operation( op.escrow, op.voter, op.release ) );

   if( _escrow->release_votes >= TRIBUNAL_VOTE_THRESHOLD )
      d.close_dispute( *_dispute, true, false );
   else if( _escrow->refund_votes >= TRIBUNAL_VOTE_THRESHOLD )
      d.close_dispute( *_dispute, false, false );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tribunal::chain

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
#include <tribunal/chain/dispute_evaluator.hpp>

#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/dispute_object.hpp>
#include <tribunal/chain/escrow_object.hpp>

#include <tribunal/chain/database.hpp>
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/guards.hpp>

namespace tribunal { namespace chain {

void_result dispute_commit_evaluator::do_evaluate( const dispute_commit_operation& op )
{ try {
   const database& d = db();

   check_not_paused( d );

   _escrow = &d.get_escrow( op.escrow );
   TRIBUNAL_ASSERT( _escrow->is_party( op.caller ), not_participant,
                    "Account ${a} is not a party of escrow ${e}", ("a",op.caller)("e",op.escrow) );
   TRIBUNAL_ASSERT( !_escrow->resolved, already_resolved, "Escrow ${e} is already resolved", ("e",op.escrow) );
   TRIBUNAL_ASSERT( !_escrow->disputed && d.find_dispute_commitment( op.escrow ) == nullptr, already_disputed,
                    "Escrow ${e} already has a dispute commitment", ("e",op.escrow) );
   TRIBUNAL_ASSERT( d.head_time() >= _escrow->arbitrator_eligible_at, dispute_too_early,
                    "Escrow ${e} can not be disputed before ${t}", ("e",op.escrow)("t",_escrow->arbitrator_eligible_at) );
   TRIBUNAL_ASSERT( op.stake >= _escrow->dispute_stake_required, insufficient_stake,
                    "Dispute stake ${s} is below the required ${r}",
                    ("s",op.stake)("r",_escrow->dispute_stake_required) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type dispute_commit_evaluator::do_apply( const dispute_commit_operation& op ) const
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();
   const time_point_sec deadline = now + d.get_global_properties().parameters.reveal_window;

   d.deposit_to_custody( op.caller, op.stake );

   const auto& commitment = d.create<dispute_commitment_object>( [&op,now,deadline]( dispute_commitment_object& c ) {
      c.escrow = op.escrow;
      c.committer = op.caller;
      c.commitment = op.commitment;
      c.stake = op.stake;
      c.committed_at = now;
      c.reveal_deadline = deadline;
   });

   d.push_applied_operation( dispute_committed_operation( op.escrow, op.caller, op.stake, deadline ) );
   return commitment.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dispute_reveal_evaluator::do_evaluate( const dispute_reveal_operation& op )
{ try {
   const database& d = db();

   check_not_paused( d );

   _escrow = &d.get_escrow( op.escrow );
   _commitment = d.find_dispute_commitment( op.escrow );

   // checked before the deadline
   TRIBUNAL_ASSERT( _commitment != nullptr
                    && compute_dispute_commitment( op.escrow, op.nonce, op.caller ) == _commitment->commitment,
                    invalid_commitment, "Nonce does not match the commitment of escrow ${e}", ("e",op.escrow) );
   TRIBUNAL_ASSERT( d.head_time() <= _commitment->reveal_deadline, reveal_deadline_passed,
                    "The reveal deadline of escrow ${e} was ${t}", ("e",op.escrow)("t",_commitment->reveal_deadline) );
   TRIBUNAL_ASSERT( !_commitment->revealed && !_escrow->disputed, already_disputed,
                    "Escrow ${e} is already disputed", ("e",op.escrow) );
   TRIBUNAL_ASSERT( !_escrow->resolved, already_resolved, "Escrow ${e} is already resolved", ("e",op.escrow) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type dispute_reveal_evaluator::do_apply( const dispute_reveal_operation& op ) const
{ try {
   database& d = db();

   d.modify( *_commitment, []( dispute_commitment_object& c ) {
      c.revealed = true;
   });
   d.modify( *_escrow, []( escrow_object& e ) {
      e.disputed = true;
   });

   const dispute_object& dispute = d.assign_arbitrator( *_escrow, op.caller, op.nonce );

   d.push_applied_operation( dispute_raised_operation( op.escrow, op.caller, dispute.arbitrator ) );
   return dispute.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dispute_rule_evaluator::do_evaluate( const dispute_rule_operation& op )
{ try {
   const database& d = db();

   const escrow_object& escrow = d.get_escrow( op.escrow );
   TRIBUNAL_ASSERT( !escrow.resolved, already_resolved, "Escrow ${e} is already resolved", ("e",op.escrow) );
   TRIBUNAL_ASSERT( escrow.disputed, not_disputed, "Escrow ${e} is not disputed", ("e",op.escrow) );

   _dispute = &d.get_dispute_by_escrow( op.escrow );
   TRIBUNAL_ASSERT( _dispute->arbitrator == op.arbitrator, not_assigned_arbitrator,
                    "Account ${a} is not the arbitrator of escrow ${e}", ("a",op.arbitrator)("e",op.escrow) );
   TRIBUNAL_ASSERT( d.is_registered_arbitrator( op.arbitrator ), arbitrator_inactive,
                    "Arbitrator ${a} has been deactivated", ("a",op.arbitrator) );
   TRIBUNAL_ASSERT( d.head_time() <= d.get_dispute_deadline( op.escrow ), dispute_timeout,
                    "The arbitrator of escrow ${e} had until ${t} to rule",
                    ("e",op.escrow)("t",d.get_dispute_deadline( op.escrow )) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dispute_rule_evaluator::do_apply( const dispute_rule_operation& op ) const
{ try {
   database& d = db();

   d.modify( *_dispute, [&op]( dispute_object& dispute ) {
      dispute.status = dispute_ruled;
      dispute.resolution_note = op.resolution_note;
   });
   d.close_dispute( *_dispute, op.release_to_seller, true );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dispute_rate_evaluator::do_evaluate( const dispute_rate_operation& op )
{ try {
   const database& d = db();

   _escrow = &d.get_escrow( op.escrow );
   TRIBUNAL_ASSERT( _escrow->is_party( op.rater ), not_participant,
                    "Account ${a} is not a party of escrow ${e}", ("a",op.rater)("e",op.escrow) );

   _dispute = d.find_dispute_by_escrow( op.escrow );
   TRIBUNAL_ASSERT( _dispute != nullptr && _dispute->is_resolved(), dispute_not_resolved,
                    "Escrow ${e} has no resolved dispute", ("e",op.escrow) );

   const bool is_buyer = op.rater == _escrow->buyer;
   const optional<uint8_t>& previous = is_buyer ? _dispute->buyer_rating : _dispute->seller_rating;
   TRIBUNAL_ASSERT( !previous.valid(), already_rated,
                    "Account ${a} already rated the arbitrator of escrow ${e}", ("a",op.rater)("e",op.escrow) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dispute_rate_evaluator::do_apply( const dispute_rate_operation& op ) const
{ try {
   database& d = db();
   const bool is_buyer = op.rater == _escrow->buyer;

   d.modify( *_dispute, [&op,is_buyer]( dispute_object& dispute ) {
      if( is_buyer )
         dispute.buyer_rating = op.rating;
      else
         dispute.seller_rating = op.rating;
   });
   d.push_applied_operation( rating_submitted_operation( op.escrow, op.rater, op.rating ) );

   if( _dispute->buyer_rating.valid() && _dispute->seller_rating.valid() )
   {
      const uint8_t average = static_cast<uint8_t>( ( *_dispute->buyer_rating + *_dispute->seller_rating ) / 2 );
      d.modify( *_dispute, [average]( dispute_object& dispute ) {
         dispute.arbitrator_rating = average;
      });
      d.apply_rating( d.get_arbitrator( _dispute->arbitrator ), average );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tribunal::chain

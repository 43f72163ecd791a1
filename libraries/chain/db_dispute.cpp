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
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/arbitrator_selection.hpp>

namespace tribunal { namespace chain {

const dispute_object& database::assign_arbitrator( const escrow_object& escrow, account_id_type disputer,
                                                   const digest_type& nonce )
{
   FC_ASSERT( escrow.disputed && !escrow.resolved && !escrow.arbitrator.valid() );

   const dynamic_global_property_object& dgp = get_dynamic_global_properties();
   const digest_type seed = make_selection_seed( escrow.created_at, dgp.arbitrator_seed, nonce, escrow.get_id() );

   // a party never judges its own escrow
   const flat_set<account_id_type> parties{ escrow.buyer, escrow.seller };
   const optional<account_id_type> candidate = select_candidate( *this, seed, parties );
   if( !candidate.valid() )
   {
      wlog( "No arbitrator available for escrow ${e}", ("e",escrow.id) );
      FC_THROW_EXCEPTION( no_candidate_available, "No arbitrator available for escrow ${e}", ("e",escrow.id) );
   }
   const account_id_type arbitrator = *candidate;

   record_case_opened( get_arbitrator( arbitrator ) );
   modify( escrow, [arbitrator]( escrow_object& e ) {
      e.arbitrator = arbitrator;
   });

   const time_point_sec now = head_time();
   const dispute_object& dispute = create<dispute_object>( [&]( dispute_object& d ) {
      d.escrow = escrow.get_id();
      d.arbitrator = arbitrator;
      d.disputer = disputer;
      d.created_at = now;
      d.status = dispute_assigned;
   });

   modify( dgp, [&seed]( dynamic_global_property_object& p ) {
      p.arbitrator_seed = next_rotating_seed( p.arbitrator_seed, seed );
   });

   ilog( "Arbitrator ${a} assigned to escrow ${e}", ("a",arbitrator)("e",escrow.id) );
   push_applied_operation( dispute_created_operation( dispute.get_id(), escrow.get_id(), arbitrator ) );
   return dispute;
}

void database::close_dispute( const dispute_object& dispute, bool release_to_seller, bool by_ruling )
{
   const escrow_object& escrow = get( dispute.escrow );
   FC_ASSERT( !dispute.is_resolved() && !escrow.resolved );

   bool success = by_ruling;
   if( !by_ruling )
   {
      auto vote = escrow.votes.find( dispute.arbitrator );
      success = vote != escrow.votes.end() && vote->second == release_to_seller;
   }

   const time_point_sec now = head_time();
   modify( dispute, [now,release_to_seller]( dispute_object& d ) {
      d.status = dispute_resolved;
      d.resolved_at = now;
      d.release_to_seller = release_to_seller;
   });

   const arbitrator_object* arbitrator = find_arbitrator( dispute.arbitrator );
   if( arbitrator != nullptr )
      record_case_resolved( *arbitrator, success );

   pay_out_escrow( escrow, release_to_seller );
   push_applied_operation( dispute_resolved_operation( escrow.get_id(), dispute.arbitrator,
                                                       release_to_seller, by_ruling ) );
}

void database::pay_out_escrow( const escrow_object& escrow, bool release_to_seller )
{
   FC_ASSERT( !escrow.resolved, "Escrow ${e} was already paid out", ("e",escrow.id) );

   const chain_parameters& params = get_global_properties().parameters;
   const share_type amount = escrow.amount;
   const account_id_type winner = release_to_seller ? escrow.seller : escrow.buyer;

   // the escrow is settled before any value leaves custody
   modify( escrow, []( escrow_object& e ) {
      e.amount = 0;
      e.resolved = true;
   });

   share_type paid = amount;
   if( release_to_seller )
   {
      const share_type fee = params.marketplace_fee( amount );
      if( fee > 0 )
      {
         pay_from_custody( params.marketplace_fee_account, fee );
         push_applied_operation( marketplace_fee_collected_operation( escrow.get_id(),
                                                                      params.marketplace_fee_account, fee ) );
         paid -= fee;
      }
   }

   pay_from_custody( winner, paid );
   dlog( "Escrow ${e} paid ${x} to ${w}", ("e",escrow.id)("x",paid)("w",winner) );
   push_applied_operation( escrow_resolved_operation( escrow.get_id(), winner, paid ) );

   return_dispute_stake( escrow );
}

void database::return_dispute_stake( const escrow_object& escrow )
{
   const dispute_commitment_object* commitment = find_dispute_commitment( escrow.get_id() );
   if( commitment == nullptr || commitment->stake_returned )
      return;

   modify( *commitment, []( dispute_commitment_object& c ) {
      c.stake_returned = true;
   });
   pay_from_custody( commitment->committer, commitment->stake );
   push_applied_operation( dispute_stake_returned_operation( escrow.get_id(), commitment->committer,
                                                             commitment->stake ) );
}

} }

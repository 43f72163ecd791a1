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
#include <tribunal/chain/arbitrator_evaluator.hpp>

#include <tribunal/chain/arbitrator_object.hpp>

#include <tribunal/chain/database.hpp>
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/guards.hpp>

#include <algorithm>

namespace tribunal { namespace chain {

void_result arbitrator_register_evaluator::do_evaluate( const arbitrator_register_operation& op )
{ try {
   const database& d = db();
   const chain_parameters& params = d.get_global_properties().parameters;

   check_not_paused( d );

   TRIBUNAL_ASSERT( d.find( op.account ) != nullptr, invalid_address,
                    "Account ${a} does not exist", ("a",op.account) );

   _existing = d.find_arbitrator( op.account );
   TRIBUNAL_ASSERT( _existing == nullptr || !_existing->is_active, already_registered,
                    "Account ${a} is already an arbitrator", ("a",op.account) );

   const arbitrator_metadata_source& source = d.metadata_source();
   _reputation = std::min<uint32_t>( source.get_reputation( op.account ), TRIBUNAL_MAX_REPUTATION );
   _participation_index = source.get_participation_index( op.account );

   TRIBUNAL_ASSERT( _reputation >= params.min_arbitrator_reputation, insufficient_reputation,
                    "Reputation ${r} of ${a} is below the required ${m}",
                    ("r",_reputation)("a",op.account)("m",params.min_arbitrator_reputation) );
   TRIBUNAL_ASSERT( _participation_index >= params.min_arbitrator_participation, insufficient_reputation,
                    "Participation index ${p} of ${a} is below the required ${m}",
                    ("p",_participation_index)("a",op.account)("m",params.min_arbitrator_participation) );
   TRIBUNAL_ASSERT( op.stake >= params.min_arbitrator_stake, insufficient_stake,
                    "Arbitrator stake ${s} is below the required ${m}",
                    ("s",op.stake)("m",params.min_arbitrator_stake) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type arbitrator_register_evaluator::do_apply( const arbitrator_register_operation& op ) const
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();
   const uint32_t reputation = _reputation;
   const uint32_t participation_index = _participation_index;

   d.deposit_to_custody( op.account, op.stake );

   const auto init = [&op,now,reputation,participation_index]( arbitrator_object& a ) {
      a.arbitrator_account = op.account;
      a.reputation = reputation;
      a.participation_index = participation_index;
      a.stake = op.stake;
      a.is_active = true;
      a.registered_at = now;
      a.last_active = now;
   };

   object_id_type result;
   if( _existing != nullptr )
   {
      d.modify( *_existing, init );
      result = _existing->id;
   }
   else
      result = d.create<arbitrator_object>( init ).id;

   ilog( "Arbitrator ${a} registered with reputation ${r}", ("a",op.account)("r",reputation) );
   d.push_applied_operation( arbitrator_registered_operation( op.account, reputation, participation_index ) );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result arbitrator_refresh_evaluator::do_evaluate( const arbitrator_refresh_operation& op )
{ try {
   _arbitrator = &db().get_arbitrator( op.account );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result arbitrator_refresh_evaluator::do_apply( const arbitrator_refresh_operation& op ) const
{ try {
   database& d = db();
   const uint32_t participation_index = d.metadata_source().get_participation_index( op.account );

   d.modify( *_arbitrator, [participation_index]( arbitrator_object& a ) {
      a.participation_index = participation_index;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result arbitrator_deactivate_evaluator::do_evaluate( const arbitrator_deactivate_operation& op )
{ try {
   const database& d = db();

   check_admin( d, op.admin );

   _arbitrator = &d.get_arbitrator( op.arbitrator );
   TRIBUNAL_ASSERT( _arbitrator->is_active, arbitrator_inactive,
                    "Arbitrator ${a} is already inactive", ("a",op.arbitrator) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result arbitrator_deactivate_evaluator::do_apply( const arbitrator_deactivate_operation& op ) const
{ try {
   database& d = db();
   const share_type stake = _arbitrator->stake;

   d.modify( *_arbitrator, []( arbitrator_object& a ) {
      a.is_active = false;
      a.stake = 0;
   });
   d.pay_from_custody( op.arbitrator, stake );

   ilog( "Arbitrator ${a} deactivated", ("a",op.arbitrator) );
   d.push_applied_operation( arbitrator_removed_operation( op.arbitrator ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tribunal::chain

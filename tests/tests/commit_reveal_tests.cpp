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
#include <boost/test/unit_test.hpp>

#include <tribunal/chain/database.hpp>
#include <tribunal/chain/arbitrator_selection.hpp>
#include <tribunal/chain/dispute_object.hpp>
#include <tribunal/chain/escrow_object.hpp>

#include "../common/database_fixture.hpp"

using namespace tribunal::chain;
using namespace tribunal::chain::test;

BOOST_FIXTURE_TEST_SUITE( commit_reveal_tests, database_fixture )

BOOST_AUTO_TEST_CASE( commit_and_reveal )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTOR( judge );
      register_arbitrator( judge_id );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000000 );
      BOOST_CHECK_EQUAL( db.get_escrow( escrow_id ).dispute_stake_required.value, 1000 );

      db.advance_time( parameters().arbitrator_delay );
      fund( alice_id, 1000 );

      const digest_type nonce = make_nonce( "alice" );

      // 0.1% of the escrowed amount is the least stake
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( escrow_id, alice_id, nonce, 999 ) ),
                              insufficient_stake );
      BOOST_CHECK( db.find_dispute_commitment( escrow_id ) == nullptr );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 1000 );

      published_ops.clear();
      const time_point_sec committed_at = db.head_time();
      db.push_operation( make_dispute_commit_op( escrow_id, alice_id, nonce, 1000 ) );

      const dispute_commitment_object* commitment = db.find_dispute_commitment( escrow_id );
      BOOST_REQUIRE( commitment != nullptr );
      BOOST_CHECK( commitment->committer == alice_id );
      BOOST_CHECK( commitment->commitment == db.compute_commitment( escrow_id, nonce, alice_id ) );
      BOOST_CHECK_EQUAL( commitment->stake.value, 1000 );
      BOOST_CHECK( commitment->reveal_deadline == committed_at + parameters().reveal_window );
      BOOST_CHECK( !commitment->revealed );
      BOOST_CHECK( !db.get_escrow( escrow_id ).disputed );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 0 );
      BOOST_CHECK_EQUAL( custody_balance().value, 1001000 );
      BOOST_CHECK_EQUAL( count_ops<dispute_committed_operation>( published_ops ), 1u );

      published_ops.clear();
      db.advance_time( 60 );
      dispute_id_type dispute_id = reveal_dispute( escrow_id, alice_id, nonce );

      const escrow_object& escrow = db.get_escrow( escrow_id );
      BOOST_CHECK( escrow.disputed );
      BOOST_REQUIRE( escrow.arbitrator.valid() );
      BOOST_CHECK( *escrow.arbitrator == judge_id );
      BOOST_CHECK( db.find_dispute_commitment( escrow_id )->revealed );

      const dispute_object& dispute = dispute_id(db);
      BOOST_CHECK( dispute.escrow == escrow_id );
      BOOST_CHECK( dispute.arbitrator == judge_id );
      BOOST_CHECK( dispute.disputer == alice_id );
      BOOST_CHECK( dispute.status == dispute_assigned );
      BOOST_CHECK( dispute.created_at == db.head_time() );
      BOOST_CHECK( db.get_dispute_by_escrow( escrow_id ).id == dispute.id );

      const arbitrator_object& arb = db.get_arbitrator( judge_id );
      BOOST_CHECK_EQUAL( arb.total_cases, 1u );
      BOOST_CHECK_EQUAL( arb.active_cases, 1u );
      BOOST_CHECK_EQUAL( arb.successful_cases, 0u );

      BOOST_CHECK_EQUAL( count_ops<dispute_created_operation>( published_ops ), 1u );
      BOOST_REQUIRE_EQUAL( count_ops<dispute_raised_operation>( published_ops ), 1u );
      const auto& raised = published_ops.back().op.get<dispute_raised_operation>();
      BOOST_CHECK( raised.escrow == escrow_id );
      BOOST_CHECK( raised.disputer == alice_id );
      BOOST_CHECK( raised.arbitrator == judge_id );

      // a disputed escrow leaves the happy path
      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id, alice_id ), already_disputed );
      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id, bob_id ), already_disputed );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( commit_too_early )
{
   try
   {
      ACTORS( (alice)(bob) );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      const time_point_sec eligible_at = db.get_escrow( escrow_id ).arbitrator_eligible_at;
      const digest_type nonce = make_nonce( "early" );
      fund( bob_id, 1 );

      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( escrow_id, bob_id, nonce, 1 ) ),
                              dispute_too_early );
      db.set_head_time( eligible_at - 1 );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( escrow_id, bob_id, nonce, 1 ) ),
                              dispute_too_early );

      db.set_head_time( eligible_at );
      db.push_operation( make_dispute_commit_op( escrow_id, bob_id, nonce, 1 ) );
      BOOST_CHECK( db.find_dispute_commitment( escrow_id ) != nullptr );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( commit_preconditions )
{
   try
   {
      ACTORS( (alice)(bob)(sam) );

      escrow_id_type open = create_escrow( alice_id, bob_id, 1000 );
      escrow_id_type settled = create_escrow( alice_id, bob_id, 1000 );
      release_escrow( settled, alice_id );
      db.advance_time( parameters().arbitrator_delay );

      fund( sam_id, 10 );
      fund( bob_id, 10 );
      const digest_type nonce = make_nonce( "pre" );

      dispute_commit_operation op = make_dispute_commit_op( open, bob_id, nonce, 1 );
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE_2( op, commitment, digest_type(), invalid_commitment );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, stake, -1, invalid_amount );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, caller, TRIBUNAL_NULL_ACCOUNT, invalid_address );

      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( open, sam_id, nonce, 1 ) ),
                              not_participant );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( settled, bob_id, nonce, 1 ) ),
                              already_resolved );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( escrow_id_type(42), bob_id, nonce, 1 ) ),
                              escrow_not_found );

      // only one commitment per escrow
      db.push_operation( make_dispute_commit_op( open, bob_id, nonce, 1 ) );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( open, bob_id, nonce, 1 ) ),
                              already_disputed );
      fund( alice_id, 1 );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( open, alice_id, make_nonce( "a" ), 1 ) ),
                              already_disputed );

      // a stake the caller does not have
      escrow_id_type big = create_escrow( alice_id, bob_id, 1000000 );
      db.advance_time( parameters().arbitrator_delay );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( big, sam_id, nonce, 1000 ) ),
                              not_participant );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( big, bob_id, nonce, 1000 ) ),
                              insufficient_balance );
      BOOST_CHECK( db.find_dispute_commitment( big ) == nullptr );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( reveal_binds_the_nonce )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTOR( judge );
      register_arbitrator( judge_id );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      db.advance_time( parameters().arbitrator_delay );
      const digest_type nonce = make_nonce( "right" );

      // nothing committed yet
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, alice_id, nonce ), invalid_commitment );

      commit_dispute( escrow_id, alice_id, nonce );

      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, alice_id, make_nonce( "wrong" ) ), invalid_commitment );
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, alice_id, digest_type() ), invalid_commitment );
      // the commitment covers the committer
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, bob_id, nonce ), invalid_commitment );

      // a wrong nonce stays a wrong nonce after the deadline
      db.advance_time( parameters().reveal_window + 1 );
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, alice_id, make_nonce( "wrong" ) ), invalid_commitment );

      BOOST_CHECK( !db.get_escrow( escrow_id ).disputed );
      BOOST_CHECK( !db.find_dispute_commitment( escrow_id )->revealed );
      BOOST_CHECK( db.find_dispute_by_escrow( escrow_id ) == nullptr );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( reveal_window )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTOR( judge );
      register_arbitrator( judge_id );

      escrow_id_type on_time = create_escrow( alice_id, bob_id, 1000 );
      escrow_id_type late = create_escrow( alice_id, bob_id, 2000 );
      db.advance_time( parameters().arbitrator_delay );

      const digest_type nonce = make_nonce( "window" );
      commit_dispute( on_time, alice_id, nonce );
      commit_dispute( late, alice_id, nonce );
      const time_point_sec deadline = db.find_dispute_commitment( on_time )->reveal_deadline;

      // the deadline itself is still in time
      db.set_head_time( deadline );
      reveal_dispute( on_time, alice_id, nonce );
      BOOST_CHECK( db.get_escrow( on_time ).disputed );

      db.set_head_time( deadline + 1 );
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( late, alice_id, nonce ), reveal_deadline_passed );
      BOOST_CHECK( !db.get_escrow( late ).disputed );

      // the stale commitment still blocks a new one
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( late, bob_id, make_nonce( "b" ), 2 ) ),
                              already_disputed );

      // the happy path stays open and hands the stake back
      published_ops.clear();
      const share_type alice_before = get_balance( alice_id );
      release_escrow( late, alice_id );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 2000 );
      BOOST_CHECK_EQUAL( ( get_balance( alice_id ) - alice_before ).value, 2 );
      BOOST_CHECK( db.find_dispute_commitment( late )->stake_returned );
      BOOST_REQUIRE_EQUAL( count_ops<dispute_stake_returned_operation>( published_ops ), 1u );
      const auto& returned = published_ops.back().op.get<dispute_stake_returned_operation>();
      BOOST_CHECK( returned.committer == alice_id );
      BOOST_CHECK_EQUAL( returned.stake.value, 2 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( reveal_twice )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTOR( judge );
      register_arbitrator( judge_id );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      raise_dispute( escrow_id, bob_id, "twice" );

      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, bob_id, make_nonce( "twice" ) ), already_disputed );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).total_cases, 1u );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( reveal_without_candidate )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTOR( judge );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      db.advance_time( parameters().arbitrator_delay );
      const digest_type nonce = make_nonce( "retry" );
      commit_dispute( escrow_id, alice_id, nonce );

      published_ops.clear();
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, alice_id, nonce ), no_candidate_available );

      // the reveal left no trace
      BOOST_CHECK( !db.get_escrow( escrow_id ).disputed );
      BOOST_CHECK( !db.find_dispute_commitment( escrow_id )->revealed );
      BOOST_CHECK( db.find_dispute_by_escrow( escrow_id ) == nullptr );
      BOOST_CHECK( published_ops.empty() );

      // and can be retried once an arbitrator is available
      register_arbitrator( judge_id );
      reveal_dispute( escrow_id, alice_id, nonce );
      BOOST_CHECK( db.get_escrow( escrow_id ).disputed );
      BOOST_CHECK( *db.get_escrow( escrow_id ).arbitrator == judge_id );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( assignment_follows_the_seed )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTORS( (judge1)(judge2)(judge3) );
      register_arbitrator( judge1_id );
      register_arbitrator( judge2_id );
      register_arbitrator( judge3_id );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      db.advance_time( parameters().arbitrator_delay );
      const digest_type nonce = make_nonce( "seed" );
      commit_dispute( escrow_id, bob_id, nonce );

      const digest_type rotating_seed = db.get_dynamic_global_properties().arbitrator_seed;
      const digest_type seed = make_selection_seed( db.get_escrow( escrow_id ).created_at, rotating_seed,
                                                    nonce, escrow_id );

      // selection is a function of the registry, the parties and the seed alone
      const flat_set<account_id_type> parties{ alice_id, bob_id };
      optional<account_id_type> expected = select_candidate( db, seed, parties );
      BOOST_REQUIRE( expected.valid() );
      BOOST_CHECK( *select_candidate( db, seed, parties ) == *expected );

      const dispute_object& dispute = db.get( reveal_dispute( escrow_id, bob_id, nonce ) );
      BOOST_CHECK( dispute.arbitrator == *expected );

      // the rotating seed moves on after every assignment
      BOOST_CHECK( db.get_dynamic_global_properties().arbitrator_seed == next_rotating_seed( rotating_seed, seed ) );
      BOOST_CHECK( db.get_dynamic_global_properties().arbitrator_seed != rotating_seed );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( paused_system_rejects_disputes )
{
   try
   {
      ACTORS( (alice)(bob) );
      QUALIFIED_ACTOR( judge );
      register_arbitrator( judge_id );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      db.advance_time( parameters().arbitrator_delay );
      const digest_type nonce = make_nonce( "pause" );
      fund( alice_id, 1 );

      set_paused( true );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_dispute_commit_op( escrow_id, alice_id, nonce, 1 ) ),
                              system_paused );
      set_paused( false );
      db.push_operation( make_dispute_commit_op( escrow_id, alice_id, nonce, 1 ) );

      set_paused( true );
      TRIBUNAL_REQUIRE_THROW( reveal_dispute( escrow_id, alice_id, nonce ), system_paused );
      set_paused( false );
      reveal_dispute( escrow_id, alice_id, nonce );
      BOOST_CHECK( db.get_escrow( escrow_id ).disputed );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

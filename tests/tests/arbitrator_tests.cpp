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
#include <tribunal/chain/arbitrator_metadata.hpp>
#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/arbitrator_selection.hpp>

#include <string>

#include "../common/database_fixture.hpp"

using namespace tribunal::chain;
using namespace tribunal::chain::test;

namespace {

/// Reports the same readings for every account
class fixed_metadata_source : public arbitrator_metadata_source
{
   public:
      fixed_metadata_source( uint32_t reputation, uint32_t participation_index )
         : _reputation( reputation ), _participation_index( participation_index ) {}

      uint32_t get_reputation( account_id_type )const override { return _reputation; }
      uint32_t get_participation_index( account_id_type )const override { return _participation_index; }

   private:
      uint32_t _reputation;
      uint32_t _participation_index;
};

}

BOOST_FIXTURE_TEST_SUITE( arbitrator_tests, database_fixture )

BOOST_AUTO_TEST_CASE( register_arbitrator_test )
{
   try
   {
      QUALIFIED_ACTOR( judge );

      BOOST_CHECK( !db.is_registered_arbitrator( judge_id ) );
      BOOST_CHECK_EQUAL( db.get_active_arbitrator_count(), 0u );

      published_ops.clear();
      const arbitrator_object& arb = register_arbitrator( judge_id );

      BOOST_CHECK( arb.arbitrator_account == judge_id );
      BOOST_CHECK_EQUAL( arb.reputation, 900u );
      BOOST_CHECK_EQUAL( arb.participation_index, 800u );
      BOOST_CHECK_EQUAL( arb.total_cases, 0u );
      BOOST_CHECK_EQUAL( arb.successful_cases, 0u );
      BOOST_CHECK_EQUAL( arb.active_cases, 0u );
      BOOST_CHECK( arb.is_active );
      BOOST_CHECK( arb.registered_at == db.head_time() );
      BOOST_CHECK_EQUAL( arb.success_rate(), 0u );

      BOOST_CHECK( db.is_registered_arbitrator( judge_id ) );
      BOOST_CHECK_EQUAL( db.get_active_arbitrator_count(), 1u );
      BOOST_CHECK_EQUAL( db.get_arbitrator_success_rate( judge_id ), 0u );

      BOOST_REQUIRE_EQUAL( count_ops<arbitrator_registered_operation>( published_ops ), 1u );
      const auto& registered = published_ops.back().op.get<arbitrator_registered_operation>();
      BOOST_CHECK( registered.arbitrator == judge_id );
      BOOST_CHECK_EQUAL( registered.reputation, 900u );
      BOOST_CHECK_EQUAL( registered.participation_index, 800u );

      TRIBUNAL_REQUIRE_THROW( register_arbitrator( judge_id ), already_registered );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( register_requires_readings )
{
   try
   {
      const auto& unproven = create_account( "unproven", 749, 800 );
      const auto& absent = create_account( "absent", 900, 499 );
      const auto& borderline = create_account( "borderline", 750, 500 );

      TRIBUNAL_REQUIRE_THROW( register_arbitrator( unproven.get_id() ), insufficient_reputation );
      TRIBUNAL_REQUIRE_THROW( register_arbitrator( absent.get_id() ), insufficient_reputation );
      register_arbitrator( borderline.get_id() );

      TRIBUNAL_REQUIRE_THROW( register_arbitrator( account_id_type(500) ), invalid_address );

      arbitrator_register_operation op;
      op.account = borderline.get_id();
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE_2( op, account, TRIBUNAL_NULL_ACCOUNT, invalid_address );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, account, TRIBUNAL_CUSTODY_ACCOUNT, invalid_address );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, stake, -5, invalid_amount );

      // the minimums follow the parameters
      chain_parameters params = parameters();
      params.min_arbitrator_reputation = 700;
      params.min_arbitrator_participation = 100;
      update_parameters( params );
      register_arbitrator( unproven.get_id() );
      register_arbitrator( absent.get_id() );
      BOOST_CHECK_EQUAL( db.get_active_arbitrator_count(), 3u );

      set_paused( true );
      QUALIFIED_ACTOR( late );
      TRIBUNAL_REQUIRE_THROW( register_arbitrator( late_id ), system_paused );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( external_metadata_source )
{
   try
   {
      ACTORS( (judge)(weak) );

      db.set_metadata_source( std::make_shared<fixed_metadata_source>( 5000, 900 ) );
      // readings above the scale are clamped
      BOOST_CHECK_EQUAL( register_arbitrator( judge_id ).reputation, TRIBUNAL_MAX_REPUTATION );

      db.set_metadata_source( std::make_shared<fixed_metadata_source>( 100, 900 ) );
      TRIBUNAL_REQUIRE_THROW( register_arbitrator( weak_id ), insufficient_reputation );

      // refresh re-reads the participation only
      db.set_metadata_source( std::make_shared<fixed_metadata_source>( 100, 650 ) );
      arbitrator_refresh_operation op;
      op.account = judge_id;
      db.push_operation( op );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).participation_index, 650u );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).reputation, TRIBUNAL_MAX_REPUTATION );

      op.account = weak_id;
      TRIBUNAL_REQUIRE_THROW( db.push_operation( op ), arbitrator_not_found );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( arbitrator_stake_and_deactivation )
{
   try
   {
      QUALIFIED_ACTORS( (judge)(other) );
      ACTOR( sam );

      chain_parameters params = parameters();
      params.min_arbitrator_stake = 100;
      update_parameters( params );

      TRIBUNAL_REQUIRE_THROW( register_arbitrator( judge_id, 50 ), insufficient_stake );
      BOOST_CHECK_EQUAL( get_balance( judge_id ).value, 50 );

      register_arbitrator( judge_id, 100 );
      BOOST_CHECK_EQUAL( get_balance( judge_id ).value, 50 );
      BOOST_CHECK_EQUAL( custody_balance().value, 100 );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).stake.value, 100 );

      arbitrator_deactivate_operation op;
      op.admin = sam_id;
      op.arbitrator = judge_id;
      TRIBUNAL_REQUIRE_THROW( db.push_operation( op ), not_admin );
      op.arbitrator = other_id;
      op.admin = admin_id;
      TRIBUNAL_REQUIRE_THROW( db.push_operation( op ), arbitrator_not_found );

      // counters survive deactivation
      db.modify( db.get_arbitrator( judge_id ), []( arbitrator_object& a ) {
         a.total_cases = 4;
         a.successful_cases = 3;
      });

      published_ops.clear();
      deactivate_arbitrator( judge_id );

      const arbitrator_object& arb = db.get_arbitrator( judge_id );
      BOOST_CHECK( !arb.is_active );
      BOOST_CHECK_EQUAL( arb.stake.value, 0 );
      BOOST_CHECK( !db.is_registered_arbitrator( judge_id ) );
      BOOST_CHECK_EQUAL( db.get_active_arbitrator_count(), 0u );
      BOOST_CHECK_EQUAL( get_balance( judge_id ).value, 150 );
      BOOST_CHECK_EQUAL( custody_balance().value, 0 );
      BOOST_REQUIRE_EQUAL( count_ops<arbitrator_removed_operation>( published_ops ), 1u );
      BOOST_CHECK( published_ops.back().op.get<arbitrator_removed_operation>().arbitrator == judge_id );

      TRIBUNAL_REQUIRE_THROW( deactivate_arbitrator( judge_id ), arbitrator_inactive );

      // registering again reactivates the same record
      const arbitrator_id_type record = arb.get_id();
      register_arbitrator( judge_id, 100 );
      BOOST_CHECK( db.get_arbitrator( judge_id ).get_id() == record );
      BOOST_CHECK( db.get_arbitrator( judge_id ).is_active );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).total_cases, 4u );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).successful_cases, 3u );
      BOOST_CHECK_EQUAL( db.get_arbitrator_success_rate( judge_id ), 7500u );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( selection_prefers_the_best_score )
{
   try
   {
      QUALIFIED_ACTORS( (steady)(famous)(busy) );
      register_arbitrator( steady_id );
      register_arbitrator( famous_id );
      register_arbitrator( busy_id );

      auto set_record = [this]( account_id_type account, uint32_t reputation, uint32_t participation,
                                uint32_t total, uint32_t successful ) {
         db.modify( db.get_arbitrator( account ), [=]( arbitrator_object& a ) {
            a.reputation = reputation;
            a.participation_index = participation;
            a.total_cases = total;
            a.successful_cases = successful;
         });
      };
      // 900 * 10000 * 800
      set_record( steady_id, 900, 800, 10, 10 );
      // 1000 * 5000 * 800
      set_record( famous_id, 1000, 800, 10, 5 );
      // 800 * 10000 * 1000
      set_record( busy_id, 800, 1000, 10, 10 );

      const digest_type seed = digest_type::hash( std::string( "any" ) );
      BOOST_CHECK( *select_candidate( db, seed, no_parties ) == busy_id );
      BOOST_CHECK( *select_candidate( db, seed, flat_set<account_id_type>{ busy_id } ) == steady_id );

      // an arbitrator at the limit of open cases is skipped
      db.modify( db.get_arbitrator( busy_id ), [this]( arbitrator_object& a ) {
         a.active_cases = parameters().max_active_disputes;
      });
      BOOST_CHECK( *select_candidate( db, seed, no_parties ) == steady_id );
      BOOST_CHECK( *select_candidate( db, seed, no_parties, false ) == busy_id );

      deactivate_arbitrator( steady_id );
      BOOST_CHECK( *select_candidate( db, seed, no_parties ) == famous_id );

      deactivate_arbitrator( famous_id );
      BOOST_CHECK( !select_candidate( db, seed, no_parties ).valid() );
      BOOST_CHECK( *select_candidate( db, seed, no_parties, false ) == busy_id );

      deactivate_arbitrator( busy_id );
      BOOST_CHECK( !select_candidate( db, seed, no_parties, false ).valid() );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( selection_tie_break )
{
   try
   {
      QUALIFIED_ACTORS( (first)(second)(third) );
      register_arbitrator( first_id );
      register_arbitrator( second_id );
      register_arbitrator( third_id );

      // third has a lower reputation and drops out of the tie
      db.modify( db.get_arbitrator( third_id ), []( arbitrator_object& a ) {
         a.reputation = 800;
         a.total_cases = 1;
         a.successful_cases = 1;
      });
      for( account_id_type id : { first_id, second_id } )
         db.modify( db.get_arbitrator( id ), []( arbitrator_object& a ) {
            a.total_cases = 1;
            a.successful_cases = 1;
         });

      const vector<account_id_type> tied{ first_id, second_id };
      for( int i = 0; i < 8; ++i )
      {
         const digest_type seed = digest_type::hash( "tie" + std::to_string( i ) );
         optional<account_id_type> chosen = select_candidate( db, seed, no_parties );
         BOOST_REQUIRE( chosen.valid() );
         BOOST_CHECK( *chosen == tied[ seed_modulo( seed, tied.size() ) ] );
      }

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( seeded_hash_strategy )
{
   try
   {
      QUALIFIED_ACTORS( (first)(second)(third) );
      register_arbitrator( first_id );
      register_arbitrator( second_id );
      register_arbitrator( third_id );
      // would win every reputation weighted selection
      db.modify( db.get_arbitrator( third_id ), []( arbitrator_object& a ) {
         a.total_cases = 1;
         a.successful_cases = 1;
      });

      chain_parameters params = parameters();
      params.selection_strategy = seeded_hash;
      update_parameters( params );

      const vector<account_id_type> eligible{ first_id, second_id, third_id };
      for( int i = 0; i < 8; ++i )
      {
         const digest_type seed = digest_type::hash( "hash" + std::to_string( i ) );
         BOOST_CHECK( *select_candidate( db, seed, no_parties ) == eligible[ seed_modulo( seed, eligible.size() ) ] );
      }

      // the parties of the escrow are never eligible
      const flat_set<account_id_type> parties{ third_id };
      const vector<account_id_type> neutral{ first_id, second_id };
      for( int i = 0; i < 8; ++i )
      {
         const digest_type seed = digest_type::hash( "party" + std::to_string( i ) );
         BOOST_CHECK( *select_candidate( db, seed, parties ) == neutral[ seed_modulo( seed, neutral.size() ) ] );
      }

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( rating_keeps_reputation_in_range )
{
   try
   {
      // 90% of 900 plus 10% of 4 stars mapped to 800
      BOOST_CHECK_EQUAL( rated_reputation( 900, 4, 10 ), 890u );
      BOOST_CHECK_EQUAL( rated_reputation( 900, 5, 10 ), 910u );
      BOOST_CHECK_EQUAL( rated_reputation( 900, 3, 0 ), 900u );
      BOOST_CHECK_EQUAL( rated_reputation( 900, 1, 100 ), 200u );

      for( uint32_t old_reputation : { 0u, 1u, 499u, 750u, 999u, 1000u } )
         for( uint8_t weight = 0; weight <= TRIBUNAL_MAX_RATING_WEIGHT; weight += 5 )
            for( uint8_t rating = TRIBUNAL_MIN_RATING; rating <= TRIBUNAL_MAX_RATING; ++rating )
               BOOST_CHECK_LE( rated_reputation( old_reputation, rating, weight ), TRIBUNAL_MAX_REPUTATION );

      QUALIFIED_ACTOR( judge );
      const arbitrator_object& arb = register_arbitrator( judge_id );
      TRIBUNAL_REQUIRE_THROW( db.apply_rating( arb, 0 ), invalid_rating );
      TRIBUNAL_REQUIRE_THROW( db.apply_rating( arb, 6 ), invalid_rating );
      BOOST_CHECK_EQUAL( db.get_arbitrator( judge_id ).reputation, 900u );

      dispute_rate_operation op;
      op.rater = judge_id;
      op.rating = 3;
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE_2( op, rating, 0, invalid_rating );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, rating, 6, invalid_amount );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

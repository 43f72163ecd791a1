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
#include <tribunal/chain/escrow_object.hpp>

#include "../common/database_fixture.hpp"

using namespace tribunal::chain;
using namespace tribunal::chain::test;

BOOST_FIXTURE_TEST_SUITE( escrow_tests, database_fixture )

BOOST_AUTO_TEST_CASE( escrow_create )
{
   try
   {
      ACTORS( (alice)(bob) );
      fund( alice_id, 1500 );

      const time_point_sec t0 = db.head_time();
      published_ops.clear();

      trx.operations.push_back( make_escrow_create_op( alice_id, bob_id, 1000, 2 * 24 * 60 * 60 ) );
      processed_transaction ptx = db.push_transaction( trx );
      trx.clear();

      escrow_id_type escrow_id( ptx.operation_results[0].get<object_id_type>() );
      const escrow_object& escrow = db.get_escrow( escrow_id );

      BOOST_CHECK( escrow.buyer == alice_id );
      BOOST_CHECK( escrow.seller == bob_id );
      BOOST_CHECK_EQUAL( escrow.amount.value, 1000 );
      BOOST_CHECK( escrow.created_at == t0 );
      BOOST_CHECK( escrow.expiry == t0 + 2 * 24 * 60 * 60 );
      BOOST_CHECK( escrow.arbitrator_eligible_at == t0 + parameters().arbitrator_delay );
      // 0.1% of 1000
      BOOST_CHECK_EQUAL( escrow.dispute_stake_required.value, 1 );
      BOOST_CHECK( !escrow.arbitrator.valid() );
      BOOST_CHECK( !escrow.disputed );
      BOOST_CHECK( !escrow.resolved );

      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 500 );
      BOOST_CHECK_EQUAL( custody_balance().value, 1000 );

      BOOST_REQUIRE_EQUAL( published_ops.size(), 2u );
      BOOST_CHECK( published_ops[0].op.is_type<escrow_create_operation>() );
      BOOST_REQUIRE( published_ops[1].op.is_type<escrow_created_operation>() );
      const auto& created = published_ops[1].op.get<escrow_created_operation>();
      BOOST_CHECK( created.escrow == escrow_id );
      BOOST_CHECK( created.buyer == alice_id );
      BOOST_CHECK( created.seller == bob_id );
      BOOST_CHECK_EQUAL( created.amount.value, 1000 );
      BOOST_CHECK( created.expiry == escrow.expiry );
      BOOST_CHECK( published_ops[1].virtual_op == 1 );

      // ids are handed out in order
      escrow_id_type second = create_escrow( alice_id, bob_id, 100 );
      BOOST_CHECK( second.instance.value == escrow_id.instance.value + 1 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( escrow_create_validation )
{
   try
   {
      ACTORS( (alice)(bob) );
      fund( alice_id, 10000 );

      escrow_create_operation op = make_escrow_create_op( alice_id, bob_id, 1000, 24 * 60 * 60 );
      op.validate();

      REQUIRE_OP_VALIDATION_FAILURE_2( op, seller, alice_id, invalid_address );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, seller, TRIBUNAL_NULL_ACCOUNT, invalid_address );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, seller, TRIBUNAL_CUSTODY_ACCOUNT, invalid_address );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, amount, 0, invalid_amount );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, amount, -1, invalid_amount );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, duration, 0, invalid_duration );

      // duration bounds are checked against the current parameters
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_escrow_create_op( alice_id, bob_id, 1000,
                                                   parameters().min_escrow_duration - 1 ) ), invalid_duration );
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_escrow_create_op( alice_id, bob_id, 1000,
                                                   parameters().max_escrow_duration + 1 ) ), invalid_duration );
      db.push_operation( make_escrow_create_op( alice_id, bob_id, 1000, parameters().min_escrow_duration ) );
      db.push_operation( make_escrow_create_op( alice_id, bob_id, 1000, parameters().max_escrow_duration ) );

      // unknown seller
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_escrow_create_op( alice_id, account_id_type(999), 1000,
                                                                        24 * 60 * 60 ) ), invalid_address );

      // more than alice holds
      TRIBUNAL_REQUIRE_THROW( db.push_operation( make_escrow_create_op( alice_id, bob_id, 8001, 24 * 60 * 60 ) ),
                              insufficient_balance );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 8000 );
      BOOST_CHECK_EQUAL( custody_balance().value, 2000 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( buyer_release_pays_seller )
{
   try
   {
      ACTORS( (alice)(bob) );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 0 );

      published_ops.clear();
      release_escrow( escrow_id, alice_id );

      const escrow_object& escrow = db.get_escrow( escrow_id );
      BOOST_CHECK( escrow.resolved );
      BOOST_CHECK_EQUAL( escrow.amount.value, 0 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 1000 );
      BOOST_CHECK_EQUAL( custody_balance().value, 0 );

      BOOST_REQUIRE_EQUAL( count_ops<escrow_resolved_operation>( published_ops ), 1u );
      const auto& resolved = published_ops.back().op.get<escrow_resolved_operation>();
      BOOST_CHECK( resolved.winner == bob_id );
      BOOST_CHECK_EQUAL( resolved.amount.value, 1000 );

      // nothing is paid twice
      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id, alice_id ), already_resolved );
      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id, bob_id ), already_resolved );
      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id, bob_id ), already_resolved );
      db.advance_time( 3 * 24 * 60 * 60 );
      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id, alice_id ), already_resolved );

      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 0 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 1000 );
      BOOST_CHECK_EQUAL( db.get_escrow( escrow_id ).amount.value, 0 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( seller_release_is_noop )
{
   try
   {
      ACTORS( (alice)(bob) );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );

      published_ops.clear();
      release_escrow( escrow_id, bob_id );

      BOOST_CHECK( !db.get_escrow( escrow_id ).resolved );
      BOOST_CHECK_EQUAL( db.get_escrow( escrow_id ).amount.value, 1000 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 0 );
      BOOST_CHECK_EQUAL( count_ops<escrow_resolved_operation>( published_ops ), 0u );

      // the buyer can still release
      release_escrow( escrow_id, alice_id );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 1000 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( seller_refund_pays_buyer )
{
   try
   {
      ACTORS( (alice)(bob) );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 700 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 0 );

      refund_escrow( escrow_id, bob_id );

      BOOST_CHECK( db.get_escrow( escrow_id ).resolved );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 700 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 0 );
      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id, alice_id ), already_resolved );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( timeout_refund )
{
   try
   {
      ACTORS( (alice)(bob) );

      const time_point_sec t0 = db.head_time();
      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 500, 60 * 60 );

      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id, alice_id ), escrow_not_expired );

      // still running at the expiry itself
      db.set_head_time( t0 + 3600 );
      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id, alice_id ), escrow_not_expired );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 0 );

      db.set_head_time( t0 + 3601 );
      refund_escrow( escrow_id, alice_id );

      BOOST_CHECK( db.get_escrow( escrow_id ).resolved );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 500 );
      BOOST_CHECK_EQUAL( custody_balance().value, 0 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( release_and_refund_authorization )
{
   try
   {
      ACTORS( (alice)(bob)(sam) );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );

      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id, sam_id ), not_participant );
      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id, sam_id ), not_participant );
      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id_type(77), alice_id ), escrow_not_found );
      TRIBUNAL_REQUIRE_THROW( refund_escrow( escrow_id_type(77), alice_id ), escrow_not_found );

      // an undisputed escrow can not be voted on
      TRIBUNAL_REQUIRE_THROW( vote( escrow_id, alice_id, true ), not_disputed );

      BOOST_CHECK( !db.get_escrow( escrow_id ).resolved );
      BOOST_CHECK_EQUAL( custody_balance().value, 1000 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( marketplace_fee )
{
   try
   {
      ACTORS( (alice)(bob)(market) );

      chain_parameters params = parameters();
      params.marketplace_fee_basis = 250;
      params.marketplace_fee_account = market_id;
      update_parameters( params );

      escrow_id_type released = create_escrow( alice_id, bob_id, 10000 );
      escrow_id_type refunded = create_escrow( alice_id, bob_id, 4000 );

      published_ops.clear();
      release_escrow( released, alice_id );

      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 9750 );
      BOOST_CHECK_EQUAL( get_balance( market_id ).value, 250 );

      BOOST_REQUIRE_EQUAL( count_ops<marketplace_fee_collected_operation>( published_ops ), 1u );
      for( const auto& oh : published_ops )
      {
         if( oh.op.is_type<marketplace_fee_collected_operation>() )
         {
            BOOST_CHECK( oh.op.get<marketplace_fee_collected_operation>().collector == market_id );
            BOOST_CHECK_EQUAL( oh.op.get<marketplace_fee_collected_operation>().fee.value, 250 );
         }
         if( oh.op.is_type<escrow_resolved_operation>() )
            BOOST_CHECK_EQUAL( oh.op.get<escrow_resolved_operation>().amount.value, 9750 );
      }

      // refunds are not charged
      refund_escrow( refunded, bob_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 4000 );
      BOOST_CHECK_EQUAL( get_balance( market_id ).value, 250 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( escrow_queries )
{
   try
   {
      ACTORS( (alice)(bob)(carol) );

      escrow_id_type e1 = create_escrow( alice_id, bob_id, 100 );
      escrow_id_type e2 = create_escrow( alice_id, carol_id, 200 );
      escrow_id_type e3 = create_escrow( bob_id, carol_id, 300 );

      vector<escrow_id_type> by_alice = db.get_escrows_by_buyer( alice_id );
      BOOST_REQUIRE_EQUAL( by_alice.size(), 2u );
      BOOST_CHECK( by_alice[0] == e1 );
      BOOST_CHECK( by_alice[1] == e2 );

      vector<escrow_id_type> to_carol = db.get_escrows_by_seller( carol_id );
      BOOST_REQUIRE_EQUAL( to_carol.size(), 2u );
      BOOST_CHECK( to_carol[0] == e2 );
      BOOST_CHECK( to_carol[1] == e3 );

      BOOST_CHECK( db.get_escrows_by_seller( alice_id ).empty() );
      BOOST_CHECK( db.find_escrow( escrow_id_type(55) ) == nullptr );
      TRIBUNAL_REQUIRE_THROW( db.get_escrow( escrow_id_type(55) ), escrow_not_found );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

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
#include <tribunal/chain/ledger.hpp>

#include "../common/database_fixture.hpp"

using namespace tribunal::chain;
using namespace tribunal::chain::test;

namespace {

/// Refuses every payout
class refusing_ledger : public database_ledger
{
   public:
      using database_ledger::database_ledger;

      bool transfer( account_id_type to, share_type amount ) override
      {
         ++refused;
         return false;
      }

      uint32_t refused = 0;
};

}

BOOST_FIXTURE_TEST_SUITE( undo_tests, database_fixture )

BOOST_AUTO_TEST_CASE( failed_transaction_leaves_no_trace )
{
   try
   {
      ACTORS( (alice)(bob)(carol) );
      escrow_id_type first = create_escrow( alice_id, bob_id, 1000 );
      fund( alice_id, 500 );

      const uint64_t applied_before = db.get_dynamic_global_properties().applied_transactions;
      published_ops.clear();

      escrow_release_operation release;
      release.escrow = escrow_id_type( first.instance.value + 1 );
      release.caller = carol_id;

      trx.operations.push_back( make_escrow_create_op( alice_id, bob_id, 500, 2 * 24 * 60 * 60 ) );
      trx.operations.push_back( release );
      TRIBUNAL_REQUIRE_THROW( db.push_transaction( trx ), not_participant );
      trx.clear();

      BOOST_CHECK( db.find_escrow( release.escrow ) == nullptr );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 500 );
      BOOST_CHECK_EQUAL( custody_balance().value, 1000 );
      BOOST_CHECK( published_ops.empty() );
      BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().applied_transactions, applied_before );
      BOOST_CHECK( db.get_escrows_by_buyer( alice_id ) == vector<escrow_id_type>{ first } );

      // the id of the undone escrow is handed out again
      escrow_id_type second = create_escrow( alice_id, bob_id, 500, 2 * 24 * 60 * 60, false );
      BOOST_CHECK( second == release.escrow );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 0 );
      BOOST_CHECK_EQUAL( custody_balance().value, 1500 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operations_apply_in_order )
{
   try
   {
      ACTORS( (alice)(bob) );
      fund( alice_id, 800 );

      std::vector<processed_transaction> seen;
      boost::signals2::scoped_connection c = db.applied_transaction.connect(
         [&seen]( const processed_transaction& p ) { seen.push_back( p ); } );

      escrow_release_operation release;
      release.escrow = escrow_id_type( 0 );
      release.caller = alice_id;

      trx.operations.push_back( make_escrow_create_op( alice_id, bob_id, 800, 2 * 24 * 60 * 60 ) );
      trx.operations.push_back( release );
      processed_transaction ptrx = db.push_transaction( trx );
      trx.clear();

      BOOST_REQUIRE_EQUAL( ptrx.operation_results.size(), 2u );
      BOOST_CHECK( ptrx.operation_results[0].get<object_id_type>() == release.escrow );
      BOOST_CHECK( ptrx.operation_results[1].is_type<void_result>() );

      BOOST_REQUIRE_EQUAL( seen.size(), 1u );
      BOOST_CHECK_EQUAL( seen.front().operations.size(), 2u );
      BOOST_CHECK_EQUAL( seen.front().operation_results.size(), 2u );

      BOOST_CHECK( db.get_escrow( release.escrow ).resolved );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 800 );
      BOOST_CHECK_EQUAL( custody_balance().value, 0 );

      // create, escrow_created, release, escrow_resolved
      BOOST_REQUIRE_EQUAL( published_ops.size(), 4u );
      BOOST_CHECK( published_ops[0].op.is_type<escrow_create_operation>() );
      BOOST_CHECK_EQUAL( published_ops[0].op_in_trx, 0u );
      BOOST_CHECK_EQUAL( published_ops[0].virtual_op, 0u );
      BOOST_CHECK( published_ops[1].op.is_type<escrow_created_operation>() );
      BOOST_CHECK_EQUAL( published_ops[1].op_in_trx, 0u );
      BOOST_CHECK_EQUAL( published_ops[1].virtual_op, 1u );
      BOOST_CHECK( published_ops[2].op.is_type<escrow_release_operation>() );
      BOOST_CHECK_EQUAL( published_ops[2].op_in_trx, 1u );
      BOOST_CHECK_EQUAL( published_ops[2].virtual_op, 0u );
      BOOST_CHECK( published_ops[3].op.is_type<escrow_resolved_operation>() );
      BOOST_CHECK_EQUAL( published_ops[3].op_in_trx, 1u );

      const auto& resolved = published_ops[3].op.get<escrow_resolved_operation>();
      BOOST_CHECK( resolved.winner == bob_id );
      BOOST_CHECK_EQUAL( resolved.amount.value, 800 );

      for( const auto& oh : published_ops )
         BOOST_CHECK_EQUAL( oh.trx_in_log, published_ops.front().trx_in_log );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( refused_payout_is_undone )
{
   try
   {
      ACTORS( (alice)(bob) );
      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );

      auto ledger = std::make_shared<refusing_ledger>( db );
      db.set_ledger( ledger );

      published_ops.clear();
      TRIBUNAL_REQUIRE_THROW( release_escrow( escrow_id, alice_id ), transfer_failed );
      BOOST_CHECK_EQUAL( ledger->refused, 1u );

      const escrow_object& escrow = db.get_escrow( escrow_id );
      BOOST_CHECK( !escrow.resolved );
      BOOST_CHECK_EQUAL( escrow.amount.value, 1000 );
      BOOST_CHECK_EQUAL( custody_balance().value, 1000 );
      BOOST_CHECK( published_ops.empty() );

      db.set_ledger( std::make_shared<database_ledger>( db ) );
      release_escrow( escrow_id, alice_id );
      BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 1000 );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( failing_subscriber_does_not_fail_the_transaction )
{
   try
   {
      ACTORS( (alice)(bob) );

      uint32_t calls = 0;
      boost::signals2::scoped_connection c = db.applied_operation.connect(
         [&calls]( const operation_history_object& ) {
            ++calls;
            FC_THROW_EXCEPTION( fc::assert_exception, "subscriber failure" );
         } );

      escrow_id_type escrow_id = create_escrow( alice_id, bob_id, 1000 );
      BOOST_CHECK_EQUAL( calls, 2u );
      BOOST_CHECK( !db.get_escrow( escrow_id ).resolved );
      BOOST_CHECK_EQUAL( custody_balance().value, 1000 );
      BOOST_CHECK_EQUAL( count_ops<escrow_created_operation>( published_ops ), 1u );

      c.disconnect();
      release_escrow( escrow_id, alice_id );
      BOOST_CHECK_EQUAL( calls, 2u );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transaction_validation )
{
   try
   {
      ACTORS( (alice)(bob) );

      TRIBUNAL_REQUIRE_THROW( db.push_transaction( trx ), tx_empty );

      escrow_created_operation created;
      created.escrow = escrow_id_type( 0 );
      created.buyer = alice_id;
      created.seller = bob_id;
      created.amount = 10;
      trx.operations.push_back( created );
      TRIBUNAL_REQUIRE_THROW( db.push_transaction( trx ), tx_virtual_operation );
      trx.clear();

      // operations are validated before any of them is applied
      fund( alice_id, 100 );
      trx.operations.push_back( make_escrow_create_op( alice_id, bob_id, 100, 2 * 24 * 60 * 60 ) );
      trx.operations.push_back( make_escrow_create_op( alice_id, alice_id, 100, 2 * 24 * 60 * 60 ) );
      TRIBUNAL_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );
      trx.clear();

      BOOST_CHECK( db.find_escrow( escrow_id_type( 0 ) ) == nullptr );
      BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 100 );
      BOOST_CHECK( published_ops.empty() );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( ids_keep_their_space_and_type )
{
   try
   {
      const object_id_type untyped( 1, 3, 7 );
      BOOST_CHECK_EQUAL( tribunal::db::to_string( untyped ), "1.3.7" );
      BOOST_CHECK( escrow_id_type{ untyped } == escrow_id_type( 7 ) );
      BOOST_CHECK( untyped == escrow_id_type( 7 ) );
      BOOST_CHECK_THROW( account_id_type{ untyped }, fc::assert_exception );
      BOOST_CHECK_THROW( object_id_type( 1, 3, uint64_t(1) << 48 ), fc::assert_exception );

      BOOST_CHECK( fc::variant( "1.3.7" ).as<escrow_id_type>( 1 ) == escrow_id_type( 7 ) );
      BOOST_CHECK_THROW( fc::variant( "1.2.7" ).as<escrow_id_type>( 1 ), fc::exception );
      BOOST_CHECK_THROW( fc::variant( "1.3" ).as<object_id_type>( 1 ), fc::exception );

      // a created object is found again by its typed id
      ACTOR( alice );
      BOOST_REQUIRE( db.find( alice_id ) != nullptr );
      BOOST_CHECK_EQUAL( db.find( alice_id )->name, alice.name );
      BOOST_CHECK( db.find( account_id_type( alice_id.instance.value + 1 ) ) == nullptr );

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

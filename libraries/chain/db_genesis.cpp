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

#include <tribunal/chain/account_object.hpp>
#include <tribunal/chain/global_property_object.hpp>

namespace tribunal { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   FC_ASSERT( find( TRIBUNAL_NULL_ACCOUNT ) == nullptr, "Genesis has already been applied." );
   genesis_state.validate();

   _undo_db.disable();

   // Reserved accounts
   FC_ASSERT( create<account_object>( []( account_object& a ) {
      a.name = "null";
   }).get_id() == TRIBUNAL_NULL_ACCOUNT );
   FC_ASSERT( create<account_object>( []( account_object& a ) {
      a.name = "custody";
   }).get_id() == TRIBUNAL_CUSTODY_ACCOUNT );

   // Initial accounts
   for( const auto& account : genesis_state.initial_accounts )
   {
      create<account_object>( [&account]( account_object& a ) {
         a.name = account.name;
         a.reputation_score = account.reputation_score;
         a.participation_index = account.participation_index;
      });
   }

   for( const auto& balance : genesis_state.initial_balances )
      adjust_balance( get_account_by_name( balance.owner_name ).get_id(), balance.amount );

   account_id_type admin = TRIBUNAL_NULL_ACCOUNT;
   if( !genesis_state.initial_admin.empty() )
      admin = get_account_by_name( genesis_state.initial_admin ).get_id();

   // Global properties
   create<global_property_object>( [&genesis_state, admin]( global_property_object& p ) {
      p.parameters = genesis_state.initial_parameters;
      p.admin_account = admin;
   });
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
      p.arbitrator_seed = genesis_state.initial_arbitrator_seed;
   });

   _undo_db.enable();

   ilog( "Genesis applied with ${n} accounts, admin ${a}",
         ("n",genesis_state.initial_accounts.size())("a",genesis_state.initial_admin) );
} FC_CAPTURE_AND_RETHROW() }

} }

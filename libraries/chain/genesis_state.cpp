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
#include <tribunal/chain/genesis_state.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <set>

namespace tribunal { namespace chain {

void genesis_state_type::validate()const
{ try {
   initial_parameters.validate();

   std::set<string> names;
   for( const auto& account : initial_accounts )
   {
      FC_ASSERT( account.name.size() >= TRIBUNAL_MIN_ACCOUNT_NAME_LENGTH
                 && account.name.size() <= TRIBUNAL_MAX_ACCOUNT_NAME_LENGTH,
                 "Invalid account name length: ${n}", ("n",account.name) );
      FC_ASSERT( account.name != "null" && account.name != "custody",
                 "Account name ${n} is reserved", ("n",account.name) );
      FC_ASSERT( account.reputation_score <= TRIBUNAL_MAX_REPUTATION,
                 "Reputation of ${n} is out of range", ("n",account.name) );
      FC_ASSERT( names.insert( account.name ).second, "Duplicate account name ${n}", ("n",account.name) );
   }

   FC_ASSERT( initial_admin.empty() || names.count( initial_admin ) > 0,
              "Admin ${a} is not an initial account", ("a",initial_admin) );

   for( const auto& balance : initial_balances )
   {
      FC_ASSERT( names.count( balance.owner_name ) > 0,
                 "Balance owner ${n} is not an initial account", ("n",balance.owner_name) );
      FC_ASSERT( balance.amount >= 0 && balance.amount <= TRIBUNAL_MAX_SHARE_SUPPLY,
                 "Invalid initial balance of ${n}", ("n",balance.owner_name) );
   }
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type genesis_state_type::from_json_file( const fc::path& path )
{ try {
   FC_ASSERT( fc::exists( path ), "Genesis file ${p} not found", ("p",path) );
   ilog( "Reading genesis state from ${p}", ("p",path) );
   auto genesis = fc::json::from_file( path ).as<genesis_state_type>( 20 );
   genesis.validate();
   return genesis;
} FC_CAPTURE_AND_RETHROW( (path) ) }

} } // tribunal::chain

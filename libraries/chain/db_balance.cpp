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
#include <tribunal/chain/account_object.hpp>

namespace tribunal { namespace chain {

share_type database::get_balance( account_id_type owner )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_account>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      return 0;
   return itr->balance;
}

void database::adjust_balance( account_id_type account, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& index = get_index_type<account_balance_index>().indices().get<by_account>();
   auto itr = index.find( account );
   if( itr == index.end() )
   {
      FC_ASSERT( delta > 0, "Insufficient Balance: ${a}'s balance of 0 is less than required ${r}",
                 ("a",account)("r",-delta) );
      create<account_balance_object>( [account,&delta]( account_balance_object& b ) {
         b.owner = account;
         b.balance = delta;
      });
   } else {
      if( delta < 0 )
         FC_ASSERT( itr->balance >= -delta, "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                    ("a",account)("b",itr->balance)("r",-delta) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.adjust_balance( delta );
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::deposit_to_custody( account_id_type from, share_type amount )
{
   if( amount == 0 )
      return;
   bool accepted = _ledger->deposit( from, amount );
   if( !accepted )
      wlog( "Ledger refused a deposit of ${x} from ${a}", ("x",amount)("a",from) );
   TRIBUNAL_ASSERT( accepted, insufficient_balance,
                    "Account ${a} can not deposit ${x}", ("a",from)("x",amount) );
}

void database::pay_from_custody( account_id_type to, share_type amount )
{
   if( amount == 0 )
      return;
   bool accepted = _ledger->transfer( to, amount );
   if( !accepted )
      wlog( "Ledger refused a payout of ${x} to ${a}", ("x",amount)("a",to) );
   TRIBUNAL_ASSERT( accepted, transfer_failed,
                    "Payout of ${x} to ${a} failed", ("a",to)("x",amount) );
}

share_type database_ledger::get_balance( account_id_type owner )const
{
   return _db.get_balance( owner );
}

bool database_ledger::deposit( account_id_type from, share_type amount )
{
   if( amount <= 0 || _db.get_balance( from ) < amount )
      return false;
   _db.adjust_balance( from, -amount );
   _db.adjust_balance( TRIBUNAL_CUSTODY_ACCOUNT, amount );
   return true;
}

bool database_ledger::transfer( account_id_type to, share_type amount )
{
   if( amount <= 0 || _db.get_balance( TRIBUNAL_CUSTODY_ACCOUNT ) < amount )
      return false;
   _db.adjust_balance( TRIBUNAL_CUSTODY_ACCOUNT, -amount );
   _db.adjust_balance( to, amount );
   return true;
}

} }

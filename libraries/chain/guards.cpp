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
#include <tribunal/chain/global_property_object.hpp>
#include <tribunal/chain/guards.hpp>

namespace tribunal { namespace chain {

scoped_reentrancy_lock::scoped_reentrancy_lock( bool& locked )
   : _locked( locked )
{
   TRIBUNAL_ASSERT( !_locked, reentrant_call, "A transaction is already being applied" );
   _locked = true;
}

scoped_reentrancy_lock::~scoped_reentrancy_lock()
{
   _locked = false;
}

void check_not_paused( const database& db )
{
   TRIBUNAL_ASSERT( !db.get_global_properties().paused, system_paused, "The system is paused" );
}

void check_admin( const database& db, account_id_type account )
{
   const auto& admin = db.get_global_properties().admin_account;
   TRIBUNAL_ASSERT( account == admin && admin != TRIBUNAL_NULL_ACCOUNT, not_admin,
                    "Account ${a} is not the admin", ("a",account) );
}

} } // tribunal::chain

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

#include <functional>

namespace tribunal { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
   _ledger = std::make_shared<database_ledger>( *this );
   _metadata_source = std::make_shared<account_metadata_source>( *this );
}

database::~database() = default;

void database::set_ledger( std::shared_ptr<ledger_interface> new_ledger )
{
   FC_ASSERT( new_ledger, "A ledger is required" );
   _ledger = std::move( new_ledger );
}

ledger_interface& database::ledger()const
{
   return *_ledger;
}

void database::set_metadata_source( std::shared_ptr<arbitrator_metadata_source> source )
{
   FC_ASSERT( source, "A metadata source is required" );
   _metadata_source = std::move( source );
}

const arbitrator_metadata_source& database::metadata_source()const
{
   return *_metadata_source;
}

} }

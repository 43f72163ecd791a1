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

namespace tribunal { namespace chain {

#define TRIBUNAL_TRY_NOTIFY( signal, ... )                                     \
   try                                                                         \
   {                                                                           \
      signal( __VA_ARGS__ );                                                   \
   }                                                                           \
   catch( const fc::exception& e )                                             \
   {                                                                           \
      wlog( "Caught exception in subscriber: ${e}", ("e", e.to_detail_string() ) ); \
   }

void database::notify_applied_transaction( const processed_transaction& trx )
{
   // subscribers may push further transactions, which reset _applied_ops
   const auto applied = _applied_ops;
   for( const auto& oh : applied )
   {
      if( oh )
         TRIBUNAL_TRY_NOTIFY( applied_operation, *oh )
   }
   TRIBUNAL_TRY_NOTIFY( applied_transaction, trx )
}

} }

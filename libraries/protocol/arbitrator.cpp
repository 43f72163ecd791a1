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
#include <tribunal/protocol/arbitrator.hpp>

namespace tribunal { namespace protocol {

   void arbitrator_register_operation::validate()const
   {
      TRIBUNAL_ASSERT( account != TRIBUNAL_NULL_ACCOUNT && account != TRIBUNAL_CUSTODY_ACCOUNT, invalid_address,
                       "Account ${a} can not be an arbitrator", ("a",account) );
      TRIBUNAL_ASSERT( stake >= 0, invalid_amount, "Arbitrator stake can not be negative" );
   }

   void arbitrator_refresh_operation::validate()const
   {
      TRIBUNAL_ASSERT( account != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing account" );
   }

   void arbitrator_deactivate_operation::validate()const
   {
      TRIBUNAL_ASSERT( admin != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing admin" );
      TRIBUNAL_ASSERT( arbitrator != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing arbitrator" );
   }

} } // tribunal::protocol

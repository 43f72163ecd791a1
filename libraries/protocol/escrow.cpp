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
#include <tribunal/protocol/escrow.hpp>

namespace tribunal { namespace protocol {

   void escrow_create_operation::validate()const
   {
      TRIBUNAL_ASSERT( buyer != TRIBUNAL_NULL_ACCOUNT && buyer != TRIBUNAL_CUSTODY_ACCOUNT, invalid_address,
                       "Buyer ${b} can not hold an escrow", ("b",buyer) );
      TRIBUNAL_ASSERT( seller != TRIBUNAL_NULL_ACCOUNT && seller != TRIBUNAL_CUSTODY_ACCOUNT, invalid_address,
                       "Seller ${s} can not hold an escrow", ("s",seller) );
      TRIBUNAL_ASSERT( seller != buyer, invalid_address, "Buyer and seller must differ" );
      TRIBUNAL_ASSERT( amount > 0, invalid_amount, "Escrow amount must be positive" );
      TRIBUNAL_ASSERT( amount <= TRIBUNAL_MAX_SHARE_SUPPLY, invalid_amount, "Escrow amount is too large" );
      TRIBUNAL_ASSERT( duration > 0, invalid_duration, "Escrow duration must be positive" );
   }

   void escrow_release_operation::validate()const
   {
      TRIBUNAL_ASSERT( caller != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing caller" );
   }

   void escrow_refund_operation::validate()const
   {
      TRIBUNAL_ASSERT( caller != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing caller" );
   }

   void escrow_vote_operation::validate()const
   {
      TRIBUNAL_ASSERT( voter != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing voter" );
   }

} } // tribunal::protocol

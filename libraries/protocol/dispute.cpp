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
#include <tribunal/protocol/dispute.hpp>

#include <fc/io/raw.hpp>

namespace tribunal { namespace protocol {

   digest_type compute_dispute_commitment( escrow_id_type escrow, const digest_type& nonce,
                                           account_id_type committer )
   {
      digest_type::encoder enc;
      fc::raw::pack( enc, escrow );
      fc::raw::pack( enc, nonce );
      fc::raw::pack( enc, committer );
      return enc.result();
   }

   void dispute_commit_operation::validate()const
   {
      TRIBUNAL_ASSERT( caller != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing caller" );
      TRIBUNAL_ASSERT( commitment != digest_type(), invalid_commitment, "Commitment must not be empty" );
      TRIBUNAL_ASSERT( stake >= 0, invalid_amount, "Dispute stake can not be negative" );
   }

   void dispute_reveal_operation::validate()const
   {
      TRIBUNAL_ASSERT( caller != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing caller" );
   }

   void dispute_rule_operation::validate()const
   {
      TRIBUNAL_ASSERT( arbitrator != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing arbitrator" );
      TRIBUNAL_ASSERT( resolution_note.size() <= TRIBUNAL_MAX_RESOLUTION_NOTE_LENGTH, invalid_note,
                       "Resolution note is longer than ${max} bytes", ("max",TRIBUNAL_MAX_RESOLUTION_NOTE_LENGTH) );
   }

   void dispute_rate_operation::validate()const
   {
      TRIBUNAL_ASSERT( rater != TRIBUNAL_NULL_ACCOUNT, invalid_address, "Missing rater" );
      TRIBUNAL_ASSERT( rating >= TRIBUNAL_MIN_RATING && rating <= TRIBUNAL_MAX_RATING, invalid_rating,
                       "Rating must be ${min}-${max}, got ${r}",
                       ("min",TRIBUNAL_MIN_RATING)("max",TRIBUNAL_MAX_RATING)("r",rating) );
   }

} } // tribunal::protocol

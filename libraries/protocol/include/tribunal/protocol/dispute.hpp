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
#pragma once

#include <tribunal/protocol/base.hpp>

namespace tribunal { namespace protocol {

   /**
    * @brief Computes the commitment a party publishes before disputing an escrow
    *
    * The commitment binds the escrow, a secret nonce and the committing account, so it can
    * neither be replayed on another escrow nor revealed by anybody else.
    */
   digest_type compute_dispute_commitment( escrow_id_type escrow, const digest_type& nonce,
                                           account_id_type committer );

   /**
    * @brief First half of raising a dispute: publishes a commitment and deposits the dispute stake
    * @ingroup operations
    *
    * The stake must cover the fraction of the escrow amount set by
    * chain_parameters::dispute_stake_basis. It is returned to the committer once the escrow resolves.
    */
   struct dispute_commit_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type caller;
      digest_type     commitment;
      share_type      stake;

      account_id_type actor()const { return caller; }
      void            validate()const override;
   };

   /**
    * @brief Second half of raising a dispute: reveals the nonce behind the commitment
    * @ingroup operations
    *
    * On success the escrow becomes disputed and an arbitrator is assigned.
    */
   struct dispute_reveal_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type caller;
      digest_type     nonce;

      account_id_type actor()const { return caller; }
      void            validate()const override;
   };

   /**
    * @brief The assigned arbitrator decides a disputed escrow alone
    * @ingroup operations
    */
   struct dispute_rule_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type arbitrator;
      bool            release_to_seller = false;
      string          resolution_note;

      account_id_type actor()const { return arbitrator; }
      void            validate()const override;
   };

   /**
    * @brief Buyer or seller rates the arbitrator of a resolved dispute
    * @ingroup operations
    */
   struct dispute_rate_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type rater;
      uint8_t         rating = 0; ///< TRIBUNAL_MIN_RATING to TRIBUNAL_MAX_RATING

      account_id_type actor()const { return rater; }
      void            validate()const override;
   };

   /// Virtual op emitted when a dispute commitment is stored
   struct dispute_committed_operation : public base_virtual_operation
   {
      dispute_committed_operation() = default;
      dispute_committed_operation( escrow_id_type e, account_id_type c, share_type s, time_point_sec d )
      : escrow(e), committer(c), stake(s), reveal_deadline(d) {}

      escrow_id_type  escrow;
      account_id_type committer;
      share_type      stake;
      time_point_sec  reveal_deadline;

      account_id_type actor()const { return committer; }
   };

   /// Virtual op emitted when a reveal turns an escrow into a dispute
   struct dispute_raised_operation : public base_virtual_operation
   {
      dispute_raised_operation() = default;
      dispute_raised_operation( escrow_id_type e, account_id_type d, account_id_type a )
      : escrow(e), disputer(d), arbitrator(a) {}

      escrow_id_type  escrow;
      account_id_type disputer;
      account_id_type arbitrator;

      account_id_type actor()const { return disputer; }
   };

   /// Virtual op emitted when the dispute record is created for an assigned arbitrator
   struct dispute_created_operation : public base_virtual_operation
   {
      dispute_created_operation() = default;
      dispute_created_operation( dispute_id_type d, escrow_id_type e, account_id_type a )
      : dispute(d), escrow(e), arbitrator(a) {}

      dispute_id_type dispute;
      escrow_id_type  escrow;
      account_id_type arbitrator;

      account_id_type actor()const { return arbitrator; }
   };

   /// Virtual op emitted when a dispute ends, either by votes or by ruling
   struct dispute_resolved_operation : public base_virtual_operation
   {
      dispute_resolved_operation() = default;
      dispute_resolved_operation( escrow_id_type e, account_id_type a, bool r, bool by_ruling )
      : escrow(e), arbitrator(a), release_to_seller(r), ruled(by_ruling) {}

      escrow_id_type  escrow;
      account_id_type arbitrator;
      bool            release_to_seller = false;
      bool            ruled = false;

      account_id_type actor()const { return arbitrator; }
   };

   /// Virtual op emitted for every accepted rating
   struct rating_submitted_operation : public base_virtual_operation
   {
      rating_submitted_operation() = default;
      rating_submitted_operation( escrow_id_type e, account_id_type r, uint8_t v )
      : escrow(e), rater(r), rating(v) {}

      escrow_id_type  escrow;
      account_id_type rater;
      uint8_t         rating = 0;

      account_id_type actor()const { return rater; }
   };

   /// Virtual op emitted when a dispute stake goes back to its committer
   struct dispute_stake_returned_operation : public base_virtual_operation
   {
      dispute_stake_returned_operation() = default;
      dispute_stake_returned_operation( escrow_id_type e, account_id_type c, share_type s )
      : escrow(e), committer(c), stake(s) {}

      escrow_id_type  escrow;
      account_id_type committer;
      share_type      stake;

      account_id_type actor()const { return committer; }
   };

} } // tribunal::protocol

FC_REFLECT( tribunal::protocol::dispute_commit_operation, (escrow)(caller)(commitment)(stake) )
FC_REFLECT( tribunal::protocol::dispute_reveal_operation, (escrow)(caller)(nonce) )
FC_REFLECT( tribunal::protocol::dispute_rule_operation, (escrow)(arbitrator)(release_to_seller)(resolution_note) )
FC_REFLECT( tribunal::protocol::dispute_rate_operation, (escrow)(rater)(rating) )
FC_REFLECT( tribunal::protocol::dispute_committed_operation, (escrow)(committer)(stake)(reveal_deadline) )
FC_REFLECT( tribunal::protocol::dispute_raised_operation, (escrow)(disputer)(arbitrator) )
FC_REFLECT( tribunal::protocol::dispute_created_operation, (dispute)(escrow)(arbitrator) )
FC_REFLECT( tribunal::protocol::dispute_resolved_operation, (escrow)(arbitrator)(release_to_seller)(ruled) )
FC_REFLECT( tribunal::protocol::rating_submitted_operation, (escrow)(rater)(rating) )
FC_REFLECT( tribunal::protocol::dispute_stake_returned_operation, (escrow)(committer)(stake) )

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
    * @brief Locks @ref amount of the buyer's funds in custody on behalf of @ref seller
    * @ingroup operations
    *
    * The escrow expires @ref duration seconds after it is created. Until then only the buyer can
    * release the funds to the seller or the seller can refund them to the buyer. After expiry the
    * buyer can take the funds back unless the escrow is disputed.
    *
    * The id of the new escrow_object is returned as the operation result.
    */
   struct escrow_create_operation : public base_operation
   {
      account_id_type buyer;
      account_id_type seller;
      share_type      amount;
      uint32_t        duration = 0; ///< seconds until expiry

      account_id_type actor()const { return buyer; }
      void            validate()const override;
   };

   /**
    * @brief Pays the escrowed amount to the seller
    * @ingroup operations
    *
    * Only a call by the buyer moves funds. A call by the seller on an undisputed escrow is accepted
    * and changes nothing.
    */
   struct escrow_release_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type caller;

      account_id_type actor()const { return caller; }
      void            validate()const override;
   };

   /**
    * @brief Returns the escrowed amount to the buyer
    * @ingroup operations
    *
    * Accepted from the seller at any time before a dispute, and from the buyer once the escrow has
    * expired without a dispute.
    */
   struct escrow_refund_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type caller;

      account_id_type actor()const { return caller; }
      void            validate()const override;
   };

   /**
    * @brief Votes on the outcome of a disputed escrow
    * @ingroup operations
    *
    * The buyer, the seller and the assigned arbitrator may each vote once. The first side to
    * collect two votes wins and the escrow is paid out immediately.
    */
   struct escrow_vote_operation : public base_operation
   {
      escrow_id_type  escrow;
      account_id_type voter;
      bool            release = false; ///< true pays the seller, false refunds the buyer

      account_id_type actor()const { return voter; }
      void            validate()const override;
   };

   /// Virtual op emitted when an escrow is opened
   struct escrow_created_operation : public base_virtual_operation
   {
      escrow_created_operation() = default;
      escrow_created_operation( escrow_id_type e, account_id_type b, account_id_type s,
                                share_type a, time_point_sec x )
      : escrow(e), buyer(b), seller(s), amount(a), expiry(x) {}

      escrow_id_type  escrow;
      account_id_type buyer;
      account_id_type seller;
      share_type      amount;
      time_point_sec  expiry;

      account_id_type actor()const { return buyer; }
   };

   /// Virtual op emitted when the escrowed funds are paid out, @ref amount is what @ref winner received
   struct escrow_resolved_operation : public base_virtual_operation
   {
      escrow_resolved_operation() = default;
      escrow_resolved_operation( escrow_id_type e, account_id_type w, share_type a )
      : escrow(e), winner(w), amount(a) {}

      escrow_id_type  escrow;
      account_id_type winner;
      share_type      amount;

      account_id_type actor()const { return winner; }
   };

   /// Virtual op emitted for every accepted vote
   struct vote_cast_operation : public base_virtual_operation
   {
      vote_cast_operation() = default;
      vote_cast_operation( escrow_id_type e, account_id_type v, bool r )
      : escrow(e), voter(v), release(r) {}

      escrow_id_type  escrow;
      account_id_type voter;
      bool            release = false;

      account_id_type actor()const { return voter; }
   };

   /// Virtual op emitted when part of a seller payout goes to the marketplace
   struct marketplace_fee_collected_operation : public base_virtual_operation
   {
      marketplace_fee_collected_operation() = default;
      marketplace_fee_collected_operation( escrow_id_type e, account_id_type c, share_type f )
      : escrow(e), collector(c), fee(f) {}

      escrow_id_type  escrow;
      account_id_type collector;
      share_type      fee;

      account_id_type actor()const { return collector; }
   };

} } // tribunal::protocol

FC_REFLECT( tribunal::protocol::escrow_create_operation, (buyer)(seller)(amount)(duration) )
FC_REFLECT( tribunal::protocol::escrow_release_operation, (escrow)(caller) )
FC_REFLECT( tribunal::protocol::escrow_refund_operation, (escrow)(caller) )
FC_REFLECT( tribunal::protocol::escrow_vote_operation, (escrow)(voter)(release) )
FC_REFLECT( tribunal::protocol::escrow_created_operation, (escrow)(buyer)(seller)(amount)(expiry) )
FC_REFLECT( tribunal::protocol::escrow_resolved_operation, (escrow)(winner)(amount) )
FC_REFLECT( tribunal::protocol::vote_cast_operation, (escrow)(voter)(release) )
FC_REFLECT( tribunal::protocol::marketplace_fee_collected_operation, (escrow)(collector)(fee) )

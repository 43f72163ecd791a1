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
#include <tribunal/chain/types.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace tribunal { namespace chain {

   /**
    * @brief Funds held in custody between a buyer and a seller
    * @ingroup object
    * @ingroup protocol
    *
    * An escrow ends in exactly one payout. Until then it can be released by the buyer, refunded by
    * the seller or, after expiry, by the buyer. Once disputed it only ends by two matching votes or
    * by a ruling of the assigned arbitrator.
    */
   class escrow_object : public tribunal::db::abstract_object<escrow_object, protocol_ids, escrow_object_type>
   {
      public:
         account_id_type                  buyer;
         account_id_type                  seller;
         optional<account_id_type>        arbitrator;       ///< set when the dispute is revealed
         share_type                       amount;           ///< in custody, zero once resolved
         share_type                       dispute_stake_required;
         time_point_sec                   created_at;
         time_point_sec                   expiry;
         time_point_sec                   arbitrator_eligible_at; ///< earliest time a dispute may be committed
         uint8_t                          release_votes = 0;
         uint8_t                          refund_votes = 0;
         flat_map<account_id_type, bool>  votes;            ///< voter -> true for release
         bool                             disputed = false;
         bool                             resolved = false;

         bool is_party( account_id_type account )const { return account == buyer || account == seller; }
         bool is_expired( time_point_sec now )const { return now > expiry; }
         bool has_voted( account_id_type account )const { return votes.find( account ) != votes.end(); }
   };

   /**
    * @brief The hidden first half of a dispute
    * @ingroup object
    * @ingroup implementation
    *
    * At most one per escrow. The commitment stays in place after it is revealed or abandoned, so an
    * escrow can be disputed only once.
    */
   class dispute_commitment_object : public tribunal::db::abstract_object<dispute_commitment_object,
                                                                            implementation_ids,
                                                                            impl_dispute_commitment_object_type>
   {
      public:
         escrow_id_type   escrow;
         account_id_type  committer;
         digest_type      commitment;
         share_type       stake;            ///< in custody until the escrow resolves
         time_point_sec   committed_at;
         time_point_sec   reveal_deadline;
         bool             revealed = false;
         bool             stake_returned = false;
   };

   struct by_buyer;
   struct by_seller;

   /**
    * @ingroup object_index
    */
   using escrow_multi_index_type = multi_index_container<
      escrow_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_buyer>,
            composite_key< escrow_object,
               member< escrow_object, account_id_type, &escrow_object::buyer >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_seller>,
            composite_key< escrow_object,
               member< escrow_object, account_id_type, &escrow_object::seller >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using escrow_index = generic_index<escrow_object, escrow_multi_index_type>;

   struct by_escrow;

   /**
    * @ingroup object_index
    */
   using dispute_commitment_multi_index_type = multi_index_container<
      dispute_commitment_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_escrow>,
            member< dispute_commitment_object, escrow_id_type, &dispute_commitment_object::escrow >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using dispute_commitment_index = generic_index<dispute_commitment_object, dispute_commitment_multi_index_type>;

} } // tribunal::chain

MAP_OBJECT_ID_TO_TYPE( tribunal::chain::escrow_object )
MAP_OBJECT_ID_TO_TYPE( tribunal::chain::dispute_commitment_object )

FC_REFLECT_DERIVED( tribunal::chain::escrow_object, (tribunal::db::object),
                    (buyer)(seller)(arbitrator)(amount)(dispute_stake_required)
                    (created_at)(expiry)(arbitrator_eligible_at)
                    (release_votes)(refund_votes)(votes)(disputed)(resolved) )
FC_REFLECT_DERIVED( tribunal::chain::dispute_commitment_object, (tribunal::db::object),
                    (escrow)(committer)(commitment)(stake)(committed_at)(reveal_deadline)
                    (revealed)(stake_returned) )

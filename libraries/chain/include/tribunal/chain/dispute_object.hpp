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

   enum dispute_status
   {
      dispute_assigned = 0,
      dispute_voting   = 1,
      dispute_ruled    = 2,
      dispute_resolved = 3
   };

   /**
    * @brief The arbitration record of a disputed escrow
    * @ingroup object
    * @ingroup protocol
    *
    * Created when the dispute is revealed and an arbitrator assigned. Moves from assigned to
    * voting on the first vote, or to ruled when the arbitrator decides alone, and ends resolved.
    * Ratings are collected afterwards.
    */
   class dispute_object : public tribunal::db::abstract_object<dispute_object, protocol_ids, dispute_object_type>
   {
      public:
         escrow_id_type      escrow;
         account_id_type     arbitrator;
         account_id_type     disputer;
         time_point_sec      created_at;
         dispute_status      status = dispute_assigned;
         time_point_sec      resolved_at;
         bool                release_to_seller = false;
         string              resolution_note;
         optional<uint8_t>   buyer_rating;
         optional<uint8_t>   seller_rating;
         optional<uint8_t>   arbitrator_rating;  ///< average of both ratings once both are in

         bool is_resolved()const { return status == dispute_resolved; }
   };

   struct by_escrow;
   struct by_arbitrator;

   /**
    * @ingroup object_index
    */
   using dispute_multi_index_type = multi_index_container<
      dispute_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_escrow>, member< dispute_object, escrow_id_type, &dispute_object::escrow > >,
         ordered_unique< tag<by_arbitrator>,
            composite_key< dispute_object,
               member< dispute_object, account_id_type, &dispute_object::arbitrator >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using dispute_index = generic_index<dispute_object, dispute_multi_index_type>;

} } // tribunal::chain

MAP_OBJECT_ID_TO_TYPE( tribunal::chain::dispute_object )

FC_REFLECT_ENUM( tribunal::chain::dispute_status,
                 (dispute_assigned)(dispute_voting)(dispute_ruled)(dispute_resolved) )

FC_REFLECT_DERIVED( tribunal::chain::dispute_object, (tribunal::db::object),
                    (escrow)(arbitrator)(disputer)(created_at)(status)(resolved_at)
                    (release_to_seller)(resolution_note)
                    (buyer_rating)(seller_rating)(arbitrator_rating) )

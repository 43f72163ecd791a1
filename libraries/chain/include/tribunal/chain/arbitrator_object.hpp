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
    * @brief A registered arbitrator and its case history
    * @ingroup object
    * @ingroup protocol
    *
    * One record per account. Deactivation keeps the record and its counters so that a later
    * registration reactivates it.
    */
   class arbitrator_object : public tribunal::db::abstract_object<arbitrator_object, protocol_ids, arbitrator_object_type>
   {
      public:
         account_id_type  arbitrator_account;
         uint32_t         reputation = 0;           ///< 0 to TRIBUNAL_MAX_REPUTATION, moved by ratings
         uint32_t         participation_index = 0;
         uint32_t         total_cases = 0;
         uint32_t         successful_cases = 0;
         uint16_t         active_cases = 0;         ///< assigned and not yet resolved
         share_type       stake;
         bool             is_active = true;
         time_point_sec   registered_at;
         time_point_sec   last_active;

         /// successful cases in basis points, 0 without any case
         uint16_t success_rate()const
         {
            if( total_cases == 0 )
               return 0;
            return static_cast<uint16_t>( uint64_t(successful_cases) * TRIBUNAL_100_PERCENT / total_cases );
         }

         uint64_t selection_score()const
         {
            return uint64_t(reputation) * success_rate() * participation_index;
         }
   };

   struct by_account;
   struct by_active;

   /**
    * @ingroup object_index
    */
   using arbitrator_multi_index_type = multi_index_container<
      arbitrator_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account>,
            member< arbitrator_object, account_id_type, &arbitrator_object::arbitrator_account >
         >,
         ordered_unique< tag<by_active>,
            composite_key< arbitrator_object,
               member< arbitrator_object, bool, &arbitrator_object::is_active >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using arbitrator_index = generic_index<arbitrator_object, arbitrator_multi_index_type>;

} } // tribunal::chain

MAP_OBJECT_ID_TO_TYPE( tribunal::chain::arbitrator_object )

FC_REFLECT_DERIVED( tribunal::chain::arbitrator_object, (tribunal::db::object),
                    (arbitrator_account)(reputation)(participation_index)
                    (total_cases)(successful_cases)(active_cases)(stake)
                    (is_active)(registered_at)(last_active) )

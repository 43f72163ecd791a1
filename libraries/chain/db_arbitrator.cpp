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
#include <tribunal/chain/exceptions.hpp>
#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/arbitrator_selection.hpp>

namespace tribunal { namespace chain {

uint32_t account_metadata_source::get_reputation( account_id_type account )const
{
   const account_object* a = _db.find( account );
   return a ? a->reputation_score : 0;
}

uint32_t account_metadata_source::get_participation_index( account_id_type account )const
{
   const account_object* a = _db.find( account );
   return a ? a->participation_index : 0;
}

void database::record_case_opened( const arbitrator_object& arbitrator )
{
   const time_point_sec now = head_time();
   modify( arbitrator, [now]( arbitrator_object& a ) {
      ++a.total_cases;
      ++a.active_cases;
      a.last_active = now;
   });
}

void database::record_case_resolved( const arbitrator_object& arbitrator, bool success )
{
   const time_point_sec now = head_time();
   modify( arbitrator, [now,success]( arbitrator_object& a ) {
      if( a.active_cases > 0 )
         --a.active_cases;
      if( success )
         ++a.successful_cases;
      a.last_active = now;
   });
}

uint32_t database::apply_rating( const arbitrator_object& arbitrator, uint8_t rating )
{
   TRIBUNAL_ASSERT( rating >= TRIBUNAL_MIN_RATING && rating <= TRIBUNAL_MAX_RATING, invalid_rating,
                    "Rating must be ${min}-${max}, got ${r}",
                    ("min",TRIBUNAL_MIN_RATING)("max",TRIBUNAL_MAX_RATING)("r",rating) );

   const uint32_t old_reputation = arbitrator.reputation;
   const uint32_t new_reputation = rated_reputation( old_reputation, rating,
                                                     get_global_properties().parameters.rating_weight );
   modify( arbitrator, [new_reputation]( arbitrator_object& a ) {
      a.reputation = new_reputation;
   });

   dlog( "Reputation of ${a} moved from ${o} to ${n}",
         ("a",arbitrator.arbitrator_account)("o",old_reputation)("n",new_reputation) );
   push_applied_operation( reputation_updated_operation( arbitrator.arbitrator_account,
                                                         old_reputation, new_reputation ) );
   return new_reputation;
}

} }

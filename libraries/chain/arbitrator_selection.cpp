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
#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/arbitrator_selection.hpp>
#include <tribunal/chain/database.hpp>

#include <fc/io/raw.hpp>

#include <boost/tuple/tuple.hpp>

#include <algorithm>

namespace tribunal { namespace chain {

digest_type make_selection_seed( time_point_sec escrow_created_at, const digest_type& rotating_seed,
                                 const digest_type& nonce, escrow_id_type escrow )
{
   digest_type::encoder enc;
   fc::raw::pack( enc, escrow_created_at );
   fc::raw::pack( enc, rotating_seed );
   fc::raw::pack( enc, nonce );
   fc::raw::pack( enc, escrow );
   return enc.result();
}

digest_type next_rotating_seed( const digest_type& current, const digest_type& used )
{
   return digest_type::hash( std::make_pair( current, used ) );
}

uint64_t seed_modulo( const digest_type& seed, uint64_t bound )
{
   FC_ASSERT( bound > 0 );
   return seed._hash[0] % bound;
}

optional<account_id_type> select_candidate( const database& db, const digest_type& seed,
                                            const flat_set<account_id_type>& excluded, bool exclude_overloaded )
{
   const chain_parameters& params = db.get_global_properties().parameters;
   const auto& by_active_idx = db.get_index_type<arbitrator_index>().indices().get<by_active>();

   vector<const arbitrator_object*> eligible;
   for( auto itr = by_active_idx.lower_bound( boost::make_tuple( true ) ); itr != by_active_idx.end() && itr->is_active; ++itr )
   {
      if( excluded.find( itr->arbitrator_account ) != excluded.end() )
         continue;
      if( exclude_overloaded && itr->active_cases >= params.max_active_disputes )
         continue;
      eligible.push_back( &*itr );
   }

   if( eligible.empty() )
      return optional<account_id_type>();

   if( params.selection_strategy == seeded_hash )
      return eligible[ seed_modulo( seed, eligible.size() ) ]->arbitrator_account;

   uint64_t best_score = 0;
   vector<const arbitrator_object*> best;
   for( const arbitrator_object* arb : eligible )
   {
      const uint64_t score = arb->selection_score();
      if( best.empty() || score > best_score )
      {
         best_score = score;
         best.clear();
         best.push_back( arb );
      }
      else if( score == best_score )
         best.push_back( arb );
   }

   return best[ seed_modulo( seed, best.size() ) ]->arbitrator_account;
}

uint32_t rated_reputation( uint32_t old_reputation, uint8_t rating, uint8_t weight )
{
   FC_ASSERT( weight <= TRIBUNAL_MAX_RATING_WEIGHT );
   const uint64_t mapped = uint64_t(rating) * TRIBUNAL_MAX_REPUTATION / TRIBUNAL_MAX_RATING;
   const uint64_t blended = ( uint64_t(old_reputation) * ( TRIBUNAL_MAX_RATING_WEIGHT - weight )
                              + mapped * weight ) / TRIBUNAL_MAX_RATING_WEIGHT;
   return static_cast<uint32_t>( std::min<uint64_t>( blended, TRIBUNAL_MAX_REPUTATION ) );
}

} } // tribunal::chain

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

namespace tribunal { namespace chain {

   class database;

   /**
    * @brief Derives the seed that picks the arbitrator of a revealed dispute
    *
    * Mixes the escrow's creation time, the rotating seed kept in the dynamic global properties,
    * the revealed nonce and the escrow id. This is weak randomness: once the commitment is
    * revealed every input is public and the outcome can be computed in advance. It only keeps
    * the outcome unknown to whoever would want to pick the moment of the commit.
    */
   digest_type make_selection_seed( time_point_sec escrow_created_at, const digest_type& rotating_seed,
                                    const digest_type& nonce, escrow_id_type escrow );

   /// The rotating seed that replaces @p current after @p used picked an arbitrator
   digest_type next_rotating_seed( const digest_type& current, const digest_type& used );

   /// @return the seed reduced to [0, bound), @p bound must not be zero
   uint64_t seed_modulo( const digest_type& seed, uint64_t bound );

   /**
    * @brief Picks the arbitrator for a new dispute
    *
    * Only active arbitrators are considered, and none of the accounts in @p excluded, which holds
    * the buyer and the seller of the disputed escrow. With @p exclude_overloaded, arbitrators that
    * already carry chain_parameters::max_active_disputes open cases are skipped.
    *
    * With the reputation_weighted strategy the candidate with the highest selection_score() wins.
    * Ties are broken by the seed modulo the number of tied candidates, taken in id order. With
    * the seeded_hash strategy the seed modulo the number of eligible arbitrators picks directly.
    *
    * The result only depends on the registry and on @p seed.
    *
    * @return the account of the chosen arbitrator, or nothing if no arbitrator is eligible
    */
   optional<account_id_type> select_candidate( const database& db, const digest_type& seed,
                                               const flat_set<account_id_type>& excluded,
                                               bool exclude_overloaded = true );

   /**
    * Reputation after one rating: the rating is scaled onto [0, TRIBUNAL_MAX_REPUTATION] and
    * averaged with the old reputation, the new value weighing @p weight percent.
    */
   uint32_t rated_reputation( uint32_t old_reputation, uint8_t rating, uint8_t weight );

} } // tribunal::chain

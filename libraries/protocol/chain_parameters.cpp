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
#include <tribunal/protocol/chain_parameters.hpp>
#include <tribunal/protocol/exceptions.hpp>

#include <fc/uint128.hpp>

namespace tribunal { namespace protocol {

   static share_type cut_basis( share_type a, uint16_t p )
   {
      if( a <= 0 || p == 0 )
         return 0;
      if( p == TRIBUNAL_100_PERCENT )
         return a;

      fc::uint128_t r = a.value;
      r *= p;
      r /= TRIBUNAL_100_PERCENT;
      return static_cast<uint64_t>(r);
   }

   void chain_parameters::validate()const
   {
      TRIBUNAL_ASSERT( min_escrow_duration > 0, invalid_parameters,
                       "Minimum escrow duration must be positive" );
      TRIBUNAL_ASSERT( min_escrow_duration <= max_escrow_duration, invalid_parameters,
                       "Minimum escrow duration ${min} exceeds the maximum ${max}",
                       ("min",min_escrow_duration)("max",max_escrow_duration) );
      TRIBUNAL_ASSERT( reveal_window > 0, invalid_parameters, "Reveal window must be positive" );
      TRIBUNAL_ASSERT( dispute_timeout > 0, invalid_parameters, "Dispute timeout must be positive" );
      TRIBUNAL_ASSERT( dispute_stake_basis <= TRIBUNAL_100_PERCENT, invalid_parameters,
                       "Dispute stake can not exceed 100%" );
      TRIBUNAL_ASSERT( marketplace_fee_basis <= TRIBUNAL_100_PERCENT, invalid_parameters,
                       "Marketplace fee can not exceed 100%" );
      TRIBUNAL_ASSERT( marketplace_fee_basis == 0 || marketplace_fee_account != TRIBUNAL_NULL_ACCOUNT,
                       invalid_parameters, "A marketplace fee needs a fee account" );
      TRIBUNAL_ASSERT( min_arbitrator_reputation <= TRIBUNAL_MAX_REPUTATION, invalid_parameters,
                       "Minimum arbitrator reputation ${r} is out of range", ("r",min_arbitrator_reputation) );
      TRIBUNAL_ASSERT( max_active_disputes > 0, invalid_parameters,
                       "Arbitrators must be allowed at least one open dispute" );
      TRIBUNAL_ASSERT( rating_weight <= TRIBUNAL_MAX_RATING_WEIGHT, invalid_parameters,
                       "Rating weight ${w} is not a percentage", ("w",rating_weight) );
      TRIBUNAL_ASSERT( min_arbitrator_stake >= 0, invalid_parameters, "Minimum arbitrator stake is negative" );
      TRIBUNAL_ASSERT( selection_strategy == reputation_weighted || selection_strategy == seeded_hash,
                       invalid_parameters, "Unknown arbitrator selection strategy" );
   }

   share_type chain_parameters::required_dispute_stake( share_type amount )const
   {
      return cut_basis( amount, dispute_stake_basis );
   }

   share_type chain_parameters::marketplace_fee( share_type amount )const
   {
      return cut_basis( amount, marketplace_fee_basis );
   }

} } // tribunal::protocol

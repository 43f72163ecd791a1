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

#include <tribunal/protocol/types.hpp>

namespace tribunal { namespace protocol {

   /**
    * @brief Tunable parameters of the escrow and arbitration rules
    *
    * Durations are in seconds, basis point fields have a denominator of TRIBUNAL_100_PERCENT.
    * The current values live in the global property object and are replaced by the admin
    * through parameters_update_operation.
    */
   struct chain_parameters
   {
      uint32_t   min_escrow_duration           = TRIBUNAL_DEFAULT_MIN_ESCROW_DURATION; ///< shortest allowed escrow
      uint32_t   max_escrow_duration           = TRIBUNAL_DEFAULT_MAX_ESCROW_DURATION; ///< longest allowed escrow
      uint32_t   arbitrator_delay              = TRIBUNAL_DEFAULT_ARBITRATOR_DELAY; ///< time after creation before a dispute may be committed
      uint32_t   reveal_window                 = TRIBUNAL_DEFAULT_REVEAL_WINDOW; ///< time a commitment stays revealable
      uint16_t   dispute_stake_basis           = TRIBUNAL_DEFAULT_DISPUTE_STAKE_BASIS; ///< stake required to commit a dispute
      uint16_t   marketplace_fee_basis         = TRIBUNAL_DEFAULT_MARKETPLACE_FEE_BASIS; ///< cut of seller payouts
      account_id_type marketplace_fee_account; ///< receives the marketplace fee
      uint32_t   min_arbitrator_reputation     = TRIBUNAL_DEFAULT_MIN_ARBITRATOR_REPUTATION;
      uint32_t   min_arbitrator_participation  = TRIBUNAL_DEFAULT_MIN_ARBITRATOR_PARTICIPATION;
      uint16_t   max_active_disputes           = TRIBUNAL_DEFAULT_MAX_ACTIVE_DISPUTES; ///< open cases per arbitrator
      uint32_t   dispute_timeout               = TRIBUNAL_DEFAULT_DISPUTE_TIMEOUT; ///< time the arbitrator has to rule
      uint8_t    rating_weight                 = TRIBUNAL_DEFAULT_RATING_WEIGHT; ///< percent of a new rating in the reputation average
      share_type min_arbitrator_stake          = TRIBUNAL_DEFAULT_MIN_ARBITRATOR_STAKE;
      arbitrator_selection_strategy selection_strategy = reputation_weighted;

      /// @throws invalid_parameters
      void validate()const;

      /// stake required to dispute an escrow of the given amount
      share_type required_dispute_stake( share_type amount )const;
      /// marketplace cut of a seller payout
      share_type marketplace_fee( share_type amount )const;
   };

} }  // tribunal::protocol

FC_REFLECT( tribunal::protocol::chain_parameters,
            (min_escrow_duration)
            (max_escrow_duration)
            (arbitrator_delay)
            (reveal_window)
            (dispute_stake_basis)
            (marketplace_fee_basis)
            (marketplace_fee_account)
            (min_arbitrator_reputation)
            (min_arbitrator_participation)
            (max_active_disputes)
            (dispute_timeout)
            (rating_weight)
            (min_arbitrator_stake)
            (selection_strategy)
          )

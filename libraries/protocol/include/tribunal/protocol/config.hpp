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

/** percentage fields are fixed point with a denominator of 10,000 */
#define TRIBUNAL_100_PERCENT                                 10000
#define TRIBUNAL_1_PERCENT                                   (TRIBUNAL_100_PERCENT/100)

#define TRIBUNAL_MAX_SHARE_SUPPLY                            int64_t(1000000000000000ll)

#define TRIBUNAL_MIN_ACCOUNT_NAME_LENGTH                     1
#define TRIBUNAL_MAX_ACCOUNT_NAME_LENGTH                     63

#define TRIBUNAL_MAX_RESOLUTION_NOTE_LENGTH                  1024

/// Reputation scores live in [0, TRIBUNAL_MAX_REPUTATION]
#define TRIBUNAL_MAX_REPUTATION                              1000
/// Ratings submitted by escrow parties live in [TRIBUNAL_MIN_RATING, TRIBUNAL_MAX_RATING]
#define TRIBUNAL_MIN_RATING                                  1
#define TRIBUNAL_MAX_RATING                                  5
/// Votes needed on one side to resolve a disputed escrow (2 of buyer, seller and arbitrator)
#define TRIBUNAL_VOTE_THRESHOLD                              2
/// The rating weight is a percentage in [0, 100]
#define TRIBUNAL_MAX_RATING_WEIGHT                           100

#define TRIBUNAL_DEFAULT_MIN_ESCROW_DURATION                 (60*60)          ///< 1 hour
#define TRIBUNAL_DEFAULT_MAX_ESCROW_DURATION                 (60*60*24*30)    ///< 30 days
#define TRIBUNAL_DEFAULT_ARBITRATOR_DELAY                    (60*60*24)       ///< 1 day
#define TRIBUNAL_DEFAULT_REVEAL_WINDOW                       (60*60)          ///< 1 hour
#define TRIBUNAL_DEFAULT_DISPUTE_STAKE_BASIS                 10               ///< 0.1%
#define TRIBUNAL_DEFAULT_MARKETPLACE_FEE_BASIS               0
#define TRIBUNAL_DEFAULT_MIN_ARBITRATOR_REPUTATION           750
#define TRIBUNAL_DEFAULT_MIN_ARBITRATOR_PARTICIPATION        500
#define TRIBUNAL_DEFAULT_MAX_ACTIVE_DISPUTES                 5
#define TRIBUNAL_DEFAULT_DISPUTE_TIMEOUT                     (60*60*24*7)     ///< 7 days
#define TRIBUNAL_DEFAULT_RATING_WEIGHT                       10
#define TRIBUNAL_DEFAULT_MIN_ARBITRATOR_STAKE                0

#define TRIBUNAL_MIN_UNDO_HISTORY                            10

/**
 * Reserved accounts, created by genesis in this order.
 */
///@{
/// Represents "no account", never a valid party
#define TRIBUNAL_NULL_ACCOUNT       (tribunal::protocol::account_id_type(0))
/// Holds every escrowed amount, dispute stake and arbitrator stake
#define TRIBUNAL_CUSTODY_ACCOUNT    (tribunal::protocol::account_id_type(1))
///@}

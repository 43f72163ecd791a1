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
#include <tribunal/chain/exceptions.hpp>

namespace tribunal { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "escrow chain exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception, chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,  chain_exception, 3070000, "undo database exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( state_exception,          chain_exception, 3110000, "invalid state transition" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_not_found,         state_exception, 3110001, "escrow not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_resolved,         state_exception, 3110002, "escrow already resolved" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_disputed,         state_exception, 3110003, "escrow already disputed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_voted,            state_exception, 3110004, "already voted" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_rated,            state_exception, 3110005, "already rated" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_registered,       state_exception, 3110006, "arbitrator already registered" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( dispute_not_resolved,     state_exception, 3110007, "dispute not resolved" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( arbitrator_not_found,     state_exception, 3110008, "arbitrator not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_disputed,             state_exception, 3110009, "escrow not disputed" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( timing_exception,         chain_exception,  3120000, "timing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( dispute_too_early,        timing_exception, 3120001, "dispute raised too early" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( reveal_deadline_passed,   timing_exception, 3120002, "reveal deadline passed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( dispute_timeout,          timing_exception, 3120003, "dispute timed out" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_not_expired,       timing_exception, 3120004, "escrow not expired" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( authorization_exception,  chain_exception,         3130000, "authorization exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_participant,          authorization_exception, 3130001, "caller is not a participant" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_assigned_arbitrator,  authorization_exception, 3130002, "caller is not the assigned arbitrator" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_admin,                authorization_exception, 3130003, "caller is not the admin" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( system_paused,            authorization_exception, 3130004, "system paused" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( arbitrator_inactive,      authorization_exception, 3130005, "arbitrator inactive" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( economic_exception,       chain_exception,    3140000, "economic exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_stake,       economic_exception, 3140001, "insufficient stake" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,     economic_exception, 3140002, "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_reputation,  economic_exception, 3140003, "insufficient reputation" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_failed,          economic_exception, 3140004, "transfer failed" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( no_candidate_exception,   chain_exception,        3150000, "no arbitrator candidate" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_candidate_available,   no_candidate_exception, 3150001, "no arbitrator candidate available" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( reentrancy_exception,     chain_exception,      3160000, "reentrancy exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( reentrant_call,           reentrancy_exception, 3160001, "reentrant call" )

} } // tribunal::chain

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

#include <fc/exception/exception.hpp>
#include <tribunal/protocol/exceptions.hpp>
#include <tribunal/chain/types.hpp>

namespace tribunal { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,    tribunal::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,     tribunal::chain::chain_exception, 3070000 )

   /// The operation is well formed but the record is not in a state that allows it
   FC_DECLARE_DERIVED_EXCEPTION( state_exception,             tribunal::chain::chain_exception, 3110000 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_not_found,            tribunal::chain::state_exception, 3110001 )
   FC_DECLARE_DERIVED_EXCEPTION( already_resolved,            tribunal::chain::state_exception, 3110002 )
   FC_DECLARE_DERIVED_EXCEPTION( already_disputed,            tribunal::chain::state_exception, 3110003 )
   FC_DECLARE_DERIVED_EXCEPTION( already_voted,               tribunal::chain::state_exception, 3110004 )
   FC_DECLARE_DERIVED_EXCEPTION( already_rated,               tribunal::chain::state_exception, 3110005 )
   FC_DECLARE_DERIVED_EXCEPTION( already_registered,          tribunal::chain::state_exception, 3110006 )
   FC_DECLARE_DERIVED_EXCEPTION( dispute_not_resolved,        tribunal::chain::state_exception, 3110007 )
   FC_DECLARE_DERIVED_EXCEPTION( arbitrator_not_found,        tribunal::chain::state_exception, 3110008 )
   FC_DECLARE_DERIVED_EXCEPTION( not_disputed,                tribunal::chain::state_exception, 3110009 )

   /// Compared against the head time when the operation is applied
   FC_DECLARE_DERIVED_EXCEPTION( timing_exception,            tribunal::chain::chain_exception, 3120000 )
   FC_DECLARE_DERIVED_EXCEPTION( dispute_too_early,           tribunal::chain::timing_exception, 3120001 )
   FC_DECLARE_DERIVED_EXCEPTION( reveal_deadline_passed,      tribunal::chain::timing_exception, 3120002 )
   FC_DECLARE_DERIVED_EXCEPTION( dispute_timeout,             tribunal::chain::timing_exception, 3120003 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_not_expired,          tribunal::chain::timing_exception, 3120004 )

   FC_DECLARE_DERIVED_EXCEPTION( authorization_exception,     tribunal::chain::chain_exception, 3130000 )
   FC_DECLARE_DERIVED_EXCEPTION( not_participant,             tribunal::chain::authorization_exception, 3130001 )
   FC_DECLARE_DERIVED_EXCEPTION( not_assigned_arbitrator,     tribunal::chain::authorization_exception, 3130002 )
   FC_DECLARE_DERIVED_EXCEPTION( not_admin,                   tribunal::chain::authorization_exception, 3130003 )
   FC_DECLARE_DERIVED_EXCEPTION( system_paused,               tribunal::chain::authorization_exception, 3130004 )
   FC_DECLARE_DERIVED_EXCEPTION( arbitrator_inactive,         tribunal::chain::authorization_exception, 3130005 )

   FC_DECLARE_DERIVED_EXCEPTION( economic_exception,          tribunal::chain::chain_exception, 3140000 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_stake,          tribunal::chain::economic_exception, 3140001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,        tribunal::chain::economic_exception, 3140002 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_reputation,     tribunal::chain::economic_exception, 3140003 )
   FC_DECLARE_DERIVED_EXCEPTION( transfer_failed,             tribunal::chain::economic_exception, 3140004 )

   /// Nothing was changed, the operation may be retried once an arbitrator becomes available
   FC_DECLARE_DERIVED_EXCEPTION( no_candidate_exception,      tribunal::chain::chain_exception, 3150000 )
   FC_DECLARE_DERIVED_EXCEPTION( no_candidate_available,      tribunal::chain::no_candidate_exception, 3150001 )

   FC_DECLARE_DERIVED_EXCEPTION( reentrancy_exception,        tribunal::chain::chain_exception, 3160000 )
   FC_DECLARE_DERIVED_EXCEPTION( reentrant_call,              tribunal::chain::reentrancy_exception, 3160001 )

} } // tribunal::chain

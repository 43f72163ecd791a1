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
#include <tribunal/protocol/base.hpp>
#include <tribunal/protocol/admin.hpp>
#include <tribunal/protocol/arbitrator.hpp>
#include <tribunal/protocol/dispute.hpp>
#include <tribunal/protocol/escrow.hpp>

namespace tribunal { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ escrow_create_operation,
            /*  1 */ escrow_release_operation,
            /*  2 */ escrow_refund_operation,
            /*  3 */ escrow_vote_operation,
            /*  4 */ dispute_commit_operation,
            /*  5 */ dispute_reveal_operation,
            /*  6 */ dispute_rule_operation,
            /*  7 */ dispute_rate_operation,
            /*  8 */ arbitrator_register_operation,
            /*  9 */ arbitrator_refresh_operation,
            /* 10 */ arbitrator_deactivate_operation,
            /* 11 */ parameters_update_operation,
            /* 12 */ pause_update_operation,
            /* 13 */ escrow_created_operation,            // VIRTUAL
            /* 14 */ escrow_resolved_operation,           // VIRTUAL
            /* 15 */ vote_cast_operation,                 // VIRTUAL
            /* 16 */ marketplace_fee_collected_operation, // VIRTUAL
            /* 17 */ dispute_committed_operation,         // VIRTUAL
            /* 18 */ dispute_raised_operation,            // VIRTUAL
            /* 19 */ dispute_created_operation,           // VIRTUAL
            /* 20 */ dispute_resolved_operation,          // VIRTUAL
            /* 21 */ rating_submitted_operation,          // VIRTUAL
            /* 22 */ dispute_stake_returned_operation,    // VIRTUAL
            /* 23 */ arbitrator_registered_operation,     // VIRTUAL
            /* 24 */ arbitrator_removed_operation,        // VIRTUAL
            /* 25 */ reputation_updated_operation         // VIRTUAL
         > operation;

   void operation_validate( const operation& op );

   /// @return the account on whose behalf @p op was submitted or produced
   account_id_type operation_actor( const operation& op );

   /// @return true if @p op can only be produced while applying another operation
   bool operation_is_virtual( const operation& op );

} } // tribunal::protocol

FC_REFLECT_TYPENAME( tribunal::protocol::operation )

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

#include <tribunal/chain/account_object.hpp>
#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/dispute_object.hpp>
#include <tribunal/chain/escrow_object.hpp>
#include <tribunal/chain/global_property_object.hpp>

#include <tribunal/chain/admin_evaluator.hpp>
#include <tribunal/chain/arbitrator_evaluator.hpp>
#include <tribunal/chain/dispute_evaluator.hpp>
#include <tribunal/chain/escrow_evaluator.hpp>

namespace tribunal { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<escrow_create_evaluator>();
   register_evaluator<escrow_release_evaluator>();
   register_evaluator<escrow_refund_evaluator>();
   register_evaluator<escrow_vote_evaluator>();
   register_evaluator<dispute_commit_evaluator>();
   register_evaluator<dispute_reveal_evaluator>();
   register_evaluator<dispute_rule_evaluator>();
   register_evaluator<dispute_rate_evaluator>();
   register_evaluator<arbitrator_register_evaluator>();
   register_evaluator<arbitrator_refresh_evaluator>();
   register_evaluator<arbitrator_deactivate_evaluator>();
   register_evaluator<parameters_update_evaluator>();
   register_evaluator<pause_update_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( TRIBUNAL_MIN_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<escrow_index> >();
   add_index< primary_index<dispute_index> >();
   add_index< primary_index<arbitrator_index> >();

   //Implementation object indexes
   add_index< primary_index<global_property_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<dispute_commitment_index> >();
}

} }

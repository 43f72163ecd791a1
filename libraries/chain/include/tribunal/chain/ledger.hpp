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
    * @brief The value ledger that holds escrowed funds
    *
    * The escrow rules never move value themselves, they ask the ledger to pull funds into custody
    * and to pay them out again. A ledger reports refusal by returning false; the caller turns that
    * into insufficient_balance or transfer_failed and the whole transaction is undone.
    *
    * A ledger that keeps its state outside the database can not be rolled back by the undo session,
    * so it must only commit a movement once the call returns true.
    */
   class ledger_interface
   {
      public:
         virtual ~ledger_interface() = default;

         virtual share_type get_balance( account_id_type owner )const = 0;

         /// moves @p amount from @p from into custody
         virtual bool deposit( account_id_type from, share_type amount ) = 0;

         /// moves @p amount from custody to @p to
         virtual bool transfer( account_id_type to, share_type amount ) = 0;
   };

   /**
    * @brief Reference ledger that keeps balances in account_balance_objects
    *
    * Custody is the balance of TRIBUNAL_CUSTODY_ACCOUNT. All movements are database modifications
    * and are undone together with the transaction that made them.
    */
   class database_ledger : public ledger_interface
   {
      public:
         explicit database_ledger( database& db ) : _db(db) {}

         share_type get_balance( account_id_type owner )const override;
         bool       deposit( account_id_type from, share_type amount ) override;
         bool       transfer( account_id_type to, share_type amount ) override;

      protected:
         database& _db;
   };

} } // tribunal::chain

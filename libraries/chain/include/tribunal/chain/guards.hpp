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
    * @brief Holds the database's reentrancy flag for the lifetime of a state changing call
    *
    * Throws reentrant_call if the flag is already held, e.g. when a ledger callback tries to push
    * another transaction while the first one is still being applied.
    */
   class scoped_reentrancy_lock
   {
      public:
         explicit scoped_reentrancy_lock( bool& locked );
         ~scoped_reentrancy_lock();

         scoped_reentrancy_lock( const scoped_reentrancy_lock& ) = delete;
         scoped_reentrancy_lock& operator=( const scoped_reentrancy_lock& ) = delete;

      private:
         bool& _locked;
   };

   /// @throws system_paused while the admin has paused new escrows, disputes and registrations
   void check_not_paused( const database& db );

   /// @throws not_admin unless @p account is the admin account
   void check_admin( const database& db, account_id_type account );

} } // tribunal::chain

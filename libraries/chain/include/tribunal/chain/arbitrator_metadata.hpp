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
    * @brief Where arbitrator candidates get their reputation and participation readings
    */
   class arbitrator_metadata_source
   {
      public:
         virtual ~arbitrator_metadata_source() = default;

         virtual uint32_t get_reputation( account_id_type account )const = 0;
         virtual uint32_t get_participation_index( account_id_type account )const = 0;
   };

   /// Reads the readings stored on account_object
   class account_metadata_source : public arbitrator_metadata_source
   {
      public:
         explicit account_metadata_source( const database& db ) : _db(db) {}

         uint32_t get_reputation( account_id_type account )const override;
         uint32_t get_participation_index( account_id_type account )const override;

      private:
         const database& _db;
   };

} } // tribunal::chain

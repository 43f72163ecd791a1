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

#include <tribunal/protocol/chain_parameters.hpp>
#include <tribunal/chain/types.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/filesystem.hpp>

#include <string>
#include <vector>

namespace tribunal { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string(),
                           uint32_t reputation_score = 0,
                           uint32_t participation_index = 0)
         : name(name),
           reputation_score(reputation_score),
           participation_index(participation_index)
      {}
      string   name;
      uint32_t reputation_score = 0;
      uint32_t participation_index = 0;
   };
   struct initial_balance_type {
      string     owner_name;
      share_type amount;
   };

   time_point_sec                           initial_timestamp;
   chain_parameters                         initial_parameters;
   /// name of an initial account that becomes the admin, empty for none
   string                                   initial_admin;
   vector<initial_account_type>             initial_accounts;
   vector<initial_balance_type>             initial_balances;
   digest_type                              initial_arbitrator_seed;

   /// @throws fc::assert_exception if names are duplicated or unknown, invalid_parameters for bad parameters
   void validate()const;

   static genesis_state_type from_json_file( const fc::path& path );
};

} } // namespace tribunal::chain

FC_REFLECT( tribunal::chain::genesis_state_type::initial_account_type,
            (name)(reputation_score)(participation_index) )

FC_REFLECT( tribunal::chain::genesis_state_type::initial_balance_type,
            (owner_name)(amount) )

FC_REFLECT( tribunal::chain::genesis_state_type,
            (initial_timestamp)(initial_parameters)(initial_admin)(initial_accounts)(initial_balances)
            (initial_arbitrator_seed) )

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

#include <boost/multi_index/composite_key.hpp>

namespace tribunal { namespace chain {

   /**
    * @brief An account that can take part in escrows
    * @ingroup object
    *
    * The reputation score and participation index are the readings the default
    * arbitrator_metadata_source reports for the account.
    */
   class account_object : public tribunal::db::abstract_object<account_object, protocol_ids, account_object_type>
   {
      public:
         string   name;
         uint32_t reputation_score = 0;      ///< 0 to TRIBUNAL_MAX_REPUTATION
         uint32_t participation_index = 0;
   };

   /**
    * @brief Balance of an account in the reference ledger
    * @ingroup object
    */
   class account_balance_object : public tribunal::db::abstract_object<account_balance_object,
                                                                         implementation_ids,
                                                                         impl_account_balance_object_type>
   {
      public:
         account_id_type owner;
         share_type      balance;

         void adjust_balance( share_type delta )
         {
            balance += delta;
         }
   };

   struct by_name;

   /**
    * @ingroup object_index
    */
   using account_multi_index_type = multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member< account_object, string, &account_object::name > >
      >
   >;

   /**
    * @ingroup object_index
    */
   using account_index = generic_index<account_object, account_multi_index_type>;

   struct by_account;

   /**
    * @ingroup object_index
    */
   using account_balance_object_multi_index_type = multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account>,
            member< account_balance_object, account_id_type, &account_balance_object::owner >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using account_balance_index = generic_index<account_balance_object, account_balance_object_multi_index_type>;

} } // tribunal::chain

MAP_OBJECT_ID_TO_TYPE( tribunal::chain::account_object )
MAP_OBJECT_ID_TO_TYPE( tribunal::chain::account_balance_object )

FC_REFLECT_DERIVED( tribunal::chain::account_object, (tribunal::db::object),
                    (name)(reputation_score)(participation_index) )
FC_REFLECT_DERIVED( tribunal::chain::account_balance_object, (tribunal::db::object),
                    (owner)(balance) )

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

namespace tribunal { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains global state set by the admin
    * @ingroup object
    * @ingroup implementation
    *
    * This is an implementation detail. The values here are set by genesis and changed only by the
    * admin operations.
    */
   class global_property_object : public tribunal::db::abstract_object<global_property_object,
                                                                         implementation_ids,
                                                                         impl_global_property_object_type>
   {
      public:
         chain_parameters  parameters;
         account_id_type   admin_account;
         bool              paused = false;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state that changes with every applied transaction
    * @ingroup object
    * @ingroup implementation
    *
    * This is an implementation detail.
    */
   class dynamic_global_property_object : public tribunal::db::abstract_object<dynamic_global_property_object,
                                                                                 implementation_ids,
                                                                                 impl_dynamic_global_property_object_type>
   {
      public:
         /// head time, every deadline is compared against it
         time_point_sec    time;
         /// mixed into every arbitrator selection and rotated after each assignment
         digest_type       arbitrator_seed;
         uint64_t          applied_transactions = 0;
   };

   using global_property_index = generic_index<global_property_object,
      multi_index_container< global_property_object,
         indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
      >
   >;

   using dynamic_global_property_index = generic_index<dynamic_global_property_object,
      multi_index_container< dynamic_global_property_object,
         indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
      >
   >;

} } // tribunal::chain

MAP_OBJECT_ID_TO_TYPE( tribunal::chain::global_property_object )
MAP_OBJECT_ID_TO_TYPE( tribunal::chain::dynamic_global_property_object )

FC_REFLECT_DERIVED( tribunal::chain::global_property_object, (tribunal::db::object),
                    (parameters)(admin_account)(paused) )
FC_REFLECT_DERIVED( tribunal::chain::dynamic_global_property_object, (tribunal::db::object),
                    (time)(arbitrator_seed)(applied_transactions) )

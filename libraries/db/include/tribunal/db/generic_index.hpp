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
#include <tribunal/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/mem_fun.hpp>

namespace tribunal { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    * Stores ObjectType in a boost::multi_index_container whose first index is ordered_unique
    * on object::id. The container's other indices are read through indices().
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         using index_type = MultiIndexType;
         using object_type = ObjectType;

         const object& create( const std::function<void(object&)>& init ) override
         {
            ObjectType item;
            item.id = get_next_id();
            init( item );
            const object_id_type id = item.id;
            auto result = _indices.insert( std::move( item ) );
            FC_ASSERT( result.second, "Could not create ${id}, a unique key is already taken", ("id",id) );
            return *result.first;
         }

         const object& insert( object&& obj ) override
         {
            const object_id_type id = obj.id;
            auto result = _indices.insert( std::move( static_cast<ObjectType&>( obj ) ) );
            FC_ASSERT( result.second, "Could not restore ${id}, a unique key is already taken", ("id",id) );
            return *result.first;
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            const bool ok = _indices.modify( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ),
                                             [&m]( ObjectType& o ){ m( o ); } );
            FC_ASSERT( ok, "Modifying ${id} would break a unique key", ("id",obj.id) );
         }

         void remove( const object& obj ) override
         {
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ) );
         }

         const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            return itr == _indices.end() ? nullptr : &*itr;
         }

         const index_type& indices()const { return _indices; }

      private:
         index_type _indices;
   };

} } // tribunal::db

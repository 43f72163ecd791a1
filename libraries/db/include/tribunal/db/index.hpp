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
#include <tribunal/db/object.hpp>
#include <tribunal/db/undo_database.hpp>

#include <functional>

namespace tribunal { namespace db {

   /**
    * Type-erased storage for the objects of one space.type. Instances are handed out in increasing
    * order; an index never changes an object except through modify.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual object_id_type get_next_id()const = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /// Constructs an object under the next free id
         virtual const object& create( const std::function<void(object&)>& init ) = 0;
         /// Puts back a removed object under its old id
         virtual const object& insert( object&& obj ) = 0;
         virtual void          modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void          remove( const object& obj ) = 0;

         virtual const object* find( object_id_type id )const = 0;
   };

   /**
    * Wraps a concrete index and reports each change to the undo database before or after it
    * happens, so an open undo session can revert it.
    */
   template<typename StorageIndex>
   class primary_index : public StorageIndex
   {
      public:
         using object_type = typename StorageIndex::object_type;

         explicit primary_index( undo_database& undo )
         : _undo( undo ), _next_id( object_type::space_id, object_type::type_id, 0 ) {}

         object_id_type get_next_id()const override { return _next_id; }
         void set_next_id( object_id_type id ) override { _next_id = id; }

         const object& create( const std::function<void(object&)>& init ) override
         {
            const object& created = StorageIndex::create( init );
            _next_id = object_id_type( object_type::space_id, object_type::type_id, _next_id.instance() + 1 );
            _undo.on_create( created );
            return created;
         }

         const object& insert( object&& obj ) override
         {
            const object& restored = StorageIndex::insert( std::move( obj ) );
            _undo.on_create( restored );
            return restored;
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            _undo.on_modify( obj );
            StorageIndex::modify( obj, m );
         }

         void remove( const object& obj ) override
         {
            _undo.on_remove( obj );
            StorageIndex::remove( obj );
         }

      private:
         undo_database& _undo;
         object_id_type _next_id;
   };

} } // tribunal::db

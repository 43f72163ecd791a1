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
#include <tribunal/db/index.hpp>
#include <tribunal/db/undo_database.hpp>

#include <fc/container/flat.hpp>

namespace tribunal { namespace db {

   /**
    * Owns one primary index per object type and routes every change through the undo database.
    * Callers only ever see const objects; all writes go through create, modify and remove.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         void reset_indexes() { _indexes.clear(); }

         template<typename IndexType>
         IndexType* add_index()
         {
            using object_type = typename IndexType::object_type;
            const uint16_t key = index_key( object_type::space_id, object_type::type_id );
            FC_ASSERT( _indexes.find( key ) == _indexes.end(), "Index ${s}.${t} is already registered",
                       ("s",object_type::space_id)("t",object_type::type_id) );
            _indexes[key] = std::make_unique<IndexType>( _undo_db );
            return static_cast<IndexType*>( _indexes[key].get() );
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            using object_type = typename IndexType::object_type;
            return static_cast<const IndexType&>( lookup( object_type::space_id, object_type::type_id ) );
         }

         template<typename T, typename Constructor>
         const T& create( Constructor&& init )
         {
            return static_cast<const T&>( lookup( T::space_id, T::type_id ).create(
                                             [&init]( object& o ){ init( static_cast<T&>(o) ); } ) );
         }

         template<typename T, typename Modifier>
         void modify( const T& obj, const Modifier& m )
         {
            lookup( obj.id.space(), obj.id.type() ).modify( obj, [&m]( object& o ){ m( static_cast<T&>(o) ); } );
         }

         const object* find_object( const object_id_type& id )const
         {
            return lookup( id.space(), id.type() ).find( id );
         }
         const object& get_object( const object_id_type& id )const;

         /// @return nullptr when no object has the id
         template<uint8_t SpaceID, uint8_t TypeID>
         auto find( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<decltype(id)>*
         {
            return static_cast<const object_downcast_t<decltype(id)>*>( find_object( object_id_type( id ) ) );
         }

         template<uint8_t SpaceID, uint8_t TypeID>
         auto get( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<decltype(id)>&
         {
            return static_cast<const object_downcast_t<decltype(id)>&>( get_object( object_id_type( id ) ) );
         }

      protected:
         undo_database _undo_db;

      private:
         friend class undo_database;

         void insert( object&& obj ) { lookup( obj.id.space(), obj.id.type() ).insert( std::move( obj ) ); }
         void remove( const object& obj ) { lookup( obj.id.space(), obj.id.type() ).remove( obj ); }

         static uint16_t index_key( uint8_t space, uint8_t type ) { return uint16_t( ( space << 8 ) | type ); }
         index& lookup( uint8_t space, uint8_t type )const;

         fc::flat_map< uint16_t, std::unique_ptr<index> > _indexes;
   };

} } // tribunal::db

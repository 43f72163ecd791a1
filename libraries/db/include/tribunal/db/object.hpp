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
#include <tribunal/protocol/object_id.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>

namespace tribunal { namespace db {

   /**
    * Base of everything stored in the object database. Objects refer to each other by id only,
    * and must be cheap to copy: the undo database keeps whole copies of changed objects.
    */
   class object
   {
      public:
         object() = default;
         object( uint8_t space, uint8_t type ) : id( space, type, 0 ) {}
         virtual ~object() = default;

         object_id_type id;

         virtual std::unique_ptr<object> clone()const = 0;
         /// Overwrites this object with the state held by @p saved, which must be of the same class
         virtual void restore( object& saved ) = 0;
   };

   /// Gives DerivedClass its space.type, a typed get_id() and the polymorphic copy operations
   template<typename DerivedClass, uint8_t SpaceID, uint8_t TypeID>
   class abstract_object : public object
   {
      public:
         static constexpr uint8_t space_id = SpaceID;
         static constexpr uint8_t type_id = TypeID;

         abstract_object() : object( SpaceID, TypeID ) {}

         object_id<SpaceID,TypeID> get_id()const { return object_id<SpaceID,TypeID>( id ); }

         std::unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( static_cast<const DerivedClass&>( *this ) );
         }

         void restore( object& saved ) override
         {
            static_cast<DerivedClass&>( *this ) = std::move( static_cast<DerivedClass&>( saved ) );
         }
   };

} } // tribunal::db

FC_REFLECT( tribunal::db::object, (id) )

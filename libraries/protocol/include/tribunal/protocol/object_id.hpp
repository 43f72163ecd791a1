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
#include <functional>

#include <fc/exception/exception.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>
#include <fc/string.hpp>

namespace tribunal { namespace db {

   /**
    * Untyped id of a stored object. The top byte is the space, the next byte the type and the low
    * 48 bits the instance within that index.
    */
   struct object_id_type
   {
      static constexpr uint64_t instance_mask = ( uint64_t(1) << 48 ) - 1;

      object_id_type() = default;
      object_id_type( uint8_t space, uint8_t type, uint64_t instance )
      {
         FC_ASSERT( instance <= instance_mask, "Instance ${i} does not fit in 48 bits", ("i",instance) );
         number = ( uint64_t(space) << 56 ) | ( uint64_t(type) << 48 ) | instance;
      }

      uint8_t  space()const    { return uint8_t( number >> 56 ); }
      uint8_t  type()const     { return uint8_t( number >> 48 ); }
      uint64_t instance()const { return number & instance_mask; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      uint64_t number = 0;
   };

   /// "space.type.instance"
   inline std::string to_string( const object_id_type& id )
   {
      return fc::to_string( id.space() ) + "." + fc::to_string( id.type() ) + "." + fc::to_string( id.instance() );
   }

   class object;

   /// Maps an id type to the concrete object class stored under it; filled in by MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };
   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

#define MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace tribunal { namespace db { \
   template<> \
   struct object_downcast<const tribunal::db::object_id<OBJECT::space_id, \
                                                        OBJECT::type_id>&> { using type = OBJECT; }; \
   } }

   /// Typed id: only the instance is stored, space and type are part of the C++ type
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      object_id() = default;
      explicit object_id( uint64_t i ) : instance( i )
      {
         FC_ASSERT( i <= object_id_type::instance_mask, "Instance ${i} does not fit in 48 bits", ("i",i) );
      }
      explicit object_id( const object_id_type& id ) : instance( id.instance() )
      {
         FC_ASSERT( id.space() == SpaceID && id.type() == TypeID, "Id ${id} is not a ${s}.${t} id",
                    ("id",to_string(id))("s",SpaceID)("t",TypeID) );
      }

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance.value ); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b )
      { return a.instance.value < b.instance.value; }

      friend bool operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }
      friend bool operator == ( const object_id& a, const object_id_type& b ) { return object_id_type(a) == b; }

      fc::unsigned_int instance;
   };

} } // tribunal::db

FC_REFLECT( tribunal::db::object_id_type, (number) )

namespace fc {

// typed ids serialize as their instance alone
template<uint8_t SpaceID, uint8_t TypeID>
struct get_typename<tribunal::db::object_id<SpaceID,TypeID>>
{
   static const char* name()
   {
      static const std::string n = "tribunal::db::object_id<" + fc::to_string( SpaceID ) + ":"
                                   + fc::to_string( TypeID ) + ">";
      return n.c_str();
   }
};

template<uint8_t SpaceID, uint8_t TypeID>
struct reflector<tribunal::db::object_id<SpaceID,TypeID>>
{
   using type = tribunal::db::object_id<SpaceID,TypeID>;
   using is_defined = std::true_type;
   using native_members = typelist::list<fc::field_reflection<0, type, unsigned_int, &type::instance>>;
   using inherited_members = typelist::list<>;
   using members = native_members;
   using base_classes = typelist::list<>;
   enum member_count_enum { local_member_count = 1, total_member_count = 1 };

   template<typename Visitor>
   static void visit( const Visitor& v )
   {
      v.TEMPLATE operator()<unsigned_int, type, &type::instance>( "instance" );
   }
};

namespace member_names {
template<uint8_t SpaceID, uint8_t TypeID>
struct member_name<tribunal::db::object_id<SpaceID,TypeID>, 0> { static constexpr const char* value = "instance"; };
}

inline void to_variant( const tribunal::db::object_id_type& id, fc::variant& v, uint32_t max_depth = 1 )
{
   v = tribunal::db::to_string( id );
}

inline void from_variant( const fc::variant& v, tribunal::db::object_id_type& id, uint32_t max_depth = 1 )
{ try {
   const std::string& s = v.get_string();
   const auto dot1 = s.find( '.' );
   const auto dot2 = dot1 == std::string::npos ? dot1 : s.find( '.', dot1 + 1 );
   FC_ASSERT( dot2 != std::string::npos && dot1 > 0 && dot2 > dot1 + 1 && dot2 + 1 < s.size(),
              "Expected an id of the form space.type.instance" );
   const uint64_t space = fc::to_uint64( s.substr( 0, dot1 ) );
   const uint64_t type = fc::to_uint64( s.substr( dot1 + 1, dot2 - dot1 - 1 ) );
   FC_ASSERT( space <= 0xff && type <= 0xff, "Space and type must fit in one byte" );
   id = tribunal::db::object_id_type( uint8_t(space), uint8_t(type), fc::to_uint64( s.substr( dot2 + 1 ) ) );
} FC_CAPTURE_AND_RETHROW( (v) ) }

template<uint8_t SpaceID, uint8_t TypeID>
void to_variant( const tribunal::db::object_id<SpaceID,TypeID>& id, fc::variant& v, uint32_t max_depth = 1 )
{
   v = tribunal::db::to_string( tribunal::db::object_id_type( id ) );
}

template<uint8_t SpaceID, uint8_t TypeID>
void from_variant( const fc::variant& v, tribunal::db::object_id<SpaceID,TypeID>& id, uint32_t max_depth = 1 )
{
   tribunal::db::object_id_type untyped;
   from_variant( v, untyped, max_depth );
   id = tribunal::db::object_id<SpaceID,TypeID>( untyped );
}

} // fc

namespace std {
template<> struct hash<tribunal::db::object_id_type>
{
   size_t operator()( const tribunal::db::object_id_type& id )const { return std::hash<uint64_t>()( id.number ); }
};
}

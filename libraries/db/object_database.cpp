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
#include <tribunal/db/object_database.hpp>

namespace tribunal { namespace db {

object_database::object_database()
: _undo_db( *this )
{
   _undo_db.enable();
}

const object& object_database::get_object( const object_id_type& id )const
{
   const object* obj = find_object( id );
   FC_ASSERT( obj != nullptr, "No object with id ${id}", ("id",id) );
   return *obj;
}

index& object_database::lookup( uint8_t space, uint8_t type )const
{
   auto itr = _indexes.find( index_key( space, type ) );
   FC_ASSERT( itr != _indexes.end(), "No index registered for ${s}.${t}", ("s",space)("t",type) );
   return *itr->second;
}

} } // tribunal::db

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
#include <tribunal/db/undo_database.hpp>

namespace tribunal { namespace db {

undo_database::session undo_database::start_undo_session()
{
   if( !_enabled )
      return session( *this, false );

   while( _stack.size() >= _max_size )
      _stack.pop_front();
   _stack.emplace_back();
   ++_open_sessions;
   return session( *this, true );
}

void undo_database::on_create( const object& obj )
{
   if( !recording() )
      return;
   undo_state& state = _stack.back();
   // the first id created per index this session is where the counter goes back to
   const object_id_type index_id( obj.id.space(), obj.id.type(), 0 );
   if( state.old_next_ids.find( index_id ) == state.old_next_ids.end() )
      state.old_next_ids[index_id] = obj.id;
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( !recording() )
      return;
   undo_state& state = _stack.back();
   if( state.new_ids.count( obj.id ) || state.old_values.count( obj.id ) )
      return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( !recording() )
      return;
   undo_state& state = _stack.back();
   if( state.new_ids.erase( obj.id ) )
      return;
   auto saved = state.old_values.find( obj.id );
   if( saved != state.old_values.end() )
   {
      state.removed[obj.id] = std::move( saved->second );
      state.old_values.erase( saved );
      return;
   }
   if( !state.removed.count( obj.id ) )
      state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( _open_sessions > 0, "No session to undo" );
   undo_state& state = _stack.back();

   disable();
   for( auto& saved : state.old_values )
      _db.modify( _db.get_object( saved.first ), [&saved]( object& o ){ o.restore( *saved.second ); } );
   for( const object_id_type& id : state.new_ids )
      _db.remove( _db.get_object( id ) );
   for( const auto& next : state.old_next_ids )
      _db.lookup( next.first.space(), next.first.type() ).set_next_id( next.second );
   for( auto& gone : state.removed )
      _db.insert( std::move( *gone.second ) );
   enable();

   _stack.pop_back();
   --_open_sessions;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( _open_sessions > 0, "No session to commit" );
   if( _open_sessions == 1 )
   {
      _stack.pop_back();
      --_open_sessions;
      return;
   }

   undo_state& state = _stack.back();
   undo_state& outer = _stack[_stack.size() - 2];
   for( auto& saved : state.old_values )
   {
      if( !outer.new_ids.count( saved.first ) && !outer.old_values.count( saved.first ) )
         outer.old_values[saved.first] = std::move( saved.second );
   }
   for( const object_id_type& id : state.new_ids )
      outer.new_ids.insert( id );
   for( const auto& next : state.old_next_ids )
   {
      if( outer.old_next_ids.find( next.first ) == outer.old_next_ids.end() )
         outer.old_next_ids[next.first] = next.second;
   }
   for( auto& gone : state.removed )
   {
      if( outer.new_ids.erase( gone.first ) == 0 )
         outer.removed[gone.first] = std::move( gone.second );
   }

   _stack.pop_back();
   --_open_sessions;
} FC_CAPTURE_AND_RETHROW() }

} } // tribunal::db

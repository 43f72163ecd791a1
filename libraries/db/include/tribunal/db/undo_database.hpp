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
#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace tribunal { namespace db {

   class object_database;

   /// What one session must put back: prior values, created ids, removed objects and index counters
   struct undo_state
   {
      std::unordered_map<object_id_type, std::unique_ptr<object>> old_values;
      std::unordered_map<object_id_type, object_id_type>          old_next_ids;
      std::unordered_set<object_id_type>                          new_ids;
      std::unordered_map<object_id_type, std::unique_ptr<object>> removed;
   };

   /**
    * Records changes made while a session is open. Sessions nest: committing an inner session
    * folds its state into the enclosing one, and only the outermost commit makes changes permanent.
    * A session that goes out of scope without commit() reverts everything done under it.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ) : _db( db ) {}

         class session
         {
            public:
               session( session&& other ) : _undo( other._undo ), _active( other._active ) { other._active = false; }
               session( const session& ) = delete;
               session& operator=( const session& ) = delete;
               session& operator=( session&& ) = delete;

               ~session()
               {
                  if( !_active )
                     return;
                  try {
                     _undo.undo();
                  } catch( const fc::exception& e ) {
                     elog( "Could not revert session: ${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }

               void commit()
               {
                  if( _active )
                     _undo.commit();
                  _active = false;
               }

            private:
               friend class undo_database;
               session( undo_database& undo, bool active ) : _undo( undo ), _active( active ) {}

               undo_database& _undo;
               bool           _active;
         };

         void enable()  { _enabled = true; }
         void disable() { _enabled = false; }

         /// An inactive session is returned while the undo database is disabled
         session start_undo_session();

         /// Called after obj was created or restored
         void on_create( const object& obj );
         /// Called before obj changes; the first call per session saves a copy
         void on_modify( const object& obj );
         /// Called before obj is removed
         void on_remove( const object& obj );

         void set_max_size( size_t max_size ) { _max_size = max_size; }

      private:
         bool recording()const { return _enabled && _open_sessions > 0; }
         void undo();
         void commit();

         object_database&       _db;
         std::deque<undo_state> _stack;
         uint32_t               _open_sessions = 0;
         size_t                 _max_size = 256;
         bool                   _enabled = false;
   };

} } // tribunal::db

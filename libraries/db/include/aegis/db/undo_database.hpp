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
#include <aegis/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace aegis { namespace db {

   class object_database;

   /// Changes recorded by one undo session
   struct undo_state
   {
      /// values of objects before their first modification in this state
      std::unordered_map<object_id_type, unique_ptr<object> > old_values;
      /// next_id of each touched index before its first create in this state, keyed by space.type.0
      std::unordered_map<object_id_type, object_id_type>      old_index_next_ids;
      std::unordered_set<object_id_type>                      new_ids;
      std::unordered_map<object_id_type, unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief records object changes so that the most recent sessions can be rolled back
    *
    * Sessions nest.  Leaving a session without calling commit() or merge() undoes it;
    * merge() folds it into the enclosing session so that both roll back together.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo),_disable_on_exit(mv._disable_on_exit)
               {
                  mv._apply_undo = false;
                  mv._disable_on_exit = false;
               }
               session( const session& ) = delete;
               session& operator=( const session& ) = delete;

               ~session()
               {
                  if( _apply_undo )
                  {
                     try {
                        _db.undo();
                     } catch( const fc::exception& e ) {
                        // the state is inconsistent from here on
                        elog( "Rollback failed: ${e}", ("e",e.to_detail_string()) );
                        throw;
                     }
                  }
                  if( _disable_on_exit )
                     _db.disable();
               }

               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

            private:
               friend class undo_database;
               session( undo_database& db, bool apply_undo, bool disable_on_exit )
               : _db(db),_apply_undo(apply_undo),_disable_on_exit(disable_on_exit) {}

               undo_database& _db;
               bool _apply_undo = true;
               bool _disable_on_exit = false;
         };

         void    disable() { _disabled = true; }
         void    enable()  { _disabled = false; }
         bool    enabled()const { return !_disabled; }

         /**
          * Opens a new session.  While recording is disabled the returned session does nothing,
          * unless @p force_enable turns recording on for the session's lifetime.
          */
         session start_undo_session( bool force_enable = false );

         /// Called just after @p obj was created
         void on_create( const object& obj );
         /// Called just before @p obj is modified.  Objects created in the current state are not saved.
         void on_modify( const object& obj );
         /// Called just before @p obj is removed
         void on_remove( const object& obj );

         /// Forgets all recorded history; no session may be open
         void clear();

         std::size_t size()const { return _stack.size(); }

         /// Number of sessions that were started and are neither committed, merged nor undone
         uint32_t active_sessions()const { return _active_sessions; }

      private:
         void undo();
         void merge();
         void commit();

         undo_state& current_state();

         uint32_t                _active_sessions = 0;
         bool                    _disabled = true;
         std::deque<undo_state>  _stack;
         object_database&        _db;
         /// committed states kept before the oldest is dropped
         static constexpr size_t max_size = 256;
   };

} } // aegis::db

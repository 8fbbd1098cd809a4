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
#include <aegis/db/object_database.hpp>
#include <aegis/db/undo_database.hpp>

namespace aegis { namespace db {

undo_database::session undo_database::start_undo_session( bool force_enable )
{
   if( _disabled && !force_enable )
      return session( *this, false, false );

   const bool disable_on_exit = _disabled;
   _disabled = false;

   while( _stack.size() > max_size )
      _stack.pop_front();

   _stack.emplace_back();
   ++_active_sessions;
   return session( *this, true, disable_on_exit );
}

undo_state& undo_database::current_state()
{
   if( _stack.empty() )
      _stack.emplace_back();
   return _stack.back();
}

void undo_database::on_create( const object& obj )
{
   if( _disabled ) return;

   undo_state& state = current_state();
   const object_id_type index_id( obj.id.space(), obj.id.type(), 0 );
   // keep the next_id from before the first create only
   state.old_index_next_ids.emplace( index_id, obj.id );
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled ) return;

   undo_state& state = current_state();
   if( state.new_ids.count( obj.id ) || state.old_values.count( obj.id ) )
      return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled ) return;

   undo_state& state = current_state();
   if( state.new_ids.erase( obj.id ) )
      return;
   if( state.removed.count( obj.id ) )
      return;

   auto itr = state.old_values.find( obj.id );
   if( itr != state.old_values.end() )
   {
      state.removed[obj.id] = std::move( itr->second );
      state.old_values.erase( itr );
   }
   else
      state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled, "Undo history is not being recorded" );
   FC_ASSERT( _active_sessions > 0, "No open undo session" );
   disable();

   undo_state& state = _stack.back();
   for( auto& item : state.old_values )
   {
      const object& current = _db.get_object( item.second->id );
      _db.modify( current, [&item]( object& obj ){ obj.move_from( *item.second ); } );
   }

   for( const auto& id : state.new_ids )
      _db.remove( _db.get_object( id ) );

   for( const auto& item : state.old_index_next_ids )
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );

   _stack.pop_back();
   --_active_sessions;
   enable();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _active_sessions > 0, "No open undo session" );
   FC_ASSERT( _stack.size() >= 2, "Nothing to merge into" );

   undo_state& state = _stack.back();
   undo_state& prev_state = _stack[_stack.size()-2];

   for( auto& item : state.old_values )
   {
      const object_id_type id = item.first;
      if( prev_state.new_ids.count( id ) || prev_state.old_values.count( id ) )
         continue;
      prev_state.old_values[id] = std::move( item.second );
   }

   prev_state.new_ids.insert( state.new_ids.begin(), state.new_ids.end() );

   for( const auto& item : state.old_index_next_ids )
      prev_state.old_index_next_ids.emplace( item.first, item.second );

   for( auto& item : state.removed )
   {
      const object_id_type id = item.first;
      if( prev_state.new_ids.erase( id ) )
         continue;
      auto itr = prev_state.old_values.find( id );
      if( itr != prev_state.old_values.end() )
      {
         prev_state.removed[id] = std::move( itr->second );
         prev_state.old_values.erase( itr );
      }
      else
         prev_state.removed[id] = std::move( item.second );
   }

   _stack.pop_back();
   --_active_sessions;
}

void undo_database::commit()
{
   FC_ASSERT( _active_sessions > 0, "No open undo session" );
   --_active_sessions;
}

void undo_database::clear()
{
   FC_ASSERT( _active_sessions == 0, "Cannot drop undo history with ${n} open session(s)", ("n",_active_sessions) );
   _stack.clear();
}

} } // aegis::db

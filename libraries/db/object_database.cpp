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

namespace aegis { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   reset_indexes();
   _undo_db.enable();
}

void object_database::reset_indexes()
{
   _index.clear();
   _index.resize( max_index_slots );
}

void object_database::close()
{
   ilog( "Closing object database" );
   _undo_db.clear();
   reset_indexes();
}

const std::unique_ptr<index>& object_database::index_slot( uint8_t space_id, uint8_t type_id )const
{
   FC_ASSERT( space_id < _index.size() && type_id < _index[space_id].size() && _index[space_id][type_id],
              "Database index ${space_id}.${type_id} does not exist",
              ("space_id",space_id)("type_id",type_id) );
   return _index[space_id][type_id];
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   return *index_slot( space_id, type_id );
}

index& object_database::get_mutable_index( uint8_t space_id, uint8_t type_id )
{
   return *index_slot( space_id, type_id );
}

const object* object_database::find_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).find( id );
}

const object& object_database::get_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).get( id );
}

} } // namespace aegis::db

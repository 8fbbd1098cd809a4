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
#include <aegis/db/index.hpp>
#include <aegis/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <cassert>
#include <memory>
#include <vector>

namespace aegis { namespace db {

   /**
    *   @class object_database
    *   @brief in-memory object store addressed by space.type.instance ids
    *
    *   Objects live in one index per (space, type).  Every mutation made through create(),
    *   modify() or remove() is recorded by the undo database, so a session started with
    *   _undo_db can roll it back.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         /// Upper bound on both the number of spaces and the number of types per space
         static constexpr uint8_t max_index_slots = 255;

         /// Drops every index together with the objects in it
         void reset_indexes();

         /// Drops all objects and the undo history
         void close();

         template<typename IndexType>
         IndexType* add_index()
         {
            using ObjectType = typename IndexType::object_type;
            auto& space = _index[ObjectType::space_id];
            if( space.empty() )
               space.resize( max_index_slots );
            FC_ASSERT( !space[ObjectType::type_id], "Index ${s}.${t} already exists",
                       ("s",ObjectType::space_id)("t",ObjectType::type_id) );
            auto* result = new IndexType(*this);
            space[ObjectType::type_id].reset( result );
            return result;
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            return static_cast<const IndexType&>( get_index( IndexType::object_type::space_id,
                                                             IndexType::object_type::type_id ) );
         }
         const index& get_index( uint8_t space_id, uint8_t type_id )const;

         const object& get_object( const object_id_type& id )const;
         const object* find_object( const object_id_type& id )const;

         template<typename T>
         const T& get( const object_id_type& id )const
         {
            const object& obj = get_object( id );
            assert( nullptr != dynamic_cast<const T*>(&obj) );
            return static_cast<const T&>(obj);
         }
         template<typename T>
         const T* find( const object_id_type& id )const
         {
            return static_cast<const T*>( find_object( id ) );
         }

         template<uint8_t SpaceID, uint8_t TypeID>
         auto get( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<decltype(id)>&
         {
            return get<object_downcast_t<decltype(id)>>( object_id_type(id) );
         }
         template<uint8_t SpaceID, uint8_t TypeID>
         auto find( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<decltype(id)>*
         {
            return find<object_downcast_t<decltype(id)>>( object_id_type(id) );
         }

         /// @name Mutators
         /// All changes go through these so that they can be undone.
         /// @{
         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            index& idx = get_mutable_index( T::space_id, T::type_id );
            return static_cast<const T&>( idx.create( [&constructor]( object& o ) {
               constructor( static_cast<T&>(o) );
            } ) );
         }

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            get_mutable_index( obj.id.space(), obj.id.type() ).modify( obj, m );
         }

         void remove( const object& obj ) { get_mutable_index( obj.id.space(), obj.id.type() ).remove( obj ); }

         /// Puts back an object removed earlier; used when undoing
         const object& insert( object&& obj )
         {
            return get_mutable_index( obj.id.space(), obj.id.type() ).insert( std::move(obj) );
         }
         /// @}

      protected:
         index& get_mutable_index( uint8_t space_id, uint8_t type_id );

         undo_database                          _undo_db;

      private:
         friend class base_primary_index;
         friend class undo_database;

         const std::unique_ptr<index>& index_slot( uint8_t space_id, uint8_t type_id )const;

         std::vector< std::vector< std::unique_ptr<index> > >      _index;
   };

} } // aegis::db

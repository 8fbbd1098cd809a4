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
#include <fc/exception/exception.hpp>
#include <fc/io/varint.hpp>
#include <fc/string.hpp>

namespace aegis { namespace db {

   /**
    *  A space.type.instance triple packed into 64 bits: 8 bits of space, 8 bits of type
    *  and 48 bits of instance.  Every object in the ledger is addressed by one of these.
    */
   struct object_id_type
   {
      static constexpr uint8_t instance_bits = 48;
      static constexpr uint8_t type_and_instance_bits = 56;
      static constexpr uint64_t one_byte_mask = 0x00ff;
      static constexpr uint64_t max_instance = 0x0000ffffffffffff;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i ){ reset( s, t, i ); }

      void reset( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> instance_bits == 0, "instance overflow", ("instance",i) );
         number = ( (uint64_t(s) << type_and_instance_bits) | (uint64_t(t) << instance_bits) ) | i;
      }

      uint8_t  space()const      { return number >> type_and_instance_bits; }
      uint8_t  type()const       { return (number >> instance_bits) & one_byte_mask; }
      uint16_t space_type()const { return number >> instance_bits; }
      uint64_t instance()const   { return number & max_instance; }

      friend bool  operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool  operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool  operator < ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool  operator > ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      template< typename T >
      bool is() const
      {
         return space_type() == T::space_type;
      }

      /// "space.type.instance"
      explicit operator std::string() const
      {
         return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      /// Inverse of the string conversion
      static object_id_type from_string( const std::string& s )
      {
         const auto first_dot = s.find('.');
         FC_ASSERT( first_dot != std::string::npos && first_dot != 0, "Missing the space part of ${s}", ("s",s) );
         const auto second_dot = s.find( '.', first_dot + 1 );
         FC_ASSERT( second_dot != std::string::npos && second_dot != first_dot + 1,
                    "Missing the type part of ${s}", ("s",s) );
         const uint64_t space_id = fc::to_uint64( s.substr( 0, first_dot ) );
         const uint64_t type_id  = fc::to_uint64( s.substr( first_dot + 1, second_dot - first_dot - 1 ) );
         FC_ASSERT( space_id <= one_byte_mask && type_id <= one_byte_mask, "space or type overflow in ${s}", ("s",s) );
         return object_id_type( uint8_t(space_id), uint8_t(type_id), fc::to_uint64( s.substr( second_dot + 1 ) ) );
      }

      uint64_t number = 0;
   };

   class object;
   class object_database;

   /// Maps a typed id back to the object class stored under it, see AEGIS_MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };

#define AEGIS_MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace aegis { namespace db { \
   template<> \
   struct object_downcast<const aegis::db::object_id<OBJECT::space_id, \
                                                     OBJECT::type_id>&> { using type = OBJECT; }; \
   } }
   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t type_bits = 8;
      static constexpr uint8_t instance_bits = 48;

      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id = TypeID;

      static constexpr uint16_t space_type = uint16_t(uint16_t(space_id) << type_bits) | uint16_t(type_id);

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (i >> instance_bits) == 0, "instance overflow", ("instance",i) );
      }
      explicit object_id( const object_id_type& id ):instance(id.instance())
      {
         FC_ASSERT( id.is<object_id>(), "space or type mismatch", ("id",std::string(id)) );
      }

      object_id& operator=( const object_id_type& o )
      {
         *this = object_id(o);
         return *this;
      }

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance.value ); }

      template<typename DB>
      auto operator()(const DB& db)const -> const decltype(db.get(*this))& { return db.get(*this); }

      friend bool  operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool  operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool  operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }
      friend bool  operator != ( const object_id_type& a, const object_id& b ) { return a != object_id_type(b); }
      friend bool  operator == ( const object_id& a, const object_id_type& b ) { return object_id_type(a) == b; }
      friend bool  operator != ( const object_id& a, const object_id_type& b ) { return object_id_type(a) != b; }

      friend bool  operator < ( const object_id& a, const object_id& b )
      { return a.instance.value < b.instance.value; }
      friend bool  operator > ( const object_id& a, const object_id& b )
      { return a.instance.value > b.instance.value; }

      explicit operator std::string() const
      {
         return fc::to_string(space_id) + "." + fc::to_string(type_id) + "." + fc::to_string(instance.value);
      }

      fc::unsigned_int instance;
   };

} } // aegis::db

FC_REFLECT( aegis::db::object_id_type, (number) )

// object_id has two non-type template parameters, so it is reflected by hand
namespace fc {
template<uint8_t SpaceID, uint8_t TypeID>
struct get_typename<aegis::db::object_id<SpaceID,TypeID>>
{
   static const char* name() {
      static std::string _str = string("aegis::db::object_id<") + fc::to_string(SpaceID) + ":"
                                                                + fc::to_string(TypeID)  + ">";
      return _str.c_str();
   }
};

template<uint8_t SpaceID, uint8_t TypeID>
struct reflector<aegis::db::object_id<SpaceID,TypeID> >
{
    using type = aegis::db::object_id<SpaceID,TypeID>;
    using is_defined = std::true_type;
    using native_members = typelist::list<fc::field_reflection<0, type, unsigned_int, &type::instance>>;
    using inherited_members = typelist::list<>;
    using members = native_members;
    using base_classes = typelist::list<>;
    enum  member_count_enum {
      local_member_count = 1,
      total_member_count = 1
    };
    template<typename Visitor>
    static inline void visit( const Visitor& visitor )
    {
       using member_type = decltype(((type*)nullptr)->instance);
       visitor.TEMPLATE operator()<member_type,type,&type::instance>( "instance" );
    }
};
namespace member_names {
template<uint8_t S, uint8_t T>
struct member_name<aegis::db::object_id<S,T>, 0> { static constexpr const char* value = "instance"; };
}

 inline void to_variant( const aegis::db::object_id_type& var,  fc::variant& vo, uint32_t max_depth = 1 )
 {
    vo = std::string( var );
 }

 inline void from_variant( const fc::variant& var,  aegis::db::object_id_type& vo, uint32_t max_depth = 1 )
 {
    vo = aegis::db::object_id_type::from_string( var.get_string() );
 }

 template<uint8_t SpaceID, uint8_t TypeID>
 void to_variant( const aegis::db::object_id<SpaceID,TypeID>& var,  fc::variant& vo, uint32_t max_depth = 1 )
 {
    vo = std::string( var );
 }

 template<uint8_t SpaceID, uint8_t TypeID>
 void from_variant( const fc::variant& var,  aegis::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
 { try {
    aegis::db::object_id_type generic;
    from_variant( var, generic, max_depth );
    vo = aegis::db::object_id<SpaceID,TypeID>( generic );
 } FC_CAPTURE_AND_RETHROW( (var) ) }

} // namespace fc

namespace std {
     template <> struct hash<aegis::db::object_id_type>
     {
          size_t operator()(const aegis::db::object_id_type& x) const
          {
              return std::hash<uint64_t>()(x.number);
          }
     };
}

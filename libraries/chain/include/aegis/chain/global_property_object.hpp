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
#include <aegis/protocol/chain_parameters.hpp>
#include <aegis/chain/types.hpp>
#include <aegis/db/object.hpp>
#include <aegis/db/generic_index.hpp>

namespace aegis { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains global state information that is fixed at genesis
    * @ingroup object
    * @ingroup implementation
    */
   class global_property_object : public aegis::db::abstract_object<global_property_object,
                                     implementation_ids, impl_global_property_object_type>
   {
      public:
         chain_parameters  parameters;
         /// Receives marketplace fees and verifier fees nobody earned
         account_id_type   treasury_account;
         chain_id_type     chain_id;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state information that changes as transactions are applied
    * @ingroup object
    * @ingroup implementation
    */
   class dynamic_global_property_object : public aegis::db::abstract_object<dynamic_global_property_object,
                                             implementation_ids, impl_dynamic_global_property_object_type>
   {
      public:
         /// Number of transactions applied since genesis
         uint32_t          transaction_count = 0;
   };

   typedef aegis::db::generic_index< global_property_object,
      db::multi_index_container< global_property_object, db::indexed_by<
         db::ordered_unique< db::tag<db::by_id>, db::member< db::object, db::object_id_type, &db::object::id > >
      > >
   > global_property_index;

   typedef aegis::db::generic_index< dynamic_global_property_object,
      db::multi_index_container< dynamic_global_property_object, db::indexed_by<
         db::ordered_unique< db::tag<db::by_id>, db::member< db::object, db::object_id_type, &db::object::id > >
      > >
   > dynamic_global_property_index;
}}

AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::global_property_object)
AEGIS_MAP_OBJECT_ID_TO_TYPE(aegis::chain::dynamic_global_property_object)

FC_REFLECT_DERIVED( aegis::chain::global_property_object, (aegis::db::object),
                    (parameters)(treasury_account)(chain_id) )
FC_REFLECT_DERIVED( aegis::chain::dynamic_global_property_object, (aegis::db::object),
                    (transaction_count) )

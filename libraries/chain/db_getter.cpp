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
#include <aegis/chain/database.hpp>

#include <aegis/chain/account_object.hpp>
#include <aegis/chain/global_property_object.hpp>

namespace aegis { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties() const
{
   return get( dynamic_global_property_id_type() );
}

const chain_parameters& database::get_chain_parameters()const
{
   return get_global_properties().parameters;
}

const chain_id_type& database::get_chain_id()const
{
   return get_global_properties().chain_id;
}

account_id_type database::get_treasury_account()const
{
   return get_global_properties().treasury_account;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& accounts_by_name = get_index_type< primary_index<account_index> >().indices().get<by_name>();
   auto itr = accounts_by_name.find( name );
   if( itr == accounts_by_name.end() )
      return nullptr;
   return &*itr;
}

const account_object& database::get_account_by_name( const string& name )const
{
   const account_object* account = find_account_by_name( name );
   FC_ASSERT( account != nullptr, "Unable to find account ${name}", ("name", name) );
   return *account;
}

node_property_object& database::node_properties()
{
   return _node_property_object;
}

const node_property_object& database::get_node_properties()const
{
   return _node_property_object;
}

} }

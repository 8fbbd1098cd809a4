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
#include <aegis/protocol/account.hpp>

namespace aegis { namespace protocol {

namespace {
   bool is_lower_alpha( char c ) { return c >= 'a' && c <= 'z'; }
   bool is_digit( char c )       { return c >= '0' && c <= '9'; }
}

bool is_valid_name( const string& name )
{
   const size_t len = name.size();
   if( len < AEGIS_MIN_ACCOUNT_NAME_LENGTH || len > AEGIS_MAX_ACCOUNT_NAME_LENGTH )
      return false;

   size_t begin = 0;
   while( true )
   {
      size_t end = name.find_first_of( '.', begin );
      if( end == std::string::npos )
         end = len;
      if( end - begin < 3 )
         return false;
      if( !is_lower_alpha( name[begin] ) )
         return false;
      if( !is_lower_alpha( name[end-1] ) && !is_digit( name[end-1] ) )
         return false;
      for( size_t i = begin+1; i < end-1; ++i )
      {
         const char c = name[i];
         if( !is_lower_alpha( c ) && !is_digit( c ) && c != '-' )
            return false;
      }
      if( end == len )
         break;
      begin = end+1;
   }
   return true;
}

void account_create_operation::validate()const
{
   FC_ASSERT( is_valid_name( name ), "Invalid account name ${n}", ("n", name) );
   FC_ASSERT( !key.is_null(), "New accounts need a signing key" );
}

} } // aegis::protocol

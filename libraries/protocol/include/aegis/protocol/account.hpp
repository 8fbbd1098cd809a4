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
#include <aegis/protocol/base.hpp>

namespace aegis { namespace protocol {

   /**
    * Names are made of dot separated labels.  Each label is at least three characters long,
    * starts with a lowercase letter, ends with a letter or digit and otherwise holds only
    * lowercase letters, digits and dashes.
    */
   bool is_valid_name( const string& s );

   /**
    *  @ingroup operations
    *  Registers a new principal.  The registrar signs on its behalf; afterwards only
    *  signatures by @ref key act for the new account.
    */
   struct account_create_operation : public base_operation
   {
      account_id_type   registrar;
      string            name;
      public_key_type   key;

      void validate()const;
      void get_required_active_authorities( flat_set<account_id_type>& a )const{ a.insert(registrar); }
   };

} } // aegis::protocol

FC_REFLECT( aegis::protocol::account_create_operation, (registrar)(name)(key) )

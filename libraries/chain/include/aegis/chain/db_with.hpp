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

#include <aegis/chain/database.hpp>

/*
 * Scoped changes to database settings.  Each helper restores the previous value
 * when it goes out of scope, also when an exception leaves the scope.
 */

namespace aegis { namespace chain { namespace detail {

/// Puts back the skip flags that were active before with_skip_flags()
struct skip_flags_restorer
{
   skip_flags_restorer( node_property_object& npo, uint32_t old_skip_flags )
      : _npo( npo ), _old_skip_flags( old_skip_flags )
   {}

   ~skip_flags_restorer()
   {
      _npo.skip_flags = _old_skip_flags;
   }

   node_property_object& _npo;
   uint32_t _old_skip_flags;
};

/**
 * Raises the payout flag for the lifetime of the guard.  Escrow evaluators refuse to run
 * while it is raised.
 */
struct escrow_payout_guard
{
   explicit escrow_payout_guard( bool& flag )
      : _flag( flag ), _old_value( flag )
   {
      _flag = true;
   }

   ~escrow_payout_guard()
   {
      _flag = _old_value;
   }

   bool& _flag;
   bool  _old_value;
};

/// Runs @p callback with @p skip_flags in effect
template< typename Lambda >
void with_skip_flags( database& db, uint32_t skip_flags, Lambda callback )
{
   node_property_object& npo = db.node_properties();
   skip_flags_restorer restorer( npo, npo.skip_flags );
   npo.skip_flags = skip_flags;
   callback();
}

} } } // aegis::chain::detail

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
#include <aegis/chain/genesis_state.hpp>

#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>
#include <fc/log/logger.hpp>

namespace aegis { namespace chain {

chain_id_type genesis_state_type::compute_chain_id() const
{
   chain_id_type::encoder enc;
   fc::raw::pack( enc, *this );
   return enc.result();
}

genesis_state_type load_genesis_state( const fc::path& genesis_file )
{ try {
   FC_ASSERT( fc::exists( genesis_file ), "Genesis file '${f}' does not exist", ("f", genesis_file.generic_string()) );
   ilog( "Loading genesis state from ${f}", ("f", genesis_file.generic_string()) );
   return fc::json::from_file( genesis_file ).as<genesis_state_type>( AEGIS_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW( (genesis_file) ) }

} } // aegis::chain

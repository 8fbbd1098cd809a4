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
#include <aegis/protocol/types.hpp>

namespace aegis { namespace protocol {

   struct chain_parameters
   {
      /// upper bound on the verifier list of a single escrow, never above AEGIS_MAX_ESCROW_VERIFIERS
      uint8_t  max_escrow_verifiers             = AEGIS_DEFAULT_MAX_ESCROW_VERIFIERS;
      uint16_t max_operations_per_transaction   = AEGIS_DEFAULT_MAX_OPERATIONS_PER_TRANSACTION;

      void validate()const;
   };

} }  // aegis::protocol

FC_REFLECT( aegis::protocol::chain_parameters,
            (max_escrow_verifiers)
            (max_operations_per_transaction)
          )

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

#define AEGIS_ADDRESS_PREFIX "AGS"

#define AEGIS_MIN_ACCOUNT_NAME_LENGTH 1
#define AEGIS_MAX_ACCOUNT_NAME_LENGTH 63

#define AEGIS_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)

/** Basis point denominator used by every fee rate */
#define AEGIS_100_PERCENT 10000

/**
 * Approval counters are 8 bits wide, so a single escrow can name at most this many verifiers.
 * chain_parameters::max_escrow_verifiers may lower it but never raise it.
 */
#define AEGIS_MAX_ESCROW_VERIFIERS 255
#define AEGIS_DEFAULT_MAX_ESCROW_VERIFIERS 255
#define AEGIS_DEFAULT_MAX_OPERATIONS_PER_TRANSACTION 64

#define AEGIS_MAX_NESTED_OBJECTS (200)

#define AEGIS_DEFAULT_TREASURY_ACCOUNT_NAME "treasury"

/// Represents the canonical "zero address": it exists from genesis, holds no key and can never sign
#define AEGIS_NULL_ACCOUNT (aegis::protocol::account_id_type(0))
#define AEGIS_NULL_ACCOUNT_NAME "null-account"

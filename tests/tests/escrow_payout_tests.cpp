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
#include <boost/test/unit_test.hpp>

#include <aegis/chain/escrow_payout.hpp>

#include <fc/exception/exception.hpp>

#include <limits>

using namespace aegis::chain;

BOOST_AUTO_TEST_SUITE( escrow_payout_tests )

BOOST_AUTO_TEST_CASE( bps_fee_rounds_down )
{
   BOOST_CHECK_EQUAL( calculate_bps_fee( 1000000, 500 ).value, 50000 );
   BOOST_CHECK_EQUAL( calculate_bps_fee( 1000050, 500 ).value, 50002 );
   BOOST_CHECK_EQUAL( calculate_bps_fee( 99, 100 ).value, 0 );
   BOOST_CHECK_EQUAL( calculate_bps_fee( 12345, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( calculate_bps_fee( 12345, AEGIS_100_PERCENT ).value, 12345 );
   BOOST_CHECK_THROW( calculate_bps_fee( 100, AEGIS_100_PERCENT + 1 ), fc::exception );
}

BOOST_AUTO_TEST_CASE( bps_fee_does_not_overflow )
{
   // amount * bps exceeds 64 bits here
   const share_type amount = AEGIS_MAX_SHARE_SUPPLY;
   BOOST_CHECK_EQUAL( calculate_bps_fee( amount, 9999 ).value, AEGIS_MAX_SHARE_SUPPLY / 10000 * 9999 );
   const share_type huge = std::numeric_limits<int64_t>::max();
   BOOST_CHECK_EQUAL( calculate_bps_fee( huge, AEGIS_100_PERCENT ).value, std::numeric_limits<int64_t>::max() );
   BOOST_CHECK_EQUAL( calculate_bps_fee( huge, 5000 ).value, std::numeric_limits<int64_t>::max() / 2 );
}

BOOST_AUTO_TEST_CASE( release_split )
{
   const escrow_split split = calculate_escrow_release_split( 1000000, 500, 200 );
   BOOST_CHECK_EQUAL( split.marketplace_fee.value, 50000 );
   BOOST_CHECK_EQUAL( split.verifier_fee.value, 20000 );
   BOOST_CHECK_EQUAL( split.principal.value, 930000 );

   const escrow_split odd = calculate_escrow_release_split( 1000050, 500, 200 );
   BOOST_CHECK_EQUAL( odd.marketplace_fee.value, 50002 );
   BOOST_CHECK_EQUAL( odd.verifier_fee.value, 20001 );
   BOOST_CHECK_EQUAL( odd.principal.value, 930047 );
   BOOST_CHECK_EQUAL( ( odd.principal + odd.marketplace_fee + odd.verifier_fee ).value, 1000050 );

   const escrow_split everything = calculate_escrow_release_split( 777, 6000, 4000 );
   BOOST_CHECK_EQUAL( everything.principal.value, 1 );
   BOOST_CHECK_EQUAL( ( everything.principal + everything.marketplace_fee + everything.verifier_fee ).value, 777 );

   BOOST_CHECK_THROW( calculate_escrow_release_split( 1000, 6000, 4001 ), fc::exception );
}

BOOST_AUTO_TEST_CASE( refund_split_takes_no_marketplace_fee )
{
   const escrow_split split = calculate_escrow_refund_split( 500000, 200 );
   BOOST_CHECK_EQUAL( split.marketplace_fee.value, 0 );
   BOOST_CHECK_EQUAL( split.verifier_fee.value, 10000 );
   BOOST_CHECK_EQUAL( split.principal.value, 490000 );

   const escrow_split free_refund = calculate_escrow_refund_split( 500000, 0 );
   BOOST_CHECK_EQUAL( free_refund.verifier_fee.value, 0 );
   BOOST_CHECK_EQUAL( free_refund.principal.value, 500000 );
}

BOOST_AUTO_TEST_CASE( verifier_fee_remainder_goes_to_first_entries )
{
   vector<share_type> even = split_verifier_fee( 20000, 2 );
   BOOST_REQUIRE_EQUAL( even.size(), 2u );
   BOOST_CHECK_EQUAL( even[0].value, 10000 );
   BOOST_CHECK_EQUAL( even[1].value, 10000 );

   vector<share_type> odd = split_verifier_fee( 20001, 2 );
   BOOST_REQUIRE_EQUAL( odd.size(), 2u );
   BOOST_CHECK_EQUAL( odd[0].value, 10001 );
   BOOST_CHECK_EQUAL( odd[1].value, 10000 );

   vector<share_type> three = split_verifier_fee( 11, 3 );
   BOOST_REQUIRE_EQUAL( three.size(), 3u );
   BOOST_CHECK_EQUAL( three[0].value, 4 );
   BOOST_CHECK_EQUAL( three[1].value, 4 );
   BOOST_CHECK_EQUAL( three[2].value, 3 );

   vector<share_type> dust = split_verifier_fee( 2, 5 );
   BOOST_REQUIRE_EQUAL( dust.size(), 5u );
   share_type total;
   for( const auto& s : dust )
      total += s;
   BOOST_CHECK_EQUAL( total.value, 2 );
   BOOST_CHECK_EQUAL( dust[0].value, 1 );
   BOOST_CHECK_EQUAL( dust[1].value, 1 );
   BOOST_CHECK_EQUAL( dust[4].value, 0 );

   BOOST_CHECK( split_verifier_fee( 100, 0 ).empty() );
}

BOOST_AUTO_TEST_CASE( verifier_fee_split_is_exact_for_many_verifiers )
{
   for( size_t count = 1; count <= AEGIS_MAX_ESCROW_VERIFIERS; count += 17 )
   {
      const share_type fee = 1000003;
      vector<share_type> shares = split_verifier_fee( fee, count );
      BOOST_REQUIRE_EQUAL( shares.size(), count );
      share_type total;
      for( const auto& s : shares )
         total += s;
      BOOST_CHECK_EQUAL( total.value, fee.value );
      BOOST_CHECK( shares.front() - shares.back() <= 1 );
   }
}

BOOST_AUTO_TEST_SUITE_END()

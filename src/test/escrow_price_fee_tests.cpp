// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Price and Fee Arithmetic Tests
 *
 * - ParsePrice accepts "2", "2.5", "5/2" and rejects malformed input
 * - Price comparison and reduction are exact
 * - SrcFloor / DstCeil round toward the maker and detect overflow
 * - FeeFloor never exceeds the notional
 * - AddNoOverflow / AddPipsNoOverflow detect overflow
 */

#include "amount.h"
#include "escrow/fees.h"
#include "escrow/price.h"
#include "test/test_escrow.h"

#include <boost/test/unit_test.hpp>
#include <limits>

BOOST_FIXTURE_TEST_SUITE(escrow_price_fee_tests, BasicTestingSetup)

// =============================================================================
// ParsePrice
// =============================================================================

BOOST_AUTO_TEST_CASE(parse_price_integer_and_decimal)
{
    Price price;
    BOOST_CHECK(ParsePrice("2", price));
    BOOST_CHECK(price == Price(2, 1));

    BOOST_CHECK(ParsePrice("2.5", price));
    BOOST_CHECK_EQUAL(price.nNumerator, 5U);
    BOOST_CHECK_EQUAL(price.nDenominator, 2U);

    // Trailing zeros reduce away
    BOOST_CHECK(ParsePrice("2.500", price));
    BOOST_CHECK(price == Price(5, 2));

    BOOST_CHECK(ParsePrice("0.000001", price));
    BOOST_CHECK(price == Price(1, 1000000));
}

BOOST_AUTO_TEST_CASE(parse_price_fraction)
{
    Price price;
    BOOST_CHECK(ParsePrice("5/2", price));
    BOOST_CHECK(price == Price(5, 2));

    BOOST_CHECK(ParsePrice("4/2", price));
    BOOST_CHECK(price == Price(2, 1));

    BOOST_CHECK(!ParsePrice("5/0", price));
    BOOST_CHECK(!ParsePrice("/2", price));
    BOOST_CHECK(!ParsePrice("5/", price));
}

BOOST_AUTO_TEST_CASE(parse_price_rejects_malformed)
{
    Price price;
    BOOST_CHECK(!ParsePrice("", price));
    BOOST_CHECK(!ParsePrice("-2", price));
    BOOST_CHECK(!ParsePrice("+2", price));
    BOOST_CHECK(!ParsePrice("+4/+2", price));
    BOOST_CHECK(!ParsePrice("4/+2", price));
    BOOST_CHECK(!ParsePrice("-4/2", price));
    BOOST_CHECK(!ParsePrice("2e3", price));
    BOOST_CHECK(!ParsePrice(".5", price));
    BOOST_CHECK(!ParsePrice("2.", price));
    BOOST_CHECK(!ParsePrice("1.2.3", price));
    BOOST_CHECK(!ParsePrice(" 2", price));
    // 19 fractional digits
    BOOST_CHECK(!ParsePrice("0.0000000000000000001", price));
    // Above 64 bits
    BOOST_CHECK(!ParsePrice("18446744073709551616", price));
}

BOOST_AUTO_TEST_CASE(parse_price_zero_is_parsed)
{
    Price price(7, 1);
    BOOST_CHECK(ParsePrice("0", price));
    BOOST_CHECK(price.IsZero());
}

BOOST_AUTO_TEST_CASE(price_to_string)
{
    BOOST_CHECK_EQUAL(Price(2, 1).ToString(), "2");
    BOOST_CHECK_EQUAL(Price(5, 2).ToString(), "2.5");
    BOOST_CHECK_EQUAL(Price(1, 1000000).ToString(), "0.000001");
    BOOST_CHECK_EQUAL(Price(1, 3).ToString(), "1/3");
}

// =============================================================================
// Price arithmetic
// =============================================================================

BOOST_AUTO_TEST_CASE(price_comparison_is_exact)
{
    BOOST_CHECK(Price(1, 3) < Price(34, 100));
    BOOST_CHECK(!(Price(34, 100) < Price(1, 3)));
    BOOST_CHECK(Price(2, 1) >= Price(4, 2));
    BOOST_CHECK(Price(2, 1) == Price(4, 2));

    // Cross-multiplication must not overflow 64 bits
    const uint64_t nMax = std::numeric_limits<uint64_t>::max();
    BOOST_CHECK(Price(nMax - 1, nMax) < Price(1, 1));
}

BOOST_AUTO_TEST_CASE(src_floor_and_dst_ceil_rounding)
{
    const Price price(5, 2); // 2.5 dst per src
    Amount nSrc = 0;
    BOOST_CHECK(price.SrcFloor(101, nSrc));
    BOOST_CHECK_EQUAL(nSrc, 40U); // floor(101 / 2.5)

    Amount nDst = 0;
    BOOST_CHECK(price.DstCeil(41, nDst));
    BOOST_CHECK_EQUAL(nDst, 103U); // ceil(102.5)

    BOOST_CHECK(price.DstCeil(40, nDst));
    BOOST_CHECK_EQUAL(nDst, 100U);
}

BOOST_AUTO_TEST_CASE(price_arithmetic_overflow)
{
    const Amount nMax = std::numeric_limits<Amount>::max();
    Amount nOut = 0;
    BOOST_CHECK(!Price(2, 1).DstCeil(nMax, nOut));
    BOOST_CHECK(Price(1, 2).DstCeil(nMax, nOut));
    BOOST_CHECK_EQUAL(nOut, nMax / 2 + 1);

    BOOST_CHECK(!Price(1, 2).SrcFloor(nMax, nOut));
    BOOST_CHECK(!Price().SrcFloor(100, nOut));
}

// =============================================================================
// Fees
// =============================================================================

BOOST_AUTO_TEST_CASE(fee_floor_rounds_down)
{
    BOOST_CHECK_EQUAL(FeeFloor(2000, 5000), 10U);          // 0.5%
    BOOST_CHECK_EQUAL(FeeFloor(199, ONE_PERCENT), 1U);     // 1.99 -> 1
    BOOST_CHECK_EQUAL(FeeFloor(99, ONE_PERCENT), 0U);
    BOOST_CHECK_EQUAL(FeeFloor(1000, PIPS_DENOMINATOR), 1000U);

    const Amount nMax = std::numeric_limits<Amount>::max();
    BOOST_CHECK_EQUAL(FeeFloor(nMax, MAX_TOTAL_FEE_PIPS), nMax / 4);
}

BOOST_AUTO_TEST_CASE(pips_constants_and_format)
{
    BOOST_CHECK_EQUAL(ONE_BIP, 100U);
    BOOST_CHECK_EQUAL(ONE_PERCENT, 10000U);
    BOOST_CHECK_EQUAL(MAX_TOTAL_FEE_PIPS, 250000U);
    BOOST_CHECK_EQUAL(FormatPips(5000), "0.5%");
    BOOST_CHECK_EQUAL(FormatPips(ONE_PERCENT), "1%");
    BOOST_CHECK_EQUAL(FormatPips(1), "0.0001%");
    BOOST_CHECK_EQUAL(FormatPips(0), "0%");
}

BOOST_AUTO_TEST_CASE(add_no_overflow)
{
    Amount nResult = 0;
    BOOST_CHECK(AddNoOverflow(100, 200, nResult));
    BOOST_CHECK_EQUAL(nResult, 300U);

    const Amount nMax = std::numeric_limits<Amount>::max();
    BOOST_CHECK(AddNoOverflow(nMax - 1, 1, nResult));
    BOOST_CHECK_EQUAL(nResult, nMax);
    BOOST_CHECK(!AddNoOverflow(nMax, 1, nResult));

    Pips nPips = 0;
    BOOST_CHECK(AddPipsNoOverflow(1, 2, nPips));
    BOOST_CHECK_EQUAL(nPips, 3U);
    BOOST_CHECK(!AddPipsNoOverflow(std::numeric_limits<Pips>::max(), 1, nPips));
}

BOOST_AUTO_TEST_SUITE_END()

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_PRICE_H
#define ESCROWSWAP_ESCROW_PRICE_H

#include "amount.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

/** Most fractional digits accepted by ParsePrice ("0.000000000000000001") */
static const unsigned int PRICE_MAX_DECIMALS = 18;

/**
 * Price - Exact exchange rate, destination units per one source unit
 *
 * Carried as a reduced rational numerator/denominator so that "2", "2.0" and
 * "4/2" are the same price (and the same fingerprint). No floating point is
 * involved anywhere: conversions multiply in WideAmount and range-check the
 * result before narrowing back to Amount.
 */
struct Price
{
    uint64_t nNumerator;
    uint64_t nDenominator;

    Price() : nNumerator(0), nDenominator(1) {}
    Price(uint64_t numerator, uint64_t denominator);

    bool IsZero() const { return nNumerator == 0; }
    bool IsValid() const { return nDenominator != 0; }

    /**
     * SrcFloor - Source units bought by dstAmount: floor(dst / price)
     *
     * @return false on zero price or if the result does not fit in Amount
     */
    bool SrcFloor(Amount dstAmount, Amount& srcOut) const;

    /**
     * DstCeil - Destination units owed for srcAmount: ceil(src * price)
     *
     * Rounds toward the maker so repeated small fills cannot leak value.
     * @return false if the result does not fit in Amount
     */
    bool DstCeil(Amount srcAmount, Amount& dstOut) const;

    /** "2.5" for decimal-representable prices, "1/3" otherwise */
    std::string ToString() const;

    friend bool operator<(const Price& a, const Price& b);
    friend bool operator==(const Price& a, const Price& b)
    {
        return a.nNumerator == b.nNumerator && a.nDenominator == b.nDenominator;
    }
    friend bool operator!=(const Price& a, const Price& b) { return !(a == b); }
    friend bool operator>=(const Price& a, const Price& b) { return !(a < b); }

    SERIALIZE_METHODS(Price, obj)
    {
        READWRITE(obj.nNumerator, obj.nDenominator);
    }
};

/**
 * ParsePrice - Parse "2", "2.5" or "5/2" into an exact reduced Price
 *
 * Rejects signs, exponents, empty strings, zero denominators, more than
 * PRICE_MAX_DECIMALS fractional digits and values that do not fit in 64 bits.
 * A zero price parses successfully; CheckEscrowParams() rejects it.
 */
bool ParsePrice(const std::string& str, Price& priceOut);

#endif // ESCROWSWAP_ESCROW_PRICE_H

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/price.h"

#include "utilstrencodings.h"
#include "util/format.h"

#include <ctype.h>

static bool IsDigits(const std::string& str)
{
    if (str.empty()) return false;
    for (char c : str) {
        if (!isdigit((unsigned char)c)) return false;
    }
    return true;
}

static uint64_t GCD(uint64_t a, uint64_t b)
{
    while (b != 0) {
        uint64_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

Price::Price(uint64_t numerator, uint64_t denominator) : nNumerator(numerator), nDenominator(denominator)
{
    if (nDenominator == 0) {
        // invalid, left as is so IsValid() reports it
        return;
    }
    if (nNumerator == 0) {
        nDenominator = 1;
        return;
    }
    uint64_t g = GCD(nNumerator, nDenominator);
    nNumerator /= g;
    nDenominator /= g;
}

bool Price::SrcFloor(Amount dstAmount, Amount& srcOut) const
{
    if (IsZero() || !IsValid()) {
        return false;
    }
    WideAmount src = static_cast<WideAmount>(dstAmount) * nDenominator / nNumerator;
    if (!AmountRange(src)) {
        return false;
    }
    srcOut = static_cast<Amount>(src);
    return true;
}

bool Price::DstCeil(Amount srcAmount, Amount& dstOut) const
{
    if (!IsValid()) {
        return false;
    }
    WideAmount product = static_cast<WideAmount>(srcAmount) * nNumerator;
    WideAmount dst = product / nDenominator;
    if (product % nDenominator != 0) {
        dst += 1;
    }
    if (!AmountRange(dst)) {
        return false;
    }
    dstOut = static_cast<Amount>(dst);
    return true;
}

bool operator<(const Price& a, const Price& b)
{
    // a.n / a.d < b.n / b.d  <=>  a.n * b.d < b.n * a.d (denominators are positive)
    return static_cast<WideAmount>(a.nNumerator) * b.nDenominator <
           static_cast<WideAmount>(b.nNumerator) * a.nDenominator;
}

std::string Price::ToString() const
{
    if (!IsValid()) {
        return "invalid";
    }

    // Smallest power of ten the denominator divides, if any within range
    uint64_t nScale = 1;
    unsigned int nDecimals = 0;
    while (nScale % nDenominator != 0 && nDecimals < PRICE_MAX_DECIMALS) {
        nScale *= 10;
        nDecimals++;
    }
    if (nScale % nDenominator != 0) {
        return strprintf("%d/%d", nNumerator, nDenominator);
    }

    WideAmount scaled = static_cast<WideAmount>(nNumerator) * (nScale / nDenominator);
    uint64_t nWhole = nNumerator / nDenominator;
    std::string str = strprintf("%d", nWhole);
    if (nDecimals > 0) {
        uint64_t nFrac = static_cast<uint64_t>(scaled % nScale);
        std::string strFrac = strprintf("%d", nFrac);
        str += "." + std::string(nDecimals - strFrac.size(), '0') + strFrac;
    }
    return str;
}

bool ParsePrice(const std::string& str, Price& priceOut)
{
    if (str.empty()) {
        return false;
    }

    size_t nSlash = str.find('/');
    if (nSlash != std::string::npos) {
        uint64_t num = 0;
        uint64_t den = 0;
        if (!IsDigits(str.substr(0, nSlash)) || !IsDigits(str.substr(nSlash + 1))) {
            return false;
        }
        if (!ParseUInt64(str.substr(0, nSlash), &num) ||
            !ParseUInt64(str.substr(nSlash + 1), &den) || den == 0) {
            return false;
        }
        priceOut = Price(num, den);
        return true;
    }

    std::string strWhole = str;
    std::string strFrac;
    size_t nDot = str.find('.');
    if (nDot != std::string::npos) {
        strWhole = str.substr(0, nDot);
        strFrac = str.substr(nDot + 1);
        if (strFrac.empty() || strFrac.size() > PRICE_MAX_DECIMALS) {
            return false;
        }
    }
    if (!IsDigits(strWhole) || (nDot != std::string::npos && !IsDigits(strFrac))) {
        return false;
    }

    uint64_t den = 1;
    for (size_t i = 0; i < strFrac.size(); i++) {
        den *= 10;
    }

    uint64_t whole = 0;
    uint64_t frac = 0;
    if (!ParseUInt64(strWhole, &whole)) {
        return false;
    }
    if (!strFrac.empty() && !ParseUInt64(strFrac, &frac)) {
        return false;
    }

    WideAmount num = static_cast<WideAmount>(whole) * den + frac;
    if (!AmountRange(num)) {
        return false;
    }

    priceOut = Price(static_cast<uint64_t>(num), den);
    return true;
}

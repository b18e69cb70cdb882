// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/fees.h"

#include "util/format.h"

#include <limits>

Amount FeeFloor(Amount amount, Pips pips)
{
    // amount * pips fits in 96 bits, so WideAmount cannot overflow
    WideAmount fee = static_cast<WideAmount>(amount) * pips / PIPS_DENOMINATOR;
    return static_cast<Amount>(fee);
}

bool AddPipsNoOverflow(Pips a, Pips b, Pips& result)
{
    uint64_t sum = static_cast<uint64_t>(a) + b;
    if (sum > std::numeric_limits<Pips>::max()) {
        return false;
    }
    result = static_cast<Pips>(sum);
    return true;
}

std::string FormatPips(Pips pips)
{
    std::string str = strprintf("%d.%04d", pips / ONE_PERCENT, pips % ONE_PERCENT);
    // Trim trailing zeros of the fractional part ("0.5000" -> "0.5", "1.0000" -> "1")
    size_t nLast = str.find_last_not_of('0');
    str.erase(nLast + 1);
    if (!str.empty() && str.back() == '.') {
        str.pop_back();
    }
    return str + "%";
}

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"

#include "logging.h"

bool AddNoOverflow(Amount a, Amount b, Amount& result)
{
    WideAmount sum = static_cast<WideAmount>(a) + static_cast<WideAmount>(b);

    if (!AmountRange(sum)) {
        LogPrintf("ERROR: AddNoOverflow: overflow a=%d b=%d\n", a, b);
        return false;
    }

    result = static_cast<Amount>(sum);
    return true;
}

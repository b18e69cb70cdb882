// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_FEES_H
#define ESCROWSWAP_ESCROW_FEES_H

#include "amount.h"

#include <map>
#include <stdint.h>
#include <string>

/**
 * Pips - fixed-point fee rate, 1 pip = 1/1_000_000 of notional
 *
 *   1 bip      =    100 pips
 *   1 percent  = 10_000 pips
 */
typedef uint32_t Pips;

static const Pips ONE_PIP = 1;
static const Pips ONE_BIP = 100 * ONE_PIP;
static const Pips ONE_PERCENT = 100 * ONE_BIP;
static const Pips PIPS_DENOMINATOR = 100 * ONE_PERCENT;

/** Cap on protocol fee + surplus fee + all integrator fees (25%) */
static const Pips MAX_TOTAL_FEE_PIPS = 25 * ONE_PERCENT;

/**
 * FeeFloor - floor(amount * pips / 1_000_000)
 *
 * Never exceeds amount for pips <= PIPS_DENOMINATOR; rounding favors the
 * payer so the fee split can never take more than the notional.
 */
Amount FeeFloor(Amount amount, Pips pips);

/**
 * AddPipsNoOverflow - Sum fee rates without wrapping uint32
 *
 * @return false if the sum does not fit in Pips
 */
bool AddPipsNoOverflow(Pips a, Pips b, Pips& result);

/** Render pips as a percentage string, e.g. 5000 -> "0.5%" */
std::string FormatPips(Pips pips);

#endif // ESCROWSWAP_ESCROW_FEES_H

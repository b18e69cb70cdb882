// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_AMOUNT_H
#define ESCROWSWAP_AMOUNT_H

#include <stdint.h>
#include <limits>

/**
 * Amount in the asset's native base unit.
 *
 * Escrowed assets are unsigned: there is no negative balance anywhere in the
 * engine, and every subtraction is guarded by the caller.
 */
typedef uint64_t Amount;

/** Widened type for products of two amounts (price and fee arithmetic) */
typedef unsigned __int128 WideAmount;

static const Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

inline bool AmountRange(const WideAmount& nValue) { return nValue <= static_cast<WideAmount>(MAX_AMOUNT); }

/**
 * AddNoOverflow - Overflow-safe Amount addition
 *
 * @return false (result untouched) if a + b exceeds MAX_AMOUNT
 */
bool AddNoOverflow(Amount a, Amount b, Amount& result);

#endif // ESCROWSWAP_AMOUNT_H

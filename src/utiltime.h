// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_UTILTIME_H
#define ESCROWSWAP_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime - Current time in seconds since epoch, or the mock time if set.
 *
 * Escrow deadlines are evaluated against this clock only, so tests move time
 * with SetMockTime() instead of sleeping.
 */
int64_t GetTime();

/** For testing. 0 restores the system clock */
void SetMockTime(int64_t nMockTimeIn);

/**
 * ISO 8601 formatting is preferred. Use the FormatISO8601{DateTime,Date}
 * helper functions if possible.
 */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // ESCROWSWAP_UTILTIME_H

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_LEDGER_H
#define ESCROWSWAP_ESCROW_LEDGER_H

/**
 * Escrow Ledger - Mutable accounting state of one escrow instance
 *
 * Lifetime is exactly Init() .. cleanup: the ledger is created with the
 * parameter fingerprint and reaches the terminal CLEANED status once every
 * obligation is settled. The deadline is kept beside the fingerprint so that
 * transfer callbacks, which carry no params, can still auto-close.
 *
 * Lost-and-found:
 * - nDstLost: maker payouts whose transfer failed or came back ambiguous
 * - nSrcLost: maker source refunds whose transfer failed
 * - nDstRetrying / nSrcRetrying: part of the lost amount currently being
 *   re-sent by a sweep; a second sweep only re-sends lost - retrying
 *
 * Invariants:
 * - nDstRetrying <= nDstLost, nSrcRetrying <= nSrcLost
 * - CLEANED only if closed, nSrcRemaining == 0, nothing lost, nInFlight == 0
 */

#include "amount.h"
#include "uint256.h"

#include <stdint.h>
#include <string>

class CValidationState;

enum class EscrowStatus : uint8_t {
    OPEN = 0,
    CLOSED = 1,
    CLEANED = 2,
};

/** Which asset a lost-and-found entry is denominated in */
enum class EscrowSide : uint8_t {
    DST = 0,
    SRC = 1,
};

std::string EscrowStatusToString(EscrowStatus status);
std::string EscrowSideToString(EscrowSide side);

struct EscrowLedger
{
    uint256 paramsHash;
    int64_t nDeadline;
    Amount nSrcRemaining;
    Amount nDstLost;
    Amount nSrcLost;
    Amount nDstRetrying;
    Amount nSrcRetrying;
    uint32_t nInFlight;
    EscrowStatus status;

    EscrowLedger() { SetNull(); }
    EscrowLedger(const uint256& hash, int64_t nDeadlineIn)
    {
        SetNull();
        paramsHash = hash;
        nDeadline = nDeadlineIn;
    }

    void SetNull()
    {
        paramsHash.SetNull();
        nDeadline = 0;
        nSrcRemaining = 0;
        nDstLost = 0;
        nSrcLost = 0;
        nDstRetrying = 0;
        nSrcRetrying = 0;
        nInFlight = 0;
        status = EscrowStatus::OPEN;
    }

    bool IsNull() const { return paramsHash.IsNull(); }
    bool IsClosed() const { return status != EscrowStatus::OPEN; }
    bool IsCleaned() const { return status == EscrowStatus::CLEANED; }
    bool IsExpired(int64_t nNow) const { return nNow >= nDeadline; }

    /** srcRemaining += nAmount; rejects bad-escrow-overflow */
    bool CreditSrc(Amount nAmount, CValidationState& state);

    /** srcRemaining -= nAmount; rejects bad-escrow-insufficient-inventory */
    bool DebitSrc(Amount nAmount, CValidationState& state);

    Amount GetLost(EscrowSide side) const;
    Amount GetRetrying(EscrowSide side) const;

    /** Lost amount not already being re-sent */
    Amount GetRetryable(EscrowSide side) const { return GetLost(side) - GetRetrying(side); }

    /** Record a failed maker-side leg; rejects bad-escrow-overflow */
    bool MarkLost(EscrowSide side, Amount nAmount, CValidationState& state);

    /** Forget a lost amount once its retry succeeded */
    bool ClearLost(EscrowSide side, Amount nAmount);

    bool BeginRetry(EscrowSide side, Amount nAmount);
    bool EndRetry(EscrowSide side, Amount nAmount);

    void IncrementInFlight() { ++nInFlight; }
    bool DecrementInFlight();

    /**
     * TryClose - OPEN -> CLOSED
     *
     * @return true if this call closed the escrow, false if it already was
     */
    bool TryClose();

    /** closed && nothing remaining, lost or in flight */
    bool CanCleanup() const;

    /**
     * TryCleanup - CLOSED -> CLEANED when CanCleanup()
     *
     * @return true if the escrow reached the terminal state in this call
     */
    bool TryCleanup();

    /**
     * CheckInvariants - Verify ledger invariants
     *
     * @param strError  Set to the violated invariant on failure
     */
    bool CheckInvariants(std::string& strError) const;

    std::string ToString() const;
};

#endif // ESCROWSWAP_ESCROW_LEDGER_H

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/ledger.h"

#include "consensus/validation.h"
#include "logging.h"

std::string EscrowStatusToString(EscrowStatus status)
{
    switch (status) {
    case EscrowStatus::OPEN: return "open";
    case EscrowStatus::CLOSED: return "closed";
    case EscrowStatus::CLEANED: return "cleaned";
    }
    return "unknown";
}

std::string EscrowSideToString(EscrowSide side)
{
    return side == EscrowSide::DST ? "dst" : "src";
}

bool EscrowLedger::CreditSrc(Amount nAmount, CValidationState& state)
{
    Amount nNew;
    if (!AddNoOverflow(nSrcRemaining, nAmount, nNew)) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-overflow",
                             strprintf("src remaining %d + %d", nSrcRemaining, nAmount));
    }
    nSrcRemaining = nNew;
    return true;
}

bool EscrowLedger::DebitSrc(Amount nAmount, CValidationState& state)
{
    if (nAmount > nSrcRemaining) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-insufficient-inventory",
                             strprintf("debit %d > remaining %d", nAmount, nSrcRemaining));
    }
    nSrcRemaining -= nAmount;
    return true;
}

Amount EscrowLedger::GetLost(EscrowSide side) const
{
    return side == EscrowSide::DST ? nDstLost : nSrcLost;
}

Amount EscrowLedger::GetRetrying(EscrowSide side) const
{
    return side == EscrowSide::DST ? nDstRetrying : nSrcRetrying;
}

bool EscrowLedger::MarkLost(EscrowSide side, Amount nAmount, CValidationState& state)
{
    Amount& nLost = side == EscrowSide::DST ? nDstLost : nSrcLost;
    Amount nNew;
    if (!AddNoOverflow(nLost, nAmount, nNew)) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-overflow",
                             strprintf("%s lost %d + %d", EscrowSideToString(side), nLost, nAmount));
    }
    nLost = nNew;
    return true;
}

bool EscrowLedger::ClearLost(EscrowSide side, Amount nAmount)
{
    Amount& nLost = side == EscrowSide::DST ? nDstLost : nSrcLost;
    const Amount nRetrying = GetRetrying(side);
    if (nAmount > nLost || nLost - nAmount < nRetrying) {
        LogPrintf("ERROR: %s: clear %d from %s lost %d (retrying %d)\n",
                  __func__, nAmount, EscrowSideToString(side), nLost, nRetrying);
        return false;
    }
    nLost -= nAmount;
    return true;
}

bool EscrowLedger::BeginRetry(EscrowSide side, Amount nAmount)
{
    Amount& nRetrying = side == EscrowSide::DST ? nDstRetrying : nSrcRetrying;
    if (nAmount > GetLost(side) - nRetrying) {
        LogPrintf("ERROR: %s: retry %d exceeds retryable %s %d\n",
                  __func__, nAmount, EscrowSideToString(side), GetLost(side) - nRetrying);
        return false;
    }
    nRetrying += nAmount;
    return true;
}

bool EscrowLedger::EndRetry(EscrowSide side, Amount nAmount)
{
    Amount& nRetrying = side == EscrowSide::DST ? nDstRetrying : nSrcRetrying;
    if (nAmount > nRetrying) {
        LogPrintf("ERROR: %s: end retry %d > retrying %s %d\n",
                  __func__, nAmount, EscrowSideToString(side), nRetrying);
        return false;
    }
    nRetrying -= nAmount;
    return true;
}

bool EscrowLedger::DecrementInFlight()
{
    if (nInFlight == 0) {
        LogPrintf("ERROR: %s: in-flight counter underflow\n", __func__);
        return false;
    }
    --nInFlight;
    return true;
}

bool EscrowLedger::TryClose()
{
    if (status != EscrowStatus::OPEN) {
        return false;
    }
    status = EscrowStatus::CLOSED;
    return true;
}

bool EscrowLedger::CanCleanup() const
{
    return status == EscrowStatus::CLOSED &&
           nSrcRemaining == 0 &&
           nDstLost == 0 &&
           nSrcLost == 0 &&
           nInFlight == 0;
}

bool EscrowLedger::TryCleanup()
{
    if (!CanCleanup()) {
        return false;
    }
    status = EscrowStatus::CLEANED;
    return true;
}

bool EscrowLedger::CheckInvariants(std::string& strError) const
{
    if (nDstRetrying > nDstLost) {
        strError = strprintf("dst retrying %d > lost %d", nDstRetrying, nDstLost);
        return false;
    }
    if (nSrcRetrying > nSrcLost) {
        strError = strprintf("src retrying %d > lost %d", nSrcRetrying, nSrcLost);
        return false;
    }
    if (status == EscrowStatus::CLEANED &&
        (nSrcRemaining != 0 || nDstLost != 0 || nSrcLost != 0 || nInFlight != 0)) {
        strError = strprintf("cleaned with obligations: %s", ToString());
        return false;
    }
    return true;
}

std::string EscrowLedger::ToString() const
{
    return strprintf("EscrowLedger(status=%s, srcRemaining=%d, dstLost=%d/%d, srcLost=%d/%d, inFlight=%u)",
                     EscrowStatusToString(status), nSrcRemaining,
                     nDstLost, nDstRetrying, nSrcLost, nSrcRetrying, nInFlight);
}

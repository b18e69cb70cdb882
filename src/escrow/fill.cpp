// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/fill.h"

#include "consensus/validation.h"
#include "escrow/ledger.h"
#include "logging.h"

#include <algorithm>

Amount FillQuote::GetIntegratorFeeTotal() const
{
    // Each fee is floor(nDstRequired * pips / 1e6) and the pips sum to at
    // most 25%, so the total cannot exceed nDstRequired
    Amount nTotal = 0;
    for (const auto& it : integratorFees) {
        nTotal += it.second;
    }
    return nTotal;
}

bool ComputeFill(const EscrowParams& params,
                 const EscrowLedger& ledger,
                 const std::string& taker,
                 Amount nDstIn,
                 const FillRequest& request,
                 int64_t nNow,
                 FillQuote& quote,
                 CValidationState& state)
{
    if (ledger.IsClosed() || params.IsExpired(nNow)) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-closed",
                             strprintf("status=%s deadline=%d now=%d",
                                       EscrowStatusToString(ledger.status), params.nDeadline, nNow));
    }
    if (request.nDeadline && nNow >= *request.nDeadline) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-closed",
                             strprintf("fill request expired at %d", *request.nDeadline));
    }

    if (!params.IsTakerAllowed(taker)) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-unauthorized",
                             strprintf("taker %s not whitelisted", taker));
    }

    if (request.receiveSrcTo.minGas && *request.receiveSrcTo.minGas > MAX_LEG_GAS) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-excessive-gas",
                             strprintf("receiveSrcTo minGas %d > %d", *request.receiveSrcTo.minGas, MAX_LEG_GAS));
    }

    const Price& takerPrice = request.takerPrice;
    if (!takerPrice.IsValid() || takerPrice.IsZero() || takerPrice < params.price) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-price-too-low",
                             strprintf("taker price %s < %s", takerPrice.ToString(), params.price.ToString()));
    }

    FillQuote q;

    // floor(D_in / P_taker) can only be out of range when it exceeds any
    // inventory, so it is capped at srcRemaining either way
    Amount nSrcBought = 0;
    if (!takerPrice.SrcFloor(nDstIn, nSrcBought)) {
        nSrcBought = ledger.nSrcRemaining;
    }
    q.nSrcFillable = std::min(ledger.nSrcRemaining, nSrcBought);
    if (q.nSrcFillable == 0) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-insufficient-amount",
                             strprintf("dst %d at %s buys nothing (remaining %d)",
                                       nDstIn, takerPrice.ToString(), ledger.nSrcRemaining));
    }
    if (!params.fPartialFillsAllowed && q.nSrcFillable < ledger.nSrcRemaining) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-partial-fills-not-allowed",
                             strprintf("fillable %d < remaining %d", q.nSrcFillable, ledger.nSrcRemaining));
    }

    // ceil(src * P_taker) <= D_in because src <= D_in / P_taker
    if (!takerPrice.DstCeil(q.nSrcFillable, q.nDstRequired) || q.nDstRequired > nDstIn) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-overflow",
                             strprintf("dst required for %d src at %s", q.nSrcFillable, takerPrice.ToString()));
    }
    q.nDstUnused = nDstIn - q.nDstRequired;

    if (!params.price.DstCeil(q.nSrcFillable, q.nDstWanted)) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-overflow",
                             strprintf("dst wanted for %d src at %s", q.nSrcFillable, params.price.ToString()));
    }
    q.nSurplus = q.nDstRequired > q.nDstWanted ? q.nDstRequired - q.nDstWanted : 0;

    if (params.protocolFees) {
        q.nProtocolFee = FeeFloor(q.nDstRequired, params.protocolFees->fee) +
                         FeeFloor(q.nSurplus, params.protocolFees->surplus);
    }
    WideAmount nFees = q.nProtocolFee;
    for (const auto& it : params.integratorFees) {
        const Amount nFee = FeeFloor(q.nDstRequired, it.second);
        q.integratorFees[it.first] = nFee;
        nFees += nFee;
    }
    if (nFees > q.nDstRequired) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-excessive-fees",
                             strprintf("fees %d > dst required %d", (Amount)nFees, q.nDstRequired));
    }
    q.nMakerPayout = q.nDstRequired - static_cast<Amount>(nFees);

    LogPrint(BCLog::FILL, "ComputeFill: taker=%s price=%s src=%d dst required=%d unused=%d surplus=%d protocol fee=%d integrator fees=%d payout=%d\n",
             taker, takerPrice.ToString(), q.nSrcFillable, q.nDstRequired, q.nDstUnused,
             q.nSurplus, q.nProtocolFee, q.GetIntegratorFeeTotal(), q.nMakerPayout);

    quote = q;
    return true;
}

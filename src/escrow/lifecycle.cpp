// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/lifecycle.h"

#include "consensus/validation.h"
#include "escrow/transfer.h"
#include "logging.h"

CEscrowLifecycle::CEscrowLifecycle(EscrowLedger& ledgerIn,
                                   CTransferOrchestrator& transfersIn,
                                   CEscrowEventSink& eventsIn)
    : ledger(ledgerIn), transfers(transfersIn), events(eventsIn)
{
}

void CEscrowLifecycle::EmitClosed(CloseReason reason)
{
    LogPrint(BCLog::ESCROW, "CEscrowLifecycle: closed (%s) %s\n",
             CloseReasonToString(reason), ledger.ToString());
    EscrowClosedEvent ev;
    ev.reason = reason;
    events.EscrowClosed(ev);
}

bool CEscrowLifecycle::CheckClose(const EscrowParams& params,
                                  const std::string& caller,
                                  int64_t nNow,
                                  CloseReason& reason,
                                  CValidationState& state) const
{
    if (params.IsExpired(nNow)) {
        reason = CloseReason::DEADLINE_EXPIRED;
        return true;
    }
    if (caller == params.maker && ledger.nSrcRemaining == 0) {
        reason = CloseReason::BY_MAKER;
        return true;
    }
    if (params.IsSingleTaker(caller)) {
        reason = CloseReason::BY_SINGLE_TAKER;
        return true;
    }
    return state.Invalid(false, REJECT_POLICY, "bad-escrow-unauthorized",
                         strprintf("%s may not close before %d", caller, params.nDeadline));
}

bool CEscrowLifecycle::Close(const EscrowParams& params,
                             const std::string& caller,
                             int64_t nNow,
                             bool& fCleaned,
                             CValidationState& state)
{
    if (!ledger.IsClosed()) {
        CloseReason reason;
        if (!CheckClose(params, caller, nNow, reason, state)) {
            return false;
        }
        if (ledger.TryClose()) {
            EmitClosed(reason);
        }
    }
    return Sweep(params, nNow, fCleaned, state);
}

bool CEscrowLifecycle::AutoClose(int64_t nNow)
{
    if (!ledger.IsExpired(nNow) || !ledger.TryClose()) {
        return false;
    }
    EmitClosed(CloseReason::DEADLINE_EXPIRED);
    return true;
}

bool CEscrowLifecycle::Sweep(const EscrowParams& params, int64_t nNow, bool& fCleaned, CValidationState& state)
{
    fCleaned = false;
    AutoClose(nNow);

    EscrowMakerRefundedEvent ev;

    if (ledger.IsClosed() && ledger.nSrcRemaining > 0) {
        ev.nSrcRefunded = ledger.nSrcRemaining;
        if (!ledger.DebitSrc(ev.nSrcRefunded, state)) {
            return false;
        }
        transfers.Issue(MakeTransferLeg(LegKind::MAKER_SRC_REFUND, params.srcAsset, ev.nSrcRefunded,
                                        params.refundSrcTo, params.maker));
    }

    ev.nSrcRetried = ledger.GetRetryable(EscrowSide::SRC);
    if (ev.nSrcRetried > 0) {
        if (!ledger.BeginRetry(EscrowSide::SRC, ev.nSrcRetried)) {
            return state.Error("escrow-retry-accounting src");
        }
        TransferLeg leg = MakeTransferLeg(LegKind::MAKER_SRC_REFUND, params.srcAsset, ev.nSrcRetried,
                                          params.refundSrcTo, params.maker);
        leg.fRetry = true;
        transfers.Issue(leg);
    }

    ev.nDstRetried = ledger.GetRetryable(EscrowSide::DST);
    if (ev.nDstRetried > 0) {
        if (!ledger.BeginRetry(EscrowSide::DST, ev.nDstRetried)) {
            return state.Error("escrow-retry-accounting dst");
        }
        TransferLeg leg = MakeTransferLeg(LegKind::MAKER_DST, params.dstAsset, ev.nDstRetried,
                                          params.receiveDstTo, params.maker);
        leg.fRetry = true;
        transfers.Issue(leg);
    }

    if (ev.nSrcRefunded > 0 || ev.nSrcRetried > 0 || ev.nDstRetried > 0) {
        LogPrint(BCLog::ESCROW, "CEscrowLifecycle::Sweep: refunded src %d, retried src %d dst %d\n",
                 ev.nSrcRefunded, ev.nSrcRetried, ev.nDstRetried);
        events.EscrowMakerRefunded(ev);
    }

    fCleaned = TryCleanup(nNow);
    return true;
}

bool CEscrowLifecycle::TryCleanup(int64_t nNow)
{
    AutoClose(nNow);

    if (!ledger.TryCleanup()) {
        return false;
    }

    LogPrint(BCLog::ESCROW, "CEscrowLifecycle::TryCleanup: escrow %s cleaned up\n",
             ledger.paramsHash.ToString());
    EscrowCleanupEvent ev;
    ev.paramsHash = ledger.paramsHash;
    events.EscrowCleanup(ev);
    return true;
}

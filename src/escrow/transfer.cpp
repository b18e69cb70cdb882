// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/transfer.h"

#include "consensus/validation.h"
#include "escrow/events.h"
#include "logging.h"

#include <set>

std::string LegKindToString(LegKind kind)
{
    switch (kind) {
    case LegKind::MAKER_DST: return "maker_dst";
    case LegKind::TAKER_SRC: return "taker_src";
    case LegKind::PROTOCOL_FEE: return "protocol_fee";
    case LegKind::INTEGRATOR_FEE: return "integrator_fee";
    case LegKind::MAKER_SRC_REFUND: return "maker_src_refund";
    }
    return "unknown";
}

Optional<EscrowSide> GetMakerLegSide(LegKind kind)
{
    if (kind == LegKind::MAKER_DST) return EscrowSide::DST;
    if (kind == LegKind::MAKER_SRC_REFUND) return EscrowSide::SRC;
    return nullopt;
}

std::string TransferResultToString(TransferResult result)
{
    switch (result) {
    case TransferResult::SUCCEEDED: return "succeeded";
    case TransferResult::FAILED: return "failed";
    case TransferResult::AMBIGUOUS: return "ambiguous";
    }
    return "unknown";
}

std::string TransferLeg::ToString() const
{
    return strprintf("TransferLeg(id=%d, kind=%s, asset=%s, amount=%d, receiver=%s, gas=%d%s)",
                     nLegId, LegKindToString(kind), asset, nAmount, receiver, nGas,
                     fRetry ? ", retry" : "");
}

TransferLeg MakeTransferLeg(LegKind kind,
                            const std::string& asset,
                            Amount nAmount,
                            const OverrideSend& send,
                            const std::string& strDefaultReceiver)
{
    TransferLeg leg;
    leg.kind = kind;
    leg.asset = asset;
    leg.nAmount = nAmount;
    leg.receiver = send.GetReceiver(strDefaultReceiver);
    leg.memo = send.memo;
    leg.msg = send.msg;
    leg.nGas = send.GetTransferGas();
    return leg;
}

CTransferOrchestrator::CTransferOrchestrator(EscrowLedger& ledgerIn,
                                             CTransferDispatcher& dispatcherIn,
                                             CEscrowEventSink& eventsIn)
    : ledger(ledgerIn), dispatcher(dispatcherIn), events(eventsIn), nNextLegId(1)
{
}

uint64_t CTransferOrchestrator::Issue(TransferLeg leg)
{
    if (leg.nAmount == 0) {
        return 0;
    }

    leg.nLegId = nNextLegId++;
    ledger.IncrementInFlight();
    mapPending.emplace(leg.nLegId, leg);

    LogPrint(BCLog::TRANSFER, "CTransferOrchestrator::Issue: %s (in flight %u)\n",
             leg.ToString(), ledger.nInFlight);

    dispatcher.RequestTransfer(leg);
    return leg.nLegId;
}

bool CTransferOrchestrator::CheckOutcomes(const std::vector<TransferOutcome>& outcomes, CValidationState& state) const
{
    std::set<uint64_t> setSeen;
    Amount nLost[2] = {ledger.GetLost(EscrowSide::DST), ledger.GetLost(EscrowSide::SRC)};

    for (const TransferOutcome& outcome : outcomes) {
        auto it = mapPending.find(outcome.nLegId);
        if (it == mapPending.end() || !setSeen.insert(outcome.nLegId).second) {
            return state.Invalid(false, REJECT_INVALID, "bad-escrow-unknown-leg",
                                 strprintf("leg %d", outcome.nLegId));
        }
        const TransferLeg& leg = it->second;
        if (leg.asset != outcome.asset || leg.nAmount != outcome.nAmount) {
            return state.Invalid(false, REJECT_INVALID, "bad-escrow-outcome-mismatch",
                                 strprintf("leg %d expected %d %s, got %d %s", leg.nLegId,
                                           leg.nAmount, leg.asset, outcome.nAmount, outcome.asset));
        }

        const Optional<EscrowSide> side = GetMakerLegSide(leg.kind);
        if (outcome.result != TransferResult::SUCCEEDED && side && !leg.fRetry) {
            Amount& nSideLost = nLost[*side == EscrowSide::DST ? 0 : 1];
            if (!AddNoOverflow(nSideLost, leg.nAmount, nSideLost)) {
                return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-overflow",
                                     strprintf("%s lost + %d", EscrowSideToString(*side), leg.nAmount));
            }
        }
    }
    return true;
}

bool CTransferOrchestrator::OnOutcome(const TransferOutcome& outcome, CValidationState& state)
{
    auto it = mapPending.find(outcome.nLegId);
    if (it == mapPending.end()) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-unknown-leg",
                             strprintf("leg %d", outcome.nLegId));
    }
    const TransferLeg leg = it->second;
    if (leg.asset != outcome.asset || leg.nAmount != outcome.nAmount) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-outcome-mismatch",
                             strprintf("leg %d expected %d %s, got %d %s", leg.nLegId,
                                       leg.nAmount, leg.asset, outcome.nAmount, outcome.asset));
    }

    const Optional<EscrowSide> side = GetMakerLegSide(leg.kind);
    const bool fSucceeded = outcome.result == TransferResult::SUCCEEDED;

    // Only a fresh maker-side loss can fail; check it before mutating anything
    if (!fSucceeded && side && !leg.fRetry) {
        Amount nNewLost;
        if (!AddNoOverflow(ledger.GetLost(*side), leg.nAmount, nNewLost)) {
            return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-overflow",
                                 strprintf("%s lost + %d", EscrowSideToString(*side), leg.nAmount));
        }
    }

    mapPending.erase(it);
    if (!ledger.DecrementInFlight()) {
        return state.Error(strprintf("escrow-inflight-accounting leg %d", leg.nLegId));
    }

    LogPrint(BCLog::TRANSFER, "CTransferOrchestrator::OnOutcome: %s %s (in flight %u)\n",
             leg.ToString(), TransferResultToString(outcome.result), ledger.nInFlight);

    if (!side) {
        if (!fSucceeded) {
            LogPrint(BCLog::TRANSFER, "CTransferOrchestrator::OnOutcome: %s leg %d to %s not delivered, %d %s untracked\n",
                     LegKindToString(leg.kind), leg.nLegId, leg.receiver, leg.nAmount, leg.asset);
        }
        return true;
    }

    if (leg.fRetry) {
        if (!ledger.EndRetry(*side, leg.nAmount) ||
            (fSucceeded && !ledger.ClearLost(*side, leg.nAmount))) {
            return state.Error(strprintf("escrow-retry-accounting leg %d", leg.nLegId));
        }
        return true;
    }

    if (!fSucceeded) {
        if (!ledger.MarkLost(*side, leg.nAmount, state)) {
            return false;
        }
        EscrowMakerLostEvent ev;
        ev.asset = leg.asset;
        ev.receiver = leg.receiver;
        ev.nAmount = leg.nAmount;
        ev.nLostTotal = ledger.GetLost(*side);
        events.EscrowMakerLost(ev);
    }
    return true;
}

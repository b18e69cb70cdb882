// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/escrow.h"

#include "consensus/validation.h"
#include "logging.h"
#include "utiltime.h"

UniValue EscrowSnapshotToJSON(const EscrowSnapshot& snapshot)
{
    const EscrowLedger& ledger = snapshot.ledger;

    UniValue result(UniValue::VOBJ);
    result.pushKV("params_hash", ledger.paramsHash.GetHex());
    result.pushKV("status", EscrowStatusToString(ledger.status));
    result.pushKV("closed", ledger.IsClosed());
    result.pushKV("deadline", ledger.nDeadline);
    result.pushKV("src_remaining", strprintf("%d", ledger.nSrcRemaining));

    UniValue lost(UniValue::VOBJ);
    lost.pushKV("dst", strprintf("%d", ledger.nDstLost));
    lost.pushKV("src", strprintf("%d", ledger.nSrcLost));
    lost.pushKV("dst_retrying", strprintf("%d", ledger.nDstRetrying));
    lost.pushKV("src_retrying", strprintf("%d", ledger.nSrcRetrying));
    result.pushKV("lost_and_found", lost);

    result.pushKV("in_flight", (int64_t)ledger.nInFlight);
    result.pushKV("pending_legs", (int64_t)snapshot.nPendingLegs);
    if (snapshot.params) {
        result.pushKV("params", EscrowParamsToJSON(*snapshot.params));
    }
    return result;
}

CEscrow::CEscrow(CTransferDispatcher& dispatcher, CEscrowEventSink& eventsIn)
    : fInitialized(false),
      events(eventsIn),
      transfers(ledger, dispatcher, eventsIn),
      lifecycle(ledger, transfers, eventsIn)
{
}

bool CEscrow::CheckCallable(const EscrowParams* params, CValidationState& state) const
{
    if (!fInitialized) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-not-initialized");
    }
    if (ledger.IsCleaned()) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-cleaned-up");
    }
    if (params && GetEscrowParamsHash(*params) != ledger.paramsHash) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-mismatched-params",
                             strprintf("expected %s", ledger.paramsHash.ToString()));
    }
    return true;
}

static bool CheckLedgerInvariants(const EscrowLedger& ledger, const char* pszFunc, CValidationState& state)
{
    std::string strError;
    if (!ledger.CheckInvariants(strError)) {
        LogPrintf("ERROR: %s: ledger invariant broken: %s\n", pszFunc, strError);
        return state.Error("escrow-invariant " + strError);
    }
    return true;
}

bool CEscrow::Init(const EscrowParams& params, CValidationState& state)
{
    if (fInitialized) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-already-initialized");
    }
    if (!CheckEscrowParams(params, GetTime(), true, state)) {
        LogPrint(BCLog::ESCROW, "CEscrow::Init: rejected: %s\n", FormatStateMessage(state));
        return false;
    }

    ledger = EscrowLedger(GetEscrowParamsHash(params), params.nDeadline);
    fInitialized = true;

    LogPrint(BCLog::ESCROW, "CEscrow::Init: escrow %s maker=%s %s -> %s price=%s deadline=%s\n",
             ledger.paramsHash.ToString(), params.maker, params.srcAsset, params.dstAsset,
             params.price.ToString(), FormatISO8601DateTime(params.nDeadline));

    EscrowCreatedEvent ev;
    ev.paramsHash = ledger.paramsHash;
    ev.params = params;
    events.EscrowCreated(ev);
    return true;
}

bool CEscrow::OnDeposit(const std::string& sender,
                        const std::string& asset,
                        Amount nAmount,
                        const EscrowParams& params,
                        Amount& nRefund,
                        CValidationState& state)
{
    nRefund = nAmount;

    if (!CheckCallable(&params, state)) {
        return false;
    }
    if (asset != params.srcAsset) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-wrong-asset",
                             strprintf("deposit of %s, expected %s", asset, params.srcAsset));
    }
    if (sender != params.maker) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-wrong-sender",
                             strprintf("deposit from %s", sender));
    }
    if (nAmount == 0) {
        return state.Invalid(false, REJECT_ARITHMETIC, "bad-escrow-insufficient-amount", "zero deposit");
    }
    const int64_t nNow = GetTime();
    if (ledger.IsClosed() || ledger.IsExpired(nNow)) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-closed",
                             strprintf("status=%s deadline=%d now=%d",
                                       EscrowStatusToString(ledger.status), ledger.nDeadline, nNow));
    }
    if (!ledger.CreditSrc(nAmount, state)) {
        return false;
    }
    nRefund = 0;

    LogPrint(BCLog::ESCROW, "CEscrow::OnDeposit: +%d %s, remaining %d\n",
             nAmount, asset, ledger.nSrcRemaining);

    EscrowFundedEvent ev;
    ev.maker = params.maker;
    ev.srcAsset = params.srcAsset;
    ev.dstAsset = params.dstAsset;
    ev.price = params.price;
    ev.nDeadline = params.nDeadline;
    ev.nSrcAdded = nAmount;
    ev.nSrcRemaining = ledger.nSrcRemaining;
    events.EscrowFunded(ev);

    return CheckLedgerInvariants(ledger, __func__, state);
}

/** Fee legs are plain transfers tagged "fee" */
static OverrideSend FeeSend()
{
    OverrideSend send;
    send.memo = std::string("fee");
    return send;
}

bool CEscrow::OnIncomingAsset(const std::string& sender,
                              const std::string& asset,
                              Amount nAmount,
                              const EscrowParams& params,
                              const FillRequest& request,
                              Amount& nRefund,
                              CValidationState& state)
{
    nRefund = nAmount;

    if (!CheckCallable(&params, state)) {
        return false;
    }
    if (asset != params.dstAsset) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-wrong-asset",
                             strprintf("fill with %s, expected %s", asset, params.dstAsset));
    }

    FillQuote quote;
    if (!ComputeFill(params, ledger, sender, nAmount, request, GetTime(), quote, state)) {
        LogPrint(BCLog::FILL, "CEscrow::OnIncomingAsset: %s rejected: %s\n", sender, FormatStateMessage(state));
        return false;
    }

    // Every check passed; from here on nothing rejects
    if (!ledger.DebitSrc(quote.nSrcFillable, state)) {
        return false;
    }
    nRefund = quote.nDstUnused;

    transfers.Issue(MakeTransferLeg(LegKind::MAKER_DST, params.dstAsset, quote.nMakerPayout,
                                    params.receiveDstTo, params.maker));
    const TransferLeg takerLeg = MakeTransferLeg(LegKind::TAKER_SRC, params.srcAsset, quote.nSrcFillable,
                                                 request.receiveSrcTo, sender);
    transfers.Issue(takerLeg);
    if (params.protocolFees) {
        transfers.Issue(MakeTransferLeg(LegKind::PROTOCOL_FEE, params.dstAsset, quote.nProtocolFee,
                                        FeeSend(), params.protocolFees->collector));
    }
    for (const auto& it : quote.integratorFees) {
        transfers.Issue(MakeTransferLeg(LegKind::INTEGRATOR_FEE, params.dstAsset, it.second,
                                        FeeSend(), it.first));
    }

    LogPrint(BCLog::ESCROW, "CEscrow::OnIncomingAsset: %s filled %d %s for %d %s, remaining %d\n",
             sender, quote.nSrcFillable, params.srcAsset, quote.nDstRequired, params.dstAsset,
             ledger.nSrcRemaining);

    EscrowFilledEvent ev;
    ev.taker = sender;
    ev.srcReceiver = takerLeg.receiver;
    ev.takerPrice = request.takerPrice;
    ev.nSrcFilled = quote.nSrcFillable;
    ev.nDstRequired = quote.nDstRequired;
    ev.nDstUnused = quote.nDstUnused;
    ev.nProtocolFee = quote.nProtocolFee;
    ev.integratorFees = quote.integratorFees;
    ev.nMakerPayout = quote.nMakerPayout;
    ev.nSrcRemaining = ledger.nSrcRemaining;
    events.EscrowFilled(ev);

    return CheckLedgerInvariants(ledger, __func__, state);
}

bool CEscrow::ViewState(const EscrowParams* params, EscrowSnapshot& snapshot, CValidationState& state) const
{
    if (!fInitialized) {
        return state.Invalid(false, REJECT_POLICY, "bad-escrow-not-initialized");
    }
    if (params && GetEscrowParamsHash(*params) != ledger.paramsHash) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-mismatched-params",
                             strprintf("expected %s", ledger.paramsHash.ToString()));
    }
    snapshot.ledger = ledger;
    snapshot.nPendingLegs = transfers.GetPendingCount();
    snapshot.params = nullopt;
    if (params) {
        snapshot.params = *params;
    }
    return true;
}

bool CEscrow::Close(const std::string& caller, const EscrowParams& params, bool& fCleaned, CValidationState& state)
{
    fCleaned = false;
    if (!CheckCallable(&params, state)) {
        return false;
    }
    if (!lifecycle.Close(params, caller, GetTime(), fCleaned, state)) {
        LogPrint(BCLog::ESCROW, "CEscrow::Close: %s rejected: %s\n", caller, FormatStateMessage(state));
        return false;
    }
    return CheckLedgerInvariants(ledger, __func__, state);
}

bool CEscrow::Sweep(const std::string& caller, const EscrowParams& params, bool& fCleaned, CValidationState& state)
{
    fCleaned = false;
    if (!CheckCallable(&params, state)) {
        return false;
    }
    LogPrint(BCLog::ESCROW, "CEscrow::Sweep: by %s, %s\n", caller, ledger.ToString());
    if (!lifecycle.Sweep(params, GetTime(), fCleaned, state)) {
        return false;
    }
    return CheckLedgerInvariants(ledger, __func__, state);
}

bool CEscrow::ResolveTransfers(const std::vector<TransferOutcome>& outcomes, bool& fCleaned, CValidationState& state)
{
    fCleaned = false;
    if (!CheckCallable(nullptr, state)) {
        return false;
    }
    if (!transfers.CheckOutcomes(outcomes, state)) {
        LogPrint(BCLog::TRANSFER, "CEscrow::ResolveTransfers: batch of %d rejected: %s\n",
                 outcomes.size(), FormatStateMessage(state));
        return false;
    }
    for (const TransferOutcome& outcome : outcomes) {
        if (!transfers.OnOutcome(outcome, state)) {
            LogPrintf("ERROR: CEscrow::ResolveTransfers: leg %d after batch check: %s\n",
                      outcome.nLegId, FormatStateMessage(state));
            return false;
        }
    }
    fCleaned = lifecycle.TryCleanup(GetTime());
    return CheckLedgerInvariants(ledger, __func__, state);
}

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_TRANSFER_H
#define ESCROWSWAP_ESCROW_TRANSFER_H

/**
 * Transfer Orchestration - Outbound legs and their asynchronous outcomes
 *
 * Each leg gets a monotonic correlation id and sits in the pending table
 * until the host reports its outcome through OnOutcome(). The ledger's
 * in-flight counter always equals the size of the pending table.
 *
 * Reconciliation:
 *   maker-side leg (MAKER_DST, MAKER_SRC_REFUND)
 *     SUCCEEDED, retry      -> EndRetry + ClearLost
 *     SUCCEEDED, first send -> nothing
 *     FAILED/AMBIGUOUS, retry      -> EndRetry (amount stays lost)
 *     FAILED/AMBIGUOUS, first send -> MarkLost + MakerLost event
 *   taker and fee legs
 *     FAILED/AMBIGUOUS -> logged only, the recipient bears the loss
 */

#include "amount.h"
#include "escrow/ledger.h"
#include "escrow/params.h"
#include "optional.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

class CEscrowEventSink;
class CValidationState;

enum class LegKind : uint8_t {
    MAKER_DST = 0,         // maker payout of dst
    TAKER_SRC = 1,         // taker's bought src
    PROTOCOL_FEE = 2,      // dst to the protocol collector
    INTEGRATOR_FEE = 3,    // dst to one integrator
    MAKER_SRC_REFUND = 4,  // unsold src back to the maker
};

std::string LegKindToString(LegKind kind);

/** Lost-and-found side for a maker-side leg */
Optional<EscrowSide> GetMakerLegSide(LegKind kind);

enum class TransferResult : uint8_t {
    SUCCEEDED = 0,
    FAILED = 1,
    AMBIGUOUS = 2,
};

std::string TransferResultToString(TransferResult result);

struct TransferLeg
{
    uint64_t nLegId{0};
    LegKind kind{LegKind::MAKER_DST};
    std::string asset;
    Amount nAmount{0};
    std::string receiver;
    Optional<std::string> memo;
    Optional<std::string> msg;
    uint64_t nGas{0};
    bool fRetry{false};  // sweep re-send of a lost amount

    std::string ToString() const;
};

/**
 * MakeTransferLeg - Build a leg honoring an OverrideSend
 *
 * The receiver falls back to strDefaultReceiver; gas follows the override's
 * minGas and whether it carries a message.
 */
TransferLeg MakeTransferLeg(LegKind kind,
                            const std::string& asset,
                            Amount nAmount,
                            const OverrideSend& send,
                            const std::string& strDefaultReceiver);

struct TransferOutcome
{
    uint64_t nLegId{0};
    std::string asset;
    Amount nAmount{0};
    TransferResult result{TransferResult::SUCCEEDED};
};

/**
 * CTransferDispatcher - Host capability that moves assets
 *
 * RequestTransfer() must not call back into the escrow; the outcome is
 * delivered later through CEscrow::ResolveTransfers().
 */
class CTransferDispatcher
{
public:
    virtual ~CTransferDispatcher() {}
    virtual void RequestTransfer(const TransferLeg& leg) = 0;
};

class CTransferOrchestrator
{
private:
    EscrowLedger& ledger;
    CTransferDispatcher& dispatcher;
    CEscrowEventSink& events;

    uint64_t nNextLegId;
    std::map<uint64_t, TransferLeg> mapPending;

public:
    CTransferOrchestrator(EscrowLedger& ledgerIn, CTransferDispatcher& dispatcherIn, CEscrowEventSink& eventsIn);

    /**
     * Issue - Assign an id, count the leg in flight and dispatch it
     *
     * Zero-amount legs are skipped.
     * @return the correlation id, or 0 if nothing was issued
     */
    uint64_t Issue(TransferLeg leg);

    /**
     * OnOutcome - Reconcile one reported outcome
     *
     * Rejects unknown ids (bad-escrow-unknown-leg) and asset/amount
     * mismatches (bad-escrow-outcome-mismatch) without touching state.
     */
    bool OnOutcome(const TransferOutcome& outcome, CValidationState& state);

    /**
     * CheckOutcomes - Validate a whole batch against the pending table
     *
     * Every id must be pending and appear once, asset and amount must
     * match, and the lost-and-found totals must not overflow. Nothing is
     * mutated.
     */
    bool CheckOutcomes(const std::vector<TransferOutcome>& outcomes, CValidationState& state) const;

    size_t GetPendingCount() const { return mapPending.size(); }
    bool IsPending(uint64_t nLegId) const { return mapPending.count(nLegId) > 0; }
};

#endif // ESCROWSWAP_ESCROW_TRANSFER_H

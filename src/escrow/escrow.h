// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_ESCROW_H
#define ESCROWSWAP_ESCROW_ESCROW_H

/**
 * Escrow - Host-facing entry points of one escrow instance
 *
 * A single maker deposits srcAsset; takers buy it by sending dstAsset at or
 * above params.price. Proceeds, fees and refunds leave through
 * CTransferDispatcher legs whose outcomes come back via ResolveTransfers().
 *
 * Every call runs to completion. The host never interleaves calls on one
 * instance, so no locking is done here.
 *
 * Error model: each entry point returns false and fills the
 * CValidationState on rejection. A rejected call mutates nothing, issues no
 * leg and emits no event. Failed outbound legs are never rejections: maker
 * legs go to lost-and-found, the rest are logged.
 *
 * Lifecycle:
 *   Init -> OPEN
 *   OnDeposit / OnIncomingAsset while OPEN and before the deadline
 *   Close / deadline -> CLOSED
 *   Sweep / ResolveTransfers until settled -> CLEANED (every call rejected)
 */

#include "amount.h"
#include "escrow/events.h"
#include "escrow/fill.h"
#include "escrow/ledger.h"
#include "escrow/lifecycle.h"
#include "escrow/params.h"
#include "escrow/transfer.h"

#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

class CValidationState;

/** Read-only view returned by CEscrow::ViewState() */
struct EscrowSnapshot
{
    EscrowLedger ledger;
    size_t nPendingLegs{0};
    Optional<EscrowParams> params;  // echoed back when verified
};

UniValue EscrowSnapshotToJSON(const EscrowSnapshot& snapshot);

class CEscrow
{
private:
    bool fInitialized;
    EscrowLedger ledger;
    CEscrowEventSink& events;
    CTransferOrchestrator transfers;
    CEscrowLifecycle lifecycle;

    /** Initialized, not cleaned up and params match the fingerprint */
    bool CheckCallable(const EscrowParams* params, CValidationState& state) const;

public:
    CEscrow(CTransferDispatcher& dispatcher, CEscrowEventSink& eventsIn);

    CEscrow(const CEscrow&) = delete;
    CEscrow& operator=(const CEscrow&) = delete;

    /**
     * Init - One-time creation from validated params
     *
     * Emits Created.
     */
    bool Init(const EscrowParams& params, CValidationState& state);

    /**
     * OnDeposit - Maker adds srcAsset inventory
     *
     * @param nRefund  What the host must return to sender: 0 when accepted,
     *                 the whole amount when rejected
     * Emits Funded.
     */
    bool OnDeposit(const std::string& sender, const std::string& asset, Amount nAmount,
                   const EscrowParams& params, Amount& nRefund, CValidationState& state);

    /**
     * OnIncomingAsset - Taker sends dstAsset to fill
     *
     * @param nRefund  dst the host must return: unused dst when accepted,
     *                 the whole amount when rejected
     * Emits Filled.
     */
    bool OnIncomingAsset(const std::string& sender, const std::string& asset, Amount nAmount,
                         const EscrowParams& params, const FillRequest& request,
                         Amount& nRefund, CValidationState& state);

    /** Read-only; params are optional and verified when given */
    bool ViewState(const EscrowParams* params, EscrowSnapshot& snapshot, CValidationState& state) const;

    bool Close(const std::string& caller, const EscrowParams& params, bool& fCleaned, CValidationState& state);

    /** Permissionless */
    bool Sweep(const std::string& caller, const EscrowParams& params, bool& fCleaned, CValidationState& state);

    /**
     * ResolveTransfers - Host callback with outcomes of issued legs
     *
     * The whole batch is checked first (pending ids, no repeats, matching
     * asset and amount); a rejected batch leaves state and events untouched.
     * Accepted outcomes are applied in order, then cleanup is attempted.
     */
    bool ResolveTransfers(const std::vector<TransferOutcome>& outcomes, bool& fCleaned, CValidationState& state);

    const EscrowLedger& GetLedger() const { return ledger; }
    bool IsInitialized() const { return fInitialized; }
};

#endif // ESCROWSWAP_ESCROW_ESCROW_H

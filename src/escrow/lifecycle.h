// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_LIFECYCLE_H
#define ESCROWSWAP_ESCROW_LIFECYCLE_H

/**
 * Escrow Lifecycle - OPEN -> CLOSED -> CLEANED
 *
 * Close authorization (first match wins):
 * - anyone, once the deadline is reached          -> deadline_expired
 * - the maker, once nothing is left to sell       -> by_maker
 * - the only whitelisted taker                    -> by_single_taker
 * Closing a closed escrow is allowed and only sweeps.
 *
 * Sweep is permissionless. It refunds residual inventory of a closed escrow
 * and re-sends every lost amount that is not already being retried, so two
 * sweeps in a row never issue the same amount twice.
 */

#include "amount.h"
#include "escrow/events.h"
#include "escrow/ledger.h"
#include "escrow/params.h"

#include <stdint.h>
#include <string>

class CTransferOrchestrator;
class CValidationState;

class CEscrowLifecycle
{
private:
    EscrowLedger& ledger;
    CTransferOrchestrator& transfers;
    CEscrowEventSink& events;

    void EmitClosed(CloseReason reason);

public:
    CEscrowLifecycle(EscrowLedger& ledgerIn, CTransferOrchestrator& transfersIn, CEscrowEventSink& eventsIn);

    /** Which close rule lets caller close now; bad-escrow-unauthorized if none */
    bool CheckClose(const EscrowParams& params, const std::string& caller, int64_t nNow,
                    CloseReason& reason, CValidationState& state) const;

    /**
     * Close - Authorize, close, sweep and try cleanup
     *
     * @param fCleaned  Set to whether the escrow reached CLEANED
     */
    bool Close(const EscrowParams& params, const std::string& caller, int64_t nNow,
               bool& fCleaned, CValidationState& state);

    /** Close on a reached deadline; returns true if this call closed it */
    bool AutoClose(int64_t nNow);

    /**
     * Sweep - Refund residual inventory and re-send lost amounts
     *
     * @param fCleaned  Set to whether the escrow reached CLEANED
     */
    bool Sweep(const EscrowParams& params, int64_t nNow, bool& fCleaned, CValidationState& state);

    /**
     * TryCleanup - Auto-close on deadline, then tear down if settled
     *
     * @return true if the escrow reached CLEANED in this call
     */
    bool TryCleanup(int64_t nNow);
};

#endif // ESCROWSWAP_ESCROW_LIFECYCLE_H

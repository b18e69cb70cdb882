// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_FILL_H
#define ESCROWSWAP_ESCROW_FILL_H

#include "amount.h"
#include "escrow/params.h"
#include "escrow/price.h"
#include "optional.h"

#include <map>
#include <stdint.h>
#include <string>

class CValidationState;
struct EscrowLedger;

/** What a taker attaches to an incoming dst transfer */
struct FillRequest
{
    Price takerPrice;             // declared price, must be >= params.price
    OverrideSend receiveSrcTo;    // where the bought src goes (default: sender)
    Optional<int64_t> nDeadline;  // taker's own expiry for this request
};

/**
 * FillQuote - Outcome of one fill, every amount already rounded
 *
 * nMakerPayout + nProtocolFee + sum(integratorFees) == nDstRequired
 * nDstRequired + nDstUnused == dst received
 */
struct FillQuote
{
    Amount nSrcFillable{0};
    Amount nDstRequired{0};
    Amount nDstUnused{0};
    Amount nDstWanted{0};
    Amount nSurplus{0};
    Amount nProtocolFee{0};
    std::map<std::string, Amount> integratorFees;
    Amount nMakerPayout{0};

    Amount GetIntegratorFeeTotal() const;
};

/**
 * ComputeFill - Price and fee arithmetic for one incoming dst transfer
 *
 * Pure: neither the ledger nor anything else is mutated. Checks, in order:
 *   closed / deadline reached / request expired  -> bad-escrow-closed
 *   taker not whitelisted                        -> bad-escrow-unauthorized
 *   receiveSrcTo.minGas above MAX_LEG_GAS        -> bad-escrow-excessive-gas
 *   takerPrice < params.price                    -> bad-escrow-price-too-low
 *   nothing fillable                             -> bad-escrow-insufficient-amount
 *   partial fill while not allowed               -> bad-escrow-partial-fills-not-allowed
 *   fees above dstRequired                       -> bad-escrow-excessive-fees
 *
 * @param params   Verified escrow terms
 * @param ledger   Current ledger
 * @param taker    Sender of the dst asset
 * @param nDstIn   dst amount received
 * @param request  Taker price and options
 * @param nNow     Current time
 * @param quote    Filled on success
 * @param state    Reject code and reason on failure
 */
bool ComputeFill(const EscrowParams& params,
                 const EscrowLedger& ledger,
                 const std::string& taker,
                 Amount nDstIn,
                 const FillRequest& request,
                 int64_t nNow,
                 FillQuote& quote,
                 CValidationState& state);

#endif // ESCROWSWAP_ESCROW_FILL_H

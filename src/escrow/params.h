// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_PARAMS_H
#define ESCROWSWAP_ESCROW_PARAMS_H

/**
 * Escrow Parameters - Immutable settlement terms
 *
 * The host never stores EscrowParams on behalf of the escrow: only the
 * SHA-256 fingerprint of the canonical serialization is kept in the ledger.
 * Every mutating entry point is handed the full params again and rejects with
 * bad-escrow-mismatched-params unless they hash to the stored fingerprint.
 *
 * Gas model (units of 1 gas, TGAS = 10^12):
 * - a plain transfer leg needs at least MIN_TRANSFER_GAS
 * - a transfer leg carrying a message (a "call") needs MIN_TRANSFER_CALL_GAS
 * - one fill costs FILL_BASE_GAS plus the maker payout leg, the refund leg
 *   and one plain leg per non-zero fee recipient
 * The sum must stay within GetMaxFillGas(), otherwise no taker could ever
 * complete a fill and the maker inventory would be stuck until the deadline.
 */

#include "amount.h"
#include "escrow/fees.h"
#include "escrow/price.h"
#include "optional.h"
#include "serialize.h"
#include "uint256.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>

class CValidationState;

static const uint64_t TGAS = 1000000000000ULL;

static const uint64_t DEFAULT_MAX_FILL_GAS = 260 * TGAS;  // -maxfillgas default
static const uint64_t FILL_BASE_GAS = 10 * TGAS;          // fill bookkeeping itself
static const uint64_t MAX_LEG_GAS = 300 * TGAS;           // per-leg minGas ceiling

static const uint64_t MIN_TRANSFER_GAS = 15 * TGAS;
static const uint64_t DEFAULT_TRANSFER_GAS = 15 * TGAS;
static const uint64_t MIN_TRANSFER_CALL_GAS = 30 * TGAS;
static const uint64_t DEFAULT_TRANSFER_CALL_GAS = 50 * TGAS;

/**
 * OverrideSend - Where (and how) an outbound leg is delivered
 *
 * Every field is optional. An unset receiver falls back to the party the leg
 * belongs to (maker for payout and refund, sender for taker payouts).
 * A set msg turns the leg into a call, which needs more gas.
 */
struct OverrideSend
{
    Optional<std::string> receiver;
    Optional<std::string> memo;
    Optional<std::string> msg;
    Optional<uint64_t> minGas;

    bool IsCall() const { return msg != nullopt; }

    /** Receiver or the fallback party */
    std::string GetReceiver(const std::string& strDefault) const
    {
        return receiver ? *receiver : strDefault;
    }

    /** Gas attached to a leg sent with this override */
    uint64_t GetTransferGas() const;

    SERIALIZE_METHODS(OverrideSend, obj)
    {
        READWRITE(obj.receiver, obj.memo, obj.msg, obj.minGas);
    }
};

/** Protocol fee split: fee on consumed notional, surplus on price improvement */
struct ProtocolFees
{
    Pips fee{0};
    Pips surplus{0};
    std::string collector;

    Pips GetTotal() const { return fee + surplus; }

    SERIALIZE_METHODS(ProtocolFees, obj)
    {
        READWRITE(obj.fee, obj.surplus, obj.collector);
    }
};

struct EscrowParams
{
    std::string maker;
    std::string srcAsset;
    std::string dstAsset;
    Price price;                    // minimum dst per src
    int64_t nDeadline{0};           // absolute, seconds since epoch
    bool fPartialFillsAllowed{false};
    OverrideSend refundSrcTo;
    OverrideSend receiveDstTo;
    std::set<std::string> takerWhitelist;
    Optional<ProtocolFees> protocolFees;
    std::map<std::string, Pips> integratorFees;
    uint256 salt;

    /** Whether the deadline has been reached at nNow */
    bool IsExpired(int64_t nNow) const { return nNow >= nDeadline; }

    /** Empty whitelist lets anyone fill */
    bool IsTakerAllowed(const std::string& taker) const
    {
        return takerWhitelist.empty() || takerWhitelist.count(taker) > 0;
    }

    /** Singleton whitelist: the only taker may close early */
    bool IsSingleTaker(const std::string& caller) const
    {
        return takerWhitelist.size() == 1 && *takerWhitelist.begin() == caller;
    }

    SERIALIZE_METHODS(EscrowParams, obj)
    {
        READWRITE(obj.maker, obj.srcAsset, obj.dstAsset, obj.price);
        READWRITE(obj.nDeadline, obj.fPartialFillsAllowed);
        READWRITE(obj.refundSrcTo, obj.receiveDstTo);
        READWRITE(obj.takerWhitelist, obj.protocolFees, obj.integratorFees);
        READWRITE(obj.salt);
    }
};

/**
 * GetTotalFee - protocol fee + surplus fee + every integrator fee
 *
 * @return false if the sum does not fit in Pips
 */
bool GetTotalFee(const EscrowParams& params, Pips& nTotalOut);

/**
 * GetRequiredFillGas - Gas needed to run one fill to completion
 *
 * Saturates at UINT64_MAX instead of wrapping.
 */
uint64_t GetRequiredFillGas(const EscrowParams& params);

/** Configured fill gas ceiling (-maxfillgas, in Tgas); never above the default */
uint64_t GetMaxFillGas();

/** SHA-256 of the canonical serialization */
uint256 GetEscrowParamsHash(const EscrowParams& params);

/**
 * CheckEscrowParams - Validate settlement terms
 *
 * @param params  Terms to check
 * @param nNow    Current time
 * @param fInit   Also require a deadline in the future (creation time only)
 * @param state   Filled with REJECT_INVALID and the reason on failure
 * @return true if the terms are acceptable
 */
bool CheckEscrowParams(const EscrowParams& params, int64_t nNow, bool fInit, CValidationState& state);

#endif // ESCROWSWAP_ESCROW_PARAMS_H

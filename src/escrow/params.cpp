// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/params.h"

#include "consensus/validation.h"
#include "hash.h"
#include "logging.h"
#include "util/system.h"

#include <algorithm>
#include <limits>

uint64_t OverrideSend::GetTransferGas() const
{
    const bool fCall = IsCall();
    if (!minGas) {
        return fCall ? DEFAULT_TRANSFER_CALL_GAS : DEFAULT_TRANSFER_GAS;
    }
    return std::max(*minGas, fCall ? MIN_TRANSFER_CALL_GAS : MIN_TRANSFER_GAS);
}

bool GetTotalFee(const EscrowParams& params, Pips& nTotalOut)
{
    Pips nTotal = 0;
    if (params.protocolFees) {
        if (!AddPipsNoOverflow(nTotal, params.protocolFees->fee, nTotal) ||
            !AddPipsNoOverflow(nTotal, params.protocolFees->surplus, nTotal)) {
            return false;
        }
    }
    for (const auto& it : params.integratorFees) {
        if (!AddPipsNoOverflow(nTotal, it.second, nTotal)) {
            return false;
        }
    }
    nTotalOut = nTotal;
    return true;
}

static void AddGasSaturating(uint64_t& nTotal, uint64_t nGas)
{
    if (nTotal > std::numeric_limits<uint64_t>::max() - nGas) {
        nTotal = std::numeric_limits<uint64_t>::max();
    } else {
        nTotal += nGas;
    }
}

uint64_t GetRequiredFillGas(const EscrowParams& params)
{
    uint64_t nGas = FILL_BASE_GAS;
    AddGasSaturating(nGas, params.receiveDstTo.GetTransferGas());
    AddGasSaturating(nGas, params.refundSrcTo.GetTransferGas());

    // Fee legs are always plain transfers of dst
    if (params.protocolFees && params.protocolFees->GetTotal() > 0) {
        AddGasSaturating(nGas, DEFAULT_TRANSFER_GAS);
    }
    for (const auto& it : params.integratorFees) {
        if (it.second > 0) {
            AddGasSaturating(nGas, DEFAULT_TRANSFER_GAS);
        }
    }
    return nGas;
}

uint64_t GetMaxFillGas()
{
    const int64_t nTgas = gArgs.GetArg("-maxfillgas", (int64_t)(DEFAULT_MAX_FILL_GAS / TGAS));
    if (nTgas <= 0) {
        return 0;
    }
    // Can only lower the ceiling
    return std::min(DEFAULT_MAX_FILL_GAS, (uint64_t)nTgas * TGAS);
}

uint256 GetEscrowParamsHash(const EscrowParams& params)
{
    return SerializeHash(params);
}

static bool CheckOverrideSend(const OverrideSend& send, const char* pszName, CValidationState& state)
{
    if (send.minGas && *send.minGas > MAX_LEG_GAS) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-excessive-gas",
                             strprintf("%s minGas %d > %d", pszName, *send.minGas, MAX_LEG_GAS));
    }
    return true;
}

bool CheckEscrowParams(const EscrowParams& params, int64_t nNow, bool fInit, CValidationState& state)
{
    if (params.srcAsset == params.dstAsset) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-same-assets",
                             strprintf("asset %s", params.srcAsset));
    }

    if (!params.price.IsValid() || params.price.IsZero()) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-zero-price",
                             strprintf("price %d/%d", params.price.nNumerator, params.price.nDenominator));
    }

    if (fInit && params.IsExpired(nNow)) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-deadline-expired",
                             strprintf("deadline %d <= now %d", params.nDeadline, nNow));
    }

    Pips nTotalFee = 0;
    if (!GetTotalFee(params, nTotalFee) || nTotalFee > MAX_TOTAL_FEE_PIPS) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-excessive-fees",
                             strprintf("total fee above %s", FormatPips(MAX_TOTAL_FEE_PIPS)));
    }

    if (params.protocolFees && params.protocolFees->GetTotal() > 0 && params.protocolFees->collector.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-invalid-collector",
                             "protocol fee without collector");
    }
    for (const auto& it : params.integratorFees) {
        if (it.first.empty()) {
            return state.Invalid(false, REJECT_INVALID, "bad-escrow-invalid-collector",
                                 strprintf("integrator fee %s without account", FormatPips(it.second)));
        }
    }

    if (!CheckOverrideSend(params.refundSrcTo, "refundSrcTo", state) ||
        !CheckOverrideSend(params.receiveDstTo, "receiveDstTo", state)) {
        return false;
    }

    const uint64_t nRequiredGas = GetRequiredFillGas(params);
    const uint64_t nMaxGas = GetMaxFillGas();
    if (nRequiredGas > nMaxGas) {
        return state.Invalid(false, REJECT_INVALID, "bad-escrow-excessive-gas",
                             strprintf("fill needs %d gas, max %d", nRequiredGas, nMaxGas));
    }

    LogPrint(BCLog::ESCROW, "CheckEscrowParams: ok src=%s dst=%s price=%s fee=%s fill gas=%d\n",
             params.srcAsset, params.dstAsset, params.price.ToString(),
             FormatPips(nTotalFee), nRequiredGas);
    return true;
}

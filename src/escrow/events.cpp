// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/events.h"

#include "logging.h"

std::string CloseReasonToString(CloseReason reason)
{
    switch (reason) {
    case CloseReason::DEADLINE_EXPIRED: return "deadline_expired";
    case CloseReason::BY_MAKER: return "by_maker";
    case CloseReason::BY_SINGLE_TAKER: return "by_single_taker";
    }
    return "unknown";
}

static std::string AmountToJSONString(Amount nAmount)
{
    return strprintf("%d", nAmount);
}

static UniValue OverrideSendToJSON(const OverrideSend& send)
{
    UniValue obj(UniValue::VOBJ);
    if (send.receiver) obj.pushKV("receiver", *send.receiver);
    if (send.memo) obj.pushKV("memo", *send.memo);
    if (send.msg) obj.pushKV("msg", *send.msg);
    if (send.minGas) obj.pushKV("min_gas", strprintf("%d", *send.minGas));
    return obj;
}

static UniValue NamedEvent(const std::string& strName, const UniValue& data)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("event", strName);
    result.pushKV("data", data);
    return result;
}

UniValue EscrowParamsToJSON(const EscrowParams& params)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("maker", params.maker);
    result.pushKV("src_asset", params.srcAsset);
    result.pushKV("dst_asset", params.dstAsset);
    result.pushKV("price", params.price.ToString());
    result.pushKV("deadline", params.nDeadline);
    result.pushKV("partial_fills_allowed", params.fPartialFillsAllowed);
    result.pushKV("refund_src_to", OverrideSendToJSON(params.refundSrcTo));
    result.pushKV("receive_dst_to", OverrideSendToJSON(params.receiveDstTo));

    UniValue whitelist(UniValue::VARR);
    for (const std::string& taker : params.takerWhitelist) {
        whitelist.push_back(taker);
    }
    result.pushKV("taker_whitelist", whitelist);

    if (params.protocolFees) {
        UniValue protocol(UniValue::VOBJ);
        protocol.pushKV("fee", (int64_t)params.protocolFees->fee);
        protocol.pushKV("surplus", (int64_t)params.protocolFees->surplus);
        protocol.pushKV("collector", params.protocolFees->collector);
        result.pushKV("protocol_fees", protocol);
    }

    UniValue integrators(UniValue::VOBJ);
    for (const auto& it : params.integratorFees) {
        integrators.pushKV(it.first, (int64_t)it.second);
    }
    result.pushKV("integrator_fees", integrators);
    result.pushKV("salt", params.salt.GetHex());
    return result;
}

UniValue EscrowEventToJSON(const EscrowCreatedEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("params_hash", ev.paramsHash.GetHex());
    data.pushKV("params", EscrowParamsToJSON(ev.params));
    return NamedEvent("created", data);
}

UniValue EscrowEventToJSON(const EscrowFundedEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("maker", ev.maker);
    data.pushKV("src_asset", ev.srcAsset);
    data.pushKV("dst_asset", ev.dstAsset);
    data.pushKV("price", ev.price.ToString());
    data.pushKV("deadline", ev.nDeadline);
    data.pushKV("src_added", AmountToJSONString(ev.nSrcAdded));
    data.pushKV("src_remaining", AmountToJSONString(ev.nSrcRemaining));
    return NamedEvent("funded", data);
}

UniValue EscrowEventToJSON(const EscrowFilledEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("taker", ev.taker);
    data.pushKV("src_receiver", ev.srcReceiver);
    data.pushKV("taker_price", ev.takerPrice.ToString());
    data.pushKV("src_filled", AmountToJSONString(ev.nSrcFilled));
    data.pushKV("dst_required", AmountToJSONString(ev.nDstRequired));
    data.pushKV("dst_unused", AmountToJSONString(ev.nDstUnused));
    data.pushKV("protocol_fee", AmountToJSONString(ev.nProtocolFee));
    UniValue integrators(UniValue::VOBJ);
    for (const auto& it : ev.integratorFees) {
        integrators.pushKV(it.first, AmountToJSONString(it.second));
    }
    data.pushKV("integrator_fees", integrators);
    data.pushKV("maker_payout", AmountToJSONString(ev.nMakerPayout));
    data.pushKV("src_remaining", AmountToJSONString(ev.nSrcRemaining));
    return NamedEvent("filled", data);
}

UniValue EscrowEventToJSON(const EscrowMakerLostEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("asset", ev.asset);
    data.pushKV("receiver", ev.receiver);
    data.pushKV("amount", AmountToJSONString(ev.nAmount));
    data.pushKV("lost_total", AmountToJSONString(ev.nLostTotal));
    return NamedEvent("maker_lost", data);
}

UniValue EscrowEventToJSON(const EscrowMakerRefundedEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("src_refunded", AmountToJSONString(ev.nSrcRefunded));
    data.pushKV("src_retried", AmountToJSONString(ev.nSrcRetried));
    data.pushKV("dst_retried", AmountToJSONString(ev.nDstRetried));
    return NamedEvent("maker_refunded", data);
}

UniValue EscrowEventToJSON(const EscrowClosedEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("reason", CloseReasonToString(ev.reason));
    return NamedEvent("closed", data);
}

UniValue EscrowEventToJSON(const EscrowCleanupEvent& ev)
{
    UniValue data(UniValue::VOBJ);
    data.pushKV("params_hash", ev.paramsHash.GetHex());
    return NamedEvent("cleanup", data);
}

void CEscrowEventLogger::EscrowCreated(const EscrowCreatedEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

void CEscrowEventLogger::EscrowFunded(const EscrowFundedEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

void CEscrowEventLogger::EscrowFilled(const EscrowFilledEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

void CEscrowEventLogger::EscrowMakerLost(const EscrowMakerLostEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

void CEscrowEventLogger::EscrowMakerRefunded(const EscrowMakerRefundedEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

void CEscrowEventLogger::EscrowClosed(const EscrowClosedEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

void CEscrowEventLogger::EscrowCleanup(const EscrowCleanupEvent& ev)
{
    LogPrint(BCLog::ESCROW, "event: %s\n", EscrowEventToJSON(ev).write());
}

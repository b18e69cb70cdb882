// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_ESCROW_EVENTS_H
#define ESCROWSWAP_ESCROW_EVENTS_H

/**
 * Escrow Events - Append-only notifications of state transitions
 *
 * Emitted synchronously through CEscrowEventSink, in the order the
 * transitions happen. Rejected calls emit nothing.
 *
 * Amounts are rendered as decimal strings in JSON: they are 64-bit unsigned
 * and do not fit a JSON number losslessly.
 */

#include "amount.h"
#include "escrow/params.h"
#include "escrow/price.h"
#include "uint256.h"

#include <map>
#include <stdint.h>
#include <string>

#include <univalue.h>

enum class CloseReason : uint8_t {
    DEADLINE_EXPIRED = 0,
    BY_MAKER = 1,
    BY_SINGLE_TAKER = 2,
};

std::string CloseReasonToString(CloseReason reason);

struct EscrowCreatedEvent
{
    uint256 paramsHash;
    EscrowParams params;
};

struct EscrowFundedEvent
{
    std::string maker;
    std::string srcAsset;
    std::string dstAsset;
    Price price;
    int64_t nDeadline{0};
    Amount nSrcAdded{0};
    Amount nSrcRemaining{0};
};

struct EscrowFilledEvent
{
    std::string taker;
    std::string srcReceiver;
    Price takerPrice;
    Amount nSrcFilled{0};
    Amount nDstRequired{0};
    Amount nDstUnused{0};
    Amount nProtocolFee{0};
    std::map<std::string, Amount> integratorFees;
    Amount nMakerPayout{0};
    Amount nSrcRemaining{0};
};

/** A maker-side leg failed; the amount moved to lost-and-found */
struct EscrowMakerLostEvent
{
    std::string asset;
    std::string receiver;
    Amount nAmount{0};
    Amount nLostTotal{0};
};

/** A sweep issued legs back to the maker */
struct EscrowMakerRefundedEvent
{
    Amount nSrcRefunded{0};
    Amount nSrcRetried{0};
    Amount nDstRetried{0};
};

struct EscrowClosedEvent
{
    CloseReason reason{CloseReason::DEADLINE_EXPIRED};
};

struct EscrowCleanupEvent
{
    uint256 paramsHash;
};

/**
 * CEscrowEventSink - Receiver of escrow notifications
 *
 * Every method defaults to a no-op so a subscriber only overrides what it
 * needs.
 */
class CEscrowEventSink
{
public:
    virtual ~CEscrowEventSink() {}

    virtual void EscrowCreated(const EscrowCreatedEvent& ev) {}
    virtual void EscrowFunded(const EscrowFundedEvent& ev) {}
    virtual void EscrowFilled(const EscrowFilledEvent& ev) {}
    virtual void EscrowMakerLost(const EscrowMakerLostEvent& ev) {}
    virtual void EscrowMakerRefunded(const EscrowMakerRefundedEvent& ev) {}
    virtual void EscrowClosed(const EscrowClosedEvent& ev) {}
    virtual void EscrowCleanup(const EscrowCleanupEvent& ev) {}
};

/** Sink that writes every event to the escrow debug log category */
class CEscrowEventLogger : public CEscrowEventSink
{
public:
    void EscrowCreated(const EscrowCreatedEvent& ev) override;
    void EscrowFunded(const EscrowFundedEvent& ev) override;
    void EscrowFilled(const EscrowFilledEvent& ev) override;
    void EscrowMakerLost(const EscrowMakerLostEvent& ev) override;
    void EscrowMakerRefunded(const EscrowMakerRefundedEvent& ev) override;
    void EscrowClosed(const EscrowClosedEvent& ev) override;
    void EscrowCleanup(const EscrowCleanupEvent& ev) override;
};

UniValue EscrowParamsToJSON(const EscrowParams& params);

UniValue EscrowEventToJSON(const EscrowCreatedEvent& ev);
UniValue EscrowEventToJSON(const EscrowFundedEvent& ev);
UniValue EscrowEventToJSON(const EscrowFilledEvent& ev);
UniValue EscrowEventToJSON(const EscrowMakerLostEvent& ev);
UniValue EscrowEventToJSON(const EscrowMakerRefundedEvent& ev);
UniValue EscrowEventToJSON(const EscrowClosedEvent& ev);
UniValue EscrowEventToJSON(const EscrowCleanupEvent& ev);

#endif // ESCROWSWAP_ESCROW_EVENTS_H

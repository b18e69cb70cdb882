// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Escrow Test Suite

#include "test/test_escrow.h"

#include "consensus/validation.h"
#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup()
{
    SetMockTime(TEST_NOW);
    gArgs.ClearArgs();
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = false;
    logger.DisableCategory(BCLog::ALL);
}

BasicTestingSetup::~BasicTestingSetup()
{
    gArgs.ClearArgs();
    SetMockTime(0);
}

TransferOutcome RecordingDispatcher::Outcome(const TransferLeg& leg, TransferResult result)
{
    TransferOutcome outcome;
    outcome.nLegId = leg.nLegId;
    outcome.asset = leg.asset;
    outcome.nAmount = leg.nAmount;
    outcome.result = result;
    return outcome;
}

std::vector<TransferOutcome> RecordingDispatcher::OutcomesFrom(size_t nFrom, TransferResult result) const
{
    std::vector<TransferOutcome> outcomes;
    for (size_t i = nFrom; i < legs.size(); i++) {
        outcomes.push_back(Outcome(legs[i], result));
    }
    return outcomes;
}

const TransferLeg* RecordingDispatcher::FindLeg(LegKind kind, size_t nFrom) const
{
    for (size_t i = nFrom; i < legs.size(); i++) {
        if (legs[i].kind == kind) return &legs[i];
    }
    return nullptr;
}

void RecordingEventSink::EscrowCreated(const EscrowCreatedEvent& ev)
{
    created.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

void RecordingEventSink::EscrowFunded(const EscrowFundedEvent& ev)
{
    funded.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

void RecordingEventSink::EscrowFilled(const EscrowFilledEvent& ev)
{
    filled.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

void RecordingEventSink::EscrowMakerLost(const EscrowMakerLostEvent& ev)
{
    makerLost.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

void RecordingEventSink::EscrowMakerRefunded(const EscrowMakerRefundedEvent& ev)
{
    makerRefunded.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

void RecordingEventSink::EscrowClosed(const EscrowClosedEvent& ev)
{
    closed.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

void RecordingEventSink::EscrowCleanup(const EscrowCleanupEvent& ev)
{
    cleanup.push_back(ev);
    names.push_back(EscrowEventToJSON(ev)["event"].get_str());
}

EscrowParams MakeTestParams()
{
    EscrowParams params;
    params.maker = "maker.near";
    params.srcAsset = "nep141:src.near";
    params.dstAsset = "nep141:dst.near";
    params.price = Price(2, 1);
    params.nDeadline = TEST_NOW + 3600;
    params.fPartialFillsAllowed = true;
    params.salt = uint256S("0x0102030405060708");
    return params;
}

FillRequest MakeFillRequest(uint64_t nPrice)
{
    FillRequest request;
    request.takerPrice = Price(nPrice, 1);
    return request;
}

EscrowTestingSetup::EscrowTestingSetup()
    : escrow(dispatcher, events), params(MakeTestParams())
{
}

void EscrowTestingSetup::InitEscrow()
{
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(escrow.Init(params, state), FormatStateMessage(state));
}

void EscrowTestingSetup::Fund(Amount nAmount)
{
    CValidationState state;
    Amount nRefund = 0;
    BOOST_REQUIRE_MESSAGE(escrow.OnDeposit(params.maker, params.srcAsset, nAmount, params, nRefund, state),
                          FormatStateMessage(state));
    BOOST_REQUIRE_EQUAL(nRefund, 0U);
}

// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Transfer Orchestration Tests
 *
 * - correlation ids are monotonic and in-flight tracks the pending table
 * - unknown or mismatched outcomes are rejected without state change
 * - maker-side failures land in lost-and-found, others are untracked
 * - retried legs clear or keep their lost amount
 */

#include "consensus/validation.h"
#include "escrow/events.h"
#include "escrow/ledger.h"
#include "escrow/transfer.h"
#include "test/test_escrow.h"

#include <boost/test/unit_test.hpp>

namespace {

struct TransferTestingSetup : public BasicTestingSetup {
    EscrowLedger ledger;
    RecordingDispatcher dispatcher;
    RecordingEventSink events;
    CTransferOrchestrator transfers;

    TransferTestingSetup()
        : ledger(uint256S("0x01"), TEST_NOW + 3600),
          transfers(ledger, dispatcher, events)
    {
    }

    TransferLeg Leg(LegKind kind, Amount nAmount, bool fRetry = false)
    {
        TransferLeg leg = MakeTransferLeg(kind, kind == LegKind::TAKER_SRC || kind == LegKind::MAKER_SRC_REFUND
                                                    ? "nep141:src.near" : "nep141:dst.near",
                                          nAmount, OverrideSend(), "maker.near");
        leg.fRetry = fRetry;
        return leg;
    }

    bool Resolve(uint64_t nLegId, TransferResult result, CValidationState& state)
    {
        for (const TransferLeg& leg : dispatcher.legs) {
            if (leg.nLegId == nLegId) {
                return transfers.OnOutcome(RecordingDispatcher::Outcome(leg, result), state);
            }
        }
        BOOST_ERROR("leg not dispatched");
        return false;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(escrow_transfer_tests, TransferTestingSetup)

BOOST_AUTO_TEST_CASE(issue_assigns_ids_and_counts_in_flight)
{
    const uint64_t nFirst = transfers.Issue(Leg(LegKind::MAKER_DST, 100));
    const uint64_t nSecond = transfers.Issue(Leg(LegKind::TAKER_SRC, 50));
    BOOST_CHECK(nFirst > 0);
    BOOST_CHECK(nSecond > nFirst);
    BOOST_CHECK_EQUAL(ledger.nInFlight, 2U);
    BOOST_CHECK_EQUAL(transfers.GetPendingCount(), 2U);
    BOOST_REQUIRE_EQUAL(dispatcher.legs.size(), 2U);
    BOOST_CHECK_EQUAL(dispatcher.legs[0].nLegId, nFirst);
    BOOST_CHECK_EQUAL(dispatcher.legs[0].receiver, "maker.near");
    BOOST_CHECK_EQUAL(dispatcher.legs[0].nGas, DEFAULT_TRANSFER_GAS);
}

BOOST_AUTO_TEST_CASE(zero_amount_leg_skipped)
{
    BOOST_CHECK_EQUAL(transfers.Issue(Leg(LegKind::PROTOCOL_FEE, 0)), 0U);
    BOOST_CHECK_EQUAL(ledger.nInFlight, 0U);
    BOOST_CHECK(dispatcher.legs.empty());
}

BOOST_AUTO_TEST_CASE(override_send_shapes_leg)
{
    OverrideSend send;
    send.receiver = std::string("vault.near");
    send.memo = std::string("payout");
    send.msg = std::string("{}");
    const TransferLeg leg = MakeTransferLeg(LegKind::MAKER_DST, "nep141:dst.near", 10, send, "maker.near");
    BOOST_CHECK_EQUAL(leg.receiver, "vault.near");
    BOOST_CHECK(leg.memo == std::string("payout"));
    BOOST_CHECK_EQUAL(leg.nGas, DEFAULT_TRANSFER_CALL_GAS);
}

BOOST_AUTO_TEST_CASE(success_clears_pending)
{
    const uint64_t nId = transfers.Issue(Leg(LegKind::MAKER_DST, 100));
    CValidationState state;
    BOOST_CHECK(Resolve(nId, TransferResult::SUCCEEDED, state));
    BOOST_CHECK_EQUAL(ledger.nInFlight, 0U);
    BOOST_CHECK(!transfers.IsPending(nId));
    BOOST_CHECK_EQUAL(ledger.nDstLost, 0U);
    BOOST_CHECK(events.makerLost.empty());

    // A second report for the same leg is unknown
    BOOST_CHECK(!Resolve(nId, TransferResult::SUCCEEDED, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-escrow-unknown-leg");
}

BOOST_AUTO_TEST_CASE(unknown_and_mismatched_outcomes_rejected)
{
    const uint64_t nId = transfers.Issue(Leg(LegKind::MAKER_DST, 100));

    TransferOutcome outcome;
    outcome.nLegId = nId + 100;
    outcome.asset = "nep141:dst.near";
    outcome.nAmount = 100;
    CValidationState state;
    BOOST_CHECK(!transfers.OnOutcome(outcome, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-escrow-unknown-leg");

    outcome.nLegId = nId;
    outcome.nAmount = 99;
    CValidationState state2;
    BOOST_CHECK(!transfers.OnOutcome(outcome, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_INVALID);
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-escrow-outcome-mismatch");

    outcome.nAmount = 100;
    outcome.asset = "nep141:src.near";
    CValidationState state3;
    BOOST_CHECK(!transfers.OnOutcome(outcome, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "bad-escrow-outcome-mismatch");

    // Nothing changed
    BOOST_CHECK(transfers.IsPending(nId));
    BOOST_CHECK_EQUAL(ledger.nInFlight, 1U);
}

BOOST_AUTO_TEST_CASE(maker_failures_go_to_lost_and_found)
{
    const uint64_t nPayout = transfers.Issue(Leg(LegKind::MAKER_DST, 100));
    const uint64_t nRefund = transfers.Issue(Leg(LegKind::MAKER_SRC_REFUND, 40));

    CValidationState state;
    BOOST_CHECK(Resolve(nPayout, TransferResult::FAILED, state));
    BOOST_CHECK(Resolve(nRefund, TransferResult::AMBIGUOUS, state));
    BOOST_CHECK_EQUAL(ledger.nDstLost, 100U);
    BOOST_CHECK_EQUAL(ledger.nSrcLost, 40U);
    BOOST_CHECK_EQUAL(ledger.nInFlight, 0U);

    BOOST_REQUIRE_EQUAL(events.makerLost.size(), 2U);
    BOOST_CHECK_EQUAL(events.makerLost[0].asset, "nep141:dst.near");
    BOOST_CHECK_EQUAL(events.makerLost[0].nAmount, 100U);
    BOOST_CHECK_EQUAL(events.makerLost[1].nLostTotal, 40U);
}

BOOST_AUTO_TEST_CASE(taker_and_fee_failures_untracked)
{
    const uint64_t nTaker = transfers.Issue(Leg(LegKind::TAKER_SRC, 100));
    const uint64_t nProtocol = transfers.Issue(Leg(LegKind::PROTOCOL_FEE, 5));
    const uint64_t nIntegrator = transfers.Issue(Leg(LegKind::INTEGRATOR_FEE, 3));

    CValidationState state;
    BOOST_CHECK(Resolve(nTaker, TransferResult::FAILED, state));
    BOOST_CHECK(Resolve(nProtocol, TransferResult::AMBIGUOUS, state));
    BOOST_CHECK(Resolve(nIntegrator, TransferResult::FAILED, state));

    BOOST_CHECK_EQUAL(ledger.nDstLost, 0U);
    BOOST_CHECK_EQUAL(ledger.nSrcLost, 0U);
    BOOST_CHECK_EQUAL(ledger.nInFlight, 0U);
    BOOST_CHECK(events.makerLost.empty());
}

BOOST_AUTO_TEST_CASE(retry_success_clears_lost)
{
    CValidationState state;
    BOOST_REQUIRE(ledger.MarkLost(EscrowSide::DST, 100, state));
    BOOST_REQUIRE(ledger.BeginRetry(EscrowSide::DST, 100));
    const uint64_t nId = transfers.Issue(Leg(LegKind::MAKER_DST, 100, true));

    BOOST_CHECK(Resolve(nId, TransferResult::SUCCEEDED, state));
    BOOST_CHECK_EQUAL(ledger.nDstLost, 0U);
    BOOST_CHECK_EQUAL(ledger.nDstRetrying, 0U);
}

BOOST_AUTO_TEST_CASE(retry_failure_keeps_lost_once)
{
    CValidationState state;
    BOOST_REQUIRE(ledger.MarkLost(EscrowSide::SRC, 70, state));
    BOOST_REQUIRE(ledger.BeginRetry(EscrowSide::SRC, 70));
    const uint64_t nId = transfers.Issue(Leg(LegKind::MAKER_SRC_REFUND, 70, true));

    BOOST_CHECK(Resolve(nId, TransferResult::FAILED, state));
    // Still lost, not double counted, retryable again
    BOOST_CHECK_EQUAL(ledger.nSrcLost, 70U);
    BOOST_CHECK_EQUAL(ledger.nSrcRetrying, 0U);
    BOOST_CHECK_EQUAL(ledger.GetRetryable(EscrowSide::SRC), 70U);
    BOOST_CHECK(events.makerLost.empty());
}

BOOST_AUTO_TEST_CASE(outcomes_in_any_order)
{
    std::vector<uint64_t> ids;
    for (Amount n = 1; n <= 5; n++) {
        ids.push_back(transfers.Issue(Leg(LegKind::MAKER_DST, n)));
    }
    CValidationState state;
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        BOOST_CHECK(Resolve(*it, *it % 2 ? TransferResult::FAILED : TransferResult::SUCCEEDED, state));
    }
    BOOST_CHECK_EQUAL(ledger.nInFlight, 0U);
    BOOST_CHECK_EQUAL(transfers.GetPendingCount(), 0U);
    // Legs 1, 3 and 5 carried amounts 1, 3 and 5
    BOOST_CHECK_EQUAL(ledger.nDstLost, 9U);
}

BOOST_AUTO_TEST_SUITE_END()

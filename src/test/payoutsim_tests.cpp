// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/payoutsim.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerman.h"
#include "amount.h"
#include "test/test_revsplit.h"
#include "util/validation.h"

#include <boost/test/unit_test.hpp>

namespace {

struct PayoutSimFixture : public LedgerTestingSetup {
    const std::string ledgerAddress = TestAddress(0x1ed9e4);
    const std::string admin = TestAddress(0xad);
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);

    PayoutSimFixture()
    {
        LedgerParams params;
        params.address = ledgerAddress;
        params.admin = admin;
        params.shareTable = {{A, 6000}, {B, 4000}};
        params.repaymentCap = 6 * COIN;
        CValidationState state;
        BOOST_REQUIRE(g_ledgerman->CreateLedger(params, state));
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(payoutsim_tests, PayoutSimFixture)

BOOST_AUTO_TEST_CASE(split_deposits_and_release)
{
    CPayoutSimulator sim(*g_ledgerman);
    PayoutReport report;
    CValidationState state;
    BOOST_CHECK(sim.Run(ledgerAddress, 1 * COIN, 3, TestAddress(0xc0), true, report, state));

    BOOST_CHECK_EQUAL(report.nDeposits, 3U);
    BOOST_CHECK_EQUAL(report.nDeposited, 1 * COIN);
    BOOST_CHECK_EQUAL(report.nReleased, 1 * COIN);
    BOOST_REQUIRE_EQUAL(report.vPaid.size(), 2U);
    BOOST_CHECK_EQUAL(report.vPaid[0].first, A);
    BOOST_CHECK_EQUAL(report.vPaid[0].second, 60000000);
    BOOST_CHECK_EQUAL(report.vPaid[1].first, B);
    BOOST_CHECK_EQUAL(report.vPaid[1].second, 40000000);
    BOOST_CHECK_EQUAL(report.nRemainingCap, 5 * COIN);
    BOOST_CHECK(!report.fCapExhausted);

    // Remainder goes on the last deposit
    std::vector<CAmount> vAmounts;
    g_ledgerdb->ForEachDeposit(ledgerAddress, [&](const DepositEntry& entry) {
        vAmounts.push_back(entry.amount);
        return true;
    });
    BOOST_REQUIRE_EQUAL(vAmounts.size(), 3U);
    BOOST_CHECK_EQUAL(vAmounts[0], 33333333);
    BOOST_CHECK_EQUAL(vAmounts[1], 33333333);
    BOOST_CHECK_EQUAL(vAmounts[2], 33333334);
}

BOOST_AUTO_TEST_CASE(deposit_only)
{
    CPayoutSimulator sim(*g_ledgerman);
    PayoutReport report;
    CValidationState state;
    BOOST_CHECK(sim.Run(ledgerAddress, 2 * COIN, 1, "", false, report, state));
    BOOST_CHECK_EQUAL(report.nDeposited, 2 * COIN);
    BOOST_CHECK_EQUAL(report.nReleased, 0);
    BOOST_CHECK(report.vPaid.empty());
    BOOST_CHECK_EQUAL(report.nRemainingCap, 6 * COIN);

    std::shared_ptr<CLedger> ledger = g_ledgerman->GetLedger(ledgerAddress, state);
    BOOST_REQUIRE(ledger);
    BOOST_CHECK_EQUAL(ledger->GetPendingPayment(A), 120000000);
    BOOST_CHECK_EQUAL(ledger->GetPendingPayment(B), 80000000);
}

BOOST_AUTO_TEST_CASE(cap_exhausted)
{
    CPayoutSimulator sim(*g_ledgerman);
    PayoutReport report;
    CValidationState state;
    BOOST_CHECK(sim.Run(ledgerAddress, 10 * COIN, 4, "", true, report, state));
    BOOST_CHECK_EQUAL(report.nDeposited, 10 * COIN);
    BOOST_REQUIRE_EQUAL(report.vPaid.size(), 2U);
    BOOST_CHECK_EQUAL(report.vPaid[0].second, 360000000);
    BOOST_CHECK_EQUAL(report.vPaid[1].second, 240000000);
    BOOST_CHECK_EQUAL(report.nReleased, 6 * COIN);
    BOOST_CHECK_EQUAL(report.nRemainingCap, 0);
    BOOST_CHECK(report.fCapExhausted);

    // Later revenue is accepted but nobody is due anything
    BOOST_CHECK(sim.Run(ledgerAddress, 1 * COIN, 1, "", true, report, state));
    BOOST_CHECK_EQUAL(report.nDeposited, 1 * COIN);
    BOOST_CHECK(report.vPaid.empty());
    BOOST_CHECK(report.fCapExhausted);
}

BOOST_AUTO_TEST_CASE(paused_ledger)
{
    CValidationState state;
    BOOST_CHECK(g_ledgerman->Pause(ledgerAddress, admin, state));

    CPayoutSimulator sim(*g_ledgerman);
    PayoutReport report;
    {
        CValidationState s;
        BOOST_CHECK(!sim.Run(ledgerAddress, 1 * COIN, 1, TestAddress(0xc0), false, report, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-paused");
        BOOST_CHECK_EQUAL(s.GetRejectCode(), REJECT_PAUSED);
    }

    // Admin deposits go through, releases do not
    {
        CValidationState s;
        BOOST_CHECK(!sim.Run(ledgerAddress, 1 * COIN, 1, admin, true, report, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-paused");
    }
    std::shared_ptr<CLedger> ledger = g_ledgerman->GetLedger(ledgerAddress, state);
    BOOST_REQUIRE(ledger);
    BOOST_CHECK_EQUAL(ledger->GetTotalReceived(), 1 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetTotalReleased(), 0);
}

BOOST_AUTO_TEST_CASE(simulator_rejects)
{
    CPayoutSimulator sim(*g_ledgerman);
    PayoutReport report;
    {
        CValidationState state;
        BOOST_CHECK(!sim.Run(ledgerAddress, 0, 1, "", true, report, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-amount");
    }
    {
        CValidationState state;
        BOOST_CHECK(!sim.Run(ledgerAddress, MAX_MONEY + 1, 1, "", true, report, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-amount");
    }
    {
        CValidationState state;
        BOOST_CHECK(!sim.Run(ledgerAddress, 1 * COIN, 0, "", true, report, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-sim-deposits");
    }
    {
        CValidationState state;
        BOOST_CHECK(!sim.Run(ledgerAddress, 4, 5, "", true, report, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-sim-deposits");
    }
    {
        CValidationState state;
        BOOST_CHECK(!sim.Run(TestAddress(0xdead), 1 * COIN, 1, "", true, report, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "ledger-not-found");
    }
    unsigned int nDeposits = 0;
    g_ledgerdb->ForEachDeposit(ledgerAddress, [&](const DepositEntry&) {
        nDeposits++;
        return true;
    });
    BOOST_CHECK_EQUAL(nDeposits, 0U);
}

BOOST_AUTO_TEST_SUITE_END()

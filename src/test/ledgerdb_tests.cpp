// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Ledger persistence tests
 *
 * Tests:
 *   1. Ledger registry: create, lookup, duplicates
 *   2. Snapshots and journals survive a manager restart
 *   3. A snapshot behind its payout journal is rebuilt on load
 *   4. A journal that breaks the invariants refuses to load
 *   5. A release whose snapshot write fails still reports the payout
 */

#include "ledger/ledgerdb.h"
#include "funding/rounddb.h"
#include "ledger/ledgerman.h"
#include "amount.h"
#include "test/test_revsplit.h"
#include "util/validation.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

namespace {

struct LedgerDBFixture : public LedgerTestingSetup {
    const std::string ledgerAddress = TestAddress(0x1ed9e4);
    const std::string admin = TestAddress(0xad);
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);

    LedgerParams MakeParams() const
    {
        LedgerParams params;
        params.address = ledgerAddress;
        params.admin = admin;
        params.shareTable = {{A, 6000}, {B, 4000}};
        params.repaymentCap = 6 * COIN;
        return params;
    }

    /** A second manager over the same DB, as after a restart */
    std::unique_ptr<CLedgerManager> Restart() const
    {
        CLedgerDB* pledgerdb = g_ledgerdb.get();
        return std::make_unique<CLedgerManager>(pledgerdb, [pledgerdb](const std::string& address) {
            return std::unique_ptr<CTransferSink>(new CJournalTransferSink(*pledgerdb, address));
        });
    }
};

/** Ledger DB whose snapshot writes can be made to fail */
class CFlakySnapshotLedgerDB : public CLedgerDB
{
public:
    bool fFailSnapshots = false;

    using CLedgerDB::CLedgerDB;

    bool WriteSnapshot(const LedgerSnapshot& snapshot) override
    {
        if (fFailSnapshots) {
            return false;
        }
        return CLedgerDB::WriteSnapshot(snapshot);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(ledgerdb_tests, LedgerDBFixture)

BOOST_AUTO_TEST_CASE(ledger_registry)
{
    CValidationState state;
    BOOST_CHECK(g_ledgerman->CreateLedger(MakeParams(), state));
    BOOST_CHECK(g_ledgerman->HasLedger(ledgerAddress));
    BOOST_CHECK(g_ledgerdb->HasLedger(ledgerAddress));

    {
        CValidationState s;
        BOOST_CHECK(!g_ledgerman->CreateLedger(MakeParams(), s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-exists");
        BOOST_CHECK_EQUAL(s.GetRejectCode(), REJECT_DUPLICATE);
    }
    {
        CValidationState s;
        BOOST_CHECK(!g_ledgerman->GetLedger(TestAddress(0xdead), s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-not-found");
        BOOST_CHECK_EQUAL(s.GetRejectCode(), REJECT_NOTFOUND);
    }
    {
        CValidationState s;
        BOOST_CHECK(!g_ledgerman->GetLedger("nope", s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-address");
    }
    {
        CValidationState s;
        CAmount nPaid = 0;
        BOOST_CHECK(!g_ledgerman->Release(TestAddress(0xdead), A, A, nPaid, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-not-found");
    }

    LedgerParams second = MakeParams();
    second.address = TestAddress(0x2ed9e4);
    BOOST_CHECK(g_ledgerman->CreateLedger(second, state));

    std::vector<std::string> vLedgers = g_ledgerman->ListLedgers();
    BOOST_REQUIRE_EQUAL(vLedgers.size(), 2U);
    BOOST_CHECK_EQUAL(vLedgers[0], ledgerAddress);
    BOOST_CHECK_EQUAL(vLedgers[1], second.address);
}

BOOST_AUTO_TEST_CASE(ledger_state_survives_restart)
{
    SetMockTime(1700000000);

    CValidationState state;
    BOOST_CHECK(g_ledgerman->CreateLedger(MakeParams(), state));
    BOOST_CHECK(g_ledgerman->Deposit(ledgerAddress, 1 * COIN, TestAddress(0xc0), state));
    BOOST_CHECK(g_ledgerman->Deposit(ledgerAddress, 2 * COIN, "", state));
    CAmount nPaid = 0;
    BOOST_CHECK(g_ledgerman->Release(ledgerAddress, A, A, nPaid, state));
    BOOST_CHECK_EQUAL(nPaid, 180000000);
    BOOST_CHECK(g_ledgerman->Pause(ledgerAddress, admin, state));

    // Journals
    std::vector<DepositEntry> vDeposits;
    g_ledgerdb->ForEachDeposit(ledgerAddress, [&](const DepositEntry& entry) {
        vDeposits.push_back(entry);
        return true;
    });
    BOOST_REQUIRE_EQUAL(vDeposits.size(), 2U);
    BOOST_CHECK_EQUAL(vDeposits[0].nSeq, 0U);
    BOOST_CHECK_EQUAL(vDeposits[0].depositor, TestAddress(0xc0));
    BOOST_CHECK_EQUAL(vDeposits[0].nTime, 1700000000);
    BOOST_CHECK_EQUAL(vDeposits[1].amount, 2 * COIN);

    std::vector<PayoutEntry> vPayouts;
    g_ledgerdb->ForEachPayout(ledgerAddress, [&](const PayoutEntry& entry) {
        vPayouts.push_back(entry);
        return true;
    });
    BOOST_REQUIRE_EQUAL(vPayouts.size(), 1U);
    BOOST_CHECK_EQUAL(vPayouts[0].claimant, A);
    BOOST_CHECK_EQUAL(vPayouts[0].amount, 180000000);

    // Restart
    g_ledgerman = Restart();
    BOOST_CHECK(g_ledgerman->VerifyLedgers());

    std::shared_ptr<CLedger> ledger = g_ledgerman->GetLedger(ledgerAddress, state);
    BOOST_REQUIRE(ledger);
    BOOST_CHECK_EQUAL(ledger->GetTotalReceived(), 3 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetReleased(A), 180000000);
    BOOST_CHECK_EQUAL(ledger->GetPendingPayment(B), 120000000);
    BOOST_CHECK(ledger->IsPaused());
    BOOST_CHECK_EQUAL(ledger->GetAdmin(), admin);
    BOOST_CHECK(ledger->GetShareTable() == MakeParams().shareTable);

    // Payout sequence numbers continue after the restart
    BOOST_CHECK(g_ledgerman->Unpause(ledgerAddress, admin, state));
    BOOST_CHECK(g_ledgerman->Release(ledgerAddress, B, B, nPaid, state));
    BOOST_CHECK_EQUAL(g_ledgerdb->CountPayouts(ledgerAddress), 2U);

    uint32_t nLastSeq = 0;
    g_ledgerdb->ForEachPayout(ledgerAddress, [&](const PayoutEntry& entry) {
        nLastSeq = entry.nSeq;
        return true;
    });
    BOOST_CHECK_EQUAL(nLastSeq, 1U);
}

BOOST_AUTO_TEST_CASE(ledger_rebuild_from_journal)
{
    CValidationState state;
    BOOST_CHECK(g_ledgerman->CreateLedger(MakeParams(), state));
    BOOST_CHECK(g_ledgerman->Deposit(ledgerAddress, 1 * COIN, "", state));

    // A payout reached the journal but the snapshot was never written
    PayoutEntry entry;
    entry.claimant = A;
    entry.amount = 60000000;
    entry.nTime = GetTime();
    entry.nSeq = 0;
    BOOST_CHECK(g_ledgerdb->WritePayout(ledgerAddress, entry));

    LedgerSnapshot snapshot;
    BOOST_CHECK(g_ledgerdb->ReadSnapshot(ledgerAddress, snapshot));
    BOOST_CHECK(!CheckLedgerJournal(*g_ledgerdb, snapshot));

    g_ledgerman = Restart();
    std::shared_ptr<CLedger> ledger = g_ledgerman->GetLedger(ledgerAddress, state);
    BOOST_REQUIRE(ledger);
    BOOST_CHECK_EQUAL(ledger->GetReleased(A), 60000000);
    BOOST_CHECK_EQUAL(ledger->GetTotalReleased(), 60000000);
    BOOST_CHECK_EQUAL(ledger->GetPendingPayment(A), 0);
    BOOST_CHECK_EQUAL(ledger->GetReleaseCount(), 1U);

    // The rebuilt snapshot was written back
    BOOST_CHECK(g_ledgerdb->ReadSnapshot(ledgerAddress, snapshot));
    BOOST_CHECK(CheckLedgerJournal(*g_ledgerdb, snapshot));
    BOOST_CHECK_EQUAL(snapshot.nTotalReleased, 60000000);
}

BOOST_AUTO_TEST_CASE(ledger_corrupt_journal_refused)
{
    CValidationState state;
    BOOST_CHECK(g_ledgerman->CreateLedger(MakeParams(), state));
    BOOST_CHECK(g_ledgerman->Deposit(ledgerAddress, 1 * COIN, "", state));

    // More than A could ever be entitled to
    PayoutEntry entry;
    entry.claimant = A;
    entry.amount = 2 * COIN;
    entry.nSeq = 0;
    BOOST_CHECK(g_ledgerdb->WritePayout(ledgerAddress, entry));

    g_ledgerman = Restart();
    CValidationState s;
    BOOST_CHECK(!g_ledgerman->GetLedger(ledgerAddress, s));
    BOOST_CHECK(s.IsError());
    BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-invariant-ceiling");
    BOOST_CHECK(!g_ledgerman->VerifyLedgers());
}

BOOST_AUTO_TEST_CASE(ledger_release_snapshot_write_failed)
{
    g_ledgerman.reset();
    g_ledgerdb.reset();
    CFlakySnapshotLedgerDB* pflakydb = new CFlakySnapshotLedgerDB(1 << 20, true);
    g_ledgerdb.reset(pflakydb);
    g_ledgerman = Restart();

    CValidationState state;
    BOOST_REQUIRE(g_ledgerman->CreateLedger(MakeParams(), state));
    BOOST_REQUIRE(g_ledgerman->Deposit(ledgerAddress, 1 * COIN, "", state));

    pflakydb->fFailSnapshots = true;
    CAmount nPaid = 0;
    BOOST_CHECK(g_ledgerman->Release(ledgerAddress, A, A, nPaid, state));
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK_EQUAL(nPaid, 60000000);

    // The payout is journaled while the stored snapshot predates it
    uint32_t nPayouts = 0;
    g_ledgerdb->ForEachPayout(ledgerAddress, [&](const PayoutEntry& entry) {
        BOOST_CHECK_EQUAL(entry.amount, 60000000);
        nPayouts++;
        return true;
    });
    BOOST_CHECK_EQUAL(nPayouts, 1U);
    LedgerSnapshot snapshot;
    BOOST_CHECK(g_ledgerdb->ReadSnapshot(ledgerAddress, snapshot));
    BOOST_CHECK_EQUAL(snapshot.nTotalReleased, 0);

    // A second release sees nothing due, both cached and after a restart
    {
        CValidationState s;
        CAmount nAgain = 0;
        BOOST_CHECK(!g_ledgerman->Release(ledgerAddress, A, A, nAgain, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-nothing-due");
    }
    pflakydb->fFailSnapshots = false;
    g_ledgerman = Restart();
    std::shared_ptr<CLedger> ledger = g_ledgerman->GetLedger(ledgerAddress, state);
    BOOST_REQUIRE(ledger);
    BOOST_CHECK_EQUAL(ledger->GetReleased(A), 60000000);
    BOOST_CHECK_EQUAL(ledger->GetPendingPayment(A), 0);
    BOOST_CHECK_EQUAL(ledger->GetPendingPayment(B), 40000000);
    {
        CValidationState s;
        CAmount nAgain = 0;
        BOOST_CHECK(!g_ledgerman->Release(ledgerAddress, A, A, nAgain, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "ledger-nothing-due");
    }
}

BOOST_AUTO_TEST_CASE(ledger_memory_only)
{
    // Without a DB the manager keeps ledgers in memory and uses the given sinks
    CRecordingTransferSink* pSink = nullptr;
    CLedgerManager ledgerman(nullptr, [&pSink](const std::string&) {
        std::unique_ptr<CRecordingTransferSink> sink(new CRecordingTransferSink());
        pSink = sink.get();
        return std::unique_ptr<CTransferSink>(std::move(sink));
    });

    CValidationState state;
    BOOST_CHECK(ledgerman.CreateLedger(MakeParams(), state));
    BOOST_REQUIRE(pSink);
    BOOST_CHECK(ledgerman.Deposit(ledgerAddress, 5 * COIN, "", state));
    CAmount nPaid = 0;
    BOOST_CHECK(ledgerman.Release(ledgerAddress, B, B, nPaid, state));
    BOOST_CHECK_EQUAL(nPaid, 2 * COIN);
    BOOST_REQUIRE_EQUAL(pSink->vTransfers.size(), 1U);
    BOOST_CHECK_EQUAL(pSink->vTransfers[0].first, B);
    BOOST_CHECK(!g_ledgerdb->HasLedger(ledgerAddress));
}

BOOST_AUTO_TEST_CASE(schema_version)
{
    BOOST_CHECK(g_ledgerdb->CheckSchemaVersion());
    BOOST_CHECK(g_rounddb->CheckSchemaVersion());
}

BOOST_AUTO_TEST_SUITE_END()

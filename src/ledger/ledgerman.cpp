// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerman.h"

#include "key_io.h"
#include "ledger/ledgerdb.h"
#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"
#include "utiltime.h"

#include <set>

std::unique_ptr<CLedgerManager> g_ledgerman;

// =============================================================================
// CJournalTransferSink
// =============================================================================

CJournalTransferSink::CJournalTransferSink(CLedgerDB& ledgerdbIn, const std::string& strLedgerIn)
    : ledgerdb(ledgerdbIn), strLedger(strLedgerIn)
{
    nNextSeq = ledgerdb.CountPayouts(strLedger);
}

bool CJournalTransferSink::SendValue(const std::string& address, CAmount amount, std::string& strError)
{
    PayoutEntry entry;
    entry.claimant = address;
    entry.amount = amount;
    entry.nTime = GetTime();
    entry.nSeq = nNextSeq;

    try {
        if (!ledgerdb.WritePayout(strLedger, entry)) {
            strError = "payout journal write failed";
            return false;
        }
    } catch (const dbwrapper_error& e) {
        strError = e.what();
        return false;
    }

    nNextSeq++;
    LogPrint(BCLog::LEDGER, "CJournalTransferSink: ledger=%s seq=%u to=%s amount=%s\n",
             strLedger, entry.nSeq, address, FormatMoney(amount));
    return true;
}

// =============================================================================
// CLedgerManager
// =============================================================================

namespace {

/** Tie the lifetime of a sink to the ledger that points at it */
std::shared_ptr<CLedger> ShareWithSink(std::unique_ptr<CLedger> ledger, std::unique_ptr<CTransferSink> sink)
{
    std::shared_ptr<CTransferSink> sharedSink(std::move(sink));
    return std::shared_ptr<CLedger>(ledger.release(), [sharedSink](CLedger* p) {
        delete p;
    });
}

} // anonymous namespace

CLedgerManager::CLedgerManager(CLedgerDB* pledgerdbIn, TransferSinkFactory sinkFactoryIn)
    : pledgerdb(pledgerdbIn), sinkFactory(std::move(sinkFactoryIn))
{
}

CLedgerManager::~CLedgerManager() = default;

std::shared_ptr<CLedger> CLedgerManager::LoadLedger(const std::string& address, CValidationState& state)
{
    const std::string key = NormalizeDestination(address);
    if (key.empty()) {
        state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("ledger=%s", address));
        return nullptr;
    }

    auto it = mapLedgers.find(key);
    if (it != mapLedgers.end()) {
        return it->second;
    }

    LedgerSnapshot snapshot;
    if (!pledgerdb || !pledgerdb->ReadSnapshot(key, snapshot)) {
        state.Invalid(false, REJECT_NOTFOUND, "ledger-not-found", strprintf("ledger=%s", key));
        return nullptr;
    }

    if (!CheckLedgerJournal(*pledgerdb, snapshot)) {
        LogPrintf("CLedgerManager: snapshot of %s is behind its journal, rebuilding\n", key);
        RebuildSnapshotFromJournal(*pledgerdb, snapshot);
    }

    std::unique_ptr<CTransferSink> sink = sinkFactory(key);
    std::unique_ptr<CLedger> ledger = CLedger::FromSnapshot(snapshot, sink.get(), state);
    if (!ledger) {
        LogPrintf("ERROR: CLedgerManager: cannot load ledger %s: %s\n", key, FormatStateMessage(state));
        return nullptr;
    }

    std::shared_ptr<CLedger> shared = ShareWithSink(std::move(ledger), std::move(sink));
    mapLedgers.emplace(key, shared);

    // Persist the rebuilt snapshot so the next load starts consistent
    if (!PersistSnapshot(*shared, state)) {
        mapLedgers.erase(key);
        return nullptr;
    }

    LogPrint(BCLog::LEDGER, "CLedgerManager: loaded ledger %s\n", key);
    return shared;
}

bool CLedgerManager::PersistSnapshot(const CLedger& ledger, CValidationState& state)
{
    if (!pledgerdb) {
        return true;
    }
    try {
        if (!pledgerdb->WriteSnapshot(ledger.GetSnapshot())) {
            return state.Error("ledger-db-write-failed", strprintf("ledger=%s", ledger.GetAddress()));
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: CLedgerManager: snapshot write failed for %s: %s\n", ledger.GetAddress(), e.what());
        return state.Error("ledger-db-write-failed", e.what());
    }
    return true;
}

bool CLedgerManager::CreateLedger(const LedgerParams& params, CValidationState& state)
{
    LOCK(cs);

    const std::string key = NormalizeDestination(params.address);
    if (!key.empty() && (mapLedgers.count(key) || (pledgerdb && pledgerdb->HasLedger(key)))) {
        return state.Invalid(false, REJECT_DUPLICATE, "ledger-exists", strprintf("ledger=%s", key));
    }

    std::unique_ptr<CTransferSink> sink = sinkFactory(key);
    std::unique_ptr<CLedger> ledger = CLedger::Create(params, sink.get(), state);
    if (!ledger) {
        return false;
    }

    if (!PersistSnapshot(*ledger, state)) {
        return false;
    }

    LogPrintf("Ledger %s created: payees=%u cap=%s admin=%s\n",
              ledger->GetAddress(), ledger->GetShareTable().size(),
              FormatMoney(ledger->GetRepaymentCap()), ledger->GetAdmin());

    const std::string strAddress = ledger->GetAddress();
    mapLedgers.emplace(strAddress, ShareWithSink(std::move(ledger), std::move(sink)));
    return true;
}

std::shared_ptr<CLedger> CLedgerManager::GetLedger(const std::string& address, CValidationState& state)
{
    LOCK(cs);
    return LoadLedger(address, state);
}

bool CLedgerManager::HasLedger(const std::string& address) const
{
    const std::string key = NormalizeDestination(address);
    if (key.empty()) {
        return false;
    }
    LOCK(cs);
    return mapLedgers.count(key) || (pledgerdb && pledgerdb->HasLedger(key));
}

std::vector<std::string> CLedgerManager::ListLedgers() const
{
    std::set<std::string> setAddresses;
    {
        LOCK(cs);
        for (const auto& entry : mapLedgers) {
            setAddresses.insert(entry.first);
        }
    }
    if (pledgerdb) {
        pledgerdb->ForEachLedger([&](const LedgerSnapshot& snapshot) {
            setAddresses.insert(snapshot.params.address);
            return true;
        });
    }
    return std::vector<std::string>(setAddresses.begin(), setAddresses.end());
}

bool CLedgerManager::VerifyLedgers()
{
    bool fOk = true;
    for (const std::string& address : ListLedgers()) {
        CValidationState state;
        if (!GetLedger(address, state)) {
            LogPrintf("ERROR: VerifyLedgers: ledger %s: %s\n", address, FormatStateMessage(state));
            fOk = false;
        }
    }
    return fOk;
}

bool CLedgerManager::Deposit(const std::string& address, CAmount amount, const std::string& caller, CValidationState& state)
{
    LOCK(cs);
    std::shared_ptr<CLedger> ledger = LoadLedger(address, state);
    if (!ledger) {
        return false;
    }
    if (!ledger->Deposit(amount, caller, state)) {
        return false;
    }
    if (!pledgerdb) {
        return true;
    }

    DepositEntry entry;
    entry.depositor = caller;
    entry.amount = amount;
    entry.nTime = GetTime();
    entry.nSeq = ledger->GetDepositCount() - 1;

    try {
        CLedgerDB::Batch batch = pledgerdb->CreateBatch();
        batch.WriteDeposit(ledger->GetAddress(), entry);
        batch.WriteSnapshot(ledger->GetSnapshot());
        if (batch.Commit()) {
            return true;
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: CLedgerManager: deposit write failed for %s: %s\n", ledger->GetAddress(), e.what());
    }

    // The DB still holds the pre-deposit state; drop the cached copy
    mapLedgers.erase(ledger->GetAddress());
    return state.Error("ledger-db-write-failed", strprintf("deposit to %s not recorded", ledger->GetAddress()));
}

bool CLedgerManager::Release(const std::string& address, const std::string& claimant, const std::string& caller,
                             CAmount& amountOut, CValidationState& state)
{
    LOCK(cs);
    std::shared_ptr<CLedger> ledger = LoadLedger(address, state);
    if (!ledger) {
        return false;
    }
    if (!ledger->Release(claimant, caller, amountOut, state)) {
        return false;
    }

    // The value has been sent. The cached ledger stays authoritative, and the
    // payout journal rebuilds the snapshot if it is still stale on the next load.
    CValidationState persistState;
    if (!PersistSnapshot(*ledger, persistState)) {
        LogPrintf("ERROR: CLedgerManager: release of %s to %s done but snapshot not written: %s\n",
                  FormatMoney(amountOut), ledger->GetAddress(), FormatStateMessage(persistState));
    }
    return true;
}

bool CLedgerManager::Pause(const std::string& address, const std::string& caller, CValidationState& state)
{
    LOCK(cs);
    std::shared_ptr<CLedger> ledger = LoadLedger(address, state);
    if (!ledger) {
        return false;
    }
    if (!ledger->Pause(caller, state)) {
        return false;
    }
    if (!PersistSnapshot(*ledger, state)) {
        mapLedgers.erase(ledger->GetAddress());
        return false;
    }
    return true;
}

bool CLedgerManager::Unpause(const std::string& address, const std::string& caller, CValidationState& state)
{
    LOCK(cs);
    std::shared_ptr<CLedger> ledger = LoadLedger(address, state);
    if (!ledger) {
        return false;
    }
    if (!ledger->Unpause(caller, state)) {
        return false;
    }
    if (!PersistSnapshot(*ledger, state)) {
        mapLedgers.erase(ledger->GetAddress());
        return false;
    }
    return true;
}

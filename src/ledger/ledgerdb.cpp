// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerdb.h"

#include "logging.h"
#include "util/system.h"
#include "version.h"

#include <algorithm>
#include <map>
#include <vector>

// Global ledger DB instance
std::unique_ptr<CLedgerDB> g_ledgerdb;

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

std::pair<char, std::pair<std::string, uint32_t>> MakeJournalKey(char prefix, const std::string& address, uint32_t nSeq)
{
    return std::make_pair(prefix, std::make_pair(address, nSeq));
}

/** Read all journal entries of one ledger, ordered by sequence number */
template<typename Entry>
std::vector<Entry> ReadJournal(CDBWrapper& db, char prefix, const std::string& address)
{
    std::vector<Entry> entries;
    std::unique_ptr<CDBIterator> it(db.NewIterator());
    it->Seek(MakeJournalKey(prefix, address, 0));

    while (it->Valid()) {
        std::pair<char, std::pair<std::string, uint32_t>> key;
        if (it->GetKey(key) && key.first == prefix && key.second.first == address) {
            Entry entry;
            if (it->GetValue(entry)) {
                entries.push_back(entry);
            }
            it->Next();
        } else {
            break;  // No more entries for this ledger
        }
    }

    // Sequence numbers are stored little-endian, so key order is not seq order
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.nSeq < b.nSeq;
    });
    return entries;
}

} // anonymous namespace

CLedgerDB::CLedgerDB(size_t nCacheSize, bool fWipe)
{
    fs::path path = GetDataDir() / "ledgers";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fWipe);
}

CLedgerDB::~CLedgerDB() = default;

bool CLedgerDB::CheckSchemaVersion()
{
    int nVersion = 0;
    if (db->Read(DB_LEDGER_VERSION, nVersion)) {
        if (nVersion != DB_SCHEMA_VERSION) {
            return error("CLedgerDB: schema version %d, expected %d", nVersion, DB_SCHEMA_VERSION);
        }
        return true;
    }
    if (!db->IsEmpty()) {
        return error("CLedgerDB: database has no schema version");
    }
    return db->Write(DB_LEDGER_VERSION, DB_SCHEMA_VERSION, true);
}

// =============================================================================
// Snapshots
// =============================================================================

bool CLedgerDB::WriteSnapshot(const LedgerSnapshot& snapshot)
{
    return db->Write(MakeKey(DB_LEDGER, snapshot.params.address), snapshot);
}

bool CLedgerDB::ReadSnapshot(const std::string& address, LedgerSnapshot& snapshot) const
{
    return db->Read(MakeKey(DB_LEDGER, address), snapshot);
}

bool CLedgerDB::HasLedger(const std::string& address) const
{
    return db->Exists(MakeKey(DB_LEDGER, address));
}

void CLedgerDB::ForEachLedger(std::function<bool(const LedgerSnapshot&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_LEDGER, std::string()));

    while (it->Valid()) {
        std::pair<char, std::string> key;
        if (it->GetKey(key) && key.first == DB_LEDGER) {
            LedgerSnapshot snapshot;
            if (it->GetValue(snapshot)) {
                if (!func(snapshot)) {
                    break;  // Callback returned false, stop iteration
                }
            }
            it->Next();
        } else {
            break;  // No more ledger entries
        }
    }
}

// =============================================================================
// Journals
// =============================================================================

bool CLedgerDB::WritePayout(const std::string& address, const PayoutEntry& entry)
{
    // Payouts are the record of a transfer: write synchronously
    return db->Write(MakeJournalKey(DB_PAYOUT, address, entry.nSeq), entry, true);
}

void CLedgerDB::ForEachPayout(const std::string& address, std::function<bool(const PayoutEntry&)> func) const
{
    for (const PayoutEntry& entry : ReadJournal<PayoutEntry>(*db, DB_PAYOUT, address)) {
        if (!func(entry)) {
            break;
        }
    }
}

uint32_t CLedgerDB::CountPayouts(const std::string& address) const
{
    uint32_t nCount = 0;
    ForEachPayout(address, [&](const PayoutEntry&) {
        nCount++;
        return true;
    });
    return nCount;
}

bool CLedgerDB::WriteDeposit(const std::string& address, const DepositEntry& entry)
{
    return db->Write(MakeJournalKey(DB_DEPOSIT, address, entry.nSeq), entry);
}

void CLedgerDB::ForEachDeposit(const std::string& address, std::function<bool(const DepositEntry&)> func) const
{
    for (const DepositEntry& entry : ReadJournal<DepositEntry>(*db, DB_DEPOSIT, address)) {
        if (!func(entry)) {
            break;
        }
    }
}

bool CLedgerDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// Batch
// =============================================================================

CLedgerDB::Batch::Batch(CLedgerDB& db) : parent(db)
{
}

void CLedgerDB::Batch::WriteSnapshot(const LedgerSnapshot& snapshot)
{
    batch.Write(MakeKey(DB_LEDGER, snapshot.params.address), snapshot);
}

void CLedgerDB::Batch::WriteDeposit(const std::string& address, const DepositEntry& entry)
{
    batch.Write(MakeJournalKey(DB_DEPOSIT, address, entry.nSeq), entry);
}

bool CLedgerDB::Batch::Commit()
{
    return parent.db->WriteBatch(batch, true);
}

// =============================================================================
// Init / consistency
// =============================================================================

bool InitLedgerDB(size_t nCacheSize, bool fWipe)
{
    try {
        g_ledgerdb.reset();
        g_ledgerdb = std::make_unique<CLedgerDB>(nCacheSize, fWipe);
        if (!g_ledgerdb->CheckSchemaVersion()) {
            g_ledgerdb.reset();
            return false;
        }
        LogPrintf("Ledger DB initialized\n");
        return true;
    } catch (const std::exception& e) {
        g_ledgerdb.reset();
        return error("InitLedgerDB: %s", e.what());
    }
}

bool CheckLedgerJournal(const CLedgerDB& ledgerdb, const LedgerSnapshot& snapshot)
{
    const std::string& address = snapshot.params.address;

    CAmount nDeposited = 0;
    uint32_t nDeposits = 0;
    ledgerdb.ForEachDeposit(address, [&](const DepositEntry& entry) {
        nDeposited += entry.amount;
        nDeposits++;
        return true;
    });

    std::map<std::string, CAmount> mapPaid;
    uint32_t nPayouts = 0;
    ledgerdb.ForEachPayout(address, [&](const PayoutEntry& entry) {
        mapPaid[entry.claimant] += entry.amount;
        nPayouts++;
        return true;
    });

    // Zero entries may be absent from either side
    std::map<std::string, CAmount> mapReleased;
    for (const auto& entry : snapshot.mapReleased) {
        if (entry.second != 0) mapReleased.insert(entry);
    }

    bool fConsistent = true;
    if (nDeposited != snapshot.nTotalReceived || nDeposits != snapshot.nDeposits) {
        LogPrintf("CheckLedgerJournal: ledger=%s deposits journal=%lld (%u) snapshot=%lld (%u)\n",
                  address, (long long)nDeposited, nDeposits, (long long)snapshot.nTotalReceived, snapshot.nDeposits);
        fConsistent = false;
    }
    if (mapPaid != mapReleased || nPayouts != snapshot.nReleases) {
        LogPrintf("CheckLedgerJournal: ledger=%s payout journal (%u entries) differs from snapshot (%u releases)\n",
                  address, nPayouts, snapshot.nReleases);
        fConsistent = false;
    }
    return fConsistent;
}

void RebuildSnapshotFromJournal(const CLedgerDB& ledgerdb, LedgerSnapshot& snapshot)
{
    const std::string& address = snapshot.params.address;

    snapshot.nTotalReceived = 0;
    snapshot.nDeposits = 0;
    ledgerdb.ForEachDeposit(address, [&](const DepositEntry& entry) {
        snapshot.nTotalReceived += entry.amount;
        snapshot.nDeposits++;
        return true;
    });

    snapshot.mapReleased.clear();
    snapshot.nTotalReleased = 0;
    snapshot.nReleases = 0;
    ledgerdb.ForEachPayout(address, [&](const PayoutEntry& entry) {
        snapshot.mapReleased[entry.claimant] += entry.amount;
        snapshot.nTotalReleased += entry.amount;
        snapshot.nReleases++;
        return true;
    });

    LogPrintf("RebuildSnapshotFromJournal: ledger=%s received=%lld released=%lld deposits=%u payouts=%u\n",
              address, (long long)snapshot.nTotalReceived, (long long)snapshot.nTotalReleased,
              snapshot.nDeposits, snapshot.nReleases);
}

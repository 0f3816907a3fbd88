// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_LEDGER_LEDGERDB_H
#define REVSPLIT_LEDGER_LEDGERDB_H

/**
 * Ledger database
 *
 * DB Keys (all use CDBBatch):
 * 'L' + address           -> LedgerSnapshot
 * 'P' + (address, seq)    -> PayoutEntry (transfer journal)
 * 'D' + (address, seq)    -> DepositEntry
 * 'V'                     -> schema version
 *
 * The journals are append-only. A snapshot is a cache of what the journals
 * imply; CheckLedgerJournal / RebuildSnapshotFromJournal restore it when the
 * process stopped between a payout and the following snapshot write.
 */

#include "amount.h"
#include "dbwrapper.h"
#include "ledger/ledger.h"
#include "serialize.h"

#include <functional>
#include <memory>
#include <stdint.h>
#include <string>

static const char DB_LEDGER = 'L';
static const char DB_PAYOUT = 'P';
static const char DB_DEPOSIT = 'D';
static const char DB_LEDGER_VERSION = 'V';

/** One completed transfer to a claimant */
struct PayoutEntry
{
    std::string claimant;
    CAmount amount;
    int64_t nTime;
    uint32_t nSeq;

    PayoutEntry() { SetNull(); }

    void SetNull()
    {
        claimant.clear();
        amount = 0;
        nTime = 0;
        nSeq = 0;
    }

    bool IsNull() const { return claimant.empty(); }

    SERIALIZE_METHODS(PayoutEntry, obj)
    {
        READWRITE(obj.claimant);
        READWRITE(obj.amount);
        READWRITE(obj.nTime);
        READWRITE(obj.nSeq);
    }
};

/** One accepted deposit */
struct DepositEntry
{
    std::string depositor;       // empty for anonymous deposits
    CAmount amount;
    int64_t nTime;
    uint32_t nSeq;

    DepositEntry() { SetNull(); }

    void SetNull()
    {
        depositor.clear();
        amount = 0;
        nTime = 0;
        nSeq = 0;
    }

    SERIALIZE_METHODS(DepositEntry, obj)
    {
        READWRITE(obj.depositor);
        READWRITE(obj.amount);
        READWRITE(obj.nTime);
        READWRITE(obj.nSeq);
    }
};

class CLedgerDB
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    explicit CLedgerDB(size_t nCacheSize, bool fWipe = false);
    virtual ~CLedgerDB();

    /** Stamp an empty DB with DB_SCHEMA_VERSION; false if a stamped DB differs */
    bool CheckSchemaVersion();

    // Snapshots
    virtual bool WriteSnapshot(const LedgerSnapshot& snapshot);
    bool ReadSnapshot(const std::string& address, LedgerSnapshot& snapshot) const;
    bool HasLedger(const std::string& address) const;

    /**
     * ForEachLedger - Iterate over all ledger snapshots
     *
     * @param func Callback function (return false to stop iteration)
     */
    void ForEachLedger(std::function<bool(const LedgerSnapshot&)> func) const;

    // Journals
    bool WritePayout(const std::string& address, const PayoutEntry& entry);
    void ForEachPayout(const std::string& address, std::function<bool(const PayoutEntry&)> func) const;
    uint32_t CountPayouts(const std::string& address) const;

    bool WriteDeposit(const std::string& address, const DepositEntry& entry);
    void ForEachDeposit(const std::string& address, std::function<bool(const DepositEntry&)> func) const;

    // Batch operations for atomic updates
    class Batch
    {
    private:
        CDBBatch batch;
        CLedgerDB& parent;

    public:
        explicit Batch(CLedgerDB& db);

        void WriteSnapshot(const LedgerSnapshot& snapshot);
        void WriteDeposit(const std::string& address, const DepositEntry& entry);

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();
};

// Global ledger DB instance
extern std::unique_ptr<CLedgerDB> g_ledgerdb;

/**
 * InitLedgerDB - Open (or create) the ledger database under the data dir
 *
 * Refuses a database written with a different DB_SCHEMA_VERSION.
 */
bool InitLedgerDB(size_t nCacheSize, bool fWipe = false);

/**
 * CheckLedgerJournal - Compare a snapshot with its journals
 *
 * @return true if totalReceived equals the deposit journal sum and every
 *         released[c] equals the payout journal sum for c
 */
bool CheckLedgerJournal(const CLedgerDB& ledgerdb, const LedgerSnapshot& snapshot);

/**
 * RebuildSnapshotFromJournal - Recompute the mutable totals of a snapshot
 * from the deposit and payout journals. Params and flags are kept.
 */
void RebuildSnapshotFromJournal(const CLedgerDB& ledgerdb, LedgerSnapshot& snapshot);

#endif // REVSPLIT_LEDGER_LEDGERDB_H

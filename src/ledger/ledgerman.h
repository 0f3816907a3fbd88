// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_LEDGER_LEDGERMAN_H
#define REVSPLIT_LEDGER_LEDGERMAN_H

#include "amount.h"
#include "ledger/ledger.h"
#include "sync.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class CLedgerDB;
class CValidationState;

/**
 * Transfer sink that records each payout in the ledger DB payout journal.
 * A payout exists once its journal entry is on disk.
 */
class CJournalTransferSink : public CTransferSink
{
private:
    CLedgerDB& ledgerdb;
    const std::string strLedger;
    uint32_t nNextSeq;

public:
    CJournalTransferSink(CLedgerDB& ledgerdbIn, const std::string& strLedgerIn);

    bool SendValue(const std::string& address, CAmount amount, std::string& strError) override;
};

/** Creates the transfer sink of a ledger, keyed by ledger address */
typedef std::function<std::unique_ptr<CTransferSink>(const std::string& address)> TransferSinkFactory;

/**
 * Registry of deployed ledgers.
 *
 * Every mutating operation runs the ledger operation and the DB write under
 * cs, so snapshots reach the DB in operation order. With a null DB the
 * ledgers only live in memory.
 *
 * Each ledger owns its transfer sink through the shared_ptr deleter, so a
 * ledger handed out stays usable after it is evicted from the cache.
 */
class CLedgerManager
{
private:
    CLedgerDB* pledgerdb;
    TransferSinkFactory sinkFactory;

    mutable RecursiveMutex cs;
    std::map<std::string, std::shared_ptr<CLedger>> mapLedgers GUARDED_BY(cs);

    std::shared_ptr<CLedger> LoadLedger(const std::string& address, CValidationState& state) EXCLUSIVE_LOCKS_REQUIRED(cs);
    bool PersistSnapshot(const CLedger& ledger, CValidationState& state) EXCLUSIVE_LOCKS_REQUIRED(cs);

public:
    CLedgerManager(CLedgerDB* pledgerdbIn, TransferSinkFactory sinkFactoryIn);
    ~CLedgerManager();

    /** Register a freshly deployed ledger; ledger-exists if the address is taken */
    bool CreateLedger(const LedgerParams& params, CValidationState& state);

    /** Cached or loaded ledger, nullptr with ledger-not-found / bad-address */
    std::shared_ptr<CLedger> GetLedger(const std::string& address, CValidationState& state);

    bool HasLedger(const std::string& address) const;
    std::vector<std::string> ListLedgers() const;

    /**
     * Load every persisted ledger once, rebuilding snapshots that disagree
     * with their journals. Returns false if any ledger cannot be loaded.
     */
    bool VerifyLedgers();

    bool Deposit(const std::string& address, CAmount amount, const std::string& caller, CValidationState& state);
    bool Release(const std::string& address, const std::string& claimant, const std::string& caller,
                 CAmount& amountOut, CValidationState& state);
    bool Pause(const std::string& address, const std::string& caller, CValidationState& state);
    bool Unpause(const std::string& address, const std::string& caller, CValidationState& state);
};

// Global ledger registry
extern std::unique_ptr<CLedgerManager> g_ledgerman;

#endif // REVSPLIT_LEDGER_LEDGERMAN_H

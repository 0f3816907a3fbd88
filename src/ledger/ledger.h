// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_LEDGER_LEDGER_H
#define REVSPLIT_LEDGER_LEDGER_H

/**
 * Revenue-split ledger
 *
 * Pull-payment accounting for one deployed share table:
 * - Deposit() grows totalReceived
 * - each claimant pulls its entitlement with Release()
 *
 * Entitlement ceiling of a claimant with s basis points:
 *   min(floor(totalReceived * s / 10000), floor(repaymentCap * s / 10000))
 *
 * Invariants (checked after every mutation, see CheckInvariants):
 *   L1: totalReleased <= repaymentCap
 *   L2: 0 <= released[c] <= entitlement ceiling of c
 *   L3: totalReleased == sum(released)
 *   L4: share table, cap, admin and address never change
 */

#include "allocation/shares.h"
#include "amount.h"
#include "serialize.h"
#include "sync.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

class CValidationState;

/**
 * Value transfer collaborator.
 *
 * SendValue either fully succeeds or fully fails. On failure it fills
 * strError and the ledger rolls back the release.
 */
class CTransferSink
{
public:
    virtual ~CTransferSink() {}
    virtual bool SendValue(const std::string& address, CAmount amount, std::string& strError) = 0;
};

/** Write-once parameters of a ledger */
struct LedgerParams
{
    std::string address;         // ledger identifier
    std::string admin;           // may pause/unpause, bypasses pause
    ShareTable shareTable;
    CAmount repaymentCap;

    LedgerParams() { SetNull(); }

    void SetNull()
    {
        address.clear();
        admin.clear();
        shareTable.clear();
        repaymentCap = 0;
    }

    bool IsNull() const { return address.empty(); }

    SERIALIZE_METHODS(LedgerParams, obj)
    {
        READWRITE(obj.address);
        READWRITE(obj.admin);
        READWRITE(obj.shareTable);
        READWRITE(obj.repaymentCap);
    }
};

/** Full persisted state of a ledger */
struct LedgerSnapshot
{
    LedgerParams params;
    CAmount nTotalReceived;
    CAmount nTotalReleased;
    std::map<std::string, CAmount> mapReleased;
    bool fPaused;
    bool fCapReached;            // CapReached already emitted
    uint32_t nDeposits;
    uint32_t nReleases;

    LedgerSnapshot() { SetNull(); }

    void SetNull()
    {
        params.SetNull();
        nTotalReceived = 0;
        nTotalReleased = 0;
        mapReleased.clear();
        fPaused = false;
        fCapReached = false;
        nDeposits = 0;
        nReleases = 0;
    }

    bool IsNull() const { return params.IsNull(); }

    SERIALIZE_METHODS(LedgerSnapshot, obj)
    {
        READWRITE(obj.params);
        READWRITE(obj.nTotalReceived);
        READWRITE(obj.nTotalReleased);
        READWRITE(obj.mapReleased);
        READWRITE(obj.fPaused);
        READWRITE(obj.fCapReached);
        READWRITE(obj.nDeposits);
        READWRITE(obj.nReleases);
    }
};

class CLedger
{
private:
    const LedgerParams params;
    std::map<std::string, int64_t> mapShares;    // claimant -> basis points, built once

    CTransferSink* pSink;                        // not owned

    mutable RecursiveMutex cs;
    CAmount nTotalReceived GUARDED_BY(cs);
    CAmount nTotalReleased GUARDED_BY(cs);
    std::map<std::string, CAmount> mapReleased GUARDED_BY(cs);
    bool fPaused GUARDED_BY(cs);
    bool fCapReached GUARDED_BY(cs);
    bool fInRelease GUARDED_BY(cs);
    uint32_t nDeposits GUARDED_BY(cs);
    uint32_t nReleases GUARDED_BY(cs);

    CLedger(const LedgerParams& paramsIn, CTransferSink* pSinkIn);

    CAmount GetCeiling(int64_t nShares) const EXCLUSIVE_LOCKS_REQUIRED(cs);
    CAmount GetPendingPaymentLocked(const std::string& claimant) const EXCLUSIVE_LOCKS_REQUIRED(cs);
    bool IsCapExhaustedLocked() const EXCLUSIVE_LOCKS_REQUIRED(cs);
    bool CheckInvariantsLocked(CValidationState& state) const EXCLUSIVE_LOCKS_REQUIRED(cs);
    void UpdateCapReached() EXCLUSIVE_LOCKS_REQUIRED(cs);

public:
    /**
     * Validate parameters and build a fresh ledger.
     *
     * Addresses (ledger, admin, claimants) are stored in canonical form.
     * Fails with bad-address, bad-alloc-empty, bad-alloc-duplicate-claimant,
     * bad-shares-zero, bad-shares-sum or bad-cap-range.
     */
    static std::unique_ptr<CLedger> Create(const LedgerParams& paramsIn, CTransferSink* pSinkIn, CValidationState& state);

    /** Rebuild a ledger from persisted state; the snapshot must pass CheckInvariants */
    static std::unique_ptr<CLedger> FromSnapshot(const LedgerSnapshot& snapshot, CTransferSink* pSinkIn, CValidationState& state);

    CLedger(const CLedger&) = delete;
    CLedger& operator=(const CLedger&) = delete;

    /**
     * Add revenue. Requires amount > 0 and an active ledger, unless caller is the admin.
     * Errors: bad-amount, ledger-paused, bad-alloc-overflow.
     */
    bool Deposit(CAmount amount, const std::string& caller, CValidationState& state);

    /** Amount the claimant could release now (0 for unknown claimants) */
    CAmount GetPendingPayment(const std::string& claimant) const;

    /**
     * Pay the pending amount of claimant through the transfer sink.
     *
     * Bookkeeping and transfer run under cs; a failed transfer restores
     * the previous state. A call re-entering from inside SendValue is
     * rejected with ledger-reentrant.
     */
    bool Release(const std::string& claimant, const std::string& caller, CAmount& amountOut, CValidationState& state);

    bool Pause(const std::string& caller, CValidationState& state);
    bool Unpause(const std::string& caller, CValidationState& state);

    bool IsPaused() const;
    bool IsCapExhausted() const;
    CAmount GetRemainingCap() const;
    CAmount GetTotalReceived() const;
    CAmount GetTotalReleased() const;
    CAmount GetReleased(const std::string& claimant) const;
    int64_t GetShares(const std::string& claimant) const;
    std::vector<std::string> GetPayees() const;
    uint32_t GetDepositCount() const;
    uint32_t GetReleaseCount() const;

    const LedgerParams& GetParams() const { return params; }
    const std::string& GetAddress() const { return params.address; }
    const std::string& GetAdmin() const { return params.admin; }
    const ShareTable& GetShareTable() const { return params.shareTable; }
    CAmount GetRepaymentCap() const { return params.repaymentCap; }

    LedgerSnapshot GetSnapshot() const;

    /** Check L1-L3; fills state with ledger-invariant-* (mode ERROR) on failure */
    bool CheckInvariants(CValidationState& state) const;
};

#endif // REVSPLIT_LEDGER_LEDGER_H

// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger.h"

#include "key_io.h"
#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"

#include <algorithm>

CLedger::CLedger(const LedgerParams& paramsIn, CTransferSink* pSinkIn)
    : params(paramsIn),
      pSink(pSinkIn),
      nTotalReceived(0),
      nTotalReleased(0),
      fPaused(false),
      fCapReached(false),
      fInRelease(false),
      nDeposits(0),
      nReleases(0)
{
    for (const ShareEntry& entry : params.shareTable) {
        mapShares.emplace(entry.claimant, entry.nShares);
    }
}

std::unique_ptr<CLedger> CLedger::Create(const LedgerParams& paramsIn, CTransferSink* pSinkIn, CValidationState& state)
{
    if (pSinkIn == nullptr) {
        state.Error("ledger-no-transfer-sink");
        return nullptr;
    }
    if (!IsValidDestinationString(paramsIn.address)) {
        state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("ledger=%s", paramsIn.address));
        return nullptr;
    }
    if (!IsValidDestinationString(paramsIn.admin)) {
        state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("admin=%s", paramsIn.admin));
        return nullptr;
    }
    if (!CheckShareTable(paramsIn.shareTable, state)) {
        return nullptr;
    }
    if (paramsIn.repaymentCap <= 0 || !MoneyRange(paramsIn.repaymentCap)) {
        state.Invalid(false, REJECT_INVALID, "bad-cap-range",
                      strprintf("cap=%lld", (long long)paramsIn.repaymentCap));
        return nullptr;
    }

    LedgerParams canonical;
    canonical.address = NormalizeDestination(paramsIn.address);
    canonical.admin = NormalizeDestination(paramsIn.admin);
    canonical.repaymentCap = paramsIn.repaymentCap;
    for (const ShareEntry& entry : paramsIn.shareTable) {
        canonical.shareTable.emplace_back(NormalizeDestination(entry.claimant), entry.nShares);
    }

    return std::unique_ptr<CLedger>(new CLedger(canonical, pSinkIn));
}

std::unique_ptr<CLedger> CLedger::FromSnapshot(const LedgerSnapshot& snapshot, CTransferSink* pSinkIn, CValidationState& state)
{
    std::unique_ptr<CLedger> ledger = Create(snapshot.params, pSinkIn, state);
    if (!ledger) {
        return nullptr;
    }

    {
        LOCK(ledger->cs);
        for (const auto& entry : snapshot.mapReleased) {
            if (!ledger->mapShares.count(entry.first)) {
                state.Error("ledger-invariant-payee",
                            strprintf("ledger=%s released to unknown claimant %s", snapshot.params.address, entry.first));
                return nullptr;
            }
        }
        ledger->nTotalReceived = snapshot.nTotalReceived;
        ledger->nTotalReleased = snapshot.nTotalReleased;
        ledger->mapReleased = snapshot.mapReleased;
        ledger->fPaused = snapshot.fPaused;
        ledger->fCapReached = snapshot.fCapReached;
        ledger->nDeposits = snapshot.nDeposits;
        ledger->nReleases = snapshot.nReleases;

        if (!ledger->CheckInvariantsLocked(state)) {
            return nullptr;
        }
    }
    return ledger;
}

// =============================================================================
// Accounting
// =============================================================================

CAmount CLedger::GetCeiling(int64_t nShares) const
{
    CAmount nEntitlement = MulDivFloor(nTotalReceived, nShares, TOTAL_SHARES);
    CAmount nEntitlementCap = MulDivFloor(params.repaymentCap, nShares, TOTAL_SHARES);
    return std::min(nEntitlement, nEntitlementCap);
}

CAmount CLedger::GetPendingPaymentLocked(const std::string& claimant) const
{
    auto itShares = mapShares.find(claimant);
    if (itShares == mapShares.end()) {
        return 0;
    }
    CAmount nReleased = 0;
    auto itReleased = mapReleased.find(claimant);
    if (itReleased != mapReleased.end()) {
        nReleased = itReleased->second;
    }
    return std::max<CAmount>(0, GetCeiling(itShares->second) - nReleased);
}

bool CLedger::IsCapExhaustedLocked() const
{
    for (const auto& entry : mapShares) {
        CAmount nEntitlementCap = MulDivFloor(params.repaymentCap, entry.second, TOTAL_SHARES);
        auto it = mapReleased.find(entry.first);
        CAmount nReleased = (it != mapReleased.end()) ? it->second : 0;
        if (nReleased < nEntitlementCap) {
            return false;
        }
    }
    return true;
}

void CLedger::UpdateCapReached()
{
    if (!fCapReached && IsCapExhaustedLocked()) {
        fCapReached = true;
        LogPrintf("CapReached: ledger=%s cap=%s released=%s\n",
                  params.address, FormatMoney(params.repaymentCap), FormatMoney(nTotalReleased));
    }
}

bool CLedger::CheckInvariantsLocked(CValidationState& state) const
{
    if (nTotalReceived < 0 || nTotalReleased < 0) {
        LogPrintf("ERROR: CLedger: negative totals ledger=%s received=%lld released=%lld\n",
                  params.address, (long long)nTotalReceived, (long long)nTotalReleased);
        return state.Error("ledger-invariant-negative",
                           strprintf("received=%lld released=%lld", (long long)nTotalReceived, (long long)nTotalReleased));
    }

    // L1
    if (nTotalReleased > params.repaymentCap) {
        LogPrintf("ERROR: CLedger: L1 violated ledger=%s released=%lld > cap=%lld\n",
                  params.address, (long long)nTotalReleased, (long long)params.repaymentCap);
        return state.Error("ledger-invariant-cap",
                           strprintf("released=%lld cap=%lld", (long long)nTotalReleased, (long long)params.repaymentCap));
    }

    // L2 + L3
    CAmount nSum = 0;
    for (const auto& entry : mapReleased) {
        auto itShares = mapShares.find(entry.first);
        if (entry.second < 0) {
            LogPrintf("ERROR: CLedger: L2 violated ledger=%s claimant=%s released=%lld\n",
                      params.address, entry.first, (long long)entry.second);
            return state.Error("ledger-invariant-negative",
                               strprintf("claimant=%s released=%lld", entry.first, (long long)entry.second));
        }
        if (itShares == mapShares.end() || entry.second > GetCeiling(itShares->second)) {
            LogPrintf("ERROR: CLedger: L2 violated ledger=%s claimant=%s released=%lld exceeds ceiling\n",
                      params.address, entry.first, (long long)entry.second);
            return state.Error("ledger-invariant-ceiling",
                               strprintf("claimant=%s released=%lld", entry.first, (long long)entry.second));
        }
        nSum += entry.second;
    }
    if (nSum != nTotalReleased) {
        LogPrintf("ERROR: CLedger: L3 violated ledger=%s sum(released)=%lld != totalReleased=%lld\n",
                  params.address, (long long)nSum, (long long)nTotalReleased);
        return state.Error("ledger-invariant-sum",
                           strprintf("sum=%lld total=%lld", (long long)nSum, (long long)nTotalReleased));
    }
    return true;
}

bool CLedger::CheckInvariants(CValidationState& state) const
{
    LOCK(cs);
    return CheckInvariantsLocked(state);
}

// =============================================================================
// Operations
// =============================================================================

bool CLedger::Deposit(CAmount amount, const std::string& caller, CValidationState& state)
{
    if (amount <= 0 || !MoneyRange(amount)) {
        return state.Invalid(false, REJECT_INVALID, "bad-amount",
                             strprintf("amount=%lld", (long long)amount));
    }

    const bool fAdmin = NormalizeDestination(caller) == params.admin;

    LOCK(cs);
    if (fPaused && !fAdmin) {
        return state.Invalid(false, REJECT_PAUSED, "ledger-paused",
                             strprintf("ledger=%s", params.address));
    }

    CAmount nNewReceived;
    if (!AddNoOverflow(nTotalReceived, amount, nNewReceived)) {
        return state.Invalid(false, REJECT_INVALID, "ledger-received-overflow",
                             strprintf("received=%lld amount=%lld", (long long)nTotalReceived, (long long)amount));
    }

    nTotalReceived = nNewReceived;
    nDeposits++;

    LogPrint(BCLog::LEDGER, "PaymentReceived: ledger=%s from=%s amount=%s total=%s\n",
             params.address, caller.empty() ? "(anonymous)" : caller, FormatMoney(amount), FormatMoney(nTotalReceived));
    return true;
}

CAmount CLedger::GetPendingPayment(const std::string& claimant) const
{
    std::string key = NormalizeDestination(claimant);
    if (key.empty()) {
        return 0;
    }
    LOCK(cs);
    return GetPendingPaymentLocked(key);
}

bool CLedger::Release(const std::string& claimant, const std::string& caller, CAmount& amountOut, CValidationState& state)
{
    const std::string key = NormalizeDestination(claimant);
    const bool fAdmin = NormalizeDestination(caller) == params.admin;

    LOCK(cs);

    if (fInRelease) {
        LogPrint(BCLog::LEDGER, "Release: REJECT reentrant call ledger=%s claimant=%s\n", params.address, claimant);
        return state.Invalid(false, REJECT_INVALID, "ledger-reentrant",
                             strprintf("claimant=%s", claimant));
    }
    if (fPaused && !fAdmin) {
        return state.Invalid(false, REJECT_PAUSED, "ledger-paused",
                             strprintf("ledger=%s", params.address));
    }

    auto itShares = mapShares.find(key);
    if (key.empty() || itShares == mapShares.end()) {
        return state.Invalid(false, REJECT_NOTHING_DUE, "ledger-nothing-due",
                             strprintf("unknown claimant %s", claimant));
    }

    const CAmount nPending = GetPendingPaymentLocked(key);
    const auto itReleased = mapReleased.find(key);
    const bool fHadEntry = itReleased != mapReleased.end();
    const CAmount nReleasedBefore = fHadEntry ? itReleased->second : 0;

    if (nPending <= 0) {
        CAmount nEntitlementCap = MulDivFloor(params.repaymentCap, itShares->second, TOTAL_SHARES);
        if (nReleasedBefore >= nEntitlementCap) {
            return state.Invalid(false, REJECT_NOTHING_DUE, "ledger-cap-reached",
                                 strprintf("claimant=%s released=%s", key, FormatMoney(nReleasedBefore)));
        }
        return state.Invalid(false, REJECT_NOTHING_DUE, "ledger-nothing-due",
                             strprintf("claimant=%s", key));
    }

    const CAmount nTotalReleasedBefore = nTotalReleased;
    auto rollback = [&]() EXCLUSIVE_LOCKS_REQUIRED(cs) {
        if (fHadEntry) {
            mapReleased[key] = nReleasedBefore;
        } else {
            mapReleased.erase(key);
        }
        nTotalReleased = nTotalReleasedBefore;
        nReleases--;
    };

    // Apply bookkeeping before the transfer
    mapReleased[key] = nReleasedBefore + nPending;
    nTotalReleased = nTotalReleasedBefore + nPending;
    nReleases++;

    CValidationState invariantState;
    if (!CheckInvariantsLocked(invariantState)) {
        rollback();
        return state.Error(invariantState.GetRejectReason(), invariantState.GetDebugMessage());
    }

    std::string strError;
    bool fSent = false;
    fInRelease = true;
    try {
        fSent = pSink->SendValue(key, nPending, strError);
    } catch (...) {
        fInRelease = false;
        rollback();
        throw;
    }
    fInRelease = false;

    if (!fSent) {
        rollback();
        LogPrint(BCLog::LEDGER, "Release: transfer failed ledger=%s claimant=%s amount=%s: %s\n",
                 params.address, key, FormatMoney(nPending), strError);
        return state.Invalid(false, REJECT_INVALID, "ledger-transfer-failed", strError);
    }

    amountOut = nPending;
    LogPrint(BCLog::LEDGER, "PaymentReleased: ledger=%s to=%s amount=%s released=%s totalReleased=%s\n",
             params.address, key, FormatMoney(nPending), FormatMoney(mapReleased[key]), FormatMoney(nTotalReleased));

    UpdateCapReached();
    return true;
}

bool CLedger::Pause(const std::string& caller, CValidationState& state)
{
    if (NormalizeDestination(caller) != params.admin) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "ledger-unauthorized",
                             strprintf("caller=%s", caller));
    }

    LOCK(cs);
    if (fPaused) {
        return state.Invalid(false, REJECT_INVALID, "ledger-already-paused");
    }
    fPaused = true;
    LogPrintf("Ledger %s paused by %s\n", params.address, params.admin);
    return true;
}

bool CLedger::Unpause(const std::string& caller, CValidationState& state)
{
    if (NormalizeDestination(caller) != params.admin) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "ledger-unauthorized",
                             strprintf("caller=%s", caller));
    }

    LOCK(cs);
    if (!fPaused) {
        return state.Invalid(false, REJECT_INVALID, "ledger-not-paused");
    }
    fPaused = false;
    LogPrintf("Ledger %s unpaused by %s\n", params.address, params.admin);
    return true;
}

// =============================================================================
// Reads
// =============================================================================

bool CLedger::IsPaused() const
{
    LOCK(cs);
    return fPaused;
}

bool CLedger::IsCapExhausted() const
{
    LOCK(cs);
    return IsCapExhaustedLocked();
}

CAmount CLedger::GetRemainingCap() const
{
    LOCK(cs);
    return params.repaymentCap - nTotalReleased;
}

CAmount CLedger::GetTotalReceived() const
{
    LOCK(cs);
    return nTotalReceived;
}

CAmount CLedger::GetTotalReleased() const
{
    LOCK(cs);
    return nTotalReleased;
}

CAmount CLedger::GetReleased(const std::string& claimant) const
{
    LOCK(cs);
    auto it = mapReleased.find(NormalizeDestination(claimant));
    return it != mapReleased.end() ? it->second : 0;
}

int64_t CLedger::GetShares(const std::string& claimant) const
{
    auto it = mapShares.find(NormalizeDestination(claimant));
    return it != mapShares.end() ? it->second : 0;
}

std::vector<std::string> CLedger::GetPayees() const
{
    std::vector<std::string> vPayees;
    vPayees.reserve(params.shareTable.size());
    for (const ShareEntry& entry : params.shareTable) {
        vPayees.push_back(entry.claimant);
    }
    return vPayees;
}

uint32_t CLedger::GetDepositCount() const
{
    LOCK(cs);
    return nDeposits;
}

uint32_t CLedger::GetReleaseCount() const
{
    LOCK(cs);
    return nReleases;
}

LedgerSnapshot CLedger::GetSnapshot() const
{
    LOCK(cs);
    LedgerSnapshot snapshot;
    snapshot.params = params;
    snapshot.nTotalReceived = nTotalReceived;
    snapshot.nTotalReleased = nTotalReleased;
    snapshot.mapReleased = mapReleased;
    snapshot.fPaused = fPaused;
    snapshot.fCapReached = fCapReached;
    snapshot.nDeposits = nDeposits;
    snapshot.nReleases = nReleases;
    return snapshot;
}

// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "deploy/orchestrator.h"

#include "deploy/provisioner.h"
#include "funding/round.h"
#include "funding/rounddb.h"
#include "key_io.h"
#include "ledger/ledgerman.h"
#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

std::unique_ptr<CDeploymentOrchestrator> g_orchestrator;

// =============================================================================
// In-flight guard
// =============================================================================

CDeploymentOrchestrator::InFlightGuard::InFlightGuard(CDeploymentOrchestrator& parentIn, const std::string& roundIdIn)
    : parent(parentIn), roundId(roundIdIn)
{
    LOCK(parent.csInFlight);
    fAcquired = parent.setInFlight.insert(roundId).second;
}

CDeploymentOrchestrator::InFlightGuard::~InFlightGuard()
{
    if (fAcquired) {
        LOCK(parent.csInFlight);
        parent.setInFlight.erase(roundId);
    }
}

// =============================================================================
// CDeploymentOrchestrator
// =============================================================================

CDeploymentOrchestrator::CDeploymentOrchestrator(CRoundDB& rounddbIn, CLedgerManager& ledgermanIn, CProvisioner& provisionerIn)
    : rounddb(rounddbIn), ledgerman(ledgermanIn), provisioner(provisionerIn), pResultSink(nullptr)
{
}

bool CDeploymentOrchestrator::CheckParams(DeploymentRecord& record, CValidationState& state) const
{
    const std::string owner = NormalizeDestination(record.owner);
    if (owner.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("owner=%s", record.owner));
    }
    record.owner = owner;

    for (ShareEntry& entry : record.shareTable) {
        const std::string claimant = NormalizeDestination(entry.claimant);
        if (!claimant.empty()) {
            entry.claimant = claimant;
        }
    }
    if (!CheckShareTable(record.shareTable, state)) {
        return false;
    }

    if (record.repaymentCap <= 0 || !MoneyRange(record.repaymentCap)) {
        return state.Invalid(false, REJECT_INVALID, "bad-cap-range",
                             strprintf("cap=%lld", (long long)record.repaymentCap));
    }
    return true;
}

bool CDeploymentOrchestrator::WriteRecord(const DeploymentRecord& record, CValidationState& state)
{
    try {
        if (rounddb.WriteDeployment(record)) {
            return true;
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: CDeploymentOrchestrator: write of round %s failed: %s\n", record.roundId, e.what());
    }
    return state.Error("deploy-db-write-failed",
                       strprintf("round=%s status=%s", record.roundId, DeploymentStatusToString(record.status)));
}

void CDeploymentOrchestrator::NotifyResult(const DeploymentRecord& record)
{
    if (pResultSink) {
        pResultSink->RecordDeploymentResult(record.roundId, record);
    }
}

bool CDeploymentOrchestrator::RunAttempt(DeploymentRecord& record, std::string& addressOut, CValidationState& state)
{
    // Intent first: a crash from here on leaves a PENDING record behind
    record.status = DeploymentStatus::PENDING;
    record.nAttempts++;
    record.strLastError.clear();
    record.nUpdateTime = GetTime();
    if (!WriteRecord(record, state)) {
        return false;
    }

    LogPrintf("Deploying round %s (attempt %u): owner=%s payees=%u cap=%s\n",
              record.roundId, record.nAttempts, record.owner, record.shareTable.size(),
              FormatMoney(record.repaymentCap));

    ProvisionRequest request;
    request.owner = record.owner;
    request.shareTable = record.shareTable;
    request.repaymentCap = record.repaymentCap;

    ProvisionResult result;
    try {
        result = provisioner.Provision(request);
    } catch (const std::exception& e) {
        // Unknown how far the provisioner got
        result.outcome = ProvisionOutcome::AMBIGUOUS;
        result.strReason = "deploy-provisioner-error";
        result.strError = e.what();
    }

    LogPrint(BCLog::DEPLOY, "CDeploymentOrchestrator: round=%s outcome=%s reason=%s\n",
             record.roundId, ProvisionOutcomeToString(result.outcome), result.strReason);

    switch (result.outcome) {
    case ProvisionOutcome::SUCCEEDED:
        return FinishDeployed(record, result.address, result.strError, addressOut, state);

    case ProvisionOutcome::FAILED:
        record.status = DeploymentStatus::FAILED;
        record.strLastError = strprintf("%s: %s", result.strReason, result.strError);
        record.nUpdateTime = GetTime();
        if (!WriteRecord(record, state)) {
            return false;
        }
        LogPrintf("Deployment of round %s failed: %s\n", record.roundId, record.strLastError);
        NotifyResult(record);
        return state.Invalid(false, REJECT_DEPLOY_FAILED, result.strReason, result.strError);

    case ProvisionOutcome::AMBIGUOUS:
        record.status = DeploymentStatus::AMBIGUOUS;
        record.strLastError = strprintf("%s: %s", result.strReason, result.strError);
        record.nUpdateTime = GetTime();
        if (!WriteRecord(record, state)) {
            return false;
        }
        LogPrintf("Deployment of round %s is ambiguous, reconcile manually: %s\n", record.roundId, record.strLastError);
        NotifyResult(record);
        return state.Invalid(false, REJECT_AMBIGUOUS, result.strReason, result.strError);
    }
    return state.Error("deploy-bad-outcome", record.roundId);
}

bool CDeploymentOrchestrator::FinishDeployed(DeploymentRecord& record, const std::string& address,
                                             const std::string& strDiagnostics, std::string& addressOut,
                                             CValidationState& state)
{
    LedgerParams params;
    params.address = address;
    params.admin = record.owner;
    params.shareTable = record.shareTable;
    params.repaymentCap = record.repaymentCap;

    CValidationState ledgerState;
    if (!ledgerman.CreateLedger(params, ledgerState)) {
        // A ledger registered by an earlier, interrupted attempt is accepted if it matches
        bool fMatches = false;
        if (ledgerState.GetRejectReason() == "ledger-exists") {
            CValidationState getState;
            std::shared_ptr<CLedger> existing = ledgerman.GetLedger(address, getState);
            fMatches = existing && existing->GetAdmin() == record.owner &&
                       existing->GetShareTable() == record.shareTable &&
                       existing->GetRepaymentCap() == record.repaymentCap;
        }
        if (!fMatches) {
            record.status = DeploymentStatus::AMBIGUOUS;
            record.strLastError = strprintf("deploy-register-failed: %s at %s", FormatStateMessage(ledgerState), address);
            record.nUpdateTime = GetTime();
            if (!WriteRecord(record, state)) {
                return false;
            }
            LogPrintf("ERROR: round %s provisioned %s but the ledger could not be registered: %s\n",
                      record.roundId, address, FormatStateMessage(ledgerState));
            NotifyResult(record);
            return state.Invalid(false, REJECT_AMBIGUOUS, "deploy-register-failed", FormatStateMessage(ledgerState));
        }
    }

    record.status = DeploymentStatus::DEPLOYED;
    record.ledgerAddress = address;
    record.strLastError = strDiagnostics;
    record.nUpdateTime = GetTime();
    if (!WriteRecord(record, state)) {
        return false;
    }

    LogPrintf("Round %s deployed: ledger=%s\n", record.roundId, address);
    NotifyResult(record);
    addressOut = address;
    return true;
}

bool CDeploymentOrchestrator::Deploy(const std::string& roundId, const std::string& owner, const ShareTable& shareTable,
                                     CAmount repaymentCap, std::string& addressOut, CValidationState& state)
{
    if (!IsValidRoundId(roundId)) {
        return state.Invalid(false, REJECT_INVALID, "bad-round-id", SanitizeString(roundId));
    }

    InFlightGuard guard(*this, roundId);
    if (!guard.Acquired()) {
        return state.Invalid(false, REJECT_DUPLICATE, "deploy-in-progress", strprintf("round=%s", roundId));
    }

    DeploymentRecord existing;
    if (rounddb.ReadDeployment(roundId, existing)) {
        switch (existing.status) {
        case DeploymentStatus::DEPLOYED:
            return state.Invalid(false, REJECT_DUPLICATE, "deploy-already-deployed",
                                 strprintf("round=%s ledger=%s", roundId, existing.ledgerAddress));
        case DeploymentStatus::PENDING:
        case DeploymentStatus::AMBIGUOUS:
            return state.Invalid(false, REJECT_AMBIGUOUS, "deploy-ambiguous",
                                 strprintf("round=%s needs reconciliation", roundId));
        case DeploymentStatus::FAILED:
            return state.Invalid(false, REJECT_DUPLICATE, "deploy-record-exists",
                                 strprintf("round=%s failed before, use retry", roundId));
        }
    }

    DeploymentRecord record;
    record.roundId = roundId;
    record.owner = owner;
    record.shareTable = shareTable;
    record.repaymentCap = repaymentCap;
    record.nCreateTime = GetTime();
    if (!CheckParams(record, state)) {
        return false;
    }

    return RunAttempt(record, addressOut, state);
}

bool CDeploymentOrchestrator::RetryDeployment(const std::string& roundId, std::string& addressOut, CValidationState& state)
{
    InFlightGuard guard(*this, roundId);
    if (!guard.Acquired()) {
        return state.Invalid(false, REJECT_DUPLICATE, "deploy-in-progress", strprintf("round=%s", roundId));
    }

    DeploymentRecord record;
    if (!rounddb.ReadDeployment(roundId, record)) {
        return state.Invalid(false, REJECT_NOTFOUND, "deploy-not-found", strprintf("round=%s", roundId));
    }

    switch (record.status) {
    case DeploymentStatus::DEPLOYED:
        return state.Invalid(false, REJECT_DUPLICATE, "deploy-already-deployed",
                             strprintf("round=%s ledger=%s", roundId, record.ledgerAddress));
    case DeploymentStatus::PENDING:
    case DeploymentStatus::AMBIGUOUS:
        return state.Invalid(false, REJECT_AMBIGUOUS, "deploy-ambiguous",
                             strprintf("round=%s needs reconciliation", roundId));
    case DeploymentStatus::FAILED:
        break;
    }

    if (!CheckParams(record, state)) {
        return false;
    }
    return RunAttempt(record, addressOut, state);
}

bool CDeploymentOrchestrator::ReconcileDeployment(const std::string& roundId, const std::string& address, CValidationState& state)
{
    InFlightGuard guard(*this, roundId);
    if (!guard.Acquired()) {
        return state.Invalid(false, REJECT_DUPLICATE, "deploy-in-progress", strprintf("round=%s", roundId));
    }

    DeploymentRecord record;
    if (!rounddb.ReadDeployment(roundId, record)) {
        return state.Invalid(false, REJECT_NOTFOUND, "deploy-not-found", strprintf("round=%s", roundId));
    }

    switch (record.status) {
    case DeploymentStatus::DEPLOYED:
        return state.Invalid(false, REJECT_DUPLICATE, "deploy-already-deployed",
                             strprintf("round=%s ledger=%s", roundId, record.ledgerAddress));
    case DeploymentStatus::FAILED:
        return state.Invalid(false, REJECT_INVALID, "deploy-not-ambiguous",
                             strprintf("round=%s failed, use retry", roundId));
    case DeploymentStatus::PENDING:
    case DeploymentStatus::AMBIGUOUS:
        break;
    }

    if (address.empty()) {
        record.status = DeploymentStatus::FAILED;
        record.strLastError = "reconciled: nothing was provisioned";
        record.nUpdateTime = GetTime();
        if (!WriteRecord(record, state)) {
            return false;
        }
        LogPrintf("Round %s reconciled as failed\n", roundId);
        NotifyResult(record);
        return true;
    }

    const std::string canonical = NormalizeDestination(address);
    if (canonical.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("ledger=%s", SanitizeString(address)));
    }

    std::string addressOut;
    LogPrintf("Round %s reconciled with ledger %s\n", roundId, canonical);
    return FinishDeployed(record, canonical, "reconciled", addressOut, state);
}

bool CDeploymentOrchestrator::GetDeployment(const std::string& roundId, DeploymentRecord& record) const
{
    return rounddb.ReadDeployment(roundId, record);
}

std::vector<DeploymentRecord> CDeploymentOrchestrator::ListDeployments() const
{
    std::vector<DeploymentRecord> records;
    rounddb.ForEachDeployment([&](const DeploymentRecord& record) {
        records.push_back(record);
        return true;
    });
    return records;
}

int CDeploymentOrchestrator::RecoverInterrupted()
{
    std::vector<DeploymentRecord> vPending;
    rounddb.ForEachDeployment([&](const DeploymentRecord& record) {
        if (record.status == DeploymentStatus::PENDING) {
            vPending.push_back(record);
        }
        return true;
    });

    int nRecovered = 0;
    for (DeploymentRecord& record : vPending) {
        InFlightGuard guard(*this, record.roundId);
        if (!guard.Acquired()) {
            continue;
        }
        record.status = DeploymentStatus::AMBIGUOUS;
        record.strLastError = "deploy-interrupted: provisioning did not report back";
        record.nUpdateTime = GetTime();

        CValidationState state;
        if (!WriteRecord(record, state)) {
            LogPrintf("ERROR: RecoverInterrupted: %s\n", FormatStateMessage(state));
            continue;
        }
        LogPrintf("Round %s was interrupted during deployment, marked ambiguous\n", record.roundId);
        NotifyResult(record);
        nRecovered++;
    }
    return nRecovered;
}

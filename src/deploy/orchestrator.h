// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_DEPLOY_ORCHESTRATOR_H
#define REVSPLIT_DEPLOY_ORCHESTRATOR_H

#include "allocation/shares.h"
#include "amount.h"
#include "deploy/deployment.h"
#include "sync.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

class CLedgerManager;
class CProvisioner;
class CRoundDB;
class CValidationState;

/** Receives every persisted deployment outcome of a round */
class CDeploymentResultSink
{
public:
    virtual ~CDeploymentResultSink() {}
    virtual void RecordDeploymentResult(const std::string& roundId, const DeploymentRecord& record) = 0;
};

/**
 * CDeploymentOrchestrator - Provision one ledger per funding round
 *
 * Every attempt first persists the record as PENDING, then runs the
 * provisioner, then persists the outcome. A crash in between leaves a
 * PENDING record that RecoverInterrupted() turns into AMBIGUOUS.
 *
 * Attempts for one round are serialized by the in-flight set; attempts for
 * different rounds may run concurrently. No lock is held while the
 * provisioner runs.
 */
class CDeploymentOrchestrator
{
private:
    CRoundDB& rounddb;
    CLedgerManager& ledgerman;
    CProvisioner& provisioner;
    CDeploymentResultSink* pResultSink;

    mutable Mutex csInFlight;
    std::set<std::string> setInFlight GUARDED_BY(csInFlight);

    /** Holds a round in the in-flight set for the lifetime of the guard */
    class InFlightGuard
    {
    private:
        CDeploymentOrchestrator& parent;
        const std::string roundId;
        bool fAcquired;

    public:
        InFlightGuard(CDeploymentOrchestrator& parentIn, const std::string& roundIdIn);
        ~InFlightGuard();
        bool Acquired() const { return fAcquired; }
    };

    bool CheckParams(DeploymentRecord& record, CValidationState& state) const;
    bool RunAttempt(DeploymentRecord& record, std::string& addressOut, CValidationState& state);
    bool FinishDeployed(DeploymentRecord& record, const std::string& address, const std::string& strDiagnostics,
                        std::string& addressOut, CValidationState& state);
    bool WriteRecord(const DeploymentRecord& record, CValidationState& state);
    void NotifyResult(const DeploymentRecord& record);

public:
    CDeploymentOrchestrator(CRoundDB& rounddbIn, CLedgerManager& ledgermanIn, CProvisioner& provisionerIn);

    void SetResultSink(CDeploymentResultSink* pSink) { pResultSink = pSink; }

    /**
     * First deployment attempt of a round.
     *
     * Rejected without side effects when the round already has a record:
     * deploy-already-deployed (DEPLOYED), deploy-ambiguous (AMBIGUOUS or an
     * interrupted PENDING), deploy-record-exists (FAILED, use RetryDeployment)
     * and deploy-in-progress while another attempt runs.
     *
     * @return true once the ledger is registered and the record is DEPLOYED
     */
    bool Deploy(const std::string& roundId, const std::string& owner, const ShareTable& shareTable,
                CAmount repaymentCap, std::string& addressOut, CValidationState& state);

    /** Run another attempt with the stored parameters; only from FAILED */
    bool RetryDeployment(const std::string& roundId, std::string& addressOut, CValidationState& state);

    /**
     * Manual resolution of an AMBIGUOUS (or interrupted PENDING) record.
     * A valid address marks it DEPLOYED; an empty one declares that nothing
     * was provisioned and marks it FAILED.
     */
    bool ReconcileDeployment(const std::string& roundId, const std::string& address, CValidationState& state);

    bool GetDeployment(const std::string& roundId, DeploymentRecord& record) const;
    std::vector<DeploymentRecord> ListDeployments() const;

    /** Mark PENDING records left by an earlier process AMBIGUOUS; returns how many */
    int RecoverInterrupted();
};

// Global deployment orchestrator
extern std::unique_ptr<CDeploymentOrchestrator> g_orchestrator;

#endif // REVSPLIT_DEPLOY_ORCHESTRATOR_H

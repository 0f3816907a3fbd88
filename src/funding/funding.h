// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_FUNDING_FUNDING_H
#define REVSPLIT_FUNDING_FUNDING_H

/**
 * Funding state machine
 *
 *   FUNDING --(currentFunding reaches the target, deployment succeeds)--> LIVE
 *
 * The goal is observed exactly once: fGoalReached is persisted together with
 * the contribution that reaches the target, and only that call runs
 * OnGoalReached. A failed deployment leaves the round FUNDING with its
 * contributions intact; RetryRoundDeployment tries again.
 */

#include "amount.h"
#include "deploy/deployment.h"
#include "deploy/orchestrator.h"
#include "funding/round.h"
#include "sync.h"
#include "util/validation.h"

#include <memory>
#include <string>
#include <vector>

class CRoundDB;

/** What happened to an accepted contribution */
struct ContributionResult
{
    CAmount nCurrentFunding = 0;
    bool fGoalReached = false;       //!< this contribution reached the target
    std::string ledgerAddress;       //!< set if the deployment succeeded
    CValidationState deployState;    //!< deployment outcome when fGoalReached
};

class CFundingManager : public CDeploymentResultSink
{
private:
    CRoundDB& rounddb;
    CDeploymentOrchestrator& orchestrator;
    const DeploymentParams params;

    mutable RecursiveMutex cs;

    bool WriteRound(FundingRoundRecord& round, CValidationState& state) EXCLUSIVE_LOCKS_REQUIRED(cs);
    void RecordDeployError(const std::string& roundId, const CValidationState& deployState);

public:
    CFundingManager(CRoundDB& rounddbIn, CDeploymentOrchestrator& orchestratorIn, const DeploymentParams& paramsIn);

    /**
     * Open a round. nMinContribution == 0 selects -mincontribution.
     * Fails with bad-round-id, bad-address, bad-round-target, bad-round-min
     * or round-exists.
     */
    bool CreateRound(const std::string& roundId, const std::string& owner, CAmount nFundingTarget,
                     CAmount nMinContribution, CValidationState& state);

    /**
     * Record a contribution. Returns false only if the contribution was
     * rejected; the outcome of a triggered deployment is in result.deployState.
     */
    bool AddContribution(const std::string& roundId, const std::string& contributor, CAmount amount,
                         ContributionResult& result, CValidationState& state);

    /**
     * Allocation, cap and deployment for a round whose goal was reached.
     * Runs synchronously and returns the ledger address on success.
     */
    bool OnGoalReached(const FundingRoundRecord& round, std::string& addressOut, CValidationState& state);

    /** Manual retry after a failed deployment */
    bool RetryRoundDeployment(const std::string& roundId, std::string& addressOut, CValidationState& state);

    bool GetRound(const std::string& roundId, FundingRoundRecord& round) const;
    std::vector<FundingRoundRecord> ListRounds() const;

    const DeploymentParams& GetParams() const { return params; }

    void RecordDeploymentResult(const std::string& roundId, const DeploymentRecord& record) override;
};

// Global funding manager
extern std::unique_ptr<CFundingManager> g_fundingman;

#endif // REVSPLIT_FUNDING_FUNDING_H

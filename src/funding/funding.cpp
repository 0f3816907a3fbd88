// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "funding/funding.h"

#include "allocation/cap.h"
#include "allocation/shares.h"
#include "funding/rounddb.h"
#include "key_io.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

std::unique_ptr<CFundingManager> g_fundingman;

CFundingManager::CFundingManager(CRoundDB& rounddbIn, CDeploymentOrchestrator& orchestratorIn, const DeploymentParams& paramsIn)
    : rounddb(rounddbIn), orchestrator(orchestratorIn), params(paramsIn)
{
}

bool CFundingManager::WriteRound(FundingRoundRecord& round, CValidationState& state)
{
    round.nUpdateTime = GetTime();
    try {
        if (rounddb.WriteRound(round)) {
            return true;
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: CFundingManager: write of round %s failed: %s\n", round.roundId, e.what());
    }
    return state.Error("round-db-write-failed", strprintf("round=%s", round.roundId));
}

bool CFundingManager::CreateRound(const std::string& roundId, const std::string& owner, CAmount nFundingTarget,
                                  CAmount nMinContribution, CValidationState& state)
{
    if (!IsValidRoundId(roundId)) {
        return state.Invalid(false, REJECT_INVALID, "bad-round-id", SanitizeString(roundId));
    }
    const std::string canonicalOwner = NormalizeDestination(owner);
    if (canonicalOwner.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("owner=%s", SanitizeString(owner)));
    }
    if (nFundingTarget <= 0 || !MoneyRange(nFundingTarget)) {
        return state.Invalid(false, REJECT_INVALID, "bad-round-target", strprintf("target=%lld", (long long)nFundingTarget));
    }
    if (nMinContribution == 0) {
        nMinContribution = params.nMinContribution;
    }
    if (nMinContribution <= 0 || nMinContribution > nFundingTarget) {
        return state.Invalid(false, REJECT_INVALID, "bad-round-min",
                             strprintf("min=%lld target=%lld", (long long)nMinContribution, (long long)nFundingTarget));
    }

    LOCK(cs);
    if (rounddb.HasRound(roundId)) {
        return state.Invalid(false, REJECT_DUPLICATE, "round-exists", strprintf("round=%s", roundId));
    }

    FundingRoundRecord round;
    round.roundId = roundId;
    round.owner = canonicalOwner;
    round.nFundingTarget = nFundingTarget;
    round.nMinContribution = nMinContribution;
    round.nCreateTime = GetTime();
    if (!WriteRound(round, state)) {
        return false;
    }

    LogPrint(BCLog::FUNDING, "CFundingManager: round %s created by %s, target=%d min=%d\n",
             roundId, canonicalOwner, nFundingTarget, nMinContribution);
    return true;
}

bool CFundingManager::AddContribution(const std::string& roundId, const std::string& contributor, CAmount amount,
                                      ContributionResult& result, CValidationState& state)
{
    FundingRoundRecord round;
    {
        LOCK(cs);
        if (!rounddb.ReadRound(roundId, round)) {
            return state.Invalid(false, REJECT_NOTFOUND, "round-not-found", strprintf("round=%s", SanitizeString(roundId)));
        }
        if (round.status != FundingStatus::FUNDING) {
            return state.Invalid(false, REJECT_INVALID, "round-not-funding",
                                 strprintf("round=%s status=%s", roundId, FundingStatusToString(round.status)));
        }
        if (round.fGoalReached) {
            return state.Invalid(false, REJECT_INVALID, "round-goal-reached",
                                 strprintf("round=%s awaits deployment", roundId));
        }

        const std::string claimant = NormalizeDestination(contributor);
        if (claimant.empty()) {
            return state.Invalid(false, REJECT_INVALID, "bad-address", strprintf("contributor=%s", SanitizeString(contributor)));
        }
        if (amount <= 0 || !MoneyRange(amount)) {
            return state.Invalid(false, REJECT_INVALID, "bad-amount", strprintf("amount=%lld", (long long)amount));
        }
        // nCurrentFunding < nFundingTarget here, so the remainder is positive
        const CAmount nRemaining = round.nFundingTarget - round.nCurrentFunding;
        if (amount > nRemaining) {
            return state.Invalid(false, REJECT_INVALID, "bad-contribution-exceeds-goal",
                                 strprintf("amount=%lld available=%lld", (long long)amount, (long long)nRemaining));
        }
        // The contribution that closes the round may be smaller than the minimum
        if (amount < round.nMinContribution && amount != nRemaining) {
            return state.Invalid(false, REJECT_INVALID, "bad-contribution-min",
                                 strprintf("amount=%lld min=%lld", (long long)amount, (long long)round.nMinContribution));
        }
        if (claimant == round.owner) {
            return state.Invalid(false, REJECT_INVALID, "bad-contribution-owner", strprintf("round=%s", roundId));
        }

        round.contributions.emplace_back(claimant, amount);
        round.nCurrentFunding += amount;
        if (round.nCurrentFunding >= round.nFundingTarget) {
            round.fGoalReached = true;
        }
        if (!WriteRound(round, state)) {
            return false;
        }

        LogPrint(BCLog::FUNDING, "CFundingManager: round %s +%d from %s (%d/%d)\n",
                 roundId, amount, claimant, round.nCurrentFunding, round.nFundingTarget);
    }

    result.nCurrentFunding = round.nCurrentFunding;
    result.fGoalReached = round.fGoalReached;
    if (!round.fGoalReached) {
        return true;
    }

    LogPrintf("Round %s reached its goal of %d with %u contributions\n",
              roundId, round.nFundingTarget, round.contributions.size());
    OnGoalReached(round, result.ledgerAddress, result.deployState);
    return true;
}

void CFundingManager::RecordDeployError(const std::string& roundId, const CValidationState& deployState)
{
    LOCK(cs);
    FundingRoundRecord round;
    if (!rounddb.ReadRound(roundId, round)) {
        return;
    }
    round.strLastDeployError = FormatStateMessage(deployState);
    CValidationState state;
    if (!WriteRound(round, state)) {
        LogPrintf("ERROR: CFundingManager: cannot record deployment error of round %s\n", roundId);
    }
}

bool CFundingManager::OnGoalReached(const FundingRoundRecord& round, std::string& addressOut, CValidationState& state)
{
    ShareTable table;
    CAmount nCap = 0;
    if (!AllocateShares(AggregateContributions(round.contributions), table, state) ||
        !ComputeRepaymentCap(round.nFundingTarget, params.nCapMultiplierBps, params.nExchangeRate, nCap, state)) {
        LogPrintf("Round %s cannot be deployed: %s\n", round.roundId, FormatStateMessage(state));
        RecordDeployError(round.roundId, state);
        return false;
    }

    if (orchestrator.Deploy(round.roundId, round.owner, table, nCap, addressOut, state)) {
        return true;
    }
    LogPrintf("Deployment of round %s did not complete: %s\n", round.roundId, FormatStateMessage(state));

    // Outcomes with a deployment record were already reported through RecordDeploymentResult
    DeploymentRecord record;
    if (!orchestrator.GetDeployment(round.roundId, record)) {
        RecordDeployError(round.roundId, state);
    }
    return false;
}

bool CFundingManager::RetryRoundDeployment(const std::string& roundId, std::string& addressOut, CValidationState& state)
{
    FundingRoundRecord round;
    if (!GetRound(roundId, round)) {
        return state.Invalid(false, REJECT_NOTFOUND, "round-not-found", strprintf("round=%s", SanitizeString(roundId)));
    }
    if (round.status == FundingStatus::LIVE) {
        return state.Invalid(false, REJECT_DUPLICATE, "deploy-already-deployed",
                             strprintf("round=%s ledger=%s", roundId, round.ledgerAddress));
    }
    if (!round.fGoalReached) {
        return state.Invalid(false, REJECT_INVALID, "round-not-funded",
                             strprintf("round=%s funding=%lld/%lld", roundId, (long long)round.nCurrentFunding,
                                       (long long)round.nFundingTarget));
    }

    DeploymentRecord record;
    if (!orchestrator.GetDeployment(roundId, record)) {
        // Allocation or cap failed before any attempt was recorded
        return OnGoalReached(round, addressOut, state);
    }
    return orchestrator.RetryDeployment(roundId, addressOut, state);
}

bool CFundingManager::GetRound(const std::string& roundId, FundingRoundRecord& round) const
{
    LOCK(cs);
    return rounddb.ReadRound(roundId, round);
}

std::vector<FundingRoundRecord> CFundingManager::ListRounds() const
{
    std::vector<FundingRoundRecord> rounds;
    LOCK(cs);
    rounddb.ForEachRound([&](const FundingRoundRecord& round) {
        rounds.push_back(round);
        return true;
    });
    return rounds;
}

void CFundingManager::RecordDeploymentResult(const std::string& roundId, const DeploymentRecord& record)
{
    LOCK(cs);
    FundingRoundRecord round;
    if (!rounddb.ReadRound(roundId, round)) {
        LogPrintf("ERROR: CFundingManager: deployment result for unknown round %s\n", roundId);
        return;
    }

    if (record.status == DeploymentStatus::DEPLOYED) {
        round.status = FundingStatus::LIVE;
        round.ledgerAddress = record.ledgerAddress;
        round.strLastDeployError.clear();
    } else {
        round.strLastDeployError = strprintf("%s: %s", DeploymentStatusToString(record.status), record.strLastError);
    }

    CValidationState state;
    if (!WriteRound(round, state)) {
        LogPrintf("ERROR: CFundingManager: round %s not updated after deployment (%s)\n",
                  roundId, DeploymentStatusToString(record.status));
        return;
    }
    LogPrint(BCLog::FUNDING, "CFundingManager: round %s status=%s deployment=%s\n",
             roundId, FundingStatusToString(round.status), DeploymentStatusToString(record.status));
}

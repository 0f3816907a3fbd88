// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Funding round tests
 *
 * Tests:
 *   1. Round creation and contribution rules
 *   2. Reaching the goal deploys exactly once and makes the round LIVE
 *   3. Failed, ambiguous and unallocatable deployments keep the round FUNDING
 *   4. Retry and reconciliation complete the round
 */

#include "funding/funding.h"
#include "funding/rounddb.h"
#include "allocation/cap.h"
#include "deploy/orchestrator.h"
#include "ledger/ledgerman.h"
#include "amount.h"
#include "test/test_revsplit.h"
#include "util/validation.h"

#include <limits>

#include <boost/test/unit_test.hpp>

namespace {

struct FundingFixture : public LedgerTestingSetup {
    const std::string owner = TestAddress(0x0e);
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);
    const std::string C = TestAddress(3);
    const std::string ledgerAddress = TestAddress(0x1ed9e4);

    CMockProvisioner provisioner;
    std::unique_ptr<CDeploymentOrchestrator> orchestrator;
    std::unique_ptr<CFundingManager> fundingman;

    FundingFixture()
    {
        orchestrator = std::make_unique<CDeploymentOrchestrator>(*g_rounddb, *g_ledgerman, provisioner);
        fundingman = MakeManager(200000 * RATE_COIN);
    }

    ~FundingFixture()
    {
        orchestrator->SetResultSink(nullptr);
    }

    std::unique_ptr<CFundingManager> MakeManager(CAmount nExchangeRate)
    {
        DeploymentParams params;
        params.nCapMultiplierBps = DEFAULT_CAP_MULTIPLIER_BPS;
        params.nExchangeRate = nExchangeRate;
        params.nMinContribution = DEFAULT_MIN_CONTRIBUTION;
        std::unique_ptr<CFundingManager> manager = std::make_unique<CFundingManager>(*g_rounddb, *orchestrator, params);
        orchestrator->SetResultSink(manager.get());
        return manager;
    }

    FundingRoundRecord GetRound(const std::string& roundId) const
    {
        FundingRoundRecord round;
        BOOST_CHECK(fundingman->GetRound(roundId, round));
        return round;
    }

    void Contribute(const std::string& roundId, const std::string& contributor, CAmount amount, ContributionResult& result)
    {
        CValidationState state;
        BOOST_CHECK_MESSAGE(fundingman->AddContribution(roundId, contributor, amount, result, state), FormatStateMessage(state));
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(funding_tests, FundingFixture)

BOOST_AUTO_TEST_CASE(create_round_rules)
{
    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("film-2026", owner, 1000000, 0, state));

    FundingRoundRecord round = GetRound("film-2026");
    BOOST_CHECK_EQUAL(round.owner, owner);
    BOOST_CHECK_EQUAL(round.nFundingTarget, 1000000);
    BOOST_CHECK_EQUAL(round.nMinContribution, DEFAULT_MIN_CONTRIBUTION);
    BOOST_CHECK(round.status == FundingStatus::FUNDING);
    BOOST_CHECK(!round.fGoalReached);
    BOOST_CHECK_EQUAL(round.nCurrentFunding, 0);

    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound("film-2026", owner, 5000, 0, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "round-exists");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound("film 2026", owner, 5000, 0, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-round-id");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound(std::string(MAX_ROUND_ID_LENGTH + 1, 'r'), owner, 5000, 0, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-round-id");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound("r2", "0xabc", 5000, 0, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-address");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound("r2", owner, 0, 0, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-round-target");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound("r2", owner, 5000, 6000, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-round-min");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->CreateRound("r2", owner, 5000, -1, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-round-min");
    }

    BOOST_CHECK(fundingman->CreateRound("r2", owner, 5000, 100, state));
    BOOST_CHECK_EQUAL(fundingman->ListRounds().size(), 2U);
}

BOOST_AUTO_TEST_CASE(contribution_rules)
{
    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("r", owner, 10000, 1000, state));
    ContributionResult result;

    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("nope", A, 5000, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "round-not-found");
        BOOST_CHECK_EQUAL(s.GetRejectCode(), REJECT_NOTFOUND);
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", "alice", 5000, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-address");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", A, 0, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-amount");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", A, 999, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-min");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", owner, 5000, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-owner");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", A, 10001, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-exceeds-goal");
    }
    BOOST_CHECK_EQUAL(GetRound("r").nCurrentFunding, 0);

    Contribute("r", A, 4000, result);
    BOOST_CHECK_EQUAL(result.nCurrentFunding, 4000);
    BOOST_CHECK(!result.fGoalReached);
    Contribute("r", B, 5000, result);
    BOOST_CHECK_EQUAL(result.nCurrentFunding, 9000);

    // The last 1000 may not overshoot
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", C, 1001, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-exceeds-goal");
    }

    FundingRoundRecord round = GetRound("r");
    BOOST_REQUIRE_EQUAL(round.contributions.size(), 2U);
    BOOST_CHECK_EQUAL(round.contributions[0].claimant, A);
    BOOST_CHECK_EQUAL(round.contributions[1].amount, 5000);
    BOOST_CHECK(provisioner.vRequests.empty());
}

BOOST_AUTO_TEST_CASE(contribution_amount_out_of_range)
{
    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("r", owner, 1000000, 1000, state));
    ContributionResult result;
    Contribute("r", A, 1000, result);

    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", B, std::numeric_limits<int64_t>::max(), result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-amount");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", B, MAX_MONEY + 1, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-amount");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", B, MAX_MONEY, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-exceeds-goal");
    }

    FundingRoundRecord round = GetRound("r");
    BOOST_CHECK_EQUAL(round.nCurrentFunding, 1000);
    BOOST_CHECK_EQUAL(round.contributions.size(), 1U);
    BOOST_CHECK(round.status == FundingStatus::FUNDING);
}

BOOST_AUTO_TEST_CASE(closing_contribution_below_minimum)
{
    provisioner.vResults = {CMockProvisioner::Succeeded(ledgerAddress)};

    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("r", owner, 1500, 1000, state));
    ContributionResult result;
    Contribute("r", A, 1000, result);
    BOOST_CHECK_EQUAL(result.nCurrentFunding, 1000);

    // Below the minimum and short of the remainder
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", B, 499, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-min");
    }
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("r", B, 1000, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "bad-contribution-exceeds-goal");
    }

    // Exactly the remainder closes the round
    Contribute("r", B, 500, result);
    BOOST_CHECK(result.fGoalReached);
    BOOST_CHECK_EQUAL(result.nCurrentFunding, 1500);
    BOOST_CHECK_EQUAL(result.ledgerAddress, ledgerAddress);

    FundingRoundRecord round = GetRound("r");
    BOOST_CHECK(round.status == FundingStatus::LIVE);
    BOOST_REQUIRE_EQUAL(round.contributions.size(), 2U);
    BOOST_CHECK_EQUAL(round.contributions[1].amount, 500);
    BOOST_CHECK_EQUAL(provisioner.vRequests.size(), 1U);
}

BOOST_AUTO_TEST_CASE(goal_reached_deploys_once)
{
    provisioner.vResults = {CMockProvisioner::Succeeded(ledgerAddress)};

    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("film", owner, 1000000, 0, state));

    ContributionResult result;
    Contribute("film", A, 600000, result);
    BOOST_CHECK(!result.fGoalReached);
    BOOST_CHECK(provisioner.vRequests.empty());

    Contribute("film", B, 400000, result);
    BOOST_CHECK(result.fGoalReached);
    BOOST_CHECK_EQUAL(result.nCurrentFunding, 1000000);
    BOOST_CHECK_EQUAL(result.ledgerAddress, ledgerAddress);
    BOOST_CHECK(result.deployState.IsValid());

    BOOST_REQUIRE_EQUAL(provisioner.vRequests.size(), 1U);
    const ProvisionRequest& request = provisioner.vRequests[0];
    BOOST_CHECK_EQUAL(request.owner, owner);
    BOOST_CHECK(request.shareTable == ShareTable({{A, 6000}, {B, 4000}}));
    BOOST_CHECK_EQUAL(request.repaymentCap, 600000000);

    FundingRoundRecord round = GetRound("film");
    BOOST_CHECK(round.status == FundingStatus::LIVE);
    BOOST_CHECK_EQUAL(round.ledgerAddress, ledgerAddress);
    BOOST_CHECK(round.strLastDeployError.empty());

    std::shared_ptr<CLedger> ledger = g_ledgerman->GetLedger(ledgerAddress, state);
    BOOST_REQUIRE(ledger);
    BOOST_CHECK_EQUAL(ledger->GetRepaymentCap(), 600000000);
    BOOST_CHECK_EQUAL(ledger->GetAdmin(), owner);

    // LIVE is terminal
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("film", C, 1000, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "round-not-funding");
    }
    {
        std::string address;
        CValidationState s;
        BOOST_CHECK(!fundingman->RetryRoundDeployment("film", address, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "deploy-already-deployed");
    }
    BOOST_CHECK_EQUAL(provisioner.vRequests.size(), 1U);
}

BOOST_AUTO_TEST_CASE(repeat_contributors_are_merged)
{
    provisioner.vResults = {CMockProvisioner::Succeeded(ledgerAddress)};

    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("merge", owner, 3000, 1000, state));

    const std::string lower = TestAddress(0xab);
    const std::string upper = "0x" + std::string(38, '0') + "AB";
    ContributionResult result;
    Contribute("merge", lower, 1000, result);
    Contribute("merge", B, 1000, result);
    Contribute("merge", upper, 1000, result);
    BOOST_CHECK(result.fGoalReached);

    BOOST_REQUIRE_EQUAL(provisioner.vRequests.size(), 1U);
    BOOST_CHECK(provisioner.vRequests[0].shareTable == ShareTable({{lower, 6667}, {B, 3333}}));
}

BOOST_AUTO_TEST_CASE(failed_deploy_keeps_round_funding)
{
    provisioner.vResults = {
        CMockProvisioner::Failed("deploy-process-failed", "exit code 1: insufficient funds"),
        CMockProvisioner::Succeeded(ledgerAddress),
    };

    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("film", owner, 1000000, 0, state));

    ContributionResult result;
    Contribute("film", A, 600000, result);
    Contribute("film", B, 400000, result);
    BOOST_CHECK(result.fGoalReached);
    BOOST_CHECK(result.ledgerAddress.empty());
    BOOST_CHECK(result.deployState.IsInvalid());
    BOOST_CHECK_EQUAL(result.deployState.GetRejectReason(), "deploy-process-failed");

    FundingRoundRecord round = GetRound("film");
    BOOST_CHECK(round.status == FundingStatus::FUNDING);
    BOOST_CHECK(round.fGoalReached);
    BOOST_CHECK_EQUAL(round.nCurrentFunding, 1000000);
    BOOST_CHECK_EQUAL(round.contributions.size(), 2U);
    BOOST_CHECK_EQUAL(round.strLastDeployError, "failed: deploy-process-failed: exit code 1: insufficient funds");

    // No more money while the deployment is outstanding
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->AddContribution("film", C, 1000, result, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "round-goal-reached");
    }

    std::string address;
    BOOST_CHECK(fundingman->RetryRoundDeployment("film", address, state));
    BOOST_CHECK_EQUAL(address, ledgerAddress);
    round = GetRound("film");
    BOOST_CHECK(round.status == FundingStatus::LIVE);
    BOOST_CHECK_EQUAL(round.ledgerAddress, ledgerAddress);
    BOOST_CHECK(round.strLastDeployError.empty());
    BOOST_CHECK_EQUAL(provisioner.vRequests.size(), 2U);
}

BOOST_AUTO_TEST_CASE(ambiguous_deploy_reconciled)
{
    provisioner.vResults = {CMockProvisioner::Ambiguous("deploy-timeout", "no result after 60s")};

    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("film", owner, 2000, 1000, state));
    ContributionResult result;
    Contribute("film", A, 1000, result);
    Contribute("film", B, 1000, result);
    BOOST_CHECK_EQUAL(result.deployState.GetRejectCode(), REJECT_AMBIGUOUS);

    FundingRoundRecord round = GetRound("film");
    BOOST_CHECK(round.status == FundingStatus::FUNDING);
    BOOST_CHECK_EQUAL(round.strLastDeployError, "ambiguous: deploy-timeout: no result after 60s");

    std::string address;
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->RetryRoundDeployment("film", address, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "deploy-ambiguous");
    }
    BOOST_CHECK_EQUAL(provisioner.vRequests.size(), 1U);

    BOOST_CHECK(orchestrator->ReconcileDeployment("film", ledgerAddress, state));
    round = GetRound("film");
    BOOST_CHECK(round.status == FundingStatus::LIVE);
    BOOST_CHECK_EQUAL(round.ledgerAddress, ledgerAddress);
}

BOOST_AUTO_TEST_CASE(unallocatable_round_retries_with_new_params)
{
    // No exchange rate configured: the cap cannot be computed
    fundingman = MakeManager(0);
    provisioner.vResults = {CMockProvisioner::Succeeded(ledgerAddress)};

    CValidationState state;
    BOOST_CHECK(fundingman->CreateRound("film", owner, 1000000, 0, state));
    ContributionResult result;
    Contribute("film", A, 1000000, result);
    BOOST_CHECK(result.fGoalReached);
    BOOST_CHECK_EQUAL(result.deployState.GetRejectReason(), "bad-cap-rate");
    BOOST_CHECK(provisioner.vRequests.empty());

    DeploymentRecord record;
    BOOST_CHECK(!orchestrator->GetDeployment("film", record));
    FundingRoundRecord round = GetRound("film");
    BOOST_CHECK(round.status == FundingStatus::FUNDING);
    BOOST_CHECK(round.strLastDeployError.find("bad-cap-rate") != std::string::npos);

    // Restarted with a rate
    fundingman = MakeManager(200000 * RATE_COIN);
    std::string address;
    BOOST_CHECK(fundingman->RetryRoundDeployment("film", address, state));
    BOOST_CHECK_EQUAL(address, ledgerAddress);
    BOOST_REQUIRE_EQUAL(provisioner.vRequests.size(), 1U);
    BOOST_CHECK(provisioner.vRequests[0].shareTable == ShareTable({{A, 10000}}));
    BOOST_CHECK(GetRound("film").status == FundingStatus::LIVE);
}

BOOST_AUTO_TEST_CASE(retry_rules)
{
    std::string address;
    CValidationState state;
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->RetryRoundDeployment("none", address, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "round-not-found");
    }

    BOOST_CHECK(fundingman->CreateRound("open", owner, 5000, 1000, state));
    {
        CValidationState s;
        BOOST_CHECK(!fundingman->RetryRoundDeployment("open", address, s));
        BOOST_CHECK_EQUAL(s.GetRejectReason(), "round-not-funded");
    }
    BOOST_CHECK(provisioner.vRequests.empty());
}

BOOST_AUTO_TEST_SUITE_END()

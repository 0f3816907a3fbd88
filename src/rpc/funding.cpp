// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Funding round and deployment RPCs
 *
 * - createround / contribute / getround / listrounds
 * - retrydeployment / reconciledeployment / getdeployment
 * - allocateshares / computecap: pure helpers, no state
 */

#include "allocation/cap.h"
#include "allocation/shares.h"
#include "core_io.h"
#include "deploy/orchestrator.h"
#include "funding/funding.h"
#include "logging.h"
#include "rpc/server.h"
#include "util/validation.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

#include <stdexcept>

static CFundingManager& EnsureFundingManager()
{
    if (!g_fundingman) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Funding manager not initialized");
    }
    return *g_fundingman;
}

static CDeploymentOrchestrator& EnsureOrchestrator()
{
    if (!g_orchestrator) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Deployment orchestrator not initialized");
    }
    return *g_orchestrator;
}

static UniValue createround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 3 || request.params.size() > 4) {
        throw std::runtime_error(
            "createround \"round\" \"owner\" target ( mincontribution )\n"
            "\nOpen a funding round. The ledger is deployed once contributions reach the target.\n"
            "\nArguments:\n"
            "1. \"round\"            (string, required) Round id, [A-Za-z0-9_-], at most 64 characters\n"
            "2. \"owner\"            (string, required) Creator address, becomes the ledger admin\n"
            "3. target             (numeric, required) Funding target in whole fiat units\n"
            "4. mincontribution    (numeric, optional) Smallest accepted contribution (default: -mincontribution)\n"
            "\nResult: the round (see getround)\n"
            "\nExamples:\n"
            + HelpExampleCli("createround", "\"album-01\" \"0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\" 1000000"));
    }

    CFundingManager& fundingman = EnsureFundingManager();

    const std::string roundId = request.params[0].get_str();
    const std::string owner = AddressFromValue(request.params[1], "owner");
    const int64_t nTarget = FiatAmountFromValue(request.params[2], "target");
    int64_t nMin = 0;
    if (request.params.size() > 3) {
        nMin = FiatAmountFromValue(request.params[3], "mincontribution");
    }

    CValidationState state;
    if (!fundingman.CreateRound(roundId, owner, nTarget, nMin, state)) {
        throw JSONRPCErrorFromState(state);
    }

    FundingRoundRecord round;
    fundingman.GetRound(roundId, round);
    return FundingRoundToJSON(round);
}

static UniValue contribute(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "contribute \"round\" \"address\" amount\n"
            "\nRecord a contribution. The contribution that reaches the target deploys the ledger.\n"
            "\nArguments:\n"
            "1. \"round\"      (string, required) Round id\n"
            "2. \"address\"    (string, required) Contributor address\n"
            "3. amount       (numeric, required) Whole fiat units\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": \"id\",\n"
            "  \"current_funding\": n,\n"
            "  \"goal_reached\": true|false,\n"
            "  \"deployed\": true|false,       (only if goal_reached)\n"
            "  \"ledger\": \"address\",          (only if deployed)\n"
            "  \"deploy_error\": \"message\"     (only if goal_reached and not deployed)\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("contribute", "\"album-01\" \"0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359\" 5000"));
    }

    CFundingManager& fundingman = EnsureFundingManager();

    const std::string roundId = request.params[0].get_str();
    const std::string contributor = AddressFromValue(request.params[1], "address");
    const int64_t nAmount = FiatAmountFromValue(request.params[2], "amount");

    ContributionResult contribution;
    CValidationState state;
    if (!fundingman.AddContribution(roundId, contributor, nAmount, contribution, state)) {
        throw JSONRPCErrorFromState(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("round", roundId);
    result.pushKV("current_funding", contribution.nCurrentFunding);
    result.pushKV("goal_reached", contribution.fGoalReached);
    if (contribution.fGoalReached) {
        const bool fDeployed = contribution.deployState.IsValid();
        result.pushKV("deployed", fDeployed);
        if (fDeployed) {
            result.pushKV("ledger", contribution.ledgerAddress);
        } else {
            result.pushKV("deploy_error", FormatStateMessage(contribution.deployState));
        }
    }
    return result;
}

static UniValue getround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getround \"round\"\n"
            "\nReturns a funding round.\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": \"id\",\n"
            "  \"owner\": \"address\",\n"
            "  \"status\": \"funding|live\",\n"
            "  \"funding_target\": n,\n"
            "  \"min_contribution\": n,\n"
            "  \"current_funding\": n,\n"
            "  \"goal_reached\": true|false,\n"
            "  \"ledger\": \"address\",\n"
            "  \"last_deploy_error\": \"message\",\n"
            "  \"contributions\": [ { \"address\": \"address\", \"amount\": n }, ... ],\n"
            "  \"created\": \"time\"\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getround", "\"album-01\""));
    }

    FundingRoundRecord round;
    if (!EnsureFundingManager().GetRound(request.params[0].get_str(), round)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Round not found");
    }
    return FundingRoundToJSON(round);
}

static UniValue listrounds(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "listrounds\n"
            "\nReturns all funding rounds (see getround).\n"
            "\nExamples:\n"
            + HelpExampleCli("listrounds", ""));
    }

    UniValue result(UniValue::VARR);
    for (const FundingRoundRecord& round : EnsureFundingManager().ListRounds()) {
        result.push_back(FundingRoundToJSON(round));
    }
    return result;
}

static UniValue retrydeployment(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "retrydeployment \"round\"\n"
            "\nRun the provisioner again for a funded round whose deployment failed.\n"
            "Ambiguous deployments are never retried, use reconciledeployment.\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": \"id\",\n"
            "  \"ledger\": \"address\"\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("retrydeployment", "\"album-01\""));
    }

    const std::string roundId = request.params[0].get_str();
    std::string address;
    CValidationState state;
    if (!EnsureFundingManager().RetryRoundDeployment(roundId, address, state)) {
        throw JSONRPCErrorFromState(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("round", roundId);
    result.pushKV("ledger", address);
    return result;
}

static UniValue reconciledeployment(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "reconciledeployment \"round\" \"address\"\n"
            "\nResolve an ambiguous deployment by hand.\n"
            "\nArguments:\n"
            "1. \"round\"      (string, required) Round id\n"
            "2. \"address\"    (string, required) Ledger address the provisioner created,\n"
            "                  or \"\" if it created nothing (the round becomes retryable)\n"
            "\nResult: the deployment record (see getdeployment)\n"
            "\nExamples:\n"
            + HelpExampleCli("reconciledeployment", "\"album-01\" \"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\"")
            + HelpExampleCli("reconciledeployment", "\"album-01\" \"\""));
    }

    CDeploymentOrchestrator& orchestrator = EnsureOrchestrator();

    const std::string roundId = request.params[0].get_str();
    CValidationState state;
    if (!orchestrator.ReconcileDeployment(roundId, request.params[1].get_str(), state)) {
        throw JSONRPCErrorFromState(state);
    }

    DeploymentRecord record;
    orchestrator.GetDeployment(roundId, record);
    return DeploymentRecordToJSON(record);
}

static UniValue getdeployment(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getdeployment \"round\"\n"
            "\nReturns the deployment record of a round.\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": \"id\",\n"
            "  \"status\": \"pending|deployed|failed|ambiguous\",\n"
            "  \"ledger\": \"address\",          (empty until deployed)\n"
            "  \"owner\": \"address\",\n"
            "  \"repayment_cap\": x.xxxxxxxx,\n"
            "  \"shares\": [ { \"address\": \"address\", \"shares\": n }, ... ],\n"
            "  \"attempts\": n,\n"
            "  \"last_error\": \"message\",\n"
            "  \"created\": \"time\",\n"
            "  \"updated\": \"time\"\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getdeployment", "\"album-01\""));
    }

    DeploymentRecord record;
    if (!EnsureOrchestrator().GetDeployment(request.params[0].get_str(), record)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "No deployment for this round");
    }
    return DeploymentRecordToJSON(record);
}

static UniValue allocateshares(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "allocateshares [{\"address\":\"address\",\"amount\":n},...]\n"
            "\nCompute basis-point shares for a list of contributions.\n"
            "Repeated addresses are merged first.\n"
            "\nResult:\n"
            "[ { \"address\": \"address\", \"shares\": n }, ... ]\n"
            "\nExamples:\n"
            + HelpExampleCli("allocateshares", "'[{\"address\":\"0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\",\"amount\":2},"
                                               "{\"address\":\"0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359\",\"amount\":1}]'"));
    }

    const UniValue& entries = request.params[0].get_array();
    std::vector<Contribution> contributions;
    for (unsigned int i = 0; i < entries.size(); i++) {
        const UniValue& entry = entries[i].get_obj();
        const UniValue& address = find_value(entry, "address");
        const UniValue& amount = find_value(entry, "amount");
        if (!address.isStr() || amount.isNull()) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Entry %u needs address and amount", i));
        }
        int64_t nAmount = 0;
        if (amount.isNum()) {
            nAmount = amount.get_int64();
        } else if (!amount.isStr() || !ParseInt64(amount.get_str(), &nAmount)) {
            throw JSONRPCError(RPC_TYPE_ERROR, strprintf("Entry %u: amount must be a whole number", i));
        }
        contributions.emplace_back(address.get_str(), nAmount);
    }

    ShareTable table;
    CValidationState state;
    if (!AllocateShares(AggregateContributions(contributions), table, state)) {
        throw JSONRPCErrorFromState(state);
    }
    return ShareTableToJSON(table);
}

static UniValue computecap(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 3) {
        throw std::runtime_error(
            "computecap target ( multiplier \"exchangerate\" )\n"
            "\nConvert a fiat funding target into a repayment cap.\n"
            "\nArguments:\n"
            "1. target            (numeric, required) Whole fiat units\n"
            "2. multiplier        (numeric, optional) Basis points (default: -capmultiplier)\n"
            "3. \"exchangerate\"    (string, optional) Fiat per settlement unit (default: -exchangerate)\n"
            "\nResult:\n"
            "x.xxxxxxxx           (numeric) The cap in settlement units\n"
            "\nExamples:\n"
            + HelpExampleCli("computecap", "1000000 12000 \"200000\""));
    }

    DeploymentParams params;
    if (g_fundingman) {
        params = g_fundingman->GetParams();
    }

    const int64_t nTarget = FiatAmountFromValue(request.params[0], "target");
    int64_t nMultiplier = params.nCapMultiplierBps;
    if (request.params.size() > 1) {
        nMultiplier = FiatAmountFromValue(request.params[1], "multiplier");
    }
    CAmount nRate = params.nExchangeRate;
    if (request.params.size() > 2) {
        nRate = AmountFromValue(request.params[2]);
    }

    CAmount nCap = 0;
    CValidationState state;
    if (!ComputeRepaymentCap(nTarget, nMultiplier, nRate, nCap, state)) {
        throw JSONRPCErrorFromState(state);
    }
    return ValueFromAmount(nCap);
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                     actor (function)         okSafe argNames
  //  -------------- ------------------------ ------------------------ ------ --------
    { "funding",     "createround",           &createround,            false, {"round","owner","target","mincontribution"} },
    { "funding",     "contribute",            &contribute,             false, {"round","address","amount"} },
    { "funding",     "getround",              &getround,               true,  {"round"} },
    { "funding",     "listrounds",            &listrounds,             true,  {} },
    { "deployment",  "retrydeployment",       &retrydeployment,        false, {"round"} },
    { "deployment",  "reconciledeployment",   &reconciledeployment,    false, {"round","address"} },
    { "deployment",  "getdeployment",         &getdeployment,          true,  {"round"} },
    { "util",        "allocateshares",        &allocateshares,         true,  {"contributions"} },
    { "util",        "computecap",            &computecap,             true,  {"target","multiplier","exchangerate"} },
};
// clang-format on

void RegisterFundingRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}

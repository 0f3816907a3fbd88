// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Ledger RPCs
 *
 * Reads: getledger, listledgers, pendingpayment, listpayouts, listdeposits
 * Writes: deposit, release, pauseledger, unpauseledger, simulatepayout
 *
 * Every write goes through g_ledgerman, which persists the snapshot (and the
 * journals) before returning.
 */

#include "core_io.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerman.h"
#include "ledger/payoutsim.h"
#include "logging.h"
#include "rpc/server.h"
#include "util/validation.h"
#include "utilmoneystr.h"

#include <stdexcept>

static CLedgerManager& EnsureLedgerManager()
{
    if (!g_ledgerman) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Ledger registry not initialized");
    }
    return *g_ledgerman;
}

static std::shared_ptr<CLedger> LedgerFromValue(const UniValue& value)
{
    const std::string address = AddressFromValue(value, "ledger");
    CValidationState state;
    std::shared_ptr<CLedger> ledger = EnsureLedgerManager().GetLedger(address, state);
    if (!ledger) {
        throw JSONRPCErrorFromState(state);
    }
    return ledger;
}

static UniValue getledger(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getledger \"ledger\"\n"
            "\nReturns the state of a deployed ledger.\n"
            "\nResult:\n"
            "{\n"
            "  \"address\": \"address\",\n"
            "  \"admin\": \"address\",\n"
            "  \"paused\": true|false,\n"
            "  \"repayment_cap\": x.xxxxxxxx,\n"
            "  \"total_received\": x.xxxxxxxx,\n"
            "  \"total_released\": x.xxxxxxxx,\n"
            "  \"remaining_cap\": x.xxxxxxxx,\n"
            "  \"cap_exhausted\": true|false,   (every payee reached its cap ceiling)\n"
            "  \"deposits\": n,\n"
            "  \"releases\": n,\n"
            "  \"payees\": [\n"
            "    { \"address\": \"address\", \"shares\": n, \"released\": x.xxxxxxxx, \"pending\": x.xxxxxxxx }, ...\n"
            "  ]\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getledger", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\""));
    }

    return LedgerToJSON(*LedgerFromValue(request.params[0]));
}

static UniValue listledgers(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "listledgers\n"
            "\nReturns the addresses of all deployed ledgers.\n"
            "\nExamples:\n"
            + HelpExampleCli("listledgers", ""));
    }

    UniValue result(UniValue::VARR);
    for (const std::string& address : EnsureLedgerManager().ListLedgers()) {
        result.push_back(address);
    }
    return result;
}

static UniValue pendingpayment(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "pendingpayment \"ledger\" \"claimant\"\n"
            "\nAmount the claimant could release now (0 for unknown claimants).\n"
            "\nResult:\n"
            "x.xxxxxxxx     (numeric) Pending amount in settlement units\n"
            "\nExamples:\n"
            + HelpExampleCli("pendingpayment", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\" \"0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359\""));
    }

    std::shared_ptr<CLedger> ledger = LedgerFromValue(request.params[0]);
    const std::string claimant = AddressFromValue(request.params[1], "claimant");
    return ValueFromAmount(ledger->GetPendingPayment(claimant));
}

static UniValue deposit(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "deposit \"ledger\" amount ( \"depositor\" )\n"
            "\nCredit revenue to a ledger.\n"
            "\nArguments:\n"
            "1. \"ledger\"       (string, required) Ledger address\n"
            "2. amount         (numeric, required) Settlement units, up to 8 decimals\n"
            "3. \"depositor\"    (string, optional) Paying address; the admin may deposit while paused\n"
            "\nResult: the ledger (see getledger)\n"
            "\nExamples:\n"
            + HelpExampleCli("deposit", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\" 2.5"));
    }

    CLedgerManager& ledgerman = EnsureLedgerManager();
    const std::string address = AddressFromValue(request.params[0], "ledger");
    const CAmount nAmount = AmountFromValue(request.params[1]);
    std::string depositor;
    if (request.params.size() > 2 && !request.params[2].get_str().empty()) {
        depositor = AddressFromValue(request.params[2], "depositor");
    }

    CValidationState state;
    if (!ledgerman.Deposit(address, nAmount, depositor, state)) {
        throw JSONRPCErrorFromState(state);
    }
    return LedgerToJSON(*LedgerFromValue(request.params[0]));
}

static UniValue release(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "release \"ledger\" \"claimant\" ( \"caller\" )\n"
            "\nPay the claimant's pending amount out of the ledger.\n"
            "\nArguments:\n"
            "1. \"ledger\"     (string, required) Ledger address\n"
            "2. \"claimant\"   (string, required) Payee\n"
            "3. \"caller\"     (string, optional, default=claimant) Who asks; the admin may release while paused\n"
            "\nResult:\n"
            "{\n"
            "  \"claimant\": \"address\",\n"
            "  \"amount\": x.xxxxxxxx,\n"
            "  \"released\": x.xxxxxxxx,        (claimant total)\n"
            "  \"remaining_cap\": x.xxxxxxxx\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("release", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\" \"0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359\""));
    }

    CLedgerManager& ledgerman = EnsureLedgerManager();
    const std::string address = AddressFromValue(request.params[0], "ledger");
    const std::string claimant = AddressFromValue(request.params[1], "claimant");
    std::string caller = claimant;
    if (request.params.size() > 2) {
        caller = AddressFromValue(request.params[2], "caller");
    }

    CAmount nAmount = 0;
    CValidationState state;
    if (!ledgerman.Release(address, claimant, caller, nAmount, state)) {
        throw JSONRPCErrorFromState(state);
    }

    std::shared_ptr<CLedger> ledger = LedgerFromValue(request.params[0]);
    UniValue result(UniValue::VOBJ);
    result.pushKV("claimant", claimant);
    result.pushKV("amount", ValueFromAmount(nAmount));
    result.pushKV("released", ValueFromAmount(ledger->GetReleased(claimant)));
    result.pushKV("remaining_cap", ValueFromAmount(ledger->GetRemainingCap()));
    return result;
}

static UniValue pauseledger(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "pauseledger \"ledger\" \"caller\"\n"
            "\nStop deposits and releases by anyone but the admin.\n"
            "\nExamples:\n"
            + HelpExampleCli("pauseledger", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\" \"0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\""));
    }

    const std::string address = AddressFromValue(request.params[0], "ledger");
    CValidationState state;
    if (!EnsureLedgerManager().Pause(address, request.params[1].get_str(), state)) {
        throw JSONRPCErrorFromState(state);
    }
    return LedgerToJSON(*LedgerFromValue(request.params[0]));
}

static UniValue unpauseledger(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "unpauseledger \"ledger\" \"caller\"\n"
            "\nResume a paused ledger. Admin only.\n"
            "\nExamples:\n"
            + HelpExampleCli("unpauseledger", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\" \"0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\""));
    }

    const std::string address = AddressFromValue(request.params[0], "ledger");
    CValidationState state;
    if (!EnsureLedgerManager().Unpause(address, request.params[1].get_str(), state)) {
        throw JSONRPCErrorFromState(state);
    }
    return LedgerToJSON(*LedgerFromValue(request.params[0]));
}

static UniValue listpayouts(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "listpayouts \"ledger\" ( count )\n"
            "\nReturns the payout journal of a ledger, oldest first.\n"
            "\nArguments:\n"
            "1. \"ledger\"    (string, required) Ledger address\n"
            "2. count       (numeric, optional) Only the last count entries\n"
            "\nResult:\n"
            "[ { \"seq\": n, \"address\": \"address\", \"amount\": x.xxxxxxxx, \"time\": \"time\" }, ... ]\n"
            "\nExamples:\n"
            + HelpExampleCli("listpayouts", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\""));
    }

    if (!g_ledgerdb) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Ledger database not initialized");
    }
    const std::string address = AddressFromValue(request.params[0], "ledger");
    if (!EnsureLedgerManager().HasLedger(address)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Ledger not found");
    }

    std::vector<PayoutEntry> vEntries;
    g_ledgerdb->ForEachPayout(address, [&](const PayoutEntry& entry) {
        vEntries.push_back(entry);
        return true;
    });

    size_t nSkip = 0;
    if (request.params.size() > 1) {
        const int64_t nCount = request.params[1].get_int64();
        if (nCount < 0) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, "Negative count");
        }
        if ((size_t)nCount < vEntries.size()) {
            nSkip = vEntries.size() - nCount;
        }
    }

    UniValue result(UniValue::VARR);
    for (size_t i = nSkip; i < vEntries.size(); i++) {
        result.push_back(PayoutEntryToJSON(vEntries[i]));
    }
    return result;
}

static UniValue listdeposits(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "listdeposits \"ledger\"\n"
            "\nReturns the deposit journal of a ledger, oldest first.\n"
            "\nResult:\n"
            "[ { \"seq\": n, \"depositor\": \"address\", \"amount\": x.xxxxxxxx, \"time\": \"time\" }, ... ]\n"
            "\nExamples:\n"
            + HelpExampleCli("listdeposits", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\""));
    }

    if (!g_ledgerdb) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Ledger database not initialized");
    }
    const std::string address = AddressFromValue(request.params[0], "ledger");
    if (!EnsureLedgerManager().HasLedger(address)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Ledger not found");
    }

    UniValue result(UniValue::VARR);
    g_ledgerdb->ForEachDeposit(address, [&](const DepositEntry& entry) {
        result.push_back(DepositEntryToJSON(entry));
        return true;
    });
    return result;
}

static UniValue simulatepayout(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 5) {
        throw std::runtime_error(
            "simulatepayout \"ledger\" revenue ( deposits releaseall \"depositor\" )\n"
            "\nDeposit revenue into a ledger in equal parts and optionally release every payee.\n"
            "\nArguments:\n"
            "1. \"ledger\"      (string, required) Ledger address\n"
            "2. revenue       (numeric, required) Total settlement units\n"
            "3. deposits      (numeric, optional, default=1) Number of deposits, remainder on the last\n"
            "4. releaseall    (boolean, optional, default=true) Release every payee with a pending amount\n"
            "5. \"depositor\"   (string, optional) Depositing address\n"
            "\nResult:\n"
            "{\n"
            "  \"deposited\": x.xxxxxxxx,\n"
            "  \"deposits\": n,\n"
            "  \"released\": x.xxxxxxxx,\n"
            "  \"paid\": [ { \"address\": \"address\", \"amount\": x.xxxxxxxx }, ... ],\n"
            "  \"remaining_cap\": x.xxxxxxxx,\n"
            "  \"cap_exhausted\": true|false\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("simulatepayout", "\"0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae\" 3 3 true"));
    }

    CLedgerManager& ledgerman = EnsureLedgerManager();
    const std::string address = AddressFromValue(request.params[0], "ledger");
    const CAmount nRevenue = AmountFromValue(request.params[1]);

    int64_t nDeposits = 1;
    if (request.params.size() > 2) {
        nDeposits = request.params[2].get_int64();
        if (nDeposits <= 0 || nDeposits > 10000) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, "deposits must be between 1 and 10000");
        }
    }
    bool fReleaseAll = true;
    if (request.params.size() > 3) {
        fReleaseAll = request.params[3].get_bool();
    }
    std::string depositor;
    if (request.params.size() > 4) {
        depositor = AddressFromValue(request.params[4], "depositor");
    }

    CPayoutSimulator simulator(ledgerman);
    PayoutReport report;
    CValidationState state;
    if (!simulator.Run(address, nRevenue, (unsigned int)nDeposits, depositor, fReleaseAll, report, state)) {
        throw JSONRPCErrorFromState(state);
    }
    return PayoutReportToJSON(report);
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                   actor (function)       okSafe argNames
  //  -------------- ---------------------- ---------------------- ------ --------
    { "ledger",      "getledger",           &getledger,            true,  {"ledger"} },
    { "ledger",      "listledgers",         &listledgers,          true,  {} },
    { "ledger",      "pendingpayment",      &pendingpayment,       true,  {"ledger","claimant"} },
    { "ledger",      "deposit",             &deposit,              false, {"ledger","amount","depositor"} },
    { "ledger",      "release",             &release,              false, {"ledger","claimant","caller"} },
    { "ledger",      "pauseledger",         &pauseledger,          false, {"ledger","caller"} },
    { "ledger",      "unpauseledger",       &unpauseledger,        false, {"ledger","caller"} },
    { "ledger",      "listpayouts",         &listpayouts,          true,  {"ledger","count"} },
    { "ledger",      "listdeposits",        &listdeposits,         true,  {"ledger"} },
    { "ledger",      "simulatepayout",      &simulatepayout,       false, {"ledger","revenue","deposits","releaseall","depositor"} },
};
// clang-format on

void RegisterLedgerRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}

// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "deploy/deployment.h"
#include "funding/round.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "ledger/payoutsim.h"
#include "logging.h"
#include "utiltime.h"

#include <univalue.h>

UniValue ValueFromAmount(const CAmount& amount)
{
    bool sign = amount < 0;
    int64_t n_abs = (sign ? -amount : amount);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    return UniValue(UniValue::VNUM,
            strprintf("%s%d.%08d", sign ? "-" : "", quotient, remainder));
}

UniValue ShareTableToJSON(const ShareTable& table)
{
    UniValue result(UniValue::VARR);
    for (const ShareEntry& entry : table) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("address", entry.claimant);
        obj.pushKV("shares", entry.nShares);
        result.push_back(obj);
    }
    return result;
}

UniValue LedgerToJSON(const CLedger& ledger)
{
    const LedgerSnapshot snapshot = ledger.GetSnapshot();

    UniValue result(UniValue::VOBJ);
    result.pushKV("address", snapshot.params.address);
    result.pushKV("admin", snapshot.params.admin);
    result.pushKV("paused", snapshot.fPaused);
    result.pushKV("repayment_cap", ValueFromAmount(snapshot.params.repaymentCap));
    result.pushKV("total_received", ValueFromAmount(snapshot.nTotalReceived));
    result.pushKV("total_released", ValueFromAmount(snapshot.nTotalReleased));
    result.pushKV("remaining_cap", ValueFromAmount(snapshot.params.repaymentCap - snapshot.nTotalReleased));
    result.pushKV("cap_exhausted", ledger.IsCapExhausted());
    result.pushKV("deposits", (int64_t)snapshot.nDeposits);
    result.pushKV("releases", (int64_t)snapshot.nReleases);

    UniValue payees(UniValue::VARR);
    for (const ShareEntry& entry : snapshot.params.shareTable) {
        auto it = snapshot.mapReleased.find(entry.claimant);
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("address", entry.claimant);
        obj.pushKV("shares", entry.nShares);
        obj.pushKV("released", ValueFromAmount(it == snapshot.mapReleased.end() ? 0 : it->second));
        obj.pushKV("pending", ValueFromAmount(ledger.GetPendingPayment(entry.claimant)));
        payees.push_back(obj);
    }
    result.pushKV("payees", payees);
    return result;
}

UniValue PayoutEntryToJSON(const PayoutEntry& entry)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("seq", (int64_t)entry.nSeq);
    obj.pushKV("address", entry.claimant);
    obj.pushKV("amount", ValueFromAmount(entry.amount));
    obj.pushKV("time", FormatISO8601DateTime(entry.nTime));
    return obj;
}

UniValue DepositEntryToJSON(const DepositEntry& entry)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("seq", (int64_t)entry.nSeq);
    obj.pushKV("depositor", entry.depositor);
    obj.pushKV("amount", ValueFromAmount(entry.amount));
    obj.pushKV("time", FormatISO8601DateTime(entry.nTime));
    return obj;
}

UniValue DeploymentRecordToJSON(const DeploymentRecord& record)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("round", record.roundId);
    obj.pushKV("status", DeploymentStatusToString(record.status));
    obj.pushKV("ledger", record.ledgerAddress);
    obj.pushKV("owner", record.owner);
    obj.pushKV("repayment_cap", ValueFromAmount(record.repaymentCap));
    obj.pushKV("shares", ShareTableToJSON(record.shareTable));
    obj.pushKV("attempts", (int64_t)record.nAttempts);
    obj.pushKV("last_error", record.strLastError);
    obj.pushKV("created", FormatISO8601DateTime(record.nCreateTime));
    obj.pushKV("updated", FormatISO8601DateTime(record.nUpdateTime));
    return obj;
}

UniValue FundingRoundToJSON(const FundingRoundRecord& round)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("round", round.roundId);
    obj.pushKV("owner", round.owner);
    obj.pushKV("status", FundingStatusToString(round.status));
    obj.pushKV("funding_target", round.nFundingTarget);
    obj.pushKV("min_contribution", round.nMinContribution);
    obj.pushKV("current_funding", round.nCurrentFunding);
    obj.pushKV("goal_reached", round.fGoalReached);
    obj.pushKV("ledger", round.ledgerAddress);
    obj.pushKV("last_deploy_error", round.strLastDeployError);

    UniValue contributions(UniValue::VARR);
    for (const Contribution& contribution : round.contributions) {
        UniValue entry(UniValue::VOBJ);
        entry.pushKV("address", contribution.claimant);
        entry.pushKV("amount", contribution.amount);
        contributions.push_back(entry);
    }
    obj.pushKV("contributions", contributions);
    obj.pushKV("created", FormatISO8601DateTime(round.nCreateTime));
    return obj;
}

UniValue PayoutReportToJSON(const PayoutReport& report)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("deposited", ValueFromAmount(report.nDeposited));
    obj.pushKV("deposits", (int64_t)report.nDeposits);
    obj.pushKV("released", ValueFromAmount(report.nReleased));

    UniValue paid(UniValue::VARR);
    for (const auto& entry : report.vPaid) {
        UniValue payout(UniValue::VOBJ);
        payout.pushKV("address", entry.first);
        payout.pushKV("amount", ValueFromAmount(entry.second));
        paid.push_back(payout);
    }
    obj.pushKV("paid", paid);
    obj.pushKV("remaining_cap", ValueFromAmount(report.nRemainingCap));
    obj.pushKV("cap_exhausted", report.fCapExhausted);
    return obj;
}

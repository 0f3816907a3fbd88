// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_CORE_IO_H
#define REVSPLIT_CORE_IO_H

#include "allocation/shares.h"
#include "amount.h"

#include <string>

class CLedger;
class UniValue;
struct DeploymentRecord;
struct DepositEntry;
struct FundingRoundRecord;
struct PayoutEntry;
struct PayoutReport;

// core_write.cpp
UniValue ValueFromAmount(const CAmount& amount);
UniValue ShareTableToJSON(const ShareTable& table);
UniValue LedgerToJSON(const CLedger& ledger);
UniValue PayoutEntryToJSON(const PayoutEntry& entry);
UniValue DepositEntryToJSON(const DepositEntry& entry);
UniValue DeploymentRecordToJSON(const DeploymentRecord& record);
UniValue FundingRoundToJSON(const FundingRoundRecord& round);
UniValue PayoutReportToJSON(const PayoutReport& report);

#endif // REVSPLIT_CORE_IO_H

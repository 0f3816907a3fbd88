// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_LEDGER_PAYOUTSIM_H
#define REVSPLIT_LEDGER_PAYOUTSIM_H

#include "amount.h"

#include <string>
#include <utility>
#include <vector>

class CLedgerManager;
class CValidationState;

/** Outcome of one simulator run */
struct PayoutReport
{
    CAmount nDeposited = 0;
    CAmount nReleased = 0;
    unsigned int nDeposits = 0;
    std::vector<std::pair<std::string, CAmount>> vPaid;   // claimant -> amount released in this run
    CAmount nRemainingCap = 0;
    bool fCapExhausted = false;
};

/**
 * Drives revenue through a deployed ledger: splits totalRevenue into
 * nDeposits deposits (remainder on the last one) and optionally releases
 * every claimant with a pending amount.
 */
class CPayoutSimulator
{
private:
    CLedgerManager& ledgerman;

public:
    explicit CPayoutSimulator(CLedgerManager& ledgermanIn) : ledgerman(ledgermanIn) {}

    bool Run(const std::string& ledgerAddress, CAmount totalRevenue, unsigned int nDeposits,
             const std::string& depositor, bool fReleaseAll, PayoutReport& report, CValidationState& state);
};

#endif // REVSPLIT_LEDGER_PAYOUTSIM_H

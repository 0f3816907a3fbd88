// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/payoutsim.h"

#include "ledger/ledger.h"
#include "ledger/ledgerman.h"
#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"

bool CPayoutSimulator::Run(const std::string& ledgerAddress, CAmount totalRevenue, unsigned int nDeposits,
                           const std::string& depositor, bool fReleaseAll, PayoutReport& report, CValidationState& state)
{
    if (totalRevenue <= 0 || !MoneyRange(totalRevenue)) {
        return state.Invalid(false, REJECT_INVALID, "bad-amount",
                             strprintf("revenue=%lld", (long long)totalRevenue));
    }
    if (nDeposits == 0 || (CAmount)nDeposits > totalRevenue) {
        return state.Invalid(false, REJECT_INVALID, "bad-sim-deposits",
                             strprintf("deposits=%u revenue=%lld", nDeposits, (long long)totalRevenue));
    }

    std::shared_ptr<CLedger> ledger = ledgerman.GetLedger(ledgerAddress, state);
    if (!ledger) {
        return false;
    }

    report = PayoutReport();

    const CAmount nChunk = totalRevenue / nDeposits;
    for (unsigned int i = 0; i < nDeposits; ++i) {
        CAmount nAmount = nChunk;
        if (i == nDeposits - 1) {
            nAmount = totalRevenue - nChunk * (nDeposits - 1);
        }
        if (!ledgerman.Deposit(ledgerAddress, nAmount, depositor, state)) {
            LogPrint(BCLog::SIM, "CPayoutSimulator: deposit %u/%u failed: %s\n", i + 1, nDeposits, FormatStateMessage(state));
            return false;
        }
        report.nDeposited += nAmount;
        report.nDeposits++;
    }

    if (fReleaseAll) {
        for (const std::string& claimant : ledger->GetPayees()) {
            if (ledger->GetPendingPayment(claimant) <= 0) {
                continue;
            }
            CAmount nPaid = 0;
            if (!ledgerman.Release(ledgerAddress, claimant, claimant, nPaid, state)) {
                LogPrint(BCLog::SIM, "CPayoutSimulator: release to %s failed: %s\n", claimant, FormatStateMessage(state));
                return false;
            }
            report.vPaid.emplace_back(claimant, nPaid);
            report.nReleased += nPaid;
        }
    }

    report.nRemainingCap = ledger->GetRemainingCap();
    report.fCapExhausted = ledger->IsCapExhausted();

    LogPrint(BCLog::SIM, "CPayoutSimulator: ledger=%s deposited=%s released=%s remaining=%s exhausted=%d\n",
             ledger->GetAddress(), FormatMoney(report.nDeposited), FormatMoney(report.nReleased),
             FormatMoney(report.nRemainingCap), report.fCapExhausted);
    return true;
}

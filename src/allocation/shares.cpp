// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "allocation/shares.h"

#include "key_io.h"
#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"

#include <map>
#include <set>

std::vector<Contribution> AggregateContributions(const std::vector<Contribution>& contributions)
{
    std::vector<Contribution> result;
    std::map<std::string, size_t> mapIndex;

    for (const Contribution& c : contributions) {
        std::string key = NormalizeDestination(c.claimant);
        if (key.empty()) {
            // Not a destination: keep it as its own row, AllocateShares rejects it
            result.push_back(c);
            continue;
        }
        auto it = mapIndex.find(key);
        if (it == mapIndex.end()) {
            mapIndex.emplace(key, result.size());
            result.emplace_back(key, c.amount);
        } else {
            // Saturate instead of wrapping; AllocateShares reports the overflow
            CAmount& amount = result[it->second].amount;
            if (!AddNoOverflow(amount, c.amount, amount)) {
                amount = MAX_MONEY + 1;
            }
        }
    }
    return result;
}

bool AllocateShares(const std::vector<Contribution>& contributions, ShareTable& table, CValidationState& state)
{
    if (contributions.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-alloc-empty");
    }

    // Validate inputs and sum with overflow protection
    std::set<std::string> setSeen;
    CAmount nTotal = 0;
    for (const Contribution& c : contributions) {
        if (!IsValidDestinationString(c.claimant)) {
            return state.Invalid(false, REJECT_INVALID, "bad-address",
                                 strprintf("claimant=%s", c.claimant));
        }
        if (!setSeen.insert(NormalizeDestination(c.claimant)).second) {
            return state.Invalid(false, REJECT_INVALID, "bad-alloc-duplicate-claimant",
                                 strprintf("claimant=%s", c.claimant));
        }
        if (c.amount <= 0) {
            return state.Invalid(false, REJECT_INVALID, "bad-alloc-amount",
                                 strprintf("claimant=%s amount=%lld", c.claimant, (long long)c.amount));
        }
        if (!AddNoOverflow(nTotal, c.amount, nTotal)) {
            return state.Invalid(false, REJECT_INVALID, "bad-alloc-overflow",
                                 strprintf("claimant=%s amount=%lld", c.claimant, (long long)c.amount));
        }
    }

    ShareTable result;
    result.reserve(contributions.size());

    int64_t nSum = 0;
    size_t nLargest = 0;
    const __int128 nDenominator = static_cast<__int128>(nTotal) * 2;
    for (size_t i = 0; i < contributions.size(); ++i) {
        const Contribution& c = contributions[i];
        // round-half-up(amount * 10000 / total) == floor((2 * amount * 10000 + total) / (2 * total))
        __int128 nNumerator = static_cast<__int128>(c.amount) * TOTAL_SHARES * 2 + nTotal;
        int64_t nShares = static_cast<int64_t>(nNumerator / nDenominator);

        result.emplace_back(NormalizeDestination(c.claimant), nShares);
        nSum += nShares;

        // Strictly greater: ties stay with the first occurrence
        if (c.amount > contributions[nLargest].amount) {
            nLargest = i;
        }
    }

    int64_t nDrift = TOTAL_SHARES - nSum;
    if (nDrift != 0) {
        LogPrint(BCLog::ALLOC, "AllocateShares: drift %+d applied to %s (%d -> %d)\n",
                 nDrift, result[nLargest].claimant, result[nLargest].nShares,
                 result[nLargest].nShares + nDrift);
        result[nLargest].nShares += nDrift;
    }

    for (const ShareEntry& entry : result) {
        if (entry.nShares <= 0) {
            return state.Invalid(false, REJECT_DEGENERATE, "bad-alloc-degenerate",
                                 strprintf("claimant=%s shares=%d total=%lld", entry.claimant, entry.nShares, (long long)nTotal));
        }
    }

    LogPrint(BCLog::ALLOC, "AllocateShares: %u claimants, total=%lld\n", result.size(), (long long)nTotal);

    table = std::move(result);
    return true;
}

bool CheckShareTable(const ShareTable& table, CValidationState& state)
{
    if (table.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-alloc-empty");
    }

    std::set<std::string> setSeen;
    int64_t nSum = 0;
    for (const ShareEntry& entry : table) {
        if (!IsValidDestinationString(entry.claimant)) {
            return state.Invalid(false, REJECT_INVALID, "bad-address",
                                 strprintf("claimant=%s", entry.claimant));
        }
        if (!setSeen.insert(NormalizeDestination(entry.claimant)).second) {
            return state.Invalid(false, REJECT_INVALID, "bad-alloc-duplicate-claimant",
                                 strprintf("claimant=%s", entry.claimant));
        }
        if (entry.nShares <= 0) {
            return state.Invalid(false, REJECT_INVALID, "bad-shares-zero",
                                 strprintf("claimant=%s", entry.claimant));
        }
        if (entry.nShares > TOTAL_SHARES) {
            return state.Invalid(false, REJECT_INVALID, "bad-shares-range",
                                 strprintf("claimant=%s shares=%d", entry.claimant, entry.nShares));
        }
        nSum += entry.nShares;
    }

    if (nSum != TOTAL_SHARES) {
        return state.Invalid(false, REJECT_INVALID, "bad-shares-sum",
                             strprintf("sum=%d expected=%d", nSum, TOTAL_SHARES));
    }
    return true;
}

int64_t GetShareTableTotal(const ShareTable& table)
{
    int64_t nSum = 0;
    for (const ShareEntry& entry : table) {
        nSum += entry.nShares;
    }
    return nSum;
}

// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_ALLOCATION_SHARES_H
#define REVSPLIT_ALLOCATION_SHARES_H

/**
 * Share allocation
 *
 * Turns funding contributions into a share table in basis points.
 *
 * Invariants of every table produced here:
 * - sum(shares) == TOTAL_SHARES
 * - every share > 0
 * - claimants are distinct, canonical (lower-case) destinations
 *
 * Rounding: each share is round-half-up(amount * 10000 / total). The drift
 * (10000 - sum) goes to the entry with the largest amount, first one on ties.
 */

#include "amount.h"
#include "serialize.h"

#include <stdint.h>
#include <string>
#include <vector>

class CValidationState;

/** 100% in basis points */
static const int64_t TOTAL_SHARES = 10000;

/** One contribution towards a funding round */
struct Contribution
{
    std::string claimant;        // destination, canonical form
    CAmount amount;              // whole fiat units

    Contribution() { SetNull(); }
    Contribution(const std::string& claimantIn, CAmount amountIn) : claimant(claimantIn), amount(amountIn) {}

    void SetNull()
    {
        claimant.clear();
        amount = 0;
    }

    bool IsNull() const { return claimant.empty(); }

    SERIALIZE_METHODS(Contribution, obj)
    {
        READWRITE(obj.claimant);
        READWRITE(obj.amount);
    }
};

/** One row of a share table */
struct ShareEntry
{
    std::string claimant;
    int64_t nShares;             // basis points, 1..10000

    ShareEntry() : nShares(0) {}
    ShareEntry(const std::string& claimantIn, int64_t nSharesIn) : claimant(claimantIn), nShares(nSharesIn) {}

    bool operator==(const ShareEntry& other) const
    {
        return claimant == other.claimant && nShares == other.nShares;
    }

    SERIALIZE_METHODS(ShareEntry, obj)
    {
        READWRITE(obj.claimant);
        READWRITE(obj.nShares);
    }
};

/** Ordered share table; order is first-contribution order */
typedef std::vector<ShareEntry> ShareTable;

/**
 * Merge contributions from the same identity (case-insensitive).
 * The merged entry keeps the position of that identity's first contribution.
 * Claimants are returned in canonical form. Invalid destinations are passed
 * through untouched so that AllocateShares can reject them.
 */
std::vector<Contribution> AggregateContributions(const std::vector<Contribution>& contributions);

/**
 * Compute a share table from pre-aggregated contributions.
 *
 * @param[in]  contributions  nonempty, distinct claimants, every amount > 0
 * @param[out] table          filled only on success
 * @param[out] state          bad-alloc-empty, bad-alloc-amount, bad-alloc-overflow,
 *                            bad-alloc-duplicate-claimant, bad-address (REJECT_INVALID)
 *                            or bad-alloc-degenerate (REJECT_DEGENERATE)
 */
bool AllocateShares(const std::vector<Contribution>& contributions, ShareTable& table, CValidationState& state);

/**
 * Structural check of an existing table: nonempty, well-formed distinct
 * claimants, every share in 1..10000, sum == TOTAL_SHARES.
 */
bool CheckShareTable(const ShareTable& table, CValidationState& state);

/** Sum of the shares in a table (no validation) */
int64_t GetShareTableTotal(const ShareTable& table);

#endif // REVSPLIT_ALLOCATION_SHARES_H

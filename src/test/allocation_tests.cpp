// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Share allocation tests
 *
 * Tests:
 *   1. Proportional shares and drift correction
 *   2. Aggregation of repeated identities
 *   3. Rejected inputs (empty, duplicate, non-positive, degenerate)
 *   4. Randomised sweep: sum == 10000, every share > 0, bounded rounding error
 */

#include "allocation/shares.h"
#include "amount.h"
#include "test/test_revsplit.h"
#include "util/validation.h"

#include <ctype.h>
#include <random>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(allocation_tests, BasicTestingSetup)

static ShareTable Allocate(const std::vector<Contribution>& contributions)
{
    ShareTable table;
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(AllocateShares(contributions, table, state), FormatStateMessage(state));
    return table;
}

BOOST_AUTO_TEST_CASE(allocate_proportional)
{
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);

    ShareTable table = Allocate({{A, 600000}, {B, 400000}});
    BOOST_REQUIRE_EQUAL(table.size(), 2U);
    BOOST_CHECK(table[0] == ShareEntry(A, 6000));
    BOOST_CHECK(table[1] == ShareEntry(B, 4000));
    BOOST_CHECK_EQUAL(GetShareTableTotal(table), TOTAL_SHARES);

    // Single contributor owns everything
    table = Allocate({{A, 1}});
    BOOST_REQUIRE_EQUAL(table.size(), 1U);
    BOOST_CHECK_EQUAL(table[0].nShares, TOTAL_SHARES);
}

BOOST_AUTO_TEST_CASE(allocate_drift_goes_to_first_largest)
{
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);
    const std::string C = TestAddress(3);

    // 3333 * 3 = 9999, the missing point goes to the first of the tied claimants
    ShareTable table = Allocate({{A, 1}, {B, 1}, {C, 1}});
    BOOST_REQUIRE_EQUAL(table.size(), 3U);
    BOOST_CHECK_EQUAL(table[0].nShares, 3334);
    BOOST_CHECK_EQUAL(table[1].nShares, 3333);
    BOOST_CHECK_EQUAL(table[2].nShares, 3333);

    // Ties follow input order
    table = Allocate({{C, 1}, {A, 1}, {B, 1}});
    BOOST_CHECK_EQUAL(table[0].claimant, C);
    BOOST_CHECK_EQUAL(table[0].nShares, 3334);

    // Drift goes to the strictly largest contribution even if it comes later
    table = Allocate({{A, 1}, {B, 1}, {C, 2}});
    BOOST_CHECK_EQUAL(table[0].nShares, 2500);
    BOOST_CHECK_EQUAL(table[1].nShares, 2500);
    BOOST_CHECK_EQUAL(table[2].nShares, 5000);

    // Rounding up overshoots: 1/6 -> 1667 (x2), 4/6 -> 6667, sum 10001
    table = Allocate({{A, 1}, {B, 1}, {C, 4}});
    BOOST_CHECK_EQUAL(table[0].nShares, 1667);
    BOOST_CHECK_EQUAL(table[1].nShares, 1667);
    BOOST_CHECK_EQUAL(table[2].nShares, 6666);
    BOOST_CHECK_EQUAL(GetShareTableTotal(table), TOTAL_SHARES);
}

BOOST_AUTO_TEST_CASE(allocate_half_rounds_up)
{
    // Exact splits need no correction
    ShareTable table = Allocate({{TestAddress(1), 7}, {TestAddress(2), 1}});
    BOOST_CHECK_EQUAL(table[0].nShares, 8750);
    BOOST_CHECK_EQUAL(table[1].nShares, 1250);

    // 1 of 20000 = 0.5 bps rounds up to 1
    table = Allocate({{TestAddress(1), 19999}, {TestAddress(2), 1}});
    BOOST_CHECK_EQUAL(table[0].nShares, 9999);
    BOOST_CHECK_EQUAL(table[1].nShares, 1);
}

BOOST_AUTO_TEST_CASE(aggregate_merges_identities)
{
    const std::string A = TestAddress(0xa);
    const std::string B = TestAddress(0xb);
    std::string upperA = A;
    for (size_t i = 2; i < upperA.size(); ++i) {
        upperA[i] = toupper(upperA[i]);
    }
    BOOST_CHECK(upperA != A);

    std::vector<Contribution> merged = AggregateContributions({{A, 100}, {B, 300}, {upperA, 200}});
    BOOST_REQUIRE_EQUAL(merged.size(), 2U);
    BOOST_CHECK_EQUAL(merged[0].claimant, A);
    BOOST_CHECK_EQUAL(merged[0].amount, 300);
    BOOST_CHECK_EQUAL(merged[1].claimant, B);
    BOOST_CHECK_EQUAL(merged[1].amount, 300);

    // Tie between A (first occurrence) and B: A takes the drift
    ShareTable table = Allocate(merged);
    BOOST_CHECK_EQUAL(table[0].nShares, 5000);
    BOOST_CHECK_EQUAL(table[1].nShares, 5000);

    // Invalid entries pass through so that AllocateShares can report them
    merged = AggregateContributions({{"not-an-address", 5}, {A, 1}});
    BOOST_REQUIRE_EQUAL(merged.size(), 2U);
    BOOST_CHECK_EQUAL(merged[0].claimant, "not-an-address");
}

BOOST_AUTO_TEST_CASE(allocate_rejects)
{
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);
    ShareTable table;

    {
        CValidationState state;
        BOOST_CHECK(!AllocateShares({}, table, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-empty");
    }
    {
        CValidationState state;
        BOOST_CHECK(!AllocateShares({{A, 5}, {A, 7}}, table, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-duplicate-claimant");
    }
    {
        CValidationState state;
        BOOST_CHECK(!AllocateShares({{A, 5}, {B, 0}}, table, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-amount");
    }
    {
        CValidationState state;
        BOOST_CHECK(!AllocateShares({{A, 5}, {B, -3}}, table, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-amount");
    }
    {
        CValidationState state;
        BOOST_CHECK(!AllocateShares({{"0x1234", 5}}, table, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-address");
    }
    {
        CValidationState state;
        BOOST_CHECK(!AllocateShares({{A, MAX_MONEY}, {B, MAX_MONEY}}, table, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-overflow");
    }
    BOOST_CHECK(table.empty());
}

BOOST_AUTO_TEST_CASE(allocate_degenerate)
{
    // 1 of 100000 is 0.1 bps and rounds to zero
    ShareTable table;
    CValidationState state;
    BOOST_CHECK(!AllocateShares({{TestAddress(1), 99999}, {TestAddress(2), 1}}, table, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-degenerate");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_DEGENERATE);
    BOOST_CHECK(table.empty());
}

BOOST_AUTO_TEST_CASE(check_share_table)
{
    const std::string A = TestAddress(1);
    const std::string B = TestAddress(2);
    {
        CValidationState state;
        BOOST_CHECK(CheckShareTable({{A, 6000}, {B, 4000}}, state));
    }
    {
        CValidationState state;
        BOOST_CHECK(!CheckShareTable({{A, 6000}, {B, 3999}}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-shares-sum");
    }
    {
        CValidationState state;
        BOOST_CHECK(!CheckShareTable({{A, 10000}, {B, 0}}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-shares-zero");
    }
    {
        CValidationState state;
        BOOST_CHECK(!CheckShareTable({{A, 5000}, {A, 5000}}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-duplicate-claimant");
    }
    {
        CValidationState state;
        BOOST_CHECK(!CheckShareTable({}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-empty");
    }
}

BOOST_AUTO_TEST_CASE(allocate_random_sweep)
{
    std::mt19937_64 rng(20260101);
    std::uniform_int_distribution<int> countDist(1, 40);
    std::uniform_int_distribution<CAmount> amountDist(1000, 5000000);

    for (int round = 0; round < 500; ++round) {
        std::vector<Contribution> contributions;
        const int nCount = countDist(rng);
        CAmount nTotal = 0;
        for (int i = 0; i < nCount; ++i) {
            contributions.emplace_back(TestAddress(i + 1), amountDist(rng));
            nTotal += contributions.back().amount;
        }

        ShareTable table;
        CValidationState state;
        if (!AllocateShares(contributions, table, state)) {
            // Only a vanishing contribution may fail
            BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-alloc-degenerate");
            continue;
        }

        BOOST_REQUIRE_EQUAL(table.size(), contributions.size());
        BOOST_CHECK_EQUAL(GetShareTableTotal(table), TOTAL_SHARES);

        size_t nLargest = 0;
        for (size_t i = 0; i < contributions.size(); ++i) {
            if (contributions[i].amount > contributions[nLargest].amount) nLargest = i;
        }

        for (size_t i = 0; i < table.size(); ++i) {
            BOOST_CHECK_EQUAL(table[i].claimant, contributions[i].claimant);
            BOOST_CHECK(table[i].nShares > 0);
            if (i == nLargest) continue;
            // Everyone but the drift holder is within half a basis point of the exact share
            const __int128 nExact2 = static_cast<__int128>(contributions[i].amount) * TOTAL_SHARES * 2;
            const __int128 nGot2 = static_cast<__int128>(table[i].nShares) * nTotal * 2;
            BOOST_CHECK(nGot2 - nExact2 <= nTotal);
            BOOST_CHECK(nExact2 - nGot2 < nTotal);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

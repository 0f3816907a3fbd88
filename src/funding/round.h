// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_FUNDING_ROUND_H
#define REVSPLIT_FUNDING_ROUND_H

#include "allocation/shares.h"
#include "amount.h"
#include "serialize.h"

#include <stdint.h>
#include <string>
#include <vector>

enum class FundingStatus : uint8_t {
    FUNDING = 0,
    LIVE = 1,
};

std::string FundingStatusToString(FundingStatus status);

/** Longest accepted round id */
static const size_t MAX_ROUND_ID_LENGTH = 64;

/** Round ids are 1..64 characters of [A-Za-z0-9_-] */
bool IsValidRoundId(const std::string& roundId);

/**
 * FundingRoundRecord - Persisted state of one funding round
 *
 * Amounts are whole fiat units. nCurrentFunding never exceeds nFundingTarget;
 * fGoalReached is set once, the first time they are equal.
 */
struct FundingRoundRecord
{
    std::string roundId;
    std::string owner;                       // creator, admin of the ledger
    CAmount nFundingTarget;
    CAmount nMinContribution;
    std::vector<Contribution> contributions; // in arrival order, not aggregated
    CAmount nCurrentFunding;
    FundingStatus status;
    bool fGoalReached;
    std::string ledgerAddress;               // set when LIVE
    std::string strLastDeployError;
    int64_t nCreateTime;
    int64_t nUpdateTime;

    FundingRoundRecord() { SetNull(); }

    void SetNull()
    {
        roundId.clear();
        owner.clear();
        nFundingTarget = 0;
        nMinContribution = 0;
        contributions.clear();
        nCurrentFunding = 0;
        status = FundingStatus::FUNDING;
        fGoalReached = false;
        ledgerAddress.clear();
        strLastDeployError.clear();
        nCreateTime = 0;
        nUpdateTime = 0;
    }

    bool IsNull() const { return roundId.empty(); }

    SERIALIZE_METHODS(FundingRoundRecord, obj)
    {
        READWRITE(obj.roundId, obj.owner);
        READWRITE(obj.nFundingTarget, obj.nMinContribution);
        READWRITE(obj.contributions, obj.nCurrentFunding);
        READWRITE(WrapEnum(obj.status));
        READWRITE(obj.fGoalReached);
        READWRITE(obj.ledgerAddress, obj.strLastDeployError);
        READWRITE(obj.nCreateTime, obj.nUpdateTime);
    }
};

#endif // REVSPLIT_FUNDING_ROUND_H

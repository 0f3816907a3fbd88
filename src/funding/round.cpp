// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "funding/round.h"

std::string FundingStatusToString(FundingStatus status)
{
    switch (status) {
    case FundingStatus::FUNDING: return "funding";
    case FundingStatus::LIVE:    return "live";
    }
    return "unknown";
}

bool IsValidRoundId(const std::string& roundId)
{
    if (roundId.empty() || roundId.size() > MAX_ROUND_ID_LENGTH) {
        return false;
    }
    for (char c : roundId) {
        bool fAlnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!fAlnum && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "allocation/cap.h"

#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"

bool ComputeRepaymentCap(int64_t nFundingTarget, int64_t nCapMultiplierBps, CAmount nExchangeRate,
                         CAmount& nCapOut, CValidationState& state)
{
    if (nExchangeRate <= 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-cap-rate",
                             strprintf("rate=%lld", (long long)nExchangeRate));
    }
    if (nFundingTarget <= 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-cap-target",
                             strprintf("target=%lld", (long long)nFundingTarget));
    }
    if (nCapMultiplierBps <= 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-cap-multiplier",
                             strprintf("multiplier=%lld", (long long)nCapMultiplierBps));
    }

    // Operands are each below 2^63, so target * multiplier fits in 126 bits.
    // Scale by COIN * RATE_COIN (~2^53) only while that cannot overflow.
    const __int128 nScaled = static_cast<__int128>(nFundingTarget) * nCapMultiplierBps;
    const __int128 nUnitScale = static_cast<__int128>(COIN) * RATE_COIN;
    const __int128 nMaxScaled = (~static_cast<unsigned __int128>(0) >> 1) / nUnitScale;
    if (nScaled > nMaxScaled) {
        return state.Invalid(false, REJECT_INVALID, "bad-cap-range",
                             strprintf("target=%lld multiplier=%lld", (long long)nFundingTarget, (long long)nCapMultiplierBps));
    }

    const __int128 nCap = (nScaled * nUnitScale) / (static_cast<__int128>(MULTIPLIER_BPS_ONE) * nExchangeRate);
    if (nCap <= 0 || nCap > MAX_MONEY) {
        return state.Invalid(false, REJECT_INVALID, "bad-cap-range",
                             strprintf("target=%lld multiplier=%lld rate=%s", (long long)nFundingTarget,
                                       (long long)nCapMultiplierBps, FormatMoney(nExchangeRate)));
    }

    nCapOut = static_cast<CAmount>(nCap);
    LogPrint(BCLog::ALLOC, "ComputeRepaymentCap: target=%lld multiplier=%lld rate=%s cap=%s\n",
             (long long)nFundingTarget, (long long)nCapMultiplierBps, FormatMoney(nExchangeRate), FormatMoney(nCapOut));
    return true;
}

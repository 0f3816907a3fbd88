// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_ALLOCATION_CAP_H
#define REVSPLIT_ALLOCATION_CAP_H

#include "amount.h"

#include <stdint.h>

class CValidationState;

/** Basis points for a multiplier of 1.0 */
static const int64_t MULTIPLIER_BPS_ONE = 10000;

/** Default repayment multiplier: 1.2x the funding target */
static const int64_t DEFAULT_CAP_MULTIPLIER_BPS = 12000;

/** Fixed-point scale of exchange rates (fiat per settlement unit, 8 decimals) */
static const CAmount RATE_COIN = 100000000;

/**
 * Convert a fiat funding target into a repayment cap in smallest settlement units.
 *
 *   cap = floor(target * multiplierBps / 10000 * COIN / rate)
 *
 * evaluated as a single floor over 128-bit integers, with rate given in
 * RATE_COIN fixed point.
 *
 * Example: target 1,000,000, multiplier 12000, rate 200000.00000000
 *          -> 600000000 (6.00 units)
 *
 * @return false with bad-cap-target, bad-cap-multiplier, bad-cap-rate or
 *         bad-cap-range (result zero or above MAX_MONEY)
 */
bool ComputeRepaymentCap(int64_t nFundingTarget, int64_t nCapMultiplierBps, CAmount nExchangeRate,
                         CAmount& nCapOut, CValidationState& state);

#endif // REVSPLIT_ALLOCATION_CAP_H

// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_AMOUNT_H
#define REVSPLIT_AMOUNT_H

#include <stdint.h>

/** Amount in the smallest settlement unit (can be negative) */
typedef int64_t CAmount;

/** Smallest units per whole settlement unit */
static const CAmount COIN = 100000000;

/**
 * No amount larger than this is valid.
 *
 * Keeps every (amount * 10000) product and every running total well inside
 * int64, so the 128-bit intermediates only ever guard the cap conversion.
 */
static const CAmount MAX_MONEY = 10000000000LL * COIN;

inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // REVSPLIT_AMOUNT_H

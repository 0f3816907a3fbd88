// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef REVSPLIT_UTILMONEYSTR_H
#define REVSPLIT_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/**
 * Format an amount of smallest units as a decimal string in whole settlement
 * units, keeping at least two decimals ("6.00", "0.12345678").
 */
std::string FormatMoney(const CAmount& n, bool fPlus = false);
bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

/**
 * Checked addition of two non-negative amounts.
 * @return false (and leaves result untouched) if the sum leaves [0, MAX_MONEY]
 */
bool AddNoOverflow(CAmount a, CAmount b, CAmount& result);

/**
 * floor(a * num / den) with a 128-bit intermediate.
 * Throws std::invalid_argument unless a >= 0, num >= 0 and den > 0, and
 * std::range_error if the result does not fit in a CAmount.
 */
CAmount MulDivFloor(CAmount a, int64_t num, int64_t den);

#endif // REVSPLIT_UTILMONEYSTR_H

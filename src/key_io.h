// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_KEY_IO_H
#define REVSPLIT_KEY_IO_H

#include <string>

/** Hex digits in an encoded destination, after the "0x" prefix */
static const size_t DESTINATION_HEX_LENGTH = 40;

/**
 * A destination is "0x" followed by exactly 40 hex digits, in any case.
 * Claimants, ledger admins and provisioned ledger addresses all use it.
 */
bool IsValidDestinationString(const std::string& str);

/**
 * Canonical (lower-case) form of a destination. Two destinations are the
 * same identity iff their canonical forms are equal.
 * Returns an empty string for an invalid destination.
 */
std::string NormalizeDestination(const std::string& str);

#endif // REVSPLIT_KEY_IO_H

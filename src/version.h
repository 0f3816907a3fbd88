// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_VERSION_H
#define REVSPLIT_VERSION_H

#include <string>

/**
 * client versioning
 */
static const int CLIENT_VERSION_MAJOR = 0;
static const int CLIENT_VERSION_MINOR = 3;
static const int CLIENT_VERSION_REVISION = 0;

static const int CLIENT_VERSION = 1000000 * CLIENT_VERSION_MAJOR
                                +   10000 * CLIENT_VERSION_MINOR
                                +     100 * CLIENT_VERSION_REVISION;

/** Serialization type tag for on-disk records */
static const int SER_DISK = (1 << 1);

/**
 * On-disk schema version for the ledger and round databases.
 *
 * Stored under a dedicated key in each database. A database written with a
 * different schema is refused at startup instead of being misread.
 *
 * History:
 *   1 = Initial schema (ledger snapshots, payout and deposit journals,
 *       funding rounds, deployment records)
 */
static const int DB_SCHEMA_VERSION = 1;

std::string FormatFullVersion();

#endif // REVSPLIT_VERSION_H

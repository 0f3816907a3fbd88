// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_INIT_H
#define REVSPLIT_INIT_H

#include <memory>
#include <stdint.h>
#include <string>

class CProvisioner;

//! -dbcache default (MiB), split between the ledger and round databases
static const int64_t DEFAULT_DB_CACHE = 8;

extern std::unique_ptr<CProvisioner> g_provisioner;

/** Help for options shared between UI and daemon (for -help) */
std::string HelpMessage();
/** Apply -printtoconsole, -logtimestamps and -debug to the logger */
void InitLogging();
/**
 * Open the data dir, logging and databases, then build the ledger
 * registry, the orchestrator and the funding manager.
 * @pre Parameters and the config file have been read, InitLogging() ran.
 */
bool AppInitMain(std::string& strError);
/** Release everything AppInitMain created, in reverse order */
void Shutdown();

#endif // REVSPLIT_INIT_H

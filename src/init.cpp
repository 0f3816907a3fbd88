// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "allocation/cap.h"
#include "deploy/deployment.h"
#include "deploy/orchestrator.h"
#include "deploy/provisioner.h"
#include "funding/funding.h"
#include "funding/rounddb.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerman.h"
#include "logging.h"
#include "util/system.h"
#include "version.h"

#include <algorithm>

std::unique_ptr<CProvisioner> g_provisioner;

std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", REVSPLIT_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-dbcache=<n>", strprintf("Set database cache size in megabytes (default: %d)", DEFAULT_DB_CACHE));

    strUsage += HelpMessageGroup("Deployment options:");
    strUsage += HelpMessageOpt("-provisioner=<path>", "Program that creates a ledger and prints its address");
    strUsage += HelpMessageOpt("-provisiontimeout=<n>", strprintf("Seconds to wait for the provisioner before the deployment becomes ambiguous (default: %d)", DEFAULT_PROVISION_TIMEOUT));
    strUsage += HelpMessageOpt("-capmultiplier=<n>", strprintf("Repayment cap multiplier in basis points (default: %d)", DEFAULT_CAP_MULTIPLIER_BPS));
    strUsage += HelpMessageOpt("-exchangerate=<amt>", "Fiat units per settlement unit, up to 8 decimals (required to deploy)");
    strUsage += HelpMessageOpt("-mincontribution=<n>", strprintf("Default smallest contribution of a new round in fiat units (default: %d)", DEFAULT_MIN_CONTRIBUTION));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", strprintf("Output debugging information (default: 0). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: %s.", ListLogCategories()));
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", strprintf("Send trace/debug info to console as well as to debug.log (default: %u)", DEFAULT_PRINTTOCONSOLE));

    return strUsage;
}

void InitLogging()
{
    LogInstance().m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    LogInstance().m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::none_of(categories.begin(), categories.end(),
            [](std::string cat) { return cat == "0" || cat == "none"; })) {
            for (const auto& cat : categories) {
                if (!LogInstance().EnableCategory(cat)) {
                    LogPrintf("Unsupported logging category -debug=%s.\n", cat);
                }
            }
        }
    }
}

bool AppInitMain(std::string& strError)
{
    // ********************************************************* Step 1: parameters

    DeploymentParams params;
    if (!DeploymentParams::FromArgs(gArgs, params, strError)) {
        return false;
    }

    // ********************************************************* Step 2: data directory and logging

    const fs::path& datadir = GetDataDir();
    if (datadir.empty()) {
        strError = strprintf("Specified data directory \"%s\" does not exist.", gArgs.GetArg("-datadir", ""));
        return false;
    }

    LogInstance().m_file_path = datadir / DEFAULT_DEBUGLOGFILE;
    if (!LogInstance().StartLogging()) {
        strError = strprintf("Could not open debug log file %s", LogInstance().m_file_path.string());
        return false;
    }

    LogPrintf("RevSplit version %s\n", FormatFullVersion());
    LogPrintf("Using data directory %s\n", datadir.string());

    // ********************************************************* Step 3: databases

    int64_t nTotalCache = gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE);
    if (nTotalCache < 1) nTotalCache = 1;
    const size_t nCacheSize = (size_t)(nTotalCache << 20) / 2;
    LogPrintf("Cache configuration: %.1fMiB per database\n", nCacheSize * (1.0 / 1024 / 1024));

    if (!InitLedgerDB(nCacheSize)) {
        strError = "Error opening ledger database";
        return false;
    }
    if (!InitRoundDB(nCacheSize)) {
        strError = "Error opening round database";
        return false;
    }

    // ********************************************************* Step 4: ledger registry and deployment

    CLedgerDB* pledgerdb = g_ledgerdb.get();
    g_ledgerman = std::make_unique<CLedgerManager>(pledgerdb, [pledgerdb](const std::string& address) {
        return std::unique_ptr<CTransferSink>(new CJournalTransferSink(*pledgerdb, address));
    });

    g_provisioner = std::make_unique<CProcessProvisioner>(params.provisioner, params.nTimeoutSecs, datadir / "provision");
    g_orchestrator = std::make_unique<CDeploymentOrchestrator>(*g_rounddb, *g_ledgerman, *g_provisioner);
    g_fundingman = std::make_unique<CFundingManager>(*g_rounddb, *g_orchestrator, params);
    g_orchestrator->SetResultSink(g_fundingman.get());

    // ********************************************************* Step 5: recovery

    int nRecovered = g_orchestrator->RecoverInterrupted();
    if (nRecovered > 0) {
        LogPrintf("%d interrupted deployment(s) marked ambiguous\n", nRecovered);
    }
    if (!g_ledgerman->VerifyLedgers()) {
        LogPrintf("Warning: some ledgers could not be loaded, see above\n");
    }

    return true;
}

void Shutdown()
{
    LogPrint(BCLog::DB, "Shutdown: in progress...\n");

    if (g_orchestrator) {
        g_orchestrator->SetResultSink(nullptr);
    }
    g_fundingman.reset();
    g_orchestrator.reset();
    g_provisioner.reset();
    g_ledgerman.reset();

    try {
        if (g_rounddb && !g_rounddb->Sync()) {
            LogPrintf("ERROR: Shutdown: round database sync failed\n");
        }
        if (g_ledgerdb && !g_ledgerdb->Sync()) {
            LogPrintf("ERROR: Shutdown: ledger database sync failed\n");
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: Shutdown: %s\n", e.what());
    }
    g_rounddb.reset();
    g_ledgerdb.reset();

    LogPrint(BCLog::DB, "Shutdown: done\n");
}

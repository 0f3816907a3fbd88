// Copyright (c) 2011-2018 The Bitcoin Core developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_revsplit.h"

#include "funding/rounddb.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerman.h"
#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <algorithm>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup()
{
    m_path_root = fs::temp_directory_path() / "test_revsplit" / fs::unique_path("%%%%-%%%%-%%%%-%%%%");
    fs::create_directories(m_path_root);

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-datadir", m_path_root.string());
    ClearDatadirCache();
    SetMockTime(0);

    LogInstance().m_file_path = m_path_root / DEFAULT_DEBUGLOGFILE;
    LogInstance().m_print_to_console = false;
    LogInstance().EnableCategory(BCLog::ALL);
    if (!LogInstance().StartLogging()) {
        throw std::runtime_error("Could not open debug log file");
    }
}

BasicTestingSetup::~BasicTestingSetup()
{
    LogInstance().DisconnectTestLogger();
    gArgs.ClearArgs();
    ClearDatadirCache();
    SetMockTime(0);

    boost::system::error_code ec;
    fs::remove_all(m_path_root, ec);
}

fs::path BasicTestingSetup::WriteScript(const std::string& name, const std::string& body) const
{
    const fs::path path = m_path_root / name;
    fs::ofstream file(path, std::ios::out | std::ios::trunc);
    file << "#!/bin/sh\n" << body << "\n";
    file.close();
    fs::permissions(path, fs::owner_all | fs::group_read | fs::others_read);
    return path;
}

LedgerTestingSetup::LedgerTestingSetup()
{
    if (!InitLedgerDB(1 << 20, true) || !InitRoundDB(1 << 20, true)) {
        throw std::runtime_error("Could not open the test databases");
    }

    CLedgerDB* pledgerdb = g_ledgerdb.get();
    g_ledgerman = std::make_unique<CLedgerManager>(pledgerdb, [pledgerdb](const std::string& address) {
        return std::unique_ptr<CTransferSink>(new CJournalTransferSink(*pledgerdb, address));
    });
}

LedgerTestingSetup::~LedgerTestingSetup()
{
    g_ledgerman.reset();
    g_rounddb.reset();
    g_ledgerdb.reset();
}

std::string TestAddress(uint32_t n)
{
    return strprintf("0x%040x", n);
}

bool CRecordingTransferSink::SendValue(const std::string& address, CAmount amount, std::string& strError)
{
    if (onSend) {
        onSend();
    }
    if (fThrow) {
        throw std::runtime_error("transfer backend exploded");
    }
    if (fFail) {
        strError = "transfer rejected";
        return false;
    }
    vTransfers.emplace_back(address, amount);
    return true;
}

ProvisionResult CMockProvisioner::Provision(const ProvisionRequest& request)
{
    vRequests.push_back(request);
    if (vResults.empty()) {
        return Failed("deploy-spawn-failed", "no scripted result");
    }
    const size_t nIndex = std::min(vRequests.size(), vResults.size()) - 1;
    return vResults[nIndex];
}

ProvisionResult CMockProvisioner::Succeeded(const std::string& address)
{
    ProvisionResult result;
    result.outcome = ProvisionOutcome::SUCCEEDED;
    result.address = address;
    return result;
}

ProvisionResult CMockProvisioner::Failed(const std::string& strReason, const std::string& strError)
{
    ProvisionResult result;
    result.outcome = ProvisionOutcome::FAILED;
    result.strReason = strReason;
    result.strError = strError;
    return result;
}

ProvisionResult CMockProvisioner::Ambiguous(const std::string& strReason, const std::string& strError)
{
    ProvisionResult result;
    result.outcome = ProvisionOutcome::AMBIGUOUS;
    result.strReason = strReason;
    result.strError = strError;
    return result;
}

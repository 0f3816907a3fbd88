// Copyright (c) 2015-2018 The Bitcoin Core developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_TEST_TEST_REVSPLIT_H
#define REVSPLIT_TEST_TEST_REVSPLIT_H

#include "amount.h"
#include "deploy/provisioner.h"
#include "fs.h"
#include "ledger/ledger.h"

#include <functional>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

/** Basic testing setup.
 * This just configures logging, a fresh data directory and empty arguments.
 */
struct BasicTestingSetup {
    fs::path m_path_root;

    BasicTestingSetup();
    ~BasicTestingSetup();

    /** Write an executable /bin/sh script into the data dir */
    fs::path WriteScript(const std::string& name, const std::string& body) const;
};

/** Testing setup with the ledger and round databases (wiped) and g_ledgerman.
 * Payouts go to the ledger DB journal like in the CLI.
 */
struct LedgerTestingSetup : public BasicTestingSetup {
    LedgerTestingSetup();
    ~LedgerTestingSetup();
};

/** Deterministic, distinct destination for index n */
std::string TestAddress(uint32_t n);

/** Transfer sink that records transfers and can be told to fail or call back */
class CRecordingTransferSink : public CTransferSink
{
public:
    std::vector<std::pair<std::string, CAmount>> vTransfers;
    bool fFail = false;
    bool fThrow = false;
    std::function<void()> onSend;

    bool SendValue(const std::string& address, CAmount amount, std::string& strError) override;
};

/** Provisioner that replays scripted results in order (the last one repeats) */
class CMockProvisioner : public CProvisioner
{
public:
    std::vector<ProvisionResult> vResults;
    std::vector<ProvisionRequest> vRequests;

    ProvisionResult Provision(const ProvisionRequest& request) override;

    static ProvisionResult Succeeded(const std::string& address);
    static ProvisionResult Failed(const std::string& strReason, const std::string& strError);
    static ProvisionResult Ambiguous(const std::string& strReason, const std::string& strError);
};

#endif // REVSPLIT_TEST_TEST_REVSPLIT_H

// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_DEPLOY_PROVISIONER_H
#define REVSPLIT_DEPLOY_PROVISIONER_H

#include "allocation/shares.h"
#include "amount.h"
#include "fs.h"

#include <stdint.h>
#include <string>
#include <vector>

/** Three-state outcome of one provisioning run. Never collapse AMBIGUOUS into FAILED. */
enum class ProvisionOutcome {
    SUCCEEDED,      //!< exactly one valid address observed
    FAILED,         //!< nothing was created (not started, or nonzero exit)
    AMBIGUOUS,      //!< something may have been created, address unknown
};

std::string ProvisionOutcomeToString(ProvisionOutcome outcome);

struct ProvisionRequest
{
    std::string owner;
    ShareTable shareTable;
    CAmount repaymentCap = 0;
};

struct ProvisionResult
{
    ProvisionOutcome outcome = ProvisionOutcome::FAILED;
    std::string address;         //!< canonical form, set on SUCCEEDED
    std::string strReason;       //!< reject reason (deploy-*) unless SUCCEEDED
    std::string strError;        //!< captured diagnostics
};

/** Creates a ledger somewhere and reports its address */
class CProvisioner
{
public:
    virtual ~CProvisioner() {}
    virtual ProvisionResult Provision(const ProvisionRequest& request) = 0;
};

/**
 * Runs the external provisioning program:
 *
 *   <exe> --owner <addr> --payees <a1,a2,...> --shares <s1,s2,...> --cap <decimal>
 *
 * stdout and stderr go to files under the work directory. A run that is still
 * going after the timeout is detached, never killed.
 */
class CProcessProvisioner : public CProvisioner
{
private:
    fs::path exe;
    int64_t nTimeoutSecs;
    fs::path workDir;

public:
    CProcessProvisioner(const fs::path& exeIn, int64_t nTimeoutSecsIn, const fs::path& workDirIn);

    ProvisionResult Provision(const ProvisionRequest& request) override;
};

/** Command-line arguments for a request (without the program name) */
std::vector<std::string> BuildProvisionArgs(const ProvisionRequest& request);

/**
 * Extract the address from provisioner stdout.
 *
 * Accepts exactly one line (an optional trailing newline, surrounding
 * whitespace ignored) holding a valid destination.
 */
bool ParseProvisionOutput(const std::string& strOutput, std::string& addressOut, std::string& strError);

#endif // REVSPLIT_DEPLOY_PROVISIONER_H

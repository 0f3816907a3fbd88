// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_DEPLOY_DEPLOYMENT_H
#define REVSPLIT_DEPLOY_DEPLOYMENT_H

/**
 * Deployment records
 *
 * Status transitions (only the orchestrator writes them):
 *
 *   (none)  -> PENDING     intent persisted before the provisioner runs
 *   PENDING -> DEPLOYED    one valid address observed and registered
 *   PENDING -> FAILED      process not started or exited nonzero (retryable)
 *   PENDING -> AMBIGUOUS   timeout, unusable output, interrupted run
 *   FAILED  -> PENDING     RetryDeployment
 *   AMBIGUOUS -> DEPLOYED | FAILED   manual ReconcileDeployment
 *
 * DEPLOYED is terminal.
 */

#include "allocation/shares.h"
#include "amount.h"
#include "fs.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

class ArgsManager;

enum class DeploymentStatus : uint8_t {
    PENDING = 0,
    DEPLOYED = 1,
    FAILED = 2,
    AMBIGUOUS = 3,
};

std::string DeploymentStatusToString(DeploymentStatus status);

struct DeploymentRecord
{
    std::string roundId;
    std::string owner;               // becomes the ledger admin
    ShareTable shareTable;
    CAmount repaymentCap;
    std::string ledgerAddress;       // empty until DEPLOYED
    DeploymentStatus status;
    uint32_t nAttempts;
    std::string strLastError;
    int64_t nCreateTime;
    int64_t nUpdateTime;

    DeploymentRecord() { SetNull(); }

    void SetNull()
    {
        roundId.clear();
        owner.clear();
        shareTable.clear();
        repaymentCap = 0;
        ledgerAddress.clear();
        status = DeploymentStatus::PENDING;
        nAttempts = 0;
        strLastError.clear();
        nCreateTime = 0;
        nUpdateTime = 0;
    }

    bool IsNull() const { return roundId.empty(); }

    SERIALIZE_METHODS(DeploymentRecord, obj)
    {
        READWRITE(obj.roundId);
        READWRITE(obj.owner);
        READWRITE(obj.shareTable);
        READWRITE(obj.repaymentCap);
        READWRITE(obj.ledgerAddress);
        READWRITE(WrapEnum(obj.status));
        READWRITE(obj.nAttempts);
        READWRITE(obj.strLastError);
        READWRITE(obj.nCreateTime);
        READWRITE(obj.nUpdateTime);
    }
};

static const int64_t DEFAULT_PROVISION_TIMEOUT = 60;
static const int64_t DEFAULT_MIN_CONTRIBUTION = 1000;

/**
 * Typed deployment configuration, read once at startup.
 */
struct DeploymentParams
{
    fs::path provisioner;                //!< -provisioner
    int64_t nTimeoutSecs;                //!< -provisiontimeout
    int64_t nCapMultiplierBps;           //!< -capmultiplier
    CAmount nExchangeRate;               //!< -exchangerate, RATE_COIN fixed point
    int64_t nMinContribution;            //!< -mincontribution

    DeploymentParams();

    /**
     * Parse and validate the options.
     * -exchangerate has no default: without it FromArgs succeeds but
     * leaves nExchangeRate at 0 and cap computation reports bad-cap-rate.
     */
    static bool FromArgs(const ArgsManager& args, DeploymentParams& paramsOut, std::string& strError);
};

#endif // REVSPLIT_DEPLOY_DEPLOYMENT_H

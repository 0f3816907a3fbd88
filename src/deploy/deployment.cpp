// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "deploy/deployment.h"

#include "allocation/cap.h"
#include "logging.h"
#include "util/system.h"
#include "utilmoneystr.h"

std::string DeploymentStatusToString(DeploymentStatus status)
{
    switch (status) {
    case DeploymentStatus::PENDING:   return "pending";
    case DeploymentStatus::DEPLOYED:  return "deployed";
    case DeploymentStatus::FAILED:    return "failed";
    case DeploymentStatus::AMBIGUOUS: return "ambiguous";
    }
    return "unknown";
}

DeploymentParams::DeploymentParams()
    : nTimeoutSecs(DEFAULT_PROVISION_TIMEOUT),
      nCapMultiplierBps(DEFAULT_CAP_MULTIPLIER_BPS),
      nExchangeRate(0),
      nMinContribution(DEFAULT_MIN_CONTRIBUTION)
{
}

bool DeploymentParams::FromArgs(const ArgsManager& args, DeploymentParams& paramsOut, std::string& strError)
{
    DeploymentParams params;

    params.provisioner = fs::path(args.GetArg("-provisioner", ""));

    params.nTimeoutSecs = args.GetArg("-provisiontimeout", DEFAULT_PROVISION_TIMEOUT);
    if (params.nTimeoutSecs <= 0) {
        strError = strprintf("Invalid -provisiontimeout=%s (must be a positive number of seconds)",
                             args.GetArg("-provisiontimeout", ""));
        return false;
    }

    params.nCapMultiplierBps = args.GetArg("-capmultiplier", DEFAULT_CAP_MULTIPLIER_BPS);
    if (params.nCapMultiplierBps <= 0) {
        strError = strprintf("Invalid -capmultiplier=%s (basis points, e.g. 12000 for 1.2x)",
                             args.GetArg("-capmultiplier", ""));
        return false;
    }

    if (args.IsArgSet("-exchangerate")) {
        const std::string strRate = args.GetArg("-exchangerate", "");
        if (!ParseMoney(strRate, params.nExchangeRate) || params.nExchangeRate <= 0) {
            strError = strprintf("Invalid -exchangerate=%s (fiat per settlement unit, up to 8 decimals)", strRate);
            return false;
        }
    }

    params.nMinContribution = args.GetArg("-mincontribution", DEFAULT_MIN_CONTRIBUTION);
    if (params.nMinContribution <= 0) {
        strError = strprintf("Invalid -mincontribution=%s", args.GetArg("-mincontribution", ""));
        return false;
    }

    LogPrint(BCLog::DEPLOY, "DeploymentParams: provisioner=%s timeout=%ds multiplier=%d rate=%s mincontribution=%d\n",
             params.provisioner.string(), params.nTimeoutSecs, params.nCapMultiplierBps,
             FormatMoney(params.nExchangeRate), params.nMinContribution);

    paramsOut = params;
    return true;
}

// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "deploy/provisioner.h"

#include "key_io.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <atomic>
#include <chrono>
#include <iterator>
#include <system_error>

#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>

namespace bp = boost::process;

//! Most bytes of provisioner stdout/stderr kept
static const size_t MAX_PROVISION_OUTPUT = 64 * 1024;

static std::atomic<uint32_t> nProvisionSeq{0};

std::string ProvisionOutcomeToString(ProvisionOutcome outcome)
{
    switch (outcome) {
    case ProvisionOutcome::SUCCEEDED: return "succeeded";
    case ProvisionOutcome::FAILED:    return "failed";
    case ProvisionOutcome::AMBIGUOUS: return "ambiguous";
    }
    return "unknown";
}

std::vector<std::string> BuildProvisionArgs(const ProvisionRequest& request)
{
    std::vector<std::string> vPayees;
    std::vector<std::string> vShares;
    for (const ShareEntry& entry : request.shareTable) {
        vPayees.push_back(entry.claimant);
        vShares.push_back(strprintf("%d", entry.nShares));
    }

    return {
        "--owner", request.owner,
        "--payees", Join(vPayees, ","),
        "--shares", Join(vShares, ","),
        "--cap", FormatMoney(request.repaymentCap),
    };
}

bool ParseProvisionOutput(const std::string& strOutput, std::string& addressOut, std::string& strError)
{
    std::string str = strOutput;
    if (!str.empty() && str.back() == '\n') {
        str.pop_back();
    }
    if (str.find('\n') != std::string::npos) {
        strError = strprintf("expected one line of output, got %u", SplitString(str, '\n').size());
        return false;
    }

    const std::string line = TrimString(str);
    if (line.empty()) {
        strError = "provisioner printed no address";
        return false;
    }
    if (!IsValidDestinationString(line)) {
        strError = strprintf("malformed address '%s'", SanitizeString(line));
        return false;
    }

    addressOut = NormalizeDestination(line);
    return true;
}

namespace {

std::string ReadCapturedOutput(const fs::path& path)
{
    fs::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.good()) {
        return std::string();
    }
    std::string str;
    std::istreambuf_iterator<char> it(file), end;
    while (it != end && str.size() < MAX_PROVISION_OUTPUT) {
        str.push_back(*it++);
    }
    return str;
}

void RemoveCapturedOutput(const fs::path& path)
{
    boost::system::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LogPrint(BCLog::DEPLOY, "CProcessProvisioner: could not remove %s: %s\n", path.string(), ec.message());
    }
}

ProvisionResult MakeResult(ProvisionOutcome outcome, const std::string& strReason, const std::string& strError)
{
    ProvisionResult result;
    result.outcome = outcome;
    result.strReason = strReason;
    result.strError = strError;
    return result;
}

} // anonymous namespace

CProcessProvisioner::CProcessProvisioner(const fs::path& exeIn, int64_t nTimeoutSecsIn, const fs::path& workDirIn)
    : exe(exeIn), nTimeoutSecs(nTimeoutSecsIn), workDir(workDirIn)
{
}

ProvisionResult CProcessProvisioner::Provision(const ProvisionRequest& request)
{
    if (exe.empty()) {
        return MakeResult(ProvisionOutcome::FAILED, "deploy-spawn-failed", "no -provisioner configured");
    }

    boost::system::error_code fsec;
    fs::create_directories(workDir, fsec);
    if (fsec) {
        return MakeResult(ProvisionOutcome::FAILED, "deploy-spawn-failed",
                          strprintf("cannot create %s: %s", workDir.string(), fsec.message()));
    }

    const std::string strTag = strprintf("provision-%d-%u", GetTimeMicros(), ++nProvisionSeq);
    const fs::path outPath = workDir / (strTag + ".out");
    const fs::path errPath = workDir / (strTag + ".err");
    const std::vector<std::string> args = BuildProvisionArgs(request);

    LogPrint(BCLog::DEPLOY, "CProcessProvisioner: running %s %s\n", exe.string(), Join(args, " "));

    std::error_code ec;
    bp::child child(bp::exe = exe.string(), bp::args = args,
                    bp::std_out > outPath, bp::std_err > errPath, bp::std_in < bp::null, ec);
    if (ec) {
        RemoveCapturedOutput(outPath);
        RemoveCapturedOutput(errPath);
        return MakeResult(ProvisionOutcome::FAILED, "deploy-spawn-failed",
                          strprintf("cannot start %s: %s", exe.string(), ec.message()));
    }

    if (!child.wait_for(std::chrono::seconds(nTimeoutSecs), ec)) {
        // Let it finish on its own; whatever it creates is reconciled by hand
        child.detach();
        std::string strError = ec ? strprintf("wait failed: %s", ec.message())
                                  : strprintf("no result after %ds", nTimeoutSecs);
        LogPrintf("CProcessProvisioner: %s, process detached, output in %s\n", strError, outPath.string());
        return MakeResult(ProvisionOutcome::AMBIGUOUS, "deploy-timeout",
                          strprintf("%s (stdout: %s)", strError, outPath.string()));
    }

    const int nExitCode = child.exit_code();
    const std::string strStdout = ReadCapturedOutput(outPath);
    const std::string strStderr = TrimString(ReadCapturedOutput(errPath));

    if (nExitCode != 0) {
        RemoveCapturedOutput(outPath);
        RemoveCapturedOutput(errPath);
        return MakeResult(ProvisionOutcome::FAILED, "deploy-process-failed",
                          strprintf("exit code %d%s", nExitCode, strStderr.empty() ? "" : ": " + strStderr));
    }

    std::string address;
    std::string strParseError;
    if (!ParseProvisionOutput(strStdout, address, strParseError)) {
        // Exit status says it worked: keep the captured output for reconciliation
        return MakeResult(ProvisionOutcome::AMBIGUOUS, "deploy-bad-output",
                          strprintf("%s (stdout: %s)", strParseError, outPath.string()));
    }

    RemoveCapturedOutput(outPath);
    RemoveCapturedOutput(errPath);

    ProvisionResult result;
    result.outcome = ProvisionOutcome::SUCCEEDED;
    result.address = address;
    result.strError = strStderr;
    LogPrint(BCLog::DEPLOY, "CProcessProvisioner: provisioned %s\n", address);
    return result;
}

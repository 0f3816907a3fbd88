// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"
#include "logging.h"
#include "rpc/client.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "version.h"

#include <stdio.h>
#include <stdlib.h>

#include <univalue.h>

static const int CONTINUE_EXECUTION = -1;

static std::string CLIHelpMessage()
{
    std::string strUsage = "RevSplit CLI version " + FormatFullVersion() + "\n\n" +
        "Usage:\n" +
        "  revsplit-cli [options] <command> [params]  Run a RevSplit command\n" +
        "  revsplit-cli [options] help                List commands\n" +
        "  revsplit-cli [options] help <command>      Get help for a command\n" +
        "\n";
    return strUsage + HelpMessage();
}

//
// Exception thrown when the command line does not name a command.
//
class CommandLineError : public std::runtime_error
{
public:
    explicit CommandLineError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

//
// This function returns either one of EXIT_ codes when it's expected to stop the process or
// CONTINUE_EXECUTION when it's expected to continue further.
//
static int AppInitCLI(int argc, char* argv[])
{
    //
    // Parameters
    //
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", CLIHelpMessage().c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (!gArgs.ReadConfigFiles(error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    InitLogging();
    return CONTINUE_EXECUTION;
}

static int CommandLineRPC()
{
    std::string strPrint;
    int nRet = 0;
    try {
        std::vector<std::string> args = gArgs.GetPositionalArgs();
        if (args.size() < 1)
            throw CommandLineError("too few parameters (need at least command)");

        std::string strError;
        if (!AppInitMain(strError))
            throw std::runtime_error(strError);

        RegisterAllCoreRPCCommands(tableRPC);

        JSONRPCRequest request;
        request.id = 1;
        request.strMethod = args[0];
        request.params = RPCConvertValues(request.strMethod, std::vector<std::string>(args.begin() + 1, args.end()));

        try {
            const UniValue result = tableRPC.execute(request);
            // Result
            if (result.isNull())
                strPrint = "";
            else if (result.isStr())
                strPrint = result.get_str();
            else
                strPrint = result.write(2);
        } catch (const UniValue& objError) {
            // Error
            const UniValue& code = find_value(objError, "code");
            const UniValue& message = find_value(objError, "message");
            int nCode = code.isNum() ? code.get_int() : RPC_MISC_ERROR;
            strPrint = "error code: " + std::to_string(nCode) + "\n";
            if (message.isStr())
                strPrint += "error message:\n" + message.get_str();
            nRet = EXIT_FAILURE;
            LogPrint(BCLog::RPC, "%s failed: %s\n", request.strMethod, SanitizeString(objError.write()));
        }
    } catch (const CommandLineError& e) {
        strPrint = std::string("error: ") + e.what();
        nRet = EXIT_FAILURE;
    } catch (const std::exception& e) {
        strPrint = std::string("error: ") + e.what();
        nRet = EXIT_FAILURE;
    }

    Shutdown();

    if (strPrint != "") {
        fprintf((nRet == 0 ? stdout : stderr), "%s\n", strPrint.c_str());
    }
    return nRet == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitCLI(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppInitCLI()");
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    try {
        ret = CommandLineRPC();
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "CommandLineRPC()");
    }
    return ret;
}

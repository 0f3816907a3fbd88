// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_RPC_SERVER_H
#define REVSPLIT_RPC_SERVER_H

#include "amount.h"
#include "rpc/protocol.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

class CValidationState;

class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false) {}
};

typedef UniValue(*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * RevSplit RPC command dispatcher.
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name) const;

    /**
     * Execute a method.
     * @param request The request to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /**
     * Returns a list of registered commands
     * @returns List of registered commands.
     */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Commands cannot be overwritten (returns false).
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

/**
 * Utilities: convert RPC arguments and domain results.
 */
extern CAmount AmountFromValue(const UniValue& value);
extern int64_t FiatAmountFromValue(const UniValue& value, const std::string& strName);
extern std::string AddressFromValue(const UniValue& value, const std::string& strName);

/** Turn a failed CValidationState into a JSON-RPC error object (to be thrown) */
extern UniValue JSONRPCErrorFromState(const CValidationState& state);
extern int RPCErrorCodeFromState(const CValidationState& state);

extern std::string HelpExampleCli(const std::string& methodname, const std::string& args);

#endif // REVSPLIT_RPC_SERVER_H

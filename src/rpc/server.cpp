// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "key_io.h"
#include "logging.h"
#include "util/validation.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

CRPCTable tableRPC;

UniValue JSONRPCError(int code, const std::string& message)
{
    UniValue error(UniValue::VOBJ);
    error.pushKV("code", code);
    error.pushKV("message", message);
    return error;
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    CAmount amount;
    if (!ParseMoney(value.getValStr(), amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
    if (!MoneyRange(amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount out of range");
    return amount;
}

int64_t FiatAmountFromValue(const UniValue& value, const std::string& strName)
{
    int64_t n = 0;
    if (value.isNum()) {
        n = value.get_int64();
    } else if (!value.isStr() || !ParseInt64(value.get_str(), &n)) {
        throw JSONRPCError(RPC_TYPE_ERROR, strprintf("%s must be a whole number", strName));
    }
    if (n <= 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("%s must be positive", strName));
    return n;
}

std::string AddressFromValue(const UniValue& value, const std::string& strName)
{
    if (!value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, strprintf("%s must be a string", strName));
    const std::string address = NormalizeDestination(value.get_str());
    if (address.empty())
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, strprintf("Invalid %s: %s", strName, SanitizeString(value.get_str())));
    return address;
}

int RPCErrorCodeFromState(const CValidationState& state)
{
    if (state.IsError()) {
        return state.GetRejectReason().compare(0, 17, "ledger-invariant-") == 0 ? RPC_LEDGER_INVARIANT : RPC_DATABASE_ERROR;
    }
    switch (state.GetRejectCode()) {
    case REJECT_INVALID:
    case REJECT_DEGENERATE:
        return RPC_INVALID_PARAMETER;
    case REJECT_DUPLICATE:
        return RPC_ALREADY_EXISTS;
    case REJECT_DEPLOY_FAILED:
        return RPC_DEPLOY_FAILED;
    case REJECT_AMBIGUOUS:
        return RPC_DEPLOY_AMBIGUOUS;
    case REJECT_NOTHING_DUE:
        return RPC_LEDGER_NOTHING_DUE;
    case REJECT_UNAUTHORIZED:
        return RPC_LEDGER_UNAUTHORIZED;
    case REJECT_PAUSED:
        return RPC_LEDGER_PAUSED;
    case REJECT_NOTFOUND:
        return RPC_INVALID_ADDRESS_OR_KEY;
    }
    return RPC_MISC_ERROR;
}

UniValue JSONRPCErrorFromState(const CValidationState& state)
{
    return JSONRPCError(RPCErrorCodeFromState(state), FormatStateMessage(state));
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> revsplit-cli " + methodname + " " + args + "\n";
}

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (const auto& entry : mapCommands)
        vCommands.push_back(std::make_pair(entry.second->category + entry.first, entry.second));
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq;
    jreq.fHelp = true;
    jreq.params = UniValue(UniValue::VARR);

    for (const std::pair<std::string, const CRPCCommand*>& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if ((strCommand != "" || pcmd->category == "hidden") && strMethod != strCommand)
            continue;
        jreq.strMethod = strMethod;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

static UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand);
}

// clang-format off
static const CRPCCommand vRPCCommands[] =
{ //  category              name                      actor (function)         okSafe argNames
  //  --------------------- ------------------------  -----------------------  ------ ----------
    { "control",            "help",                   &help,                   true,  {"command"}  },
};
// clang-format on

CRPCTable::CRPCTable()
{
    for (const auto& c : vRPCCommands) {
        mapCommands[c.name] = &c;
    }
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = (*this)[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    LogPrint(BCLog::RPC, "RPC method=%s\n", SanitizeString(request.strMethod));

    try {
        // Execute
        return pcmd->actor(request);
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& i : mapCommands) commandList.emplace_back(i.first);
    return commandList;
}

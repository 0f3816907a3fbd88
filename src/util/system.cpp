// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "utilstrencodings.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <typeinfo>

const char * const REVSPLIT_CONF_FILENAME = "revsplit.conf";

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(1, 2) == "no") {
        bool bool_val = InterpretBool(val);
        if (!bool_val) {
            // Double negatives like -nofoo=0 are supported (but discouraged)
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
        }
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

ArgsManager::ArgsManager() = default;

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();
    m_positional_args.clear();

    int i = 1;
    for (; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        if (key.empty() || !IsSwitchChar(key[0]))
            break;

        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    for (; i < argc; i++) {
        m_positional_args.push_back(argv[i]);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos = str.find('#');
        if (pos != std::string::npos) {
            str = str.substr(0, pos);
        }
        str = TrimString(str);
        if (!str.empty()) {
            std::string key = str;
            std::string value;
            size_t is_index = str.find('=');
            if (is_index != std::string::npos) {
                key = TrimString(str.substr(0, is_index));
                value = TrimString(str.substr(is_index + 1));
            }
            if (key.empty() || IsSwitchChar(key[0])) {
                error = strprintf("parse error on line %i: %s, options in configuration file must be specified without leading -", linenr, str);
                return false;
            }
            key = "-" + key;
            InterpretNegatedOption(key, value);
            m_config_args[key].push_back(value);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFiles(std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    const std::string confPath = GetArg("-conf", REVSPLIT_CONF_FILENAME);
    fs::ifstream stream(GetConfigFile(confPath));

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, error)) {
            return false;
        }
    } else if (IsArgSet("-conf")) {
        error = strprintf("specified config file \"%s\" could not be opened.", confPath);
        return false;
    }

    // If datadir is changed in .conf file:
    ClearDatadirCache();
    if (!fs::is_directory(GetDataDir())) {
        error = strprintf("specified data directory \"%s\" does not exist.", GetArg("-datadir", ""));
        return false;
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) return it->second;
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) return it->second;
    return {};
}

std::vector<std::string> ArgsManager::GetPositionalArgs() const
{
    LOCK(cs_args);
    return m_positional_args;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_override_args.count(strArg) || m_config_args.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return strDefault;
    return values.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return nDefault;
    return atoi64(values.back());
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return fDefault;
    return InterpretBool(values.back());
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
    m_positional_args.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    std::string ret = std::string(optIndent, ' ') + std::string(option) + std::string("\n");
    // Wrap the description at word boundaries
    std::string line(msgIndent, ' ');
    for (const std::string& word : SplitString(message, ' ')) {
        if (line.size() + word.size() + 1 > (size_t)screenWidth && line.size() > (size_t)msgIndent) {
            ret += line + "\n";
            line = std::string(msgIndent, ' ');
        }
        if (line.size() > (size_t)msgIndent) line += " ";
        line += word;
    }
    ret += line + "\n\n";
    return ret;
}

static std::string FormatException(const std::exception* pex, const char* pszThread)
{
    const char* pszModule = "revsplit";
    if (pex)
        return strprintf(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), pszModule, pszThread);
    else
        return strprintf(
            "UNKNOWN EXCEPTION       \n%s in %s       \n", pszModule, pszThread);
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.revsplit
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".revsplit";
}

static fs::path pathCached;
static RecursiveMutex csPathCached;

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    fs::path& path = pathCached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::absolute(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
        fs::create_directories(path);
    }

    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

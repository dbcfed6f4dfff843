// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "utilstrencodings.h"

#include <istream>
#include <stdlib.h>
#include <string.h>

#include <boost/algorithm/string/trim.hpp>

const char * const ZKLEND_CONF_FILENAME = "zklend.conf";

ArgsManager gArgs;

bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // stop at the first non-option, which is the command for the cli
        if (key[0] != '-')
            break;

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = "invalid parameter " + std::string(argv[i]);
            return false;
        }

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) return it->second;
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return m_override_args.count(strArg) || m_config_args.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return strDefault;
    // Last value wins, matching command-line override order
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
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        boost::algorithm::trim(str);
        if (!str.empty()) {
            if ((pos = str.find('=')) == std::string::npos) {
                error = "parse error on line " + std::to_string(linenr) + ": " + str;
                return false;
            }
            std::string key = "-" + boost::algorithm::trim_copy(str.substr(0, pos));
            std::string value = boost::algorithm::trim_copy(str.substr(pos + 1));
            InterpretNegatedOption(key, value);
            m_config_args[key].push_back(value);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& conf_path, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        m_config_args.clear();
    }

    fs::ifstream stream(GetConfigFile(conf_path));

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, error)) {
            return false;
        }
    }

    // If datadir is changed in .conf file:
    ClearDatadirCache();
    if (!fs::is_directory(GetDataDir())) {
        error = "specified data directory \"" + gArgs.GetArg("-datadir", "") + "\" does not exist.";
        return false;
    }
    return true;
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.zklend
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".zklend";
}

static fs::path pathCached;
static std::mutex csPathCached;

const fs::path& GetDataDir()
{
    std::lock_guard<std::mutex> lock(csPathCached);

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
    }

    if (!TryCreateDirectories(path) && !fs::is_directory(path)) {
        path = "";
    }

    return path;
}

void ClearDatadirCache()
{
    std::lock_guard<std::mutex> lock(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

/**
 * Ignores exceptions thrown by Boost's create_directories if the requested directory exists.
 * Specifically handles case where path p exists, but it wasn't possible for the user to
 * write to the parent directory.
 */
bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    return std::string(optIndent, ' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent, ' ') +
           FormatParagraph(message, screenWidth - msgIndent, msgIndent) +
           std::string("\n\n");
}

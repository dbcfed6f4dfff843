// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory resolution.
 */
#ifndef ZKLEND_UTIL_SYSTEM_H
#define ZKLEND_UTIL_SYSTEM_H

#include "fs.h"

#include <map>
#include <mutex>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const ZKLEND_CONF_FILENAME;

const fs::path& GetDataDir();
fs::path GetDefaultDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);
bool TryCreateDirectories(const fs::path& p);

class ArgsManager
{
protected:
    mutable std::mutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    bool ReadConfigStream(std::istream& stream, std::string& error);

public:
    /**
     * Parse "-name=value" arguments. Returns false and fills error if a
     * non-option argument precedes the options.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /** Read zklend.conf (or -conf) from the data directory. A missing file is not an error. */
    bool ReadConfigFile(const std::string& conf_path, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /**
     * Set a boolean argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param fValue Value (e.g. false)
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Drop every parsed value. Used between test cases. */
    void ClearArgs();
};

extern ArgsManager gArgs;

/** Interpret a string argument as a boolean ("", "1", "0"; "-nofoo" handled by the parser). */
bool InterpretBool(const std::string& strValue);

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "Lending options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-lendingdbcache=<n>")
 * @param message Option description (e.g. "Cache size in MiB")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

#endif // ZKLEND_UTIL_SYSTEM_H

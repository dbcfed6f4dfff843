// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/init.h"

#include "lending/lendingdb.h"
#include "logging.h"
#include "util/system.h"
#include "version.h"

#include <algorithm>

// Hard bounds on -lendingdbcache, MiB
static const int64_t MIN_LENDINGDB_CACHE = 1;
static const int64_t MAX_LENDINGDB_CACHE = 1024;

std::string GetLendingHelpString(bool showDebug)
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", ZKLEND_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");

    strUsage += HelpMessageGroup("Lending options:");
    strUsage += HelpMessageOpt("-lendingdbcache=<n>", strprintf("Set lending database cache size in megabytes (%d to %d, default: %d)",
                                                                MIN_LENDINGDB_CACHE, MAX_LENDINGDB_CACHE, DEFAULT_LENDINGDB_CACHE));
    strUsage += HelpMessageOpt("-reindexlending", strprintf("Wipe the lending ledger at startup (default: %u)", DEFAULT_REINDEXLENDING));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
                                                    "If <category> is not supplied or if <category> = 1, output all debugging information. "
                                                    "<category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debugexclude=<category>", "Exclude debugging information for a category. Can be used in conjunction with -debug=1 to output debug logs for all categories except one or more specified categories.");
    strUsage += HelpMessageOpt("-printtoconsole", strprintf("Send trace/debug info to console instead of debug.log file (default: %u)", DEFAULT_PRINTTOCONSOLE));
    if (showDebug) {
        strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
        strUsage += HelpMessageOpt("-nodebuglogfile", "Do not write debug.log");
    }
    return strUsage;
}

bool InitLogging(std::string& strError)
{
    BCLog::Logger& logger = LogInstance();

    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    logger.m_print_to_file = gArgs.GetBoolArg("-debuglogfile", true);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        // "-debug=0" or "-debug=none" among the values turns everything off.
        // A bare "-debug" enables all categories.
        if (std::none_of(categories.begin(), categories.end(),
                         [](const std::string& cat) { return cat == "0" || cat == "none"; })) {
            for (const std::string& cat : categories) {
                if (!logger.EnableCategory(cat.empty() ? "all" : cat)) {
                    LogPrintf("Unsupported logging category %s=%s.\n", "-debug", cat);
                }
            }
        }
    }

    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        if (!logger.DisableCategory(cat)) {
            LogPrintf("Unsupported logging category %s=%s.\n", "-debugexclude", cat);
        }
    }

    if (logger.m_print_to_file) {
        if (GetDataDir().empty()) {
            strError = strprintf("Specified data directory \"%s\" does not exist.", gArgs.GetArg("-datadir", ""));
            return false;
        }
        logger.m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;
        logger.ShrinkDebugFile();
        if (!logger.OpenDebugLog()) {
            strError = strprintf("Could not open debug log file %s", logger.m_file_path.string());
            return false;
        }
    }

    LogPrintf("ZKLend version v%d.%d.%d\n", CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION);
    LogPrintf("Using data directory %s\n", GetDataDir().string());
    return true;
}

bool InitLending(std::string& strError)
{
    int64_t nCacheMiB = gArgs.GetArg("-lendingdbcache", DEFAULT_LENDINGDB_CACHE);
    nCacheMiB = std::max(nCacheMiB, MIN_LENDINGDB_CACHE);
    nCacheMiB = std::min(nCacheMiB, MAX_LENDINGDB_CACHE);
    const bool fReindex = gArgs.GetBoolArg("-reindexlending", DEFAULT_REINDEXLENDING);

    if (fReindex) {
        LogPrintf("Lending: -reindexlending set, wiping the lending ledger\n");
    }
    LogPrintf("Lending: * Using %d MiB for the lending database\n", nCacheMiB);

    if (!InitLendingDB((size_t)nCacheMiB << 20, false, fReindex)) {
        strError = "Error opening lending database";
        return false;
    }
    if (g_lendingdb->IsEmpty()) {
        LogPrintf("Lending: ledger is empty\n");
    }
    return true;
}

void ShutdownLending()
{
    if (!g_lendingdb) return;
    try {
        g_lendingdb->Sync();
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: ShutdownLending: sync failed: %s\n", e.what());
    }
    g_lendingdb.reset();
    LogPrint(BCLog::LENDINGDB, "Lending: database closed\n");
}

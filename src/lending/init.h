// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_INIT_H
#define ZKLEND_LENDING_INIT_H

#include <string>

static const bool DEFAULT_REINDEXLENDING = false;

/** Help text for the logging and lending options. */
std::string GetLendingHelpString(bool showDebug);

/**
 * Configure LogInstance() from gArgs (-debug, -printtoconsole,
 * -logtimestamps) and open debug.log in the data directory.
 */
bool InitLogging(std::string& strError);

/** Open g_lendingdb using -lendingdbcache and -reindexlending. */
bool InitLending(std::string& strError);

/** Flush and close g_lendingdb. Safe to call twice. */
void ShutdownLending();

#endif // ZKLEND_LENDING_INIT_H

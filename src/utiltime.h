// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_UTILTIME_H
#define ZKLEND_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, or the mock time if set
 * through SetMockTime(). Every time-dependent lending rule reads it.
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetMockTime();

/** For testing. Set e.g. with the -mocktime option. 0 disables mocking. */
void SetMockTime(int64_t nMockTimeIn);

/** ISO 8601 formatting (UTC), e.g. 2025-01-03T12:00:00Z */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // ZKLEND_UTILTIME_H

// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_VERSION_H
#define ZKLEND_VERSION_H

/**
 * client and record store versioning
 */

static const int CLIENT_VERSION_MAJOR = 0;
static const int CLIENT_VERSION_MINOR = 3;
static const int CLIENT_VERSION_REVISION = 0;

//! Version tag written with every serialized record batch
static const int CLIENT_VERSION = 1000000 * CLIENT_VERSION_MAJOR
                                + 10000 * CLIENT_VERSION_MINOR
                                + 100 * CLIENT_VERSION_REVISION;

/**
 * Lending transaction envelope versions
 *
 * History:
 *   1 = Initial envelope (declared record set + flat parameter block)
 */
static const int LENDTX_VERSION = 1;

//! oldest envelope version still accepted by the processor
static const int MIN_LENDTX_VERSION = 1;

#endif // ZKLEND_VERSION_H

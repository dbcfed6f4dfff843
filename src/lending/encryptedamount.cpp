// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/encryptedamount.h"

#include "streams.h"
#include "utilstrencodings.h"
#include "version.h"

std::string EncryptedAmount::GetHex() const
{
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << *this;
    return HexStr(ss.begin(), ss.end());
}

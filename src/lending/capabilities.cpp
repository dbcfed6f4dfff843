// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/capabilities.h"

#include "logging.h"
#include "utiltime.h"

bool CPlaceholderProofVerifier::Verify(const std::vector<unsigned char>& vchProof) const
{
    LogPrint(BCLog::LENDING, "ProofVerifier: accepting %u-byte proof (placeholder)\n", vchProof.size());
    return true;
}

int64_t CSystemClock::Now() const
{
    return GetTime();
}

// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_CAPABILITIES_H
#define ZKLEND_LENDING_CAPABILITIES_H

/**
 * External collaborators of the lending ledger.
 *
 * The ledger never verifies proofs, moves tokens or reads a wall clock
 * itself; each operation receives these through a LendContext.
 */

#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

/** Confidential-value proof subsystem. */
class ProofVerifier
{
public:
    virtual ~ProofVerifier() = default;
    virtual bool Verify(const std::vector<unsigned char>& vchProof) const = 0;
};

/**
 * Moves fungible tokens between custodial accounts.
 *
 * Move is called while the lending processor holds its lock. An
 * implementation must not call back into CLendingProcessor.
 */
class TokenTransfer
{
public:
    virtual ~TokenTransfer() = default;

    /**
     * Move amount from one account to another.
     *
     * @param[out] strError reason on failure
     * @return true if the tokens moved
     */
    virtual bool Move(const uint256& from, const uint256& to, uint64_t amount, std::string& strError) = 0;
};

/** A completed TokenTransfer::Move, kept so it can be reversed. */
struct CTokenMove
{
    uint256 from;
    uint256 to;
    uint64_t amount{0};

    bool IsNull() const { return amount == 0; }
};

/** Per-call source of the current unix time. */
class LendClock
{
public:
    virtual ~LendClock() = default;
    virtual int64_t Now() const = 0;
};

/** Accepts every proof. Stands in until a real verifier is wired in. */
class CPlaceholderProofVerifier : public ProofVerifier
{
public:
    bool Verify(const std::vector<unsigned char>& vchProof) const override;
};

/** Reads GetTime(), which honours SetMockTime(). */
class CSystemClock : public LendClock
{
public:
    int64_t Now() const override;
};

/**
 * LendContext - capabilities handed to one operation
 *
 * Non-owning; the caller keeps the collaborators alive for the call.
 */
struct LendContext
{
    const ProofVerifier& verifier;
    TokenTransfer& transfer;
    const LendClock& clock;

    LendContext(const ProofVerifier& verifierIn, TokenTransfer& transferIn, const LendClock& clockIn)
        : verifier(verifierIn), transfer(transferIn), clock(clockIn) {}
};

#endif // ZKLEND_LENDING_CAPABILITIES_H

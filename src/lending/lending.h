// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_H
#define ZKLEND_LENDING_H

/**
 * Lending Protocol Ledger - record types
 *
 * Over-collateralized lending kept as shared ledger state. Every record is
 * owned by the ledger and addressed by a 256-bit key; participants are
 * external 256-bit identities.
 *
 * Solvency rules enforced by lending_logic:
 * - utilizationRate == floor(totalLoans * 100 / totalLiquidity), 0 if no liquidity
 * - borrow:  totalLoans += P, totalLiquidity -= P
 * - repay:   totalLoans -= principal, totalLiquidity += amount
 *
 * DB Keys (all use CDBBatch):
 * 'S' + address  -> ProtocolState
 * 'T' + address  -> ProtocolTreasury
 * 'L' + address  -> LendingPool (address doubles as its escrow account)
 * 'C' + address  -> CollateralPool (address doubles as its escrow account)
 * 'I' + address  -> InstitutionalPool
 * 'B' + owner    -> BorrowerAccount
 * 'D' + address  -> DelegatedBorrower
 * 'G' + address  -> Governance
 * 'R' + borrower -> BorrowerReputation
 */

#include "consensus/validation.h"
#include "lending/encryptedamount.h"
#include "serialize.h"
#include "uint256.h"

#include <algorithm>
#include <stdint.h>
#include <string>
#include <vector>

// DB Key prefixes
static const char DB_PROTOCOL_STATE = 'S';
static const char DB_TREASURY = 'T';
static const char DB_LENDING_POOL = 'L';
static const char DB_COLLATERAL_POOL = 'C';
static const char DB_INSTITUTIONAL_POOL = 'I';
static const char DB_BORROWER = 'B';
static const char DB_DELEGATION = 'D';
static const char DB_GOVERNANCE = 'G';
static const char DB_REPUTATION = 'R';

// Protocol defaults
static const uint8_t DEFAULT_BASE_INTEREST_RATE = 5;         // percent per annum
static const int64_t DEFAULT_MIN_COLLATERAL_LOCK_TIME = 600; // seconds between borrows
static const uint64_t SECONDS_PER_YEAR = 31536000;
static const uint64_t BORROW_FEE_DIVISOR = 100;              // 1% of principal to treasury
static const uint64_t LENDER_REWARD_DIVISOR = 100;           // 1% of repayment to lenders

/**
 * ProtocolState - global aggregates (singleton)
 *
 * Mutated by every borrow and repay. Never deleted.
 */
struct ProtocolState
{
    uint256 address;
    uint64_t totalCollateral;
    uint64_t totalLoans;
    uint64_t totalLiquidity;
    uint8_t baseInterestRate;       // percent
    uint64_t utilizationRate;       // percent, derived; may exceed 100
    int64_t minCollateralLockTime;  // seconds

    ProtocolState() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        totalCollateral = 0;
        totalLoans = 0;
        totalLiquidity = 0;
        baseInterestRate = 0;
        utilizationRate = 0;
        minCollateralLockTime = 0;
    }

    bool IsNull() const { return address.IsNull(); }

    SERIALIZE_METHODS(ProtocolState, obj)
    {
        READWRITE(obj.address);
        READWRITE(obj.totalCollateral, obj.totalLoans, obj.totalLiquidity);
        READWRITE(obj.baseInterestRate, obj.utilizationRate);
        READWRITE(obj.minCollateralLockTime);
    }
};

/**
 * ProtocolTreasury - fee accrual (singleton)
 */
struct ProtocolTreasury
{
    uint256 address;
    uint64_t totalFeesCollected;
    uint64_t governanceFund;

    ProtocolTreasury() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        totalFeesCollected = 0;
        governanceFund = 0;
    }

    bool IsNull() const { return address.IsNull(); }

    SERIALIZE_METHODS(ProtocolTreasury, obj)
    {
        READWRITE(obj.address);
        READWRITE(obj.totalFeesCollected, obj.governanceFund);
    }
};

/**
 * LendingPool - liquidity source for borrows, sink for repayments
 *
 * The pool address is also the escrow account funds move from/to.
 */
struct LendingPool
{
    uint256 address;
    uint256 poolAuthority;
    uint64_t totalLiquidity;
    uint8_t baseInterestRate;
    uint64_t utilizationRate;
    uint64_t lenderRewards;

    LendingPool() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        poolAuthority.SetNull();
        totalLiquidity = 0;
        baseInterestRate = 0;
        utilizationRate = 0;
        lenderRewards = 0;
    }

    bool IsNull() const { return address.IsNull(); }

    SERIALIZE_METHODS(LendingPool, obj)
    {
        READWRITE(obj.address, obj.poolAuthority);
        READWRITE(obj.totalLiquidity, obj.baseInterestRate, obj.utilizationRate);
        READWRITE(obj.lenderRewards);
    }
};

/**
 * CollateralPool - one per accepted collateral asset
 */
struct CollateralPool
{
    uint256 address;
    uint256 assetMint;
    uint64_t totalCollateral;

    CollateralPool() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        assetMint.SetNull();
        totalCollateral = 0;
    }

    bool IsNull() const { return address.IsNull(); }

    SERIALIZE_METHODS(CollateralPool, obj)
    {
        READWRITE(obj.address, obj.assetMint);
        READWRITE(obj.totalCollateral);
    }
};

/**
 * InstitutionalPool - whitelist-gated liquidity
 *
 * Read-only here: gates institutional borrows and governance votes.
 */
struct InstitutionalPool
{
    uint256 address;
    uint256 poolOwner;
    uint64_t totalLiquidity;
    uint8_t fixedInterestRate;
    std::vector<uint256> whitelist;

    InstitutionalPool() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        poolOwner.SetNull();
        totalLiquidity = 0;
        fixedInterestRate = 0;
        whitelist.clear();
    }

    bool IsNull() const { return address.IsNull(); }

    bool IsWhitelisted(const uint256& participant) const
    {
        return std::find(whitelist.begin(), whitelist.end(), participant) != whitelist.end();
    }

    SERIALIZE_METHODS(InstitutionalPool, obj)
    {
        READWRITE(obj.address, obj.poolOwner);
        READWRITE(obj.totalLiquidity, obj.fixedInterestRate);
        READWRITE(obj.whitelist);
    }
};

/**
 * BorrowerAccount - one per participant, keyed by owner identity
 *
 * nBorrowTimestamp is 0 when the account has no open loan.
 */
struct BorrowerAccount
{
    uint256 owner;
    EncryptedAmount encryptedCollateral;
    EncryptedAmount encryptedBorrowed;
    int64_t nBorrowTimestamp;

    BorrowerAccount() { SetNull(); }

    void SetNull()
    {
        owner.SetNull();
        encryptedCollateral.SetZero();
        encryptedBorrowed.SetZero();
        nBorrowTimestamp = 0;
    }

    bool IsNull() const { return owner.IsNull(); }

    SERIALIZE_METHODS(BorrowerAccount, obj)
    {
        READWRITE(obj.owner);
        READWRITE(obj.encryptedCollateral, obj.encryptedBorrowed);
        READWRITE(obj.nBorrowTimestamp);
    }
};

/**
 * DelegatedBorrower - credit line from delegator to delegate
 */
struct DelegatedBorrower
{
    uint256 address;
    uint256 delegator;
    uint256 delegate;
    uint64_t maxBorrowAmount;

    DelegatedBorrower() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        delegator.SetNull();
        delegate.SetNull();
        maxBorrowAmount = 0;
    }

    bool IsNull() const { return address.IsNull(); }

    SERIALIZE_METHODS(DelegatedBorrower, obj)
    {
        READWRITE(obj.address, obj.delegator, obj.delegate);
        READWRITE(obj.maxBorrowAmount);
    }
};

/**
 * Governance - single live proposal with a signed vote tally
 *
 * A new proposal supersedes the previous one and resets the tally.
 */
struct Governance
{
    uint256 address;
    uint64_t proposalId;
    uint8_t proposalType;
    uint64_t newValue;
    int64_t votes;

    Governance() { SetNull(); }

    void SetNull()
    {
        address.SetNull();
        proposalId = 0;
        proposalType = 0;
        newValue = 0;
        votes = 0;
    }

    bool IsNull() const { return address.IsNull(); }

    SERIALIZE_METHODS(Governance, obj)
    {
        READWRITE(obj.address);
        READWRITE(obj.proposalId, obj.proposalType, obj.newValue);
        READWRITE(obj.votes);
    }
};

/**
 * BorrowerReputation - stored score, not consumed by any transition
 */
struct BorrowerReputation
{
    uint256 borrower;
    uint64_t reputationScore;

    BorrowerReputation() { SetNull(); }

    void SetNull()
    {
        borrower.SetNull();
        reputationScore = 0;
    }

    bool IsNull() const { return borrower.IsNull(); }

    SERIALIZE_METHODS(BorrowerReputation, obj)
    {
        READWRITE(obj.borrower, obj.reputationScore);
    }
};

// =============================================================================
// Error taxonomy
// =============================================================================

enum class LendError : uint8_t {
    NONE = 0,
    INVALID_PROOF,
    MATH_OVERFLOW,
    INSUFFICIENT_COLLATERAL,
    INSUFFICIENT_LIQUIDITY,
    REPAY_EXCEEDS_BORROW,
    LIQUIDATION_NOT_ALLOWED,
    UNAUTHORIZED_VOTER,
    INVALID_PROPOSAL,
    COLLATERAL_SUFFICIENT,
    COLLATERAL_LOCK_TIME_NOT_MET,
    UNAUTHORIZED_BORROWER,
    BORROW_LIMIT_EXCEEDED,
    // runtime-level
    TRANSFER_FAILED,
    RECORD_MISSING,
    RECORD_EXISTS,
    UNKNOWN,
};

/** Stable reject reason for an error kind, e.g. "bad-lend-invalid-proof". */
std::string LendErrorReason(LendError err);

/** Map a rejected state back to its error kind (NONE if valid, UNKNOWN if foreign). */
LendError GetLendError(const CValidationState& state);

/** Fill state with the reject reason of err. Always returns false. */
bool LendReject(CValidationState& state, LendError err, const std::string& strDebug = "");

#endif // ZKLEND_LENDING_H

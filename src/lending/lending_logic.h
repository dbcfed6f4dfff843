// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_LOGIC_H
#define ZKLEND_LENDING_LOGIC_H

/**
 * Lending Ledger Logic - state transitions
 *
 * Every Apply* function works on staged copies of the records it is given
 * and writes them back only when every check has passed, so a rejected
 * operation leaves its inputs untouched. Token movements are issued last,
 * after all arithmetic has been validated.
 *
 * Borrow (shared by the three policies):
 *   1. proof verified
 *   2. policy check (open / whitelisted / delegated)
 *   3. flash-loan lock: now - nBorrowTimestamp >= minCollateralLockTime
 *   4. nBorrowTimestamp = now
 *   5. collateral covers amount
 *   6. fee = amount / 100, net = amount - fee
 *   7. net moved from lending pool escrow to the borrower
 *   8. treasury fee, borrower debt, totalLoans += amount, totalLiquidity -= amount
 */

#include "lending/capabilities.h"
#include "lending/lending.h"

#include <stdint.h>
#include <vector>

class CValidationState;

// =============================================================================
// Checked arithmetic
// =============================================================================

/** a + b, false if the result does not fit in a u64. */
bool AddNoOverflow(uint64_t a, uint64_t b, uint64_t& result);

/** a - b, false if b > a. */
bool SubNoUnderflow(uint64_t a, uint64_t b, uint64_t& result);

/** a * b, false if the result does not fit in a u64. */
bool MulNoOverflow(uint64_t a, uint64_t b, uint64_t& result);

/** a + b for signed tallies, false on i64 overflow. */
bool AddNoOverflow(int64_t a, int64_t b, int64_t& result);

// =============================================================================
// Protocol ledger
// =============================================================================

/**
 * InitializeProtocol - zero both singletons with protocol defaults
 *
 * baseInterestRate = 5, minCollateralLockTime = 600s, every counter 0.
 */
void InitializeProtocol(const uint256& stateAddress,
                        const uint256& treasuryAddress,
                        ProtocolState& protocol,
                        ProtocolTreasury& treasury);

/**
 * ComputeUtilization - floor(totalLoans * 100 / totalLiquidity)
 *
 * 128-bit intermediate, 0 when there is no liquidity. Not clamped: a pool
 * lent out beyond its liquidity reports more than 100.
 */
uint64_t ComputeUtilization(uint64_t totalLoans, uint64_t totalLiquidity);

/**
 * ComputeInterestDue - simple interest since the last borrow
 *
 * interest = floor(principal * rate * elapsed / (SECONDS_PER_YEAR * 100))
 * elapsed is 0 when nBorrowTimestamp is 0 or lies in the future.
 *
 * @return false if an intermediate product overflows u64
 */
bool ComputeInterestDue(uint64_t principal,
                        uint8_t rate,
                        int64_t nBorrowTimestamp,
                        int64_t nNow,
                        uint64_t& interestDue);

// =============================================================================
// Borrow authorization
// =============================================================================

/**
 * BorrowPolicy - which gate a borrow passes through
 *
 * The referenced record must outlive the policy.
 */
struct BorrowPolicy
{
    enum class Kind : uint8_t {
        OPEN = 0,
        WHITELISTED = 1,
        DELEGATED = 2,
    };

    Kind kind{Kind::OPEN};
    const InstitutionalPool* pool{nullptr};
    const DelegatedBorrower* delegation{nullptr};

    static BorrowPolicy Open() { return BorrowPolicy(); }

    static BorrowPolicy Whitelisted(const InstitutionalPool& poolIn)
    {
        BorrowPolicy policy;
        policy.kind = Kind::WHITELISTED;
        policy.pool = &poolIn;
        return policy;
    }

    static BorrowPolicy Delegated(const DelegatedBorrower& delegationIn)
    {
        BorrowPolicy policy;
        policy.kind = Kind::DELEGATED;
        policy.delegation = &delegationIn;
        return policy;
    }
};

std::string BorrowPolicyName(BorrowPolicy::Kind kind);

/**
 * CheckBorrowPolicy - policy gate of the shared borrow algorithm
 *
 * OPEN:        always passes
 * WHITELISTED: signer in pool whitelist, else UNAUTHORIZED_BORROWER
 * DELEGATED:   signer is the delegate (UNAUTHORIZED_BORROWER) and
 *              amount <= maxBorrowAmount (BORROW_LIMIT_EXCEEDED)
 */
bool CheckBorrowPolicy(const BorrowPolicy& policy,
                       const uint256& signer,
                       uint64_t amount,
                       CValidationState& state);

// =============================================================================
// Operations
// =============================================================================

/**
 * ApplyStakeCollateral - lock collateral into a collateral pool
 *
 * Moves amount from the user's token account to the pool escrow and credits
 * both the borrower and the pool total. The move is the last step; when
 * pMoved is given it receives the move that was made.
 */
bool ApplyStakeCollateral(const LendContext& ctx,
                          const uint256& userTokenAccount,
                          uint64_t amount,
                          const std::vector<unsigned char>& vchProof,
                          BorrowerAccount& account,
                          CollateralPool& collateralPool,
                          CValidationState& state,
                          CTokenMove* pMoved = nullptr);

/**
 * ApplyBorrow - shared borrow algorithm, parameterized by policy
 *
 * The debt is recorded on the signer's own account for every policy.
 */
bool ApplyBorrow(const LendContext& ctx,
                 const BorrowPolicy& policy,
                 const uint256& userTokenAccount,
                 uint64_t amount,
                 const std::vector<unsigned char>& vchProof,
                 BorrowerAccount& account,
                 const LendingPool& lendingPool,
                 ProtocolState& protocol,
                 ProtocolTreasury& treasury,
                 CValidationState& state,
                 CTokenMove* pMoved = nullptr);

/**
 * ApplyRepay - close the borrower's debt with interest
 *
 * amount must cover principal + interest. Any excess stays with the pool.
 */
bool ApplyRepay(const LendContext& ctx,
                const uint256& userTokenAccount,
                uint64_t amount,
                BorrowerAccount& account,
                LendingPool& lendingPool,
                ProtocolState& protocol,
                CValidationState& state,
                CTokenMove* pMoved = nullptr);

/**
 * ApplyLiquidate - partial seizure of an under-collateralized position
 *
 * Allowed only when the collateral is exactly zero; seizes half of it
 * from the borrower and the pool. Debt is left as is.
 */
bool ApplyLiquidate(const LendContext& ctx,
                    const std::vector<unsigned char>& vchProof,
                    BorrowerAccount& account,
                    CollateralPool& collateralPool,
                    CValidationState& state);

/** ApplyProposeChange - start a new proposal, superseding the live one */
bool ApplyProposeChange(uint8_t proposalType,
                        uint64_t newValue,
                        Governance& governance,
                        CValidationState& state);

/**
 * ApplyVote - add +1 or -1 to the live proposal
 *
 * Voter must be whitelisted in the institutional pool and name the live
 * proposal id. Repeated votes from the same voter all count.
 */
bool ApplyVote(const InstitutionalPool& pool,
               const uint256& voter,
               uint64_t proposalId,
               bool fSupport,
               Governance& governance,
               CValidationState& state);

/**
 * ApplyRebalanceCollateral - add delta to the borrower's collateral
 *
 * The collateral pool total is not touched.
 */
bool ApplyRebalanceCollateral(const LendContext& ctx,
                              uint64_t delta,
                              const std::vector<unsigned char>& vchProof,
                              BorrowerAccount& account,
                              CValidationState& state);

#endif // ZKLEND_LENDING_LOGIC_H

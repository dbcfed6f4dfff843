// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/lending_logic.h"

#include "consensus/validation.h"
#include "logging.h"

#include <limits>

namespace {

void RecordMove(CTokenMove* pMoved, const uint256& from, const uint256& to, uint64_t amount)
{
    if (pMoved) {
        pMoved->from = from;
        pMoved->to = to;
        pMoved->amount = amount;
    }
}

} // anonymous namespace

// =============================================================================
// Checked arithmetic
// =============================================================================

bool AddNoOverflow(uint64_t a, uint64_t b, uint64_t& result)
{
    unsigned __int128 sum = (unsigned __int128)a + b;
    if (sum > std::numeric_limits<uint64_t>::max()) {
        return false;
    }
    result = (uint64_t)sum;
    return true;
}

bool SubNoUnderflow(uint64_t a, uint64_t b, uint64_t& result)
{
    if (b > a) {
        return false;
    }
    result = a - b;
    return true;
}

bool MulNoOverflow(uint64_t a, uint64_t b, uint64_t& result)
{
    unsigned __int128 product = (unsigned __int128)a * b;
    if (product > std::numeric_limits<uint64_t>::max()) {
        return false;
    }
    result = (uint64_t)product;
    return true;
}

bool AddNoOverflow(int64_t a, int64_t b, int64_t& result)
{
    __int128 sum = (__int128)a + b;
    if (sum > std::numeric_limits<int64_t>::max() || sum < std::numeric_limits<int64_t>::min()) {
        return false;
    }
    result = (int64_t)sum;
    return true;
}

// =============================================================================
// Protocol ledger
// =============================================================================

void InitializeProtocol(const uint256& stateAddress,
                        const uint256& treasuryAddress,
                        ProtocolState& protocol,
                        ProtocolTreasury& treasury)
{
    protocol.SetNull();
    protocol.address = stateAddress;
    protocol.baseInterestRate = DEFAULT_BASE_INTEREST_RATE;
    protocol.minCollateralLockTime = DEFAULT_MIN_COLLATERAL_LOCK_TIME;

    treasury.SetNull();
    treasury.address = treasuryAddress;

    LogPrint(BCLog::LENDING, "InitializeProtocol: state=%s treasury=%s rate=%u lock=%lld\n",
             stateAddress.ToString().substr(0, 16), treasuryAddress.ToString().substr(0, 16),
             (unsigned)protocol.baseInterestRate, (long long)protocol.minCollateralLockTime);
}

uint64_t ComputeUtilization(uint64_t totalLoans, uint64_t totalLiquidity)
{
    if (totalLiquidity == 0) {
        return 0;
    }
    // Saturates instead of wrapping when liquidity is tiny next to loans
    unsigned __int128 ratio = (unsigned __int128)totalLoans * 100 / totalLiquidity;
    if (ratio > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return (uint64_t)ratio;
}

bool ComputeInterestDue(uint64_t principal,
                        uint8_t rate,
                        int64_t nBorrowTimestamp,
                        int64_t nNow,
                        uint64_t& interestDue)
{
    uint64_t elapsed = 0;
    if (nBorrowTimestamp != 0 && nNow > nBorrowTimestamp) {
        elapsed = (uint64_t)((__int128)nNow - nBorrowTimestamp);
    }

    uint64_t scaled;
    if (!MulNoOverflow(principal, rate, scaled)) {
        return false;
    }
    if (!MulNoOverflow(scaled, elapsed, scaled)) {
        return false;
    }
    interestDue = scaled / (SECONDS_PER_YEAR * 100);
    return true;
}

// =============================================================================
// Borrow authorization
// =============================================================================

std::string BorrowPolicyName(BorrowPolicy::Kind kind)
{
    switch (kind) {
    case BorrowPolicy::Kind::OPEN:
        return "open";
    case BorrowPolicy::Kind::WHITELISTED:
        return "institutional";
    case BorrowPolicy::Kind::DELEGATED:
        return "delegated";
    }
    return "unknown";
}

bool CheckBorrowPolicy(const BorrowPolicy& policy,
                       const uint256& signer,
                       uint64_t amount,
                       CValidationState& state)
{
    switch (policy.kind) {
    case BorrowPolicy::Kind::OPEN:
        return true;

    case BorrowPolicy::Kind::WHITELISTED:
        if (!policy.pool) {
            return LendReject(state, LendError::RECORD_MISSING, "institutional pool");
        }
        if (!policy.pool->IsWhitelisted(signer)) {
            LogPrint(BCLog::LENDING, "CheckBorrowPolicy: REJECT signer=%s not in whitelist of pool=%s\n",
                     signer.ToString().substr(0, 16), policy.pool->address.ToString().substr(0, 16));
            return LendReject(state, LendError::UNAUTHORIZED_BORROWER);
        }
        return true;

    case BorrowPolicy::Kind::DELEGATED:
        if (!policy.delegation) {
            return LendReject(state, LendError::RECORD_MISSING, "delegation");
        }
        if (policy.delegation->delegate != signer) {
            LogPrint(BCLog::LENDING, "CheckBorrowPolicy: REJECT signer=%s is not delegate of line=%s\n",
                     signer.ToString().substr(0, 16), policy.delegation->address.ToString().substr(0, 16));
            return LendReject(state, LendError::UNAUTHORIZED_BORROWER);
        }
        if (amount > policy.delegation->maxBorrowAmount) {
            LogPrint(BCLog::LENDING, "CheckBorrowPolicy: REJECT amount=%llu > max=%llu\n",
                     (unsigned long long)amount, (unsigned long long)policy.delegation->maxBorrowAmount);
            return LendReject(state, LendError::BORROW_LIMIT_EXCEEDED);
        }
        return true;
    }

    return LendReject(state, LendError::UNKNOWN, "unknown borrow policy");
}

// =============================================================================
// Stake / rebalance
// =============================================================================

bool ApplyStakeCollateral(const LendContext& ctx,
                          const uint256& userTokenAccount,
                          uint64_t amount,
                          const std::vector<unsigned char>& vchProof,
                          BorrowerAccount& account,
                          CollateralPool& collateralPool,
                          CValidationState& state,
                          CTokenMove* pMoved)
{
    if (!ctx.verifier.Verify(vchProof)) {
        return LendReject(state, LendError::INVALID_PROOF);
    }

    BorrowerAccount newAccount = account;
    CollateralPool newPool = collateralPool;

    if (!newAccount.encryptedCollateral.Add(amount)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "borrower collateral");
    }
    if (!AddNoOverflow(newPool.totalCollateral, amount, newPool.totalCollateral)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "pool collateral");
    }

    std::string strError;
    if (!ctx.transfer.Move(userTokenAccount, collateralPool.address, amount, strError)) {
        LogPrint(BCLog::LENDING, "ApplyStakeCollateral: transfer failed: %s\n", strError);
        return LendReject(state, LendError::TRANSFER_FAILED, strError);
    }
    RecordMove(pMoved, userTokenAccount, collateralPool.address, amount);

    account = newAccount;
    collateralPool = newPool;

    LogPrint(BCLog::LENDING, "ApplyStakeCollateral: owner=%s amount=%llu pool_total=%llu\n",
             account.owner.ToString().substr(0, 16), (unsigned long long)amount,
             (unsigned long long)collateralPool.totalCollateral);
    return true;
}

bool ApplyRebalanceCollateral(const LendContext& ctx,
                              uint64_t delta,
                              const std::vector<unsigned char>& vchProof,
                              BorrowerAccount& account,
                              CValidationState& state)
{
    if (!ctx.verifier.Verify(vchProof)) {
        return LendReject(state, LendError::INVALID_PROOF);
    }

    EncryptedAmount collateral = account.encryptedCollateral;
    if (!collateral.Add(delta)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "borrower collateral");
    }
    account.encryptedCollateral = collateral;

    LogPrint(BCLog::LENDING, "ApplyRebalanceCollateral: owner=%s delta=%llu (pool total unchanged)\n",
             account.owner.ToString().substr(0, 16), (unsigned long long)delta);
    return true;
}

// =============================================================================
// Borrow
// =============================================================================

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
                 CTokenMove* pMoved)
{
    // 1. Proof
    if (!ctx.verifier.Verify(vchProof)) {
        return LendReject(state, LendError::INVALID_PROOF);
    }

    // 2. Policy
    if (!CheckBorrowPolicy(policy, account.owner, amount, state)) {
        return false;
    }

    // 3. Flash-loan lock
    const int64_t nNow = ctx.clock.Now();
    if (account.nBorrowTimestamp != 0) {
        __int128 elapsed = (__int128)nNow - account.nBorrowTimestamp;
        if (elapsed < protocol.minCollateralLockTime) {
            LogPrint(BCLog::LENDING, "ApplyBorrow: REJECT owner=%s elapsed=%lld < lock=%lld\n",
                     account.owner.ToString().substr(0, 16), (long long)elapsed,
                     (long long)protocol.minCollateralLockTime);
            return LendReject(state, LendError::COLLATERAL_LOCK_TIME_NOT_MET);
        }
    }

    BorrowerAccount newAccount = account;
    ProtocolState newProtocol = protocol;
    ProtocolTreasury newTreasury = treasury;

    // 4. Timestamp
    newAccount.nBorrowTimestamp = nNow;

    // 5. Collateral
    if (!newAccount.encryptedCollateral.Covers(amount)) {
        return LendReject(state, LendError::INSUFFICIENT_COLLATERAL);
    }

    // 6. Fee
    const uint64_t fee = amount / BORROW_FEE_DIVISOR;
    uint64_t net;
    if (!SubNoUnderflow(amount, fee, net)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "net amount");
    }

    // 8-11. Ledger updates, staged
    if (!AddNoOverflow(newTreasury.totalFeesCollected, fee, newTreasury.totalFeesCollected)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "treasury fees");
    }
    if (!newAccount.encryptedBorrowed.Add(amount)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "borrower debt");
    }
    if (!AddNoOverflow(newProtocol.totalLoans, amount, newProtocol.totalLoans)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "total loans");
    }
    if (!SubNoUnderflow(newProtocol.totalLiquidity, amount, newProtocol.totalLiquidity)) {
        LogPrint(BCLog::LENDING, "ApplyBorrow: REJECT amount=%llu exceeds liquidity=%llu\n",
                 (unsigned long long)amount, (unsigned long long)protocol.totalLiquidity);
        return LendReject(state, LendError::MATH_OVERFLOW, "total liquidity");
    }
    newProtocol.utilizationRate = ComputeUtilization(newProtocol.totalLoans, newProtocol.totalLiquidity);

    // 7. Release funds
    std::string strError;
    if (!ctx.transfer.Move(lendingPool.address, userTokenAccount, net, strError)) {
        LogPrint(BCLog::LENDING, "ApplyBorrow: transfer failed: %s\n", strError);
        return LendReject(state, LendError::TRANSFER_FAILED, strError);
    }
    RecordMove(pMoved, lendingPool.address, userTokenAccount, net);

    account = newAccount;
    protocol = newProtocol;
    treasury = newTreasury;

    LogPrint(BCLog::LENDING, "ApplyBorrow: policy=%s owner=%s amount=%llu fee=%llu net=%llu loans=%llu liquidity=%llu util=%llu\n",
             BorrowPolicyName(policy.kind), account.owner.ToString().substr(0, 16),
             (unsigned long long)amount, (unsigned long long)fee, (unsigned long long)net,
             (unsigned long long)protocol.totalLoans, (unsigned long long)protocol.totalLiquidity,
             (unsigned long long)protocol.utilizationRate);
    return true;
}

// =============================================================================
// Repay
// =============================================================================

bool ApplyRepay(const LendContext& ctx,
                const uint256& userTokenAccount,
                uint64_t amount,
                BorrowerAccount& account,
                LendingPool& lendingPool,
                ProtocolState& protocol,
                CValidationState& state,
                CTokenMove* pMoved)
{
    const int64_t nNow = ctx.clock.Now();
    const uint64_t principal = account.encryptedBorrowed.Reveal();

    uint64_t interestDue;
    if (!ComputeInterestDue(principal, protocol.baseInterestRate, account.nBorrowTimestamp, nNow, interestDue)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "interest");
    }
    uint64_t totalDue;
    if (!AddNoOverflow(principal, interestDue, totalDue)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "total due");
    }
    if (amount < totalDue) {
        LogPrint(BCLog::LENDING, "ApplyRepay: REJECT owner=%s amount=%llu < due=%llu (principal=%llu interest=%llu)\n",
                 account.owner.ToString().substr(0, 16), (unsigned long long)amount,
                 (unsigned long long)totalDue, (unsigned long long)principal, (unsigned long long)interestDue);
        return LendReject(state, LendError::REPAY_EXCEEDS_BORROW);
    }

    BorrowerAccount newAccount = account;
    LendingPool newPool = lendingPool;
    ProtocolState newProtocol = protocol;

    const uint64_t reward = amount / LENDER_REWARD_DIVISOR;
    if (!AddNoOverflow(newPool.lenderRewards, reward, newPool.lenderRewards)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "lender rewards");
    }

    newAccount.encryptedBorrowed.SetZero();
    newAccount.nBorrowTimestamp = 0;

    if (!SubNoUnderflow(newProtocol.totalLoans, principal, newProtocol.totalLoans)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "total loans");
    }
    if (!AddNoOverflow(newProtocol.totalLiquidity, amount, newProtocol.totalLiquidity)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "total liquidity");
    }
    newProtocol.utilizationRate = ComputeUtilization(newProtocol.totalLoans, newProtocol.totalLiquidity);

    std::string strError;
    if (!ctx.transfer.Move(userTokenAccount, lendingPool.address, amount, strError)) {
        LogPrint(BCLog::LENDING, "ApplyRepay: transfer failed: %s\n", strError);
        return LendReject(state, LendError::TRANSFER_FAILED, strError);
    }
    RecordMove(pMoved, userTokenAccount, lendingPool.address, amount);

    account = newAccount;
    lendingPool = newPool;
    protocol = newProtocol;

    LogPrint(BCLog::LENDING, "ApplyRepay: owner=%s amount=%llu principal=%llu interest=%llu reward=%llu loans=%llu liquidity=%llu\n",
             account.owner.ToString().substr(0, 16), (unsigned long long)amount,
             (unsigned long long)principal, (unsigned long long)interestDue, (unsigned long long)reward,
             (unsigned long long)protocol.totalLoans, (unsigned long long)protocol.totalLiquidity);
    return true;
}

// =============================================================================
// Liquidate
// =============================================================================

bool ApplyLiquidate(const LendContext& ctx,
                    const std::vector<unsigned char>& vchProof,
                    BorrowerAccount& account,
                    CollateralPool& collateralPool,
                    CValidationState& state)
{
    if (!ctx.verifier.Verify(vchProof)) {
        return LendReject(state, LendError::INVALID_PROOF);
    }

    // Only an empty position counts as under-collateralized
    if (!account.encryptedCollateral.IsZero()) {
        LogPrint(BCLog::LENDING, "ApplyLiquidate: REJECT owner=%s collateral not exhausted\n",
                 account.owner.ToString().substr(0, 16));
        return LendReject(state, LendError::LIQUIDATION_NOT_ALLOWED);
    }

    const uint64_t seized = account.encryptedCollateral.Reveal() / 2;

    CollateralPool newPool = collateralPool;
    if (!SubNoUnderflow(newPool.totalCollateral, seized, newPool.totalCollateral)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "pool collateral");
    }

    account.encryptedCollateral.Sub(seized);
    collateralPool = newPool;

    LogPrint(BCLog::LENDING, "ApplyLiquidate: owner=%s seized=%llu pool_total=%llu\n",
             account.owner.ToString().substr(0, 16), (unsigned long long)seized,
             (unsigned long long)collateralPool.totalCollateral);
    return true;
}

// =============================================================================
// Governance
// =============================================================================

bool ApplyProposeChange(uint8_t proposalType,
                        uint64_t newValue,
                        Governance& governance,
                        CValidationState& state)
{
    uint64_t nextId;
    if (!AddNoOverflow(governance.proposalId, (uint64_t)1, nextId)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "proposal id");
    }

    governance.proposalId = nextId;
    governance.proposalType = proposalType;
    governance.newValue = newValue;
    governance.votes = 0;

    LogPrint(BCLog::GOVERNANCE, "ApplyProposeChange: gov=%s id=%llu type=%u value=%llu\n",
             governance.address.ToString().substr(0, 16), (unsigned long long)governance.proposalId,
             (unsigned)proposalType, (unsigned long long)newValue);
    return true;
}

bool ApplyVote(const InstitutionalPool& pool,
               const uint256& voter,
               uint64_t proposalId,
               bool fSupport,
               Governance& governance,
               CValidationState& state)
{
    if (!pool.IsWhitelisted(voter)) {
        LogPrint(BCLog::GOVERNANCE, "ApplyVote: REJECT voter=%s not whitelisted\n",
                 voter.ToString().substr(0, 16));
        return LendReject(state, LendError::UNAUTHORIZED_VOTER);
    }
    if (governance.proposalId != proposalId) {
        LogPrint(BCLog::GOVERNANCE, "ApplyVote: REJECT stale proposal %llu (live=%llu)\n",
                 (unsigned long long)proposalId, (unsigned long long)governance.proposalId);
        return LendReject(state, LendError::INVALID_PROPOSAL);
    }

    int64_t votes;
    if (!AddNoOverflow(governance.votes, fSupport ? (int64_t)1 : (int64_t)-1, votes)) {
        return LendReject(state, LendError::MATH_OVERFLOW, "vote tally");
    }
    governance.votes = votes;

    LogPrint(BCLog::GOVERNANCE, "ApplyVote: voter=%s id=%llu %s votes=%lld\n",
             voter.ToString().substr(0, 16), (unsigned long long)proposalId,
             fSupport ? "yes" : "no", (long long)governance.votes);
    return true;
}

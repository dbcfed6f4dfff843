// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Lending rule tests - the Apply* functions without a database
 *
 * Tests:
 *   1. Checked arithmetic and utilization
 *   2. Interest accrual
 *   3. Stake and rebalance
 *   4. Borrow (fee, lock time, policies, staging)
 *   5. Repay completeness
 *   6. Liquidation gate
 */

#include "consensus/validation.h"
#include "lending/lending.h"
#include "lending/lending_logic.h"
#include "test/test_zklend.h"

#include <limits>

#include <boost/test/unit_test.hpp>

namespace {

const uint256 PROTOCOL_ADDR = TestAddress(0x01);
const uint256 TREASURY_ADDR = TestAddress(0x02);
const uint256 LENDING_POOL_ADDR = TestAddress(0x03);
const uint256 COLLATERAL_POOL_ADDR = TestAddress(0x04);
const uint256 ALICE = TestAddress(0xa1);
const uint256 ALICE_TOKENS = TestAddress(0xa2);
const uint256 BOB = TestAddress(0xb1);

struct LendingLogicSetup : public BasicTestingSetup {
    CPlaceholderProofVerifier verifier;
    MockTokenTransfer transfer;
    MockClock clock;
    LendContext ctx;

    ProtocolState protocol;
    ProtocolTreasury treasury;
    LendingPool lendingPool;
    CollateralPool collateralPool;
    BorrowerAccount account;

    const std::vector<unsigned char> proof{0x01, 0x02, 0x03};

    LendingLogicSetup() : ctx(verifier, transfer, clock)
    {
        InitializeProtocol(PROTOCOL_ADDR, TREASURY_ADDR, protocol, treasury);
        protocol.totalLiquidity = 10000;

        lendingPool.address = LENDING_POOL_ADDR;
        lendingPool.poolAuthority = TestAddress(0x30);
        lendingPool.baseInterestRate = DEFAULT_BASE_INTEREST_RATE;

        collateralPool.address = COLLATERAL_POOL_ADDR;
        collateralPool.assetMint = TestAddress(0x40);

        account.owner = ALICE;

        transfer.Credit(ALICE_TOKENS, 100000);
        transfer.Credit(LENDING_POOL_ADDR, 100000);
    }

    bool Stake(uint64_t amount, CValidationState& state)
    {
        return ApplyStakeCollateral(ctx, ALICE_TOKENS, amount, proof, account, collateralPool, state);
    }

    bool Borrow(const BorrowPolicy& policy, uint64_t amount, CValidationState& state)
    {
        return ApplyBorrow(ctx, policy, ALICE_TOKENS, amount, proof, account, lendingPool, protocol, treasury, state);
    }

    bool Repay(uint64_t amount, CValidationState& state)
    {
        return ApplyRepay(ctx, ALICE_TOKENS, amount, account, lendingPool, protocol, state);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(lending_logic_tests, LendingLogicSetup)

// =============================================================================
// Test 1: Checked arithmetic and utilization
// =============================================================================
BOOST_AUTO_TEST_CASE(checked_arithmetic)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t r;

    BOOST_CHECK(AddNoOverflow((uint64_t)1, (uint64_t)2, r));
    BOOST_CHECK_EQUAL(r, 3U);
    BOOST_CHECK(!AddNoOverflow(max, (uint64_t)1, r));

    BOOST_CHECK(SubNoUnderflow(5, 5, r));
    BOOST_CHECK_EQUAL(r, 0U);
    BOOST_CHECK(!SubNoUnderflow(4, 5, r));

    BOOST_CHECK(MulNoOverflow(max / 2, 2, r));
    BOOST_CHECK(!MulNoOverflow(max / 2 + 1, 2, r));

    int64_t s;
    BOOST_CHECK(AddNoOverflow((int64_t)-1, (int64_t)-1, s));
    BOOST_CHECK_EQUAL(s, -2);
    BOOST_CHECK(!AddNoOverflow(std::numeric_limits<int64_t>::min(), (int64_t)-1, s));
    BOOST_CHECK(!AddNoOverflow(std::numeric_limits<int64_t>::max(), (int64_t)1, s));
}

BOOST_AUTO_TEST_CASE(utilization_formula)
{
    // No liquidity
    BOOST_CHECK_EQUAL(ComputeUtilization(0, 0), 0U);
    BOOST_CHECK_EQUAL(ComputeUtilization(500, 0), 0U);

    BOOST_CHECK_EQUAL(ComputeUtilization(0, 1000), 0U);
    BOOST_CHECK_EQUAL(ComputeUtilization(1000, 1000), 100U);
    BOOST_CHECK_EQUAL(ComputeUtilization(400, 9600), 4U);

    // Loans above liquidity are reported as is
    BOOST_CHECK_EQUAL(ComputeUtilization(3000, 1000), 300U);

    // Intermediate product exceeds 64 bits
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    BOOST_CHECK_EQUAL(ComputeUtilization(max, max), 100U);
    BOOST_CHECK_EQUAL(ComputeUtilization(max, 1), max);
}

BOOST_AUTO_TEST_CASE(initialize_defaults)
{
    ProtocolState p;
    ProtocolTreasury t;
    InitializeProtocol(PROTOCOL_ADDR, TREASURY_ADDR, p, t);

    BOOST_CHECK(p.address == PROTOCOL_ADDR);
    BOOST_CHECK(t.address == TREASURY_ADDR);
    BOOST_CHECK_EQUAL(p.baseInterestRate, DEFAULT_BASE_INTEREST_RATE);
    BOOST_CHECK_EQUAL(p.minCollateralLockTime, DEFAULT_MIN_COLLATERAL_LOCK_TIME);
    BOOST_CHECK_EQUAL(p.totalCollateral, 0U);
    BOOST_CHECK_EQUAL(p.totalLoans, 0U);
    BOOST_CHECK_EQUAL(p.totalLiquidity, 0U);
    BOOST_CHECK_EQUAL(p.utilizationRate, 0U);
    BOOST_CHECK_EQUAL(t.totalFeesCollected, 0U);
    BOOST_CHECK_EQUAL(t.governanceFund, 0U);
}

// =============================================================================
// Test 2: Interest accrual
// =============================================================================
BOOST_AUTO_TEST_CASE(interest_one_year)
{
    uint64_t interest;
    BOOST_CHECK(ComputeInterestDue(400, 5, 1000, 1000 + SECONDS_PER_YEAR, interest));
    BOOST_CHECK_EQUAL(interest, 20U);

    // Half a year, floored
    BOOST_CHECK(ComputeInterestDue(401, 5, 1000, 1000 + SECONDS_PER_YEAR / 2, interest));
    BOOST_CHECK_EQUAL(interest, 10U);
}

BOOST_AUTO_TEST_CASE(interest_elapsed_clamped)
{
    uint64_t interest = 99;

    // No open loan
    BOOST_CHECK(ComputeInterestDue(400, 5, 0, TEST_START_TIME, interest));
    BOOST_CHECK_EQUAL(interest, 0U);

    // Clock behind the borrow timestamp
    BOOST_CHECK(ComputeInterestDue(400, 5, TEST_START_TIME, TEST_START_TIME - 100, interest));
    BOOST_CHECK_EQUAL(interest, 0U);
}

BOOST_AUTO_TEST_CASE(interest_overflow)
{
    uint64_t interest;
    BOOST_CHECK(!ComputeInterestDue(std::numeric_limits<uint64_t>::max() / 2, 5, 1, 1 + SECONDS_PER_YEAR, interest));
}

// =============================================================================
// Test 3: Stake and rebalance
// =============================================================================
BOOST_AUTO_TEST_CASE(stake_credits_account_and_pool)
{
    CValidationState state;
    BOOST_CHECK(Stake(1000, state));
    BOOST_CHECK(state.IsValid());

    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1000U);
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 1000U);

    BOOST_REQUIRE_EQUAL(transfer.transfers.size(), 1U);
    BOOST_CHECK(transfer.transfers[0].from == ALICE_TOKENS);
    BOOST_CHECK(transfer.transfers[0].to == COLLATERAL_POOL_ADDR);
    BOOST_CHECK_EQUAL(transfer.transfers[0].amount, 1000U);
    BOOST_CHECK_EQUAL(transfer.Balance(COLLATERAL_POOL_ADDR), 1000U);
}

BOOST_AUTO_TEST_CASE(stake_rejects_bad_proof)
{
    RejectingProofVerifier rejecting;
    LendContext badCtx(rejecting, transfer, clock);

    CValidationState state;
    BOOST_CHECK(!ApplyStakeCollateral(badCtx, ALICE_TOKENS, 1000, proof, account, collateralPool, state));
    BOOST_CHECK(GetLendError(state) == LendError::INVALID_PROOF);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-lend-invalid-proof");
    BOOST_CHECK(account.encryptedCollateral.IsZero());
    BOOST_CHECK(transfer.transfers.empty());
}

BOOST_AUTO_TEST_CASE(stake_overflow_leaves_records)
{
    account.encryptedCollateral = EncryptedAmount(std::numeric_limits<uint64_t>::max());

    CValidationState state;
    BOOST_CHECK(!Stake(1, state));
    BOOST_CHECK(GetLendError(state) == LendError::MATH_OVERFLOW);
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 0U);
    BOOST_CHECK(transfer.transfers.empty());
}

BOOST_AUTO_TEST_CASE(stake_transfer_failure)
{
    transfer.fFail = true;

    CValidationState state;
    BOOST_CHECK(!Stake(1000, state));
    BOOST_CHECK(GetLendError(state) == LendError::TRANSFER_FAILED);
    BOOST_CHECK(account.encryptedCollateral.IsZero());
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 0U);
}

BOOST_AUTO_TEST_CASE(rebalance_skips_pool)
{
    CValidationState state;
    BOOST_CHECK(Stake(1000, state));

    BOOST_CHECK(ApplyRebalanceCollateral(ctx, 250, proof, account, state));
    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1250U);
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 1000U);
    BOOST_CHECK_EQUAL(transfer.transfers.size(), 1U);
}

// =============================================================================
// Test 4: Borrow
// =============================================================================
BOOST_AUTO_TEST_CASE(borrow_fee_and_ledger)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));

    const uint64_t userBefore = transfer.Balance(ALICE_TOKENS);
    BOOST_CHECK(Borrow(BorrowPolicy::Open(), 400, state));

    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 400U);
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, clock.Now());
    BOOST_CHECK_EQUAL(treasury.totalFeesCollected, 4U);
    BOOST_CHECK_EQUAL(protocol.totalLoans, 400U);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, 9600U);
    BOOST_CHECK_EQUAL(protocol.utilizationRate, 4U);

    // Net amount leaves the lending pool
    BOOST_CHECK_EQUAL(transfer.Balance(ALICE_TOKENS), userBefore + 396);
    BOOST_CHECK(transfer.transfers.back().from == LENDING_POOL_ADDR);
    BOOST_CHECK_EQUAL(transfer.transfers.back().amount, 396U);

    // Collateral is not consumed
    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1000U);
}

BOOST_AUTO_TEST_CASE(borrow_conservation)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(5000, state));

    const uint64_t sumBefore = protocol.totalLoans + protocol.totalLiquidity;
    BOOST_REQUIRE(Borrow(BorrowPolicy::Open(), 1234, state));
    BOOST_CHECK_EQUAL(protocol.totalLoans + protocol.totalLiquidity, sumBefore);
}

BOOST_AUTO_TEST_CASE(borrow_small_amount_has_no_fee)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_CHECK(Borrow(BorrowPolicy::Open(), 99, state));
    BOOST_CHECK_EQUAL(treasury.totalFeesCollected, 0U);
    BOOST_CHECK_EQUAL(transfer.transfers.back().amount, 99U);
}

BOOST_AUTO_TEST_CASE(borrow_insufficient_collateral)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(300, state));

    BOOST_CHECK(!Borrow(BorrowPolicy::Open(), 301, state));
    BOOST_CHECK(GetLendError(state) == LendError::INSUFFICIENT_COLLATERAL);
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, 0);
    BOOST_CHECK_EQUAL(protocol.totalLoans, 0U);

    // Exactly covered
    CValidationState state2;
    BOOST_CHECK(Borrow(BorrowPolicy::Open(), 300, state2));
}

BOOST_AUTO_TEST_CASE(borrow_beyond_liquidity)
{
    protocol.totalLiquidity = 100;

    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_CHECK(!Borrow(BorrowPolicy::Open(), 101, state));
    BOOST_CHECK(GetLendError(state) == LendError::MATH_OVERFLOW);
    BOOST_CHECK_EQUAL(treasury.totalFeesCollected, 0U);
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
}

BOOST_AUTO_TEST_CASE(borrow_lock_time)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_REQUIRE(Borrow(BorrowPolicy::Open(), 100, state));

    // elapsed < lock
    clock.Advance(DEFAULT_MIN_COLLATERAL_LOCK_TIME - 1);
    BOOST_CHECK(!Borrow(BorrowPolicy::Open(), 100, state));
    BOOST_CHECK(GetLendError(state) == LendError::COLLATERAL_LOCK_TIME_NOT_MET);
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 100U);

    // elapsed == lock
    clock.Advance(1);
    CValidationState state2;
    BOOST_CHECK(Borrow(BorrowPolicy::Open(), 100, state2));
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 200U);
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, clock.Now());
}

BOOST_AUTO_TEST_CASE(borrow_clock_behind_timestamp)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_REQUIRE(Borrow(BorrowPolicy::Open(), 100, state));

    clock.nTime -= 10000;
    BOOST_CHECK(!Borrow(BorrowPolicy::Open(), 100, state));
    BOOST_CHECK(GetLendError(state) == LendError::COLLATERAL_LOCK_TIME_NOT_MET);
}

BOOST_AUTO_TEST_CASE(borrow_whitelisted)
{
    InstitutionalPool pool;
    pool.address = TestAddress(0x50);
    pool.poolOwner = TestAddress(0x51);
    pool.whitelist.push_back(BOB);

    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));

    BOOST_CHECK(!Borrow(BorrowPolicy::Whitelisted(pool), 100, state));
    BOOST_CHECK(GetLendError(state) == LendError::UNAUTHORIZED_BORROWER);
    BOOST_CHECK(account.encryptedBorrowed.IsZero());

    pool.whitelist.push_back(ALICE);
    CValidationState state2;
    BOOST_CHECK(Borrow(BorrowPolicy::Whitelisted(pool), 100, state2));
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 100U);
}

BOOST_AUTO_TEST_CASE(borrow_delegated_ceiling)
{
    DelegatedBorrower line;
    line.address = TestAddress(0x60);
    line.delegator = BOB;
    line.delegate = ALICE;
    line.maxBorrowAmount = 500;

    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));

    // max + 1
    BOOST_CHECK(!Borrow(BorrowPolicy::Delegated(line), 501, state));
    BOOST_CHECK(GetLendError(state) == LendError::BORROW_LIMIT_EXCEEDED);

    // == max
    CValidationState state2;
    BOOST_CHECK(Borrow(BorrowPolicy::Delegated(line), 500, state2));
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 500U);
}

BOOST_AUTO_TEST_CASE(borrow_delegated_wrong_delegate)
{
    DelegatedBorrower line;
    line.address = TestAddress(0x60);
    line.delegator = ALICE;
    line.delegate = BOB;
    line.maxBorrowAmount = 500;

    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_CHECK(!Borrow(BorrowPolicy::Delegated(line), 10, state));
    BOOST_CHECK(GetLendError(state) == LendError::UNAUTHORIZED_BORROWER);
}

BOOST_AUTO_TEST_CASE(borrow_transfer_failure_leaves_records)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));

    const BorrowerAccount accountBefore = account;
    const ProtocolState protocolBefore = protocol;
    transfer.fFail = true;

    BOOST_CHECK(!Borrow(BorrowPolicy::Open(), 400, state));
    BOOST_CHECK(GetLendError(state) == LendError::TRANSFER_FAILED);
    BOOST_CHECK(account.encryptedBorrowed == accountBefore.encryptedBorrowed);
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, accountBefore.nBorrowTimestamp);
    BOOST_CHECK_EQUAL(protocol.totalLoans, protocolBefore.totalLoans);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, protocolBefore.totalLiquidity);
    BOOST_CHECK_EQUAL(treasury.totalFeesCollected, 0U);
}

// =============================================================================
// Test 5: Repay
// =============================================================================
BOOST_AUTO_TEST_CASE(repay_completeness)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_REQUIRE(Borrow(BorrowPolicy::Open(), 400, state));
    clock.Advance(SECONDS_PER_YEAR);

    // principal + interest - 1
    BOOST_CHECK(!Repay(419, state));
    BOOST_CHECK(GetLendError(state) == LendError::REPAY_EXCEEDS_BORROW);
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 400U);

    CValidationState state2;
    BOOST_CHECK(Repay(420, state2));
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, 0);
    BOOST_CHECK_EQUAL(protocol.totalLoans, 0U);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, 10020U);
    BOOST_CHECK_EQUAL(protocol.utilizationRate, 0U);
    BOOST_CHECK_EQUAL(lendingPool.lenderRewards, 4U);

    BOOST_CHECK(transfer.transfers.back().from == ALICE_TOKENS);
    BOOST_CHECK(transfer.transfers.back().to == LENDING_POOL_ADDR);
    BOOST_CHECK_EQUAL(transfer.transfers.back().amount, 420U);
}

BOOST_AUTO_TEST_CASE(repay_overpay_kept_by_pool)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_REQUIRE(Borrow(BorrowPolicy::Open(), 400, state));

    // No time elapsed, no interest
    BOOST_CHECK(Repay(500, state));
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
    BOOST_CHECK_EQUAL(protocol.totalLoans, 0U);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, 10100U);
    BOOST_CHECK_EQUAL(lendingPool.lenderRewards, 5U);
}

BOOST_AUTO_TEST_CASE(repay_without_debt)
{
    CValidationState state;
    BOOST_CHECK(Repay(0, state));
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, 10000U);
}

BOOST_AUTO_TEST_CASE(repay_transfer_failure)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));
    BOOST_REQUIRE(Borrow(BorrowPolicy::Open(), 400, state));

    transfer.fFail = true;
    BOOST_CHECK(!Repay(400, state));
    BOOST_CHECK(GetLendError(state) == LendError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 400U);
    BOOST_CHECK_EQUAL(protocol.totalLoans, 400U);
    BOOST_CHECK_EQUAL(lendingPool.lenderRewards, 0U);
}

// =============================================================================
// Test 6: Liquidation gate
// =============================================================================
BOOST_AUTO_TEST_CASE(liquidate_funded_position_rejected)
{
    CValidationState state;
    BOOST_REQUIRE(Stake(1000, state));

    BOOST_CHECK(!ApplyLiquidate(ctx, proof, account, collateralPool, state));
    BOOST_CHECK(GetLendError(state) == LendError::LIQUIDATION_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1000U);
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 1000U);
}

BOOST_AUTO_TEST_CASE(liquidate_empty_position_seizes_nothing)
{
    collateralPool.totalCollateral = 700;
    account.encryptedBorrowed = EncryptedAmount(50);

    CValidationState state;
    BOOST_CHECK(ApplyLiquidate(ctx, proof, account, collateralPool, state));
    BOOST_CHECK(account.encryptedCollateral.IsZero());
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 700U);
    // Debt is untouched
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 50U);
}

BOOST_AUTO_TEST_CASE(liquidate_bad_proof)
{
    RejectingProofVerifier rejecting;
    LendContext badCtx(rejecting, transfer, clock);

    CValidationState state;
    BOOST_CHECK(!ApplyLiquidate(badCtx, proof, account, collateralPool, state));
    BOOST_CHECK(GetLendError(state) == LendError::INVALID_PROOF);
}

BOOST_AUTO_TEST_SUITE_END()

// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Lending Processor Tests - whole transactions against the ledger DB
 *
 * Tests:
 *   1. CLendTx envelope checks
 *   2. Initialize (single creation)
 *   3. Stake / borrow / repay end to end
 *   4. Atomicity on rejection, transfer failure and commit failure
 *   5. Institutional and delegated borrows
 *   6. Liquidation, governance, rebalance
 *   7. Raw decoding and metrics
 */

#include "consensus/validation.h"
#include "core_io.h"
#include "lending/lending.h"
#include "lending/lending_processor.h"
#include "lending/lendingdb.h"
#include "lending/metrics.h"
#include "streams.h"
#include "test/test_zklend.h"
#include "version.h"

#include <univalue.h>

#include <boost/test/unit_test.hpp>

namespace {

const uint256 PROTOCOL_ADDR = TestAddress(0x01);
const uint256 TREASURY_ADDR = TestAddress(0x02);
const uint256 LENDING_POOL_ADDR = TestAddress(0x03);
const uint256 COLLATERAL_POOL_ADDR = TestAddress(0x04);
const uint256 INSTITUTIONAL_POOL_ADDR = TestAddress(0x05);
const uint256 DELEGATION_ADDR = TestAddress(0x06);
const uint256 GOVERNANCE_ADDR = TestAddress(0x07);
const uint256 ALICE = TestAddress(0xa1);
const uint256 ALICE_TOKENS = TestAddress(0xa2);
const uint256 BOB = TestAddress(0xb1);
const uint256 BOB_TOKENS = TestAddress(0xb2);

const uint64_t SEED_LIQUIDITY = 10000;

/** In-memory ledger whose batch commits throw while fFailCommit is set. */
class FailingCommitDB : public CLendingDB
{
public:
    bool fFailCommit{false};

    FailingCommitDB() : CLendingDB(1 << 20, true) {}

protected:
    bool WriteBatch(CDBBatch& batch) override
    {
        if (fFailCommit) {
            throw dbwrapper_error("Fatal LevelDB error: IO error: disk full");
        }
        return CLendingDB::WriteBatch(batch);
    }
};

struct ProcessorSetup : public TestingSetup {
    CPlaceholderProofVerifier verifier;
    MockTokenTransfer transfer;
    MockClock clock;
    CLendingProcessor processor;

    ProcessorSetup() : processor(*g_lendingdb, verifier, transfer, clock)
    {
        transfer.Credit(ALICE_TOKENS, 100000);
        transfer.Credit(BOB_TOKENS, 100000);
        transfer.Credit(LENDING_POOL_ADDR, 100000);
    }

    CLendTx MakeTx(uint8_t nType, const uint256& signer) const
    {
        CLendTx tx;
        tx.nType = nType;
        tx.signer = signer;
        tx.protocolState = PROTOCOL_ADDR;
        tx.treasury = TREASURY_ADDR;
        tx.lendingPool = LENDING_POOL_ADDR;
        tx.collateralPool = COLLATERAL_POOL_ADDR;
        tx.institutionalPool = INSTITUTIONAL_POOL_ADDR;
        tx.delegation = DELEGATION_ADDR;
        tx.governance = GOVERNANCE_ADDR;
        tx.userTokenAccount = signer == BOB ? BOB_TOKENS : ALICE_TOKENS;
        tx.vchProof = {0xde, 0xad};
        return tx;
    }

    CLendTx MakeAmountTx(uint8_t nType, const uint256& signer, uint64_t nAmount) const
    {
        CLendTx tx = MakeTx(nType, signer);
        tx.nAmount = nAmount;
        return tx;
    }

    bool Process(const CLendTx& tx)
    {
        CValidationState state;
        return processor.ProcessTx(tx, state);
    }

    /** Initialize the protocol, seed liquidity and create the two pools. */
    void SetupLedger()
    {
        BOOST_REQUIRE(Process(MakeTx(CLendTx::INITIALIZE, ALICE)));

        ProtocolState protocol;
        BOOST_REQUIRE(g_lendingdb->ReadProtocolState(PROTOCOL_ADDR, protocol));
        protocol.totalLiquidity = SEED_LIQUIDITY;
        BOOST_REQUIRE(g_lendingdb->WriteProtocolState(protocol));

        LendingPool lendingPool;
        lendingPool.address = LENDING_POOL_ADDR;
        lendingPool.poolAuthority = TestAddress(0x30);
        lendingPool.totalLiquidity = SEED_LIQUIDITY;
        lendingPool.baseInterestRate = DEFAULT_BASE_INTEREST_RATE;
        BOOST_REQUIRE(g_lendingdb->WriteLendingPool(lendingPool));

        CollateralPool collateralPool;
        collateralPool.address = COLLATERAL_POOL_ADDR;
        collateralPool.assetMint = TestAddress(0x40);
        BOOST_REQUIRE(g_lendingdb->WriteCollateralPool(collateralPool));
    }

    ProtocolState ReadProtocol()
    {
        ProtocolState protocol;
        BOOST_REQUIRE(g_lendingdb->ReadProtocolState(PROTOCOL_ADDR, protocol));
        return protocol;
    }

    BorrowerAccount ReadAccount(const uint256& owner)
    {
        BorrowerAccount account;
        BOOST_REQUIRE(g_lendingdb->ReadBorrower(owner, account));
        return account;
    }

    /** Serialized image of every record a borrow or repay can touch. */
    std::string Snapshot(const uint256& owner)
    {
        CDataStream ss(SER_DISK, CLIENT_VERSION);
        ProtocolState protocol;
        ProtocolTreasury treasury;
        LendingPool lendingPool;
        CollateralPool collateralPool;
        BorrowerAccount account;
        ss << g_lendingdb->ReadProtocolState(PROTOCOL_ADDR, protocol) << protocol;
        ss << g_lendingdb->ReadTreasury(TREASURY_ADDR, treasury) << treasury;
        ss << g_lendingdb->ReadLendingPool(LENDING_POOL_ADDR, lendingPool) << lendingPool;
        ss << g_lendingdb->ReadCollateralPool(COLLATERAL_POOL_ADDR, collateralPool) << collateralPool;
        ss << g_lendingdb->ReadBorrower(owner, account) << account;
        return ss.str();
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(lending_processor_tests, ProcessorSetup)

// =============================================================================
// Test 1: CLendTx envelope checks
// =============================================================================
BOOST_AUTO_TEST_CASE(trivially_valid_checks)
{
    std::string strError;

    CLendTx tx = MakeTx(CLendTx::BORROW, ALICE);
    BOOST_CHECK(tx.IsTriviallyValid(strError));

    tx.nVersion = LENDTX_VERSION + 1;
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-version");

    tx = MakeTx(CLendTx::REBALANCE_COLLATERAL + 1, ALICE);
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-type");

    tx = MakeTx(CLendTx::BORROW, uint256());
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-null-signer");

    tx = MakeTx(CLendTx::BORROW, ALICE);
    tx.vchProof.assign(MAX_LENDTX_PROOF_SIZE + 1, 0x00);
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-proof-size");

    tx = MakeTx(CLendTx::BORROW, ALICE);
    tx.treasury.SetNull();
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-null-treasury");

    tx = MakeTx(CLendTx::DELEGATED_BORROW, ALICE);
    tx.delegation.SetNull();
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-null-delegation");

    // Liquidation needs a target
    tx = MakeTx(CLendTx::LIQUIDATE, ALICE);
    BOOST_CHECK(!tx.IsTriviallyValid(strError));
    BOOST_CHECK_EQUAL(strError, "bad-lendtx-null-borrower");

    // Rebalance declares nothing beyond the signer
    CLendTx rebalance;
    rebalance.nType = CLendTx::REBALANCE_COLLATERAL;
    rebalance.signer = ALICE;
    BOOST_CHECK(rebalance.IsTriviallyValid(strError));
}

BOOST_AUTO_TEST_CASE(malformed_tx_rejected)
{
    CLendTx tx = MakeTx(CLendTx::STAKE_COLLATERAL, ALICE);
    tx.collateralPool.SetNull();

    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(tx, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-lendtx-null-collateral-pool");
    BOOST_CHECK_EQUAL(g_lend_metrics.txMalformed.load(), 1U);
    BOOST_CHECK(g_lendingdb->IsEmpty());
}

BOOST_AUTO_TEST_CASE(type_names)
{
    BOOST_CHECK_EQUAL(LendTxTypeName(CLendTx::INITIALIZE), "initialize");
    BOOST_CHECK_EQUAL(LendTxTypeName(CLendTx::DELEGATED_BORROW), "delegated_borrow");
    BOOST_CHECK_EQUAL(LendTxTypeName(CLendTx::REBALANCE_COLLATERAL), "rebalance_collateral");
    BOOST_CHECK_EQUAL(LendTxTypeName(200), "unknown");
}

// =============================================================================
// Test 2: Initialize
// =============================================================================
BOOST_AUTO_TEST_CASE(initialize_once)
{
    BOOST_CHECK(Process(MakeTx(CLendTx::INITIALIZE, ALICE)));

    ProtocolState protocol = ReadProtocol();
    BOOST_CHECK_EQUAL(protocol.baseInterestRate, DEFAULT_BASE_INTEREST_RATE);
    BOOST_CHECK_EQUAL(protocol.minCollateralLockTime, DEFAULT_MIN_COLLATERAL_LOCK_TIME);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, 0U);

    ProtocolTreasury treasury;
    BOOST_CHECK(g_lendingdb->ReadTreasury(TREASURY_ADDR, treasury));
    BOOST_CHECK_EQUAL(treasury.totalFeesCollected, 0U);

    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeTx(CLendTx::INITIALIZE, BOB), state));
    BOOST_CHECK(GetLendError(state) == LendError::RECORD_EXISTS);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-lend-record-exists");
}

// =============================================================================
// Test 3: End to end
// =============================================================================
BOOST_AUTO_TEST_CASE(stake_borrow_repay_end_to_end)
{
    SetupLedger();

    // Stake opens the account
    BOOST_CHECK(!g_lendingdb->HaveBorrower(ALICE));
    BOOST_CHECK(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));
    BorrowerAccount account = ReadAccount(ALICE);
    BOOST_CHECK(account.owner == ALICE);
    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1000U);

    CollateralPool collateralPool;
    BOOST_CHECK(g_lendingdb->ReadCollateralPool(COLLATERAL_POOL_ADDR, collateralPool));
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 1000U);

    // Borrow 400: fee 4, net 396
    const uint64_t tokensBefore = transfer.Balance(ALICE_TOKENS);
    BOOST_CHECK(Process(MakeAmountTx(CLendTx::BORROW, ALICE, 400)));
    account = ReadAccount(ALICE);
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 400U);
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, clock.Now());
    BOOST_CHECK_EQUAL(transfer.Balance(ALICE_TOKENS), tokensBefore + 396);

    ProtocolState protocol = ReadProtocol();
    BOOST_CHECK_EQUAL(protocol.totalLoans, 400U);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, SEED_LIQUIDITY - 400);

    ProtocolTreasury treasury;
    BOOST_CHECK(g_lendingdb->ReadTreasury(TREASURY_ADDR, treasury));
    BOOST_CHECK_EQUAL(treasury.totalFeesCollected, 4U);

    // One year later: 5% interest
    clock.Advance(31536000);
    BOOST_CHECK(Process(MakeAmountTx(CLendTx::REPAY, ALICE, 420)));
    account = ReadAccount(ALICE);
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, 0);
    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1000U);

    protocol = ReadProtocol();
    BOOST_CHECK_EQUAL(protocol.totalLoans, 0U);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, SEED_LIQUIDITY + 20);
    BOOST_CHECK_EQUAL(protocol.utilizationRate, 0U);

    LendingPool lendingPool;
    BOOST_CHECK(g_lendingdb->ReadLendingPool(LENDING_POOL_ADDR, lendingPool));
    BOOST_CHECK_EQUAL(lendingPool.lenderRewards, 4U);

    BOOST_CHECK_EQUAL(g_lend_metrics.txApplied.load(), 4U);
    BOOST_CHECK_EQUAL(g_lend_metrics.borrows.load(), 1U);
    BOOST_CHECK_EQUAL(g_lend_metrics.repays.load(), 1U);
    BOOST_CHECK_EQUAL(g_lend_metrics.volumeBorrowed.load(), 400U);
    BOOST_CHECK_EQUAL(g_lend_metrics.volumeRepaid.load(), 420U);
    BOOST_CHECK_EQUAL(g_lend_metrics.lastTxTime.load(), clock.Now());
}

BOOST_AUTO_TEST_CASE(short_repay_rejected)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::BORROW, ALICE, 400)));
    clock.Advance(31536000);

    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::REPAY, ALICE, 419), state));
    BOOST_CHECK(GetLendError(state) == LendError::REPAY_EXCEEDS_BORROW);
    BOOST_CHECK_EQUAL(ReadAccount(ALICE).encryptedBorrowed.Reveal(), 400U);
    BOOST_CHECK_EQUAL(g_lend_metrics.txRejected.load(), 1U);
}

// =============================================================================
// Test 4: Atomicity
// =============================================================================
BOOST_AUTO_TEST_CASE(rejected_borrow_writes_nothing)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 300)));

    const std::string before = Snapshot(ALICE);
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 301), state));
    BOOST_CHECK(GetLendError(state) == LendError::INSUFFICIENT_COLLATERAL);
    BOOST_CHECK(Snapshot(ALICE) == before);
}

BOOST_AUTO_TEST_CASE(failed_transfer_writes_nothing)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));

    const std::string before = Snapshot(ALICE);
    const size_t nTransfers = transfer.transfers.size();
    transfer.fFail = true;

    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 400), state));
    BOOST_CHECK(GetLendError(state) == LendError::TRANSFER_FAILED);
    BOOST_CHECK(Snapshot(ALICE) == before);
    BOOST_CHECK_EQUAL(transfer.transfers.size(), nTransfers);

    // The pool cannot pay out more than it holds
    transfer.fFail = false;
    transfer.balances[LENDING_POOL_ADDR] = 100;
    CValidationState state2;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 400), state2));
    BOOST_CHECK(GetLendError(state2) == LendError::TRANSFER_FAILED);
    BOOST_CHECK(Snapshot(ALICE) == before);
}

BOOST_AUTO_TEST_CASE(failed_commit_reverses_transfer)
{
    FailingCommitDB failingDb;
    CLendingProcessor failingProcessor(failingDb, verifier, transfer, clock);

    CValidationState initState;
    BOOST_REQUIRE(failingProcessor.ProcessTx(MakeTx(CLendTx::INITIALIZE, ALICE), initState));
    ProtocolState protocol;
    BOOST_REQUIRE(failingDb.ReadProtocolState(PROTOCOL_ADDR, protocol));
    protocol.totalLiquidity = SEED_LIQUIDITY;
    BOOST_REQUIRE(failingDb.WriteProtocolState(protocol));
    LendingPool lendingPool;
    lendingPool.address = LENDING_POOL_ADDR;
    BOOST_REQUIRE(failingDb.WriteLendingPool(lendingPool));
    CollateralPool collateralPool;
    collateralPool.address = COLLATERAL_POOL_ADDR;
    BOOST_REQUIRE(failingDb.WriteCollateralPool(collateralPool));

    CValidationState stakeState;
    BOOST_REQUIRE(failingProcessor.ProcessTx(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000), stakeState));

    const uint64_t nUserBefore = transfer.Balance(ALICE_TOKENS);
    const uint64_t nPoolBefore = transfer.Balance(LENDING_POOL_ADDR);
    const uint64_t nEscrowBefore = transfer.Balance(COLLATERAL_POOL_ADDR);
    failingDb.fFailCommit = true;

    // Borrow: 396 paid out, then handed back
    CValidationState state;
    BOOST_CHECK(!failingProcessor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 400), state));
    BOOST_CHECK(state.IsError());
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "lend-db-commit");
    BOOST_CHECK_EQUAL(transfer.Balance(ALICE_TOKENS), nUserBefore);
    BOOST_CHECK_EQUAL(transfer.Balance(LENDING_POOL_ADDR), nPoolBefore);
    BOOST_REQUIRE(!transfer.transfers.empty());
    const MockTokenTransfer::Transfer& reversal = transfer.transfers.back();
    BOOST_CHECK(reversal.from == ALICE_TOKENS);
    BOOST_CHECK(reversal.to == LENDING_POOL_ADDR);
    BOOST_CHECK_EQUAL(reversal.amount, 396U);

    BorrowerAccount account;
    BOOST_REQUIRE(failingDb.ReadBorrower(ALICE, account));
    BOOST_CHECK(account.encryptedBorrowed.IsZero());
    BOOST_CHECK_EQUAL(account.nBorrowTimestamp, 0);
    BOOST_REQUIRE(failingDb.ReadProtocolState(PROTOCOL_ADDR, protocol));
    BOOST_CHECK_EQUAL(protocol.totalLoans, 0U);
    BOOST_CHECK_EQUAL(protocol.totalLiquidity, SEED_LIQUIDITY);

    // Stake: escrowed tokens come back too
    CValidationState state2;
    BOOST_CHECK(!failingProcessor.ProcessTx(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 500), state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "lend-db-commit");
    BOOST_CHECK_EQUAL(transfer.Balance(ALICE_TOKENS), nUserBefore);
    BOOST_CHECK_EQUAL(transfer.Balance(COLLATERAL_POOL_ADDR), nEscrowBefore);
    BOOST_REQUIRE(failingDb.ReadBorrower(ALICE, account));
    BOOST_CHECK_EQUAL(account.encryptedCollateral.Reveal(), 1000U);

    BOOST_CHECK_EQUAL(g_lend_metrics.dbErrors.load(), 2U);
    BOOST_CHECK_EQUAL(g_lend_metrics.txApplied.load(), 2U);

    // Storage back: the same borrow goes through
    failingDb.fFailCommit = false;
    CValidationState state3;
    BOOST_CHECK(failingProcessor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 400), state3));
    BOOST_CHECK_EQUAL(transfer.Balance(ALICE_TOKENS), nUserBefore + 396);
    BOOST_REQUIRE(failingDb.ReadBorrower(ALICE, account));
    BOOST_CHECK_EQUAL(account.encryptedBorrowed.Reveal(), 400U);
}

BOOST_AUTO_TEST_CASE(flash_loan_lock_end_to_end)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::BORROW, ALICE, 100)));

    clock.Advance(DEFAULT_MIN_COLLATERAL_LOCK_TIME - 1);
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 100), state));
    BOOST_CHECK(GetLendError(state) == LendError::COLLATERAL_LOCK_TIME_NOT_MET);

    clock.Advance(1);
    BOOST_CHECK(Process(MakeAmountTx(CLendTx::BORROW, ALICE, 100)));
    BOOST_CHECK_EQUAL(ReadAccount(ALICE).encryptedBorrowed.Reveal(), 200U);
}

BOOST_AUTO_TEST_CASE(missing_records)
{
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 10), state));
    BOOST_CHECK(GetLendError(state) == LendError::RECORD_MISSING);

    // Borrow without a prior stake
    SetupLedger();
    CValidationState state2;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, BOB, 10), state2));
    BOOST_CHECK(GetLendError(state2) == LendError::RECORD_MISSING);
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-lend-record-missing");

    CValidationState state3;
    BOOST_CHECK(!processor.ProcessTx(MakeTx(CLendTx::VOTE, BOB), state3));
    BOOST_CHECK(GetLendError(state3) == LendError::RECORD_MISSING);
}

// =============================================================================
// Test 5: Institutional and delegated borrows
// =============================================================================
BOOST_AUTO_TEST_CASE(institutional_borrow)
{
    SetupLedger();
    InstitutionalPool pool;
    pool.address = INSTITUTIONAL_POOL_ADDR;
    pool.poolOwner = TestAddress(0x51);
    pool.whitelist = {BOB};
    BOOST_REQUIRE(g_lendingdb->WriteInstitutionalPool(pool));

    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, BOB, 1000)));

    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::INSTITUTIONAL_BORROW, ALICE, 100), state));
    BOOST_CHECK(GetLendError(state) == LendError::UNAUTHORIZED_BORROWER);

    BOOST_CHECK(Process(MakeAmountTx(CLendTx::INSTITUTIONAL_BORROW, BOB, 100)));
    BOOST_CHECK_EQUAL(ReadAccount(BOB).encryptedBorrowed.Reveal(), 100U);
    BOOST_CHECK(ReadAccount(ALICE).encryptedBorrowed.IsZero());
}

BOOST_AUTO_TEST_CASE(delegated_borrow_charges_delegate)
{
    SetupLedger();
    DelegatedBorrower line;
    line.address = DELEGATION_ADDR;
    line.delegator = ALICE;
    line.delegate = BOB;
    line.maxBorrowAmount = 500;
    BOOST_REQUIRE(g_lendingdb->WriteDelegation(line));

    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, BOB, 1000)));

    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::DELEGATED_BORROW, BOB, 501), state));
    BOOST_CHECK(GetLendError(state) == LendError::BORROW_LIMIT_EXCEEDED);

    CValidationState state2;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::DELEGATED_BORROW, ALICE, 10), state2));
    BOOST_CHECK(GetLendError(state2) == LendError::UNAUTHORIZED_BORROWER);

    BOOST_CHECK(Process(MakeAmountTx(CLendTx::DELEGATED_BORROW, BOB, 500)));
    BOOST_CHECK_EQUAL(ReadAccount(BOB).encryptedBorrowed.Reveal(), 500U);
    BOOST_CHECK(ReadAccount(ALICE).encryptedBorrowed.IsZero());
}

// =============================================================================
// Test 6: Liquidation, governance, rebalance
// =============================================================================
BOOST_AUTO_TEST_CASE(liquidation_gate)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));

    CLendTx tx = MakeTx(CLendTx::LIQUIDATE, BOB);
    tx.borrower = ALICE;
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(tx, state));
    BOOST_CHECK(GetLendError(state) == LendError::LIQUIDATION_NOT_ALLOWED);

    // An empty position passes and loses nothing
    BorrowerAccount empty;
    empty.owner = TestAddress(0xee);
    empty.encryptedBorrowed = EncryptedAmount(70);
    BOOST_REQUIRE(g_lendingdb->WriteBorrower(empty));
    tx.borrower = empty.owner;
    BOOST_CHECK(Process(tx));
    BOOST_CHECK_EQUAL(ReadAccount(empty.owner).encryptedBorrowed.Reveal(), 70U);
    BOOST_CHECK_EQUAL(g_lend_metrics.liquidations.load(), 1U);
}

BOOST_AUTO_TEST_CASE(governance_round)
{
    InstitutionalPool pool;
    pool.address = INSTITUTIONAL_POOL_ADDR;
    pool.whitelist = {ALICE};
    BOOST_REQUIRE(g_lendingdb->WriteInstitutionalPool(pool));

    // First proposal creates the record
    CLendTx propose = MakeTx(CLendTx::PROPOSE_CHANGE, BOB);
    propose.nProposalType = 1;
    propose.nNewValue = 8;
    BOOST_CHECK(Process(propose));

    Governance governance;
    BOOST_REQUIRE(g_lendingdb->ReadGovernance(GOVERNANCE_ADDR, governance));
    BOOST_CHECK_EQUAL(governance.proposalId, 1U);
    BOOST_CHECK_EQUAL(governance.newValue, 8U);

    CLendTx vote = MakeTx(CLendTx::VOTE, ALICE);
    vote.nProposalId = 1;
    vote.fVote = true;
    BOOST_CHECK(Process(vote));
    BOOST_CHECK(Process(vote));

    CLendTx outsider = vote;
    outsider.signer = BOB;
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(outsider, state));
    BOOST_CHECK(GetLendError(state) == LendError::UNAUTHORIZED_VOTER);

    BOOST_REQUIRE(g_lendingdb->ReadGovernance(GOVERNANCE_ADDR, governance));
    BOOST_CHECK_EQUAL(governance.votes, 2);

    // Second proposal supersedes
    BOOST_CHECK(Process(propose));
    CValidationState state2;
    BOOST_CHECK(!processor.ProcessTx(vote, state2));
    BOOST_CHECK(GetLendError(state2) == LendError::INVALID_PROPOSAL);

    BOOST_REQUIRE(g_lendingdb->ReadGovernance(GOVERNANCE_ADDR, governance));
    BOOST_CHECK_EQUAL(governance.proposalId, 2U);
    BOOST_CHECK_EQUAL(governance.votes, 0);
    BOOST_CHECK_EQUAL(g_lend_metrics.proposals.load(), 2U);
    BOOST_CHECK_EQUAL(g_lend_metrics.votes.load(), 2U);
}

BOOST_AUTO_TEST_CASE(rebalance_updates_account_only)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));

    BOOST_CHECK(Process(MakeAmountTx(CLendTx::REBALANCE_COLLATERAL, ALICE, 500)));
    BOOST_CHECK_EQUAL(ReadAccount(ALICE).encryptedCollateral.Reveal(), 1500U);

    CollateralPool collateralPool;
    BOOST_CHECK(g_lendingdb->ReadCollateralPool(COLLATERAL_POOL_ADDR, collateralPool));
    BOOST_CHECK_EQUAL(collateralPool.totalCollateral, 1000U);

    // Unknown account
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::REBALANCE_COLLATERAL, BOB, 1), state));
    BOOST_CHECK(GetLendError(state) == LendError::RECORD_MISSING);
}

BOOST_AUTO_TEST_CASE(invalid_proof_rejected)
{
    SetupLedger();
    RejectingProofVerifier rejecting;
    CLendingProcessor strict(*g_lendingdb, rejecting, transfer, clock);

    CValidationState state;
    BOOST_CHECK(!strict.ProcessTx(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000), state));
    BOOST_CHECK(GetLendError(state) == LendError::INVALID_PROOF);
    BOOST_CHECK(!g_lendingdb->HaveBorrower(ALICE));
}

// =============================================================================
// Test 7: Raw decoding and metrics
// =============================================================================
BOOST_AUTO_TEST_CASE(raw_tx_decoding)
{
    SetupLedger();

    CDataStream ss(SER_NETWORK, CLIENT_VERSION);
    ss << MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000);
    std::vector<unsigned char> vchTx(ss.begin(), ss.end());

    CValidationState state;
    BOOST_CHECK(processor.ProcessRawTx(vchTx, state));
    BOOST_CHECK_EQUAL(ReadAccount(ALICE).encryptedCollateral.Reveal(), 1000U);

    // Truncated
    std::vector<unsigned char> vchShort(vchTx.begin(), vchTx.begin() + vchTx.size() / 2);
    CValidationState state2;
    BOOST_CHECK(!processor.ProcessRawTx(vchShort, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-lendtx-decode");

    // Trailing garbage
    vchTx.push_back(0x00);
    CValidationState state3;
    BOOST_CHECK(!processor.ProcessRawTx(vchTx, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "bad-lendtx-trailing-data");
    BOOST_CHECK_EQUAL(ReadAccount(ALICE).encryptedCollateral.Reveal(), 1000U);
}

BOOST_AUTO_TEST_CASE(lendtx_json)
{
    CLendTx tx = MakeAmountTx(CLendTx::BORROW, ALICE, 400);
    UniValue entry(UniValue::VOBJ);
    LendTxToUniv(tx, entry);

    BOOST_CHECK_EQUAL(entry["type_name"].get_str(), "borrow");
    BOOST_CHECK_EQUAL(entry["signer"].get_str(), ALICE.GetHex());
    BOOST_CHECK_EQUAL(entry["amount"].get_int64(), 400);
    BOOST_CHECK_EQUAL(entry["proof"].get_str(), "dead");
    BOOST_CHECK(entry["borrower"].isNull());
}

BOOST_AUTO_TEST_CASE(metrics_json)
{
    SetupLedger();
    BOOST_REQUIRE(Process(MakeAmountTx(CLendTx::STAKE_COLLATERAL, ALICE, 1000)));
    CValidationState state;
    BOOST_CHECK(!processor.ProcessTx(MakeAmountTx(CLendTx::BORROW, ALICE, 5000), state));

    UniValue json = g_lend_metrics.ToJSON();
    BOOST_CHECK_EQUAL(json["transactions"]["applied"].get_int64(), 2);
    BOOST_CHECK_EQUAL(json["transactions"]["rejected"].get_int64(), 1);
    BOOST_CHECK_EQUAL(json["operations"]["stakes"].get_int64(), 1);
    BOOST_CHECK_EQUAL(json["operations"]["borrows"].get_int64(), 0);

    g_lend_metrics.Reset();
    BOOST_CHECK_EQUAL(g_lend_metrics.ToJSON()["transactions"]["applied"].get_int64(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/lending_processor.h"

#include "consensus/validation.h"
#include "lending/lending_logic.h"
#include "lending/lendingdb.h"
#include "lending/metrics.h"
#include "logging.h"
#include "streams.h"

// Global metrics instance
LendMetrics g_lend_metrics;

namespace {

bool MissingRecord(CValidationState& state, const char* what, const uint256& address)
{
    LogPrint(BCLog::PROC, "LendingProcessor: REJECT missing %s record %s\n", what, address.ToString());
    return LendReject(state, LendError::RECORD_MISSING, what);
}

} // anonymous namespace

// =============================================================================
// CLendTx
// =============================================================================

std::string LendTxTypeName(uint8_t nType)
{
    switch (nType) {
    case CLendTx::INITIALIZE: return "initialize";
    case CLendTx::STAKE_COLLATERAL: return "stake_collateral";
    case CLendTx::BORROW: return "borrow";
    case CLendTx::INSTITUTIONAL_BORROW: return "institutional_borrow";
    case CLendTx::DELEGATED_BORROW: return "delegated_borrow";
    case CLendTx::REPAY: return "repay";
    case CLendTx::LIQUIDATE: return "liquidate";
    case CLendTx::PROPOSE_CHANGE: return "propose_change";
    case CLendTx::VOTE: return "vote";
    case CLendTx::REBALANCE_COLLATERAL: return "rebalance_collateral";
    }
    return "unknown";
}

bool CLendTx::IsTriviallyValid(std::string& strError) const
{
    if (nVersion < MIN_LENDTX_VERSION || nVersion > LENDTX_VERSION) {
        strError = "bad-lendtx-version";
        return false;
    }
    if (nType > REBALANCE_COLLATERAL) {
        strError = "bad-lendtx-type";
        return false;
    }
    if (signer.IsNull()) {
        strError = "bad-lendtx-null-signer";
        return false;
    }
    if (vchProof.size() > MAX_LENDTX_PROOF_SIZE) {
        strError = "bad-lendtx-proof-size";
        return false;
    }

    const bool fBorrow = nType == BORROW || nType == INSTITUTIONAL_BORROW || nType == DELEGATED_BORROW;

    if ((nType == INITIALIZE || fBorrow || nType == REPAY) && protocolState.IsNull()) {
        strError = "bad-lendtx-null-protocol";
        return false;
    }
    if ((nType == INITIALIZE || fBorrow) && treasury.IsNull()) {
        strError = "bad-lendtx-null-treasury";
        return false;
    }
    if ((fBorrow || nType == REPAY) && lendingPool.IsNull()) {
        strError = "bad-lendtx-null-lending-pool";
        return false;
    }
    if ((nType == STAKE_COLLATERAL || nType == LIQUIDATE) && collateralPool.IsNull()) {
        strError = "bad-lendtx-null-collateral-pool";
        return false;
    }
    if ((nType == INSTITUTIONAL_BORROW || nType == VOTE) && institutionalPool.IsNull()) {
        strError = "bad-lendtx-null-institutional-pool";
        return false;
    }
    if (nType == DELEGATED_BORROW && delegation.IsNull()) {
        strError = "bad-lendtx-null-delegation";
        return false;
    }
    if ((nType == PROPOSE_CHANGE || nType == VOTE) && governance.IsNull()) {
        strError = "bad-lendtx-null-governance";
        return false;
    }
    if (nType == LIQUIDATE && borrower.IsNull()) {
        strError = "bad-lendtx-null-borrower";
        return false;
    }
    if ((nType == STAKE_COLLATERAL || fBorrow || nType == REPAY) && userTokenAccount.IsNull()) {
        strError = "bad-lendtx-null-token-account";
        return false;
    }
    return true;
}

// =============================================================================
// CLendingProcessor
// =============================================================================

CLendingProcessor::CLendingProcessor(CLendingDB& dbIn,
                                     const ProofVerifier& verifier,
                                     TokenTransfer& transfer,
                                     const LendClock& clock)
    : db(dbIn), ctx(verifier, transfer, clock)
{
}

bool CLendingProcessor::ProcessRawTx(const std::vector<unsigned char>& vchTx, CValidationState& state)
{
    CLendTx tx;
    try {
        CDataStream ss(vchTx, SER_NETWORK, CLIENT_VERSION);
        ss >> tx;
        if (!ss.empty()) {
            g_lend_metrics.txMalformed++;
            return state.DoS(100, false, REJECT_MALFORMED, "bad-lendtx-trailing-data");
        }
    } catch (const std::exception& e) {
        g_lend_metrics.txMalformed++;
        LogPrint(BCLog::PROC, "LendingProcessor: undecodable tx (%u bytes): %s\n", vchTx.size(), e.what());
        return state.DoS(100, false, REJECT_MALFORMED, "bad-lendtx-decode", false, e.what());
    }
    return ProcessTx(tx, state);
}

bool CLendingProcessor::ProcessTx(const CLendTx& tx, CValidationState& state)
{
    std::string strError;
    if (!tx.IsTriviallyValid(strError)) {
        g_lend_metrics.txMalformed++;
        LogPrint(BCLog::PROC, "LendingProcessor: REJECT %s: %s\n", LendTxTypeName(tx.nType), strError);
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    std::lock_guard<std::mutex> lock(cs_process);

    LogPrint(BCLog::PROC, "LendingProcessor: processing %s signer=%s\n",
             LendTxTypeName(tx.nType), tx.signer.ToString().substr(0, 16));

    bool fOk = false;
    try {
        switch (tx.nType) {
        case CLendTx::INITIALIZE:
            fOk = ProcessInitialize(tx, state);
            break;
        case CLendTx::STAKE_COLLATERAL:
            fOk = ProcessStake(tx, state);
            break;
        case CLendTx::BORROW:
        case CLendTx::INSTITUTIONAL_BORROW:
        case CLendTx::DELEGATED_BORROW:
            fOk = ProcessBorrow(tx, state);
            break;
        case CLendTx::REPAY:
            fOk = ProcessRepay(tx, state);
            break;
        case CLendTx::LIQUIDATE:
            fOk = ProcessLiquidate(tx, state);
            break;
        case CLendTx::PROPOSE_CHANGE:
            fOk = ProcessProposeChange(tx, state);
            break;
        case CLendTx::VOTE:
            fOk = ProcessVote(tx, state);
            break;
        case CLendTx::REBALANCE_COLLATERAL:
            fOk = ProcessRebalance(tx, state);
            break;
        }
    } catch (const dbwrapper_error& e) {
        g_lend_metrics.dbErrors++;
        LogPrintf("ERROR: LendingProcessor: %s failed on storage: %s\n", LendTxTypeName(tx.nType), e.what());
        return state.Error("lend-db-error");
    }

    if (!fOk) {
        g_lend_metrics.txRejected++;
        LogPrint(BCLog::PROC, "LendingProcessor: REJECT %s: %s\n", LendTxTypeName(tx.nType), FormatStateMessage(state));
        return false;
    }

    g_lend_metrics.txApplied++;
    g_lend_metrics.lastTxTime = ctx.clock.Now();
    return true;
}

bool CLendingProcessor::CommitTx(const CLendTx& tx, CLendingDB::Batch& batch, const CTokenMove& moved, CValidationState& state)
{
    bool fCommitted = false;
    std::string strDbError = "batch write refused";
    try {
        fCommitted = batch.Commit();
    } catch (const dbwrapper_error& e) {
        strDbError = e.what();
    }
    if (fCommitted) {
        return true;
    }

    g_lend_metrics.dbErrors++;
    LogPrintf("ERROR: LendingProcessor: %s commit failed: %s\n", LendTxTypeName(tx.nType), strDbError);

    // Ledger records are unchanged, so the tokens go back
    if (!moved.IsNull()) {
        std::string strError;
        if (ctx.transfer.Move(moved.to, moved.from, moved.amount, strError)) {
            LogPrintf("LendingProcessor: reversed transfer of %llu from %s to %s\n",
                      (unsigned long long)moved.amount, moved.from.ToString(), moved.to.ToString());
        } else {
            LogPrintf("ERROR: LendingProcessor: could not reverse transfer of %llu from %s to %s: %s\n",
                      (unsigned long long)moved.amount, moved.from.ToString(), moved.to.ToString(), strError);
        }
    }
    return state.Error("lend-db-commit");
}

bool CLendingProcessor::ProcessInitialize(const CLendTx& tx, CValidationState& state)
{
    if (db.HaveRecord(DB_PROTOCOL_STATE, tx.protocolState)) {
        return LendReject(state, LendError::RECORD_EXISTS, "protocol state");
    }
    if (db.HaveRecord(DB_TREASURY, tx.treasury)) {
        return LendReject(state, LendError::RECORD_EXISTS, "treasury");
    }

    ProtocolState protocol;
    ProtocolTreasury treasury;
    InitializeProtocol(tx.protocolState, tx.treasury, protocol, treasury);

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteProtocolState(protocol);
    batch.WriteTreasury(treasury);
    if (!CommitTx(tx, batch, CTokenMove(), state)) {
        return false;
    }
    return true;
}

bool CLendingProcessor::ProcessStake(const CLendTx& tx, CValidationState& state)
{
    CollateralPool pool;
    if (!db.ReadCollateralPool(tx.collateralPool, pool)) {
        return MissingRecord(state, "collateral pool", tx.collateralPool);
    }

    BorrowerAccount account;
    if (!db.ReadBorrower(tx.signer, account)) {
        // First stake opens the account
        account.SetNull();
        account.owner = tx.signer;
        LogPrint(BCLog::PROC, "LendingProcessor: opening borrower account %s\n", tx.signer.ToString());
    }

    CTokenMove moved;
    if (!ApplyStakeCollateral(ctx, tx.userTokenAccount, tx.nAmount, tx.vchProof, account, pool, state, &moved)) {
        return false;
    }

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteBorrower(account);
    batch.WriteCollateralPool(pool);
    if (!CommitTx(tx, batch, moved, state)) {
        return false;
    }
    g_lend_metrics.stakes++;
    return true;
}

bool CLendingProcessor::ProcessBorrow(const CLendTx& tx, CValidationState& state)
{
    ProtocolState protocol;
    if (!db.ReadProtocolState(tx.protocolState, protocol)) {
        return MissingRecord(state, "protocol state", tx.protocolState);
    }
    ProtocolTreasury treasury;
    if (!db.ReadTreasury(tx.treasury, treasury)) {
        return MissingRecord(state, "treasury", tx.treasury);
    }
    LendingPool lendingPool;
    if (!db.ReadLendingPool(tx.lendingPool, lendingPool)) {
        return MissingRecord(state, "lending pool", tx.lendingPool);
    }
    BorrowerAccount account;
    if (!db.ReadBorrower(tx.signer, account)) {
        return MissingRecord(state, "borrower", tx.signer);
    }

    InstitutionalPool institutionalPool;
    DelegatedBorrower delegation;
    BorrowPolicy policy = BorrowPolicy::Open();
    if (tx.nType == CLendTx::INSTITUTIONAL_BORROW) {
        if (!db.ReadInstitutionalPool(tx.institutionalPool, institutionalPool)) {
            return MissingRecord(state, "institutional pool", tx.institutionalPool);
        }
        policy = BorrowPolicy::Whitelisted(institutionalPool);
    } else if (tx.nType == CLendTx::DELEGATED_BORROW) {
        if (!db.ReadDelegation(tx.delegation, delegation)) {
            return MissingRecord(state, "delegation", tx.delegation);
        }
        policy = BorrowPolicy::Delegated(delegation);
    }

    CTokenMove moved;
    if (!ApplyBorrow(ctx, policy, tx.userTokenAccount, tx.nAmount, tx.vchProof,
                     account, lendingPool, protocol, treasury, state, &moved)) {
        return false;
    }

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteBorrower(account);
    batch.WriteProtocolState(protocol);
    batch.WriteTreasury(treasury);
    if (!CommitTx(tx, batch, moved, state)) {
        return false;
    }
    g_lend_metrics.borrows++;
    g_lend_metrics.volumeBorrowed += tx.nAmount;
    return true;
}

bool CLendingProcessor::ProcessRepay(const CLendTx& tx, CValidationState& state)
{
    ProtocolState protocol;
    if (!db.ReadProtocolState(tx.protocolState, protocol)) {
        return MissingRecord(state, "protocol state", tx.protocolState);
    }
    LendingPool lendingPool;
    if (!db.ReadLendingPool(tx.lendingPool, lendingPool)) {
        return MissingRecord(state, "lending pool", tx.lendingPool);
    }
    BorrowerAccount account;
    if (!db.ReadBorrower(tx.signer, account)) {
        return MissingRecord(state, "borrower", tx.signer);
    }

    CTokenMove moved;
    if (!ApplyRepay(ctx, tx.userTokenAccount, tx.nAmount, account, lendingPool, protocol, state, &moved)) {
        return false;
    }

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteBorrower(account);
    batch.WriteLendingPool(lendingPool);
    batch.WriteProtocolState(protocol);
    if (!CommitTx(tx, batch, moved, state)) {
        return false;
    }
    g_lend_metrics.repays++;
    g_lend_metrics.volumeRepaid += tx.nAmount;
    return true;
}

bool CLendingProcessor::ProcessLiquidate(const CLendTx& tx, CValidationState& state)
{
    CollateralPool pool;
    if (!db.ReadCollateralPool(tx.collateralPool, pool)) {
        return MissingRecord(state, "collateral pool", tx.collateralPool);
    }
    BorrowerAccount account;
    if (!db.ReadBorrower(tx.borrower, account)) {
        return MissingRecord(state, "borrower", tx.borrower);
    }

    if (!ApplyLiquidate(ctx, tx.vchProof, account, pool, state)) {
        return false;
    }

    LogPrint(BCLog::PROC, "LendingProcessor: liquidator=%s borrower=%s\n",
             tx.signer.ToString().substr(0, 16), tx.borrower.ToString().substr(0, 16));

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteBorrower(account);
    batch.WriteCollateralPool(pool);
    if (!CommitTx(tx, batch, CTokenMove(), state)) {
        return false;
    }
    g_lend_metrics.liquidations++;
    return true;
}

bool CLendingProcessor::ProcessProposeChange(const CLendTx& tx, CValidationState& state)
{
    Governance governance;
    if (!db.ReadGovernance(tx.governance, governance)) {
        // First proposal creates the governance record
        governance.SetNull();
        governance.address = tx.governance;
    }

    if (!ApplyProposeChange(tx.nProposalType, tx.nNewValue, governance, state)) {
        return false;
    }

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteGovernance(governance);
    if (!CommitTx(tx, batch, CTokenMove(), state)) {
        return false;
    }
    g_lend_metrics.proposals++;
    return true;
}

bool CLendingProcessor::ProcessVote(const CLendTx& tx, CValidationState& state)
{
    Governance governance;
    if (!db.ReadGovernance(tx.governance, governance)) {
        return MissingRecord(state, "governance", tx.governance);
    }
    InstitutionalPool pool;
    if (!db.ReadInstitutionalPool(tx.institutionalPool, pool)) {
        return MissingRecord(state, "institutional pool", tx.institutionalPool);
    }

    if (!ApplyVote(pool, tx.signer, tx.nProposalId, tx.fVote, governance, state)) {
        return false;
    }

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteGovernance(governance);
    if (!CommitTx(tx, batch, CTokenMove(), state)) {
        return false;
    }
    g_lend_metrics.votes++;
    return true;
}

bool CLendingProcessor::ProcessRebalance(const CLendTx& tx, CValidationState& state)
{
    BorrowerAccount account;
    if (!db.ReadBorrower(tx.signer, account)) {
        return MissingRecord(state, "borrower", tx.signer);
    }

    if (!ApplyRebalanceCollateral(ctx, tx.nAmount, tx.vchProof, account, state)) {
        return false;
    }

    CLendingDB::Batch batch = db.CreateBatch();
    batch.WriteBorrower(account);
    if (!CommitTx(tx, batch, CTokenMove(), state)) {
        return false;
    }
    g_lend_metrics.rebalances++;
    return true;
}

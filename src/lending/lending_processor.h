// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_PROCESSOR_H
#define ZKLEND_LENDING_PROCESSOR_H

/**
 * Lending transaction runtime
 *
 * A CLendTx names one operation, its signer and the full set of ledger
 * records it touches. CLendingProcessor loads exactly those records,
 * applies the operation through lending_logic and commits every modified
 * record in one LevelDB batch. Nothing is written unless the operation
 * succeeds. A token move made before a failed commit is moved back.
 *
 * Declared records per type (besides the signer):
 *   INITIALIZE            protocol, treasury
 *   STAKE_COLLATERAL      collateralPool, userTokenAccount
 *   BORROW                protocol, treasury, lendingPool, userTokenAccount
 *   INSTITUTIONAL_BORROW  + institutionalPool
 *   DELEGATED_BORROW      + delegation
 *   REPAY                 protocol, lendingPool, userTokenAccount
 *   LIQUIDATE             collateralPool, borrower
 *   PROPOSE_CHANGE        governance
 *   VOTE                  governance, institutionalPool
 *   REBALANCE_COLLATERAL  (signer's borrower account only)
 */

#include "lending/capabilities.h"
#include "lending/lending.h"
#include "lending/lendingdb.h"
#include "serialize.h"
#include "uint256.h"
#include "version.h"

#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

class CValidationState;

static const size_t MAX_LENDTX_PROOF_SIZE = 16 * 1024;

/**
 * CLendTx - serialized lending transaction envelope
 */
struct CLendTx
{
    enum TxType : uint8_t {
        INITIALIZE = 0,
        STAKE_COLLATERAL = 1,
        BORROW = 2,
        INSTITUTIONAL_BORROW = 3,
        DELEGATED_BORROW = 4,
        REPAY = 5,
        LIQUIDATE = 6,
        PROPOSE_CHANGE = 7,
        VOTE = 8,
        REBALANCE_COLLATERAL = 9,
    };

    int32_t nVersion{LENDTX_VERSION};
    uint8_t nType{INITIALIZE};
    uint256 signer;

    // Declared record set
    uint256 protocolState;
    uint256 treasury;
    uint256 lendingPool;
    uint256 collateralPool;
    uint256 institutionalPool;
    uint256 delegation;
    uint256 governance;
    uint256 borrower;           // liquidation target
    uint256 userTokenAccount;   // signer's token account

    // Parameters
    uint64_t nAmount{0};        // stake / borrow / repay amount, rebalance delta
    std::vector<unsigned char> vchProof;
    uint8_t nProposalType{0};
    uint64_t nNewValue{0};
    uint64_t nProposalId{0};
    bool fVote{false};

    SERIALIZE_METHODS(CLendTx, obj)
    {
        READWRITE(obj.nVersion, obj.nType, obj.signer);
        READWRITE(obj.protocolState, obj.treasury, obj.lendingPool);
        READWRITE(obj.collateralPool, obj.institutionalPool, obj.delegation);
        READWRITE(obj.governance, obj.borrower, obj.userTokenAccount);
        READWRITE(obj.nAmount, obj.vchProof);
        READWRITE(obj.nProposalType, obj.nNewValue);
        READWRITE(obj.nProposalId, obj.fVote);
    }

    bool IsTriviallyValid(std::string& strError) const;
};

/** "borrow", "repay", ... ; "unknown" for out-of-range types. */
std::string LendTxTypeName(uint8_t nType);

/**
 * CLendingProcessor - the atomic transaction runtime
 *
 * Whole transactions are serialized by one mutex. Collaborators are
 * borrowed and must outlive the processor.
 */
class CLendingProcessor
{
private:
    CLendingDB& db;
    LendContext ctx;
    std::mutex cs_process;

    /** Commit batch; on failure reverse moved and report "lend-db-commit". */
    bool CommitTx(const CLendTx& tx, CLendingDB::Batch& batch, const CTokenMove& moved, CValidationState& state);

    bool ProcessInitialize(const CLendTx& tx, CValidationState& state);
    bool ProcessStake(const CLendTx& tx, CValidationState& state);
    bool ProcessBorrow(const CLendTx& tx, CValidationState& state);
    bool ProcessRepay(const CLendTx& tx, CValidationState& state);
    bool ProcessLiquidate(const CLendTx& tx, CValidationState& state);
    bool ProcessProposeChange(const CLendTx& tx, CValidationState& state);
    bool ProcessVote(const CLendTx& tx, CValidationState& state);
    bool ProcessRebalance(const CLendTx& tx, CValidationState& state);

public:
    CLendingProcessor(CLendingDB& dbIn,
                      const ProofVerifier& verifier,
                      TokenTransfer& transfer,
                      const LendClock& clock);

    /**
     * ProcessTx - validate, apply and commit one transaction
     *
     * @return true if committed; false with the reason in state otherwise
     */
    bool ProcessTx(const CLendTx& tx, CValidationState& state);

    /** Decode a serialized CLendTx, then ProcessTx. Undecodable input is "bad-lendtx-decode". */
    bool ProcessRawTx(const std::vector<unsigned char>& vchTx, CValidationState& state);
};

#endif // ZKLEND_LENDING_PROCESSOR_H

// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2021 The PIVX Core developers
// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "lending/encryptedamount.h"
#include "lending/lending.h"
#include "lending/lending_processor.h"
#include "serialize.h"
#include "streams.h"
#include <univalue.h>
#include "utilstrencodings.h"
#include "version.h"

// Amounts are shown as their sealed encoding only
UniValue EncryptedAmountToJSON(const EncryptedAmount& amount)
{
    return UniValue(amount.GetHex());
}

UniValue ProtocolStateToJSON(const ProtocolState& protocol)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", protocol.address.GetHex());
    obj.pushKV("total_collateral", protocol.totalCollateral);
    obj.pushKV("total_loans", protocol.totalLoans);
    obj.pushKV("total_liquidity", protocol.totalLiquidity);
    obj.pushKV("base_interest_rate", (int)protocol.baseInterestRate);
    obj.pushKV("utilization_rate", protocol.utilizationRate);
    obj.pushKV("min_collateral_lock_time", protocol.minCollateralLockTime);
    return obj;
}

UniValue TreasuryToJSON(const ProtocolTreasury& treasury)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", treasury.address.GetHex());
    obj.pushKV("total_fees_collected", treasury.totalFeesCollected);
    obj.pushKV("governance_fund", treasury.governanceFund);
    return obj;
}

UniValue LendingPoolToJSON(const LendingPool& pool)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", pool.address.GetHex());
    obj.pushKV("pool_authority", pool.poolAuthority.GetHex());
    obj.pushKV("total_liquidity", pool.totalLiquidity);
    obj.pushKV("base_interest_rate", (int)pool.baseInterestRate);
    obj.pushKV("utilization_rate", pool.utilizationRate);
    obj.pushKV("lender_rewards", pool.lenderRewards);
    return obj;
}

UniValue CollateralPoolToJSON(const CollateralPool& pool)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", pool.address.GetHex());
    obj.pushKV("asset_mint", pool.assetMint.GetHex());
    obj.pushKV("total_collateral", pool.totalCollateral);
    return obj;
}

UniValue InstitutionalPoolToJSON(const InstitutionalPool& pool)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", pool.address.GetHex());
    obj.pushKV("pool_owner", pool.poolOwner.GetHex());
    obj.pushKV("total_liquidity", pool.totalLiquidity);
    obj.pushKV("fixed_interest_rate", (int)pool.fixedInterestRate);
    UniValue whitelist(UniValue::VARR);
    for (const uint256& participant : pool.whitelist) {
        whitelist.push_back(participant.GetHex());
    }
    obj.pushKV("whitelist", whitelist);
    return obj;
}

UniValue BorrowerToJSON(const BorrowerAccount& account)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("owner", account.owner.GetHex());
    obj.pushKV("encrypted_collateral", EncryptedAmountToJSON(account.encryptedCollateral));
    obj.pushKV("encrypted_borrowed", EncryptedAmountToJSON(account.encryptedBorrowed));
    obj.pushKV("borrow_timestamp", account.nBorrowTimestamp);
    obj.pushKV("has_open_loan", account.nBorrowTimestamp != 0);
    return obj;
}

UniValue DelegationToJSON(const DelegatedBorrower& delegation)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", delegation.address.GetHex());
    obj.pushKV("delegator", delegation.delegator.GetHex());
    obj.pushKV("delegate", delegation.delegate.GetHex());
    obj.pushKV("max_borrow_amount", delegation.maxBorrowAmount);
    return obj;
}

UniValue GovernanceToJSON(const Governance& governance)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", governance.address.GetHex());
    obj.pushKV("proposal_id", governance.proposalId);
    obj.pushKV("proposal_type", (int)governance.proposalType);
    obj.pushKV("new_value", governance.newValue);
    obj.pushKV("votes", governance.votes);
    return obj;
}

UniValue ReputationToJSON(const BorrowerReputation& reputation)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("borrower", reputation.borrower.GetHex());
    obj.pushKV("reputation_score", reputation.reputationScore);
    return obj;
}

static void PushAddressIfSet(UniValue& entry, const std::string& key, const uint256& address)
{
    if (!address.IsNull()) {
        entry.pushKV(key, address.GetHex());
    }
}

void LendTxToUniv(const CLendTx& tx, UniValue& entry)
{
    entry.pushKV("version", tx.nVersion);
    entry.pushKV("type", (int)tx.nType);
    entry.pushKV("type_name", LendTxTypeName(tx.nType));
    entry.pushKV("signer", tx.signer.GetHex());

    PushAddressIfSet(entry, "protocol_state", tx.protocolState);
    PushAddressIfSet(entry, "treasury", tx.treasury);
    PushAddressIfSet(entry, "lending_pool", tx.lendingPool);
    PushAddressIfSet(entry, "collateral_pool", tx.collateralPool);
    PushAddressIfSet(entry, "institutional_pool", tx.institutionalPool);
    PushAddressIfSet(entry, "delegation", tx.delegation);
    PushAddressIfSet(entry, "governance", tx.governance);
    PushAddressIfSet(entry, "borrower", tx.borrower);
    PushAddressIfSet(entry, "user_token_account", tx.userTokenAccount);

    switch (tx.nType) {
    case CLendTx::STAKE_COLLATERAL:
    case CLendTx::BORROW:
    case CLendTx::INSTITUTIONAL_BORROW:
    case CLendTx::DELEGATED_BORROW:
    case CLendTx::REPAY:
    case CLendTx::REBALANCE_COLLATERAL:
        entry.pushKV("amount", tx.nAmount);
        break;
    case CLendTx::PROPOSE_CHANGE:
        entry.pushKV("proposal_type", (int)tx.nProposalType);
        entry.pushKV("new_value", tx.nNewValue);
        break;
    case CLendTx::VOTE:
        entry.pushKV("proposal_id", tx.nProposalId);
        entry.pushKV("vote", tx.fVote);
        break;
    }

    if (!tx.vchProof.empty()) {
        entry.pushKV("proof_size", (int)tx.vchProof.size());
        entry.pushKV("proof", HexStr(tx.vchProof));
    }
}

std::string EncodeHexLendTx(const CLendTx& tx)
{
    CDataStream ssTx(SER_NETWORK, CLIENT_VERSION);
    ssTx << tx;
    return HexStr(ssTx.begin(), ssTx.end());
}

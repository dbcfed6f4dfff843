// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2021 The PIVX Core developers
// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_CORE_IO_H
#define ZKLEND_CORE_IO_H

#include <string>

class UniValue;
class EncryptedAmount;
struct ProtocolState;
struct ProtocolTreasury;
struct LendingPool;
struct CollateralPool;
struct InstitutionalPool;
struct BorrowerAccount;
struct DelegatedBorrower;
struct Governance;
struct BorrowerReputation;
struct CLendTx;

// core_write.cpp
UniValue EncryptedAmountToJSON(const EncryptedAmount& amount);
UniValue ProtocolStateToJSON(const ProtocolState& protocol);
UniValue TreasuryToJSON(const ProtocolTreasury& treasury);
UniValue LendingPoolToJSON(const LendingPool& pool);
UniValue CollateralPoolToJSON(const CollateralPool& pool);
UniValue InstitutionalPoolToJSON(const InstitutionalPool& pool);
UniValue BorrowerToJSON(const BorrowerAccount& account);
UniValue DelegationToJSON(const DelegatedBorrower& delegation);
UniValue GovernanceToJSON(const Governance& governance);
UniValue ReputationToJSON(const BorrowerReputation& reputation);
void LendTxToUniv(const CLendTx& tx, UniValue& entry);
std::string EncodeHexLendTx(const CLendTx& tx);

#endif // ZKLEND_CORE_IO_H

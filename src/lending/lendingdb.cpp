// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lending/lendingdb.h"

#include "logging.h"
#include "util/system.h"
#include "version.h"

// Global lending DB instance
std::unique_ptr<CLendingDB> g_lendingdb;

// DB key helpers
namespace {

std::pair<char, uint256> MakeKey(char prefix, const uint256& key)
{
    return std::make_pair(prefix, key);
}

} // anonymous namespace

CLendingDB::CLendingDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    fs::path path = GetDataDir() / "lending";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fMemory, fWipe);
}

CLendingDB::~CLendingDB() = default;

// =============================================================================
// Protocol singletons
// =============================================================================

bool CLendingDB::WriteProtocolState(const ProtocolState& protocol)
{
    return db->Write(MakeKey(DB_PROTOCOL_STATE, protocol.address), protocol);
}

bool CLendingDB::ReadProtocolState(const uint256& address, ProtocolState& protocol) const
{
    return db->Read(MakeKey(DB_PROTOCOL_STATE, address), protocol);
}

bool CLendingDB::WriteTreasury(const ProtocolTreasury& treasury)
{
    return db->Write(MakeKey(DB_TREASURY, treasury.address), treasury);
}

bool CLendingDB::ReadTreasury(const uint256& address, ProtocolTreasury& treasury) const
{
    return db->Read(MakeKey(DB_TREASURY, address), treasury);
}

// =============================================================================
// Pools
// =============================================================================

bool CLendingDB::WriteLendingPool(const LendingPool& pool)
{
    return db->Write(MakeKey(DB_LENDING_POOL, pool.address), pool);
}

bool CLendingDB::ReadLendingPool(const uint256& address, LendingPool& pool) const
{
    return db->Read(MakeKey(DB_LENDING_POOL, address), pool);
}

bool CLendingDB::WriteCollateralPool(const CollateralPool& pool)
{
    return db->Write(MakeKey(DB_COLLATERAL_POOL, pool.address), pool);
}

bool CLendingDB::ReadCollateralPool(const uint256& address, CollateralPool& pool) const
{
    return db->Read(MakeKey(DB_COLLATERAL_POOL, address), pool);
}

bool CLendingDB::WriteInstitutionalPool(const InstitutionalPool& pool)
{
    return db->Write(MakeKey(DB_INSTITUTIONAL_POOL, pool.address), pool);
}

bool CLendingDB::ReadInstitutionalPool(const uint256& address, InstitutionalPool& pool) const
{
    return db->Read(MakeKey(DB_INSTITUTIONAL_POOL, address), pool);
}

// =============================================================================
// Borrowers
// =============================================================================

bool CLendingDB::WriteBorrower(const BorrowerAccount& account)
{
    return db->Write(MakeKey(DB_BORROWER, account.owner), account);
}

bool CLendingDB::ReadBorrower(const uint256& owner, BorrowerAccount& account) const
{
    return db->Read(MakeKey(DB_BORROWER, owner), account);
}

bool CLendingDB::HaveBorrower(const uint256& owner) const
{
    return db->Exists(MakeKey(DB_BORROWER, owner));
}

bool CLendingDB::WriteDelegation(const DelegatedBorrower& delegation)
{
    return db->Write(MakeKey(DB_DELEGATION, delegation.address), delegation);
}

bool CLendingDB::ReadDelegation(const uint256& address, DelegatedBorrower& delegation) const
{
    return db->Read(MakeKey(DB_DELEGATION, address), delegation);
}

bool CLendingDB::WriteReputation(const BorrowerReputation& reputation)
{
    return db->Write(MakeKey(DB_REPUTATION, reputation.borrower), reputation);
}

bool CLendingDB::ReadReputation(const uint256& borrower, BorrowerReputation& reputation) const
{
    return db->Read(MakeKey(DB_REPUTATION, borrower), reputation);
}

void CLendingDB::ForEachBorrower(std::function<bool(const BorrowerAccount&)> func) const
{
    // Iterate over all borrower entries (prefix 'B')
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_BORROWER, uint256()));

    while (it->Valid()) {
        std::pair<char, uint256> key;
        if (it->GetKey(key) && key.first == DB_BORROWER) {
            BorrowerAccount account;
            if (it->GetValue(account)) {
                if (!func(account)) {
                    break;  // Callback returned false, stop iteration
                }
            } else {
                LogPrintf("ERROR: ForEachBorrower: unreadable borrower record %s\n", key.second.ToString());
            }
            it->Next();
        } else {
            break;  // No more borrower entries
        }
    }
}

// =============================================================================
// Governance
// =============================================================================

bool CLendingDB::WriteGovernance(const Governance& governance)
{
    return db->Write(MakeKey(DB_GOVERNANCE, governance.address), governance);
}

bool CLendingDB::ReadGovernance(const uint256& address, Governance& governance) const
{
    return db->Read(MakeKey(DB_GOVERNANCE, address), governance);
}

bool CLendingDB::HaveRecord(char prefix, const uint256& address) const
{
    return db->Exists(MakeKey(prefix, address));
}

bool CLendingDB::IsEmpty() const
{
    return db->IsEmpty();
}

// =============================================================================
// Batch operations
// =============================================================================

CLendingDB::Batch::Batch(CLendingDB& db) : batch(CLIENT_VERSION), parent(db) {}

void CLendingDB::Batch::WriteProtocolState(const ProtocolState& protocol)
{
    batch.Write(MakeKey(DB_PROTOCOL_STATE, protocol.address), protocol);
}

void CLendingDB::Batch::WriteTreasury(const ProtocolTreasury& treasury)
{
    batch.Write(MakeKey(DB_TREASURY, treasury.address), treasury);
}

void CLendingDB::Batch::WriteLendingPool(const LendingPool& pool)
{
    batch.Write(MakeKey(DB_LENDING_POOL, pool.address), pool);
}

void CLendingDB::Batch::WriteCollateralPool(const CollateralPool& pool)
{
    batch.Write(MakeKey(DB_COLLATERAL_POOL, pool.address), pool);
}

void CLendingDB::Batch::WriteInstitutionalPool(const InstitutionalPool& pool)
{
    batch.Write(MakeKey(DB_INSTITUTIONAL_POOL, pool.address), pool);
}

void CLendingDB::Batch::WriteBorrower(const BorrowerAccount& account)
{
    batch.Write(MakeKey(DB_BORROWER, account.owner), account);
}

void CLendingDB::Batch::WriteDelegation(const DelegatedBorrower& delegation)
{
    batch.Write(MakeKey(DB_DELEGATION, delegation.address), delegation);
}

void CLendingDB::Batch::WriteGovernance(const Governance& governance)
{
    batch.Write(MakeKey(DB_GOVERNANCE, governance.address), governance);
}

void CLendingDB::Batch::WriteReputation(const BorrowerReputation& reputation)
{
    batch.Write(MakeKey(DB_REPUTATION, reputation.borrower), reputation);
}

bool CLendingDB::WriteBatch(CDBBatch& batch)
{
    return db->WriteBatch(batch);
}

bool CLendingDB::Batch::Commit()
{
    return parent.WriteBatch(batch);
}

bool CLendingDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// InitLendingDB - Initialize the lending database
// =============================================================================

bool InitLendingDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    try {
        g_lendingdb.reset();
        g_lendingdb = std::make_unique<CLendingDB>(nCacheSize, fMemory, fWipe);
        LogPrint(BCLog::LENDINGDB, "Lending: Initialized database (cache=%zu, memory=%d, wipe=%d)\n",
                 nCacheSize, fMemory, fWipe);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize lending database: %s\n", e.what());
        return false;
    }
}

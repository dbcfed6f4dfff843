// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDINGDB_H
#define ZKLEND_LENDINGDB_H

/**
 * Lending Ledger Database
 *
 * One LevelDB under <datadir>/lending holding every ledger record, keyed by
 * prefix char + 256-bit address (see lending/lending.h for the key map).
 * A transaction's writes go through one Batch so they land all-or-nothing.
 */

#include "dbwrapper.h"
#include "lending/lending.h"

#include <functional>
#include <memory>

//! -lendingdbcache default, MiB
static const int64_t DEFAULT_LENDINGDB_CACHE = 8;

class CLendingDB
{
private:
    std::unique_ptr<CDBWrapper> db;

protected:
    //! Every Batch::Commit lands here. Throws dbwrapper_error on storage failure.
    virtual bool WriteBatch(CDBBatch& batch);

public:
    explicit CLendingDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);
    virtual ~CLendingDB();

    // Protocol singletons
    bool WriteProtocolState(const ProtocolState& protocol);
    bool ReadProtocolState(const uint256& address, ProtocolState& protocol) const;
    bool WriteTreasury(const ProtocolTreasury& treasury);
    bool ReadTreasury(const uint256& address, ProtocolTreasury& treasury) const;

    // Pools
    bool WriteLendingPool(const LendingPool& pool);
    bool ReadLendingPool(const uint256& address, LendingPool& pool) const;
    bool WriteCollateralPool(const CollateralPool& pool);
    bool ReadCollateralPool(const uint256& address, CollateralPool& pool) const;
    bool WriteInstitutionalPool(const InstitutionalPool& pool);
    bool ReadInstitutionalPool(const uint256& address, InstitutionalPool& pool) const;

    // Borrowers
    bool WriteBorrower(const BorrowerAccount& account);
    bool ReadBorrower(const uint256& owner, BorrowerAccount& account) const;
    bool HaveBorrower(const uint256& owner) const;
    bool WriteDelegation(const DelegatedBorrower& delegation);
    bool ReadDelegation(const uint256& address, DelegatedBorrower& delegation) const;
    bool WriteReputation(const BorrowerReputation& reputation);
    bool ReadReputation(const uint256& borrower, BorrowerReputation& reputation) const;

    // Governance
    bool WriteGovernance(const Governance& governance);
    bool ReadGovernance(const uint256& address, Governance& governance) const;

    /** True if any record of any type lives at address under prefix. */
    bool HaveRecord(char prefix, const uint256& address) const;

    /**
     * ForEachBorrower - Iterate over all borrower accounts in key order
     *
     * @param func Callback function (return false to stop iteration)
     */
    void ForEachBorrower(std::function<bool(const BorrowerAccount&)> func) const;

    // Batch operations for atomic updates
    class Batch
    {
    private:
        CDBBatch batch;
        CLendingDB& parent;

    public:
        explicit Batch(CLendingDB& db);

        void WriteProtocolState(const ProtocolState& protocol);
        void WriteTreasury(const ProtocolTreasury& treasury);
        void WriteLendingPool(const LendingPool& pool);
        void WriteCollateralPool(const CollateralPool& pool);
        void WriteInstitutionalPool(const InstitutionalPool& pool);
        void WriteBorrower(const BorrowerAccount& account);
        void WriteDelegation(const DelegatedBorrower& delegation);
        void WriteGovernance(const Governance& governance);
        void WriteReputation(const BorrowerReputation& reputation);

        size_t SizeEstimate() const { return batch.SizeEstimate(); }

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    bool IsEmpty() const;

    // Sync to disk
    bool Sync();
};

// Global lending DB instance
extern std::unique_ptr<CLendingDB> g_lendingdb;

/**
 * InitLendingDB - Initialize the lending database
 *
 * @param nCacheSize DB cache size in bytes
 * @param fMemory If true, use in-memory database (for tests)
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitLendingDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

#endif // ZKLEND_LENDINGDB_H

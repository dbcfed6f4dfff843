// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKLEND_LENDING_METRICS_H
#define ZKLEND_LENDING_METRICS_H

#include <atomic>
#include <stdint.h>
#include <univalue.h>

/**
 * Lending Metrics - counters for the transaction processor
 *
 * All counters are atomic for thread-safe updates.
 *
 * Usage:
 *   g_lend_metrics.txApplied++;
 */
struct LendMetrics {
    // ═══════════════════════════════════════════════════════════════════════════
    // Transaction outcome
    // ═══════════════════════════════════════════════════════════════════════════
    std::atomic<uint64_t> txApplied{0};             // Transactions committed
    std::atomic<uint64_t> txRejected{0};            // Transactions rejected by a rule
    std::atomic<uint64_t> txMalformed{0};           // Envelopes that failed to decode or IsTriviallyValid
    std::atomic<uint64_t> dbErrors{0};              // Commits or reads that hit a storage error

    // ═══════════════════════════════════════════════════════════════════════════
    // Per-operation
    // ═══════════════════════════════════════════════════════════════════════════
    std::atomic<uint64_t> stakes{0};
    std::atomic<uint64_t> borrows{0};
    std::atomic<uint64_t> repays{0};
    std::atomic<uint64_t> liquidations{0};
    std::atomic<uint64_t> proposals{0};
    std::atomic<uint64_t> votes{0};
    std::atomic<uint64_t> rebalances{0};

    // ═══════════════════════════════════════════════════════════════════════════
    // Volume
    // ═══════════════════════════════════════════════════════════════════════════
    std::atomic<uint64_t> volumeBorrowed{0};        // Principal borrowed
    std::atomic<uint64_t> volumeRepaid{0};          // Repayment amounts received
    std::atomic<int64_t> lastTxTime{0};             // Clock time of the last committed transaction

    /**
     * Convert metrics to JSON
     */
    UniValue ToJSON() const {
        UniValue result(UniValue::VOBJ);

        UniValue tx(UniValue::VOBJ);
        tx.pushKV("applied", (int64_t)txApplied.load());
        tx.pushKV("rejected", (int64_t)txRejected.load());
        tx.pushKV("malformed", (int64_t)txMalformed.load());
        tx.pushKV("db_errors", (int64_t)dbErrors.load());
        result.pushKV("transactions", tx);

        UniValue ops(UniValue::VOBJ);
        ops.pushKV("stakes", (int64_t)stakes.load());
        ops.pushKV("borrows", (int64_t)borrows.load());
        ops.pushKV("repays", (int64_t)repays.load());
        ops.pushKV("liquidations", (int64_t)liquidations.load());
        ops.pushKV("proposals", (int64_t)proposals.load());
        ops.pushKV("votes", (int64_t)votes.load());
        ops.pushKV("rebalances", (int64_t)rebalances.load());
        result.pushKV("operations", ops);

        UniValue volume(UniValue::VOBJ);
        volume.pushKV("borrowed", (int64_t)volumeBorrowed.load());
        volume.pushKV("repaid", (int64_t)volumeRepaid.load());
        volume.pushKV("last_tx_time", (int64_t)lastTxTime.load());
        result.pushKV("volume", volume);

        return result;
    }

    /**
     * Reset all metrics (for testing)
     */
    void Reset() {
        txApplied.store(0);
        txRejected.store(0);
        txMalformed.store(0);
        dbErrors.store(0);
        stakes.store(0);
        borrows.store(0);
        repays.store(0);
        liquidations.store(0);
        proposals.store(0);
        votes.store(0);
        rebalances.store(0);
        volumeBorrowed.store(0);
        volumeRepaid.store(0);
        lastTxTime.store(0);
    }
};

// Global metrics instance
extern LendMetrics g_lend_metrics;

#endif // ZKLEND_LENDING_METRICS_H

#ifndef BUFFER_ENGINE_HPP
#define BUFFER_ENGINE_HPP

#include "Config.hpp"
#include "InFlightLedger.hpp"
#include "PriorityLanes.hpp"
#include "WriteOperation.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Queueing, batching and reconciliation state shared by every backend
 *
 * Owns the lanes, the dedup index and the in-flight ledger. None of the
 * methods lock; a backend serializes all calls behind a single mutex since
 * the invariants span all three structures. nextSequence() is the exception
 * and may be called concurrently.
 */
class BufferEngine
{
public:
    explicit BufferEngine(const WriteBufferConfig &config);

    BufferEngine(const BufferEngine &) = delete;
    BufferEngine &operator=(const BufferEngine &) = delete;

    uint64_t nextSequence() { return m_nextSequence.fetch_add(1, std::memory_order_relaxed); }

    // Admission check, then insert; false (and counted as rejected) when at capacity
    bool admit(WriteOperation op);
    // Insert into the priority lane bypassing admission (already reserved)
    void insert(WriteOperation op);
    void recordRejected() { ++m_opsRejected; }

    bool shouldFlush() const;
    BatchResult formBatch();

    ReconcileReport commit(const std::string &batchId);
    ReconcileReport fail(const std::string &batchId, const std::string &error);
    ReconcileReport failOperations(const std::string &batchId, const std::vector<std::string> &failedOpIds);

    size_t totalQueued() const { return m_lanes.size(); }
    size_t inFlightCount() const { return m_ledger.size(); }
    int backpressure() const;
    bool isBackpressured() const { return m_lanes.size() >= m_maxQueueSize; }

    WriteBufferStats stats() const;
    void resetStats();

    void setMaxQueueSize(size_t maxQueueSize);
    size_t maxQueueSize() const { return m_maxQueueSize; }
    size_t batchSize() const { return m_batchSize; }
    size_t maxRetries() const { return m_maxRetries; }

    void clear() { m_lanes.clear(); }
    std::vector<WriteOperation> drainAll() { return m_lanes.drainAll(); }
    // Bypasses admission; retried operations go back to the retry lane
    void restore(std::vector<WriteOperation> operations);
    void reset();

    const PriorityLanes &lanes() const { return m_lanes; }
    const InFlightLedger &ledger() const { return m_ledger; }

private:
    void place(WriteOperation op, Lane lane);
    void requeueOrDrop(WriteOperation op, const std::string &error, ReconcileReport &report);

    PriorityLanes m_lanes;
    InFlightLedger m_ledger;

    const size_t m_batchSize;
    const std::chrono::milliseconds m_flushInterval;
    const size_t m_maxRetries;
    size_t m_maxQueueSize;

    std::atomic<uint64_t> m_nextSequence{0};
    uint64_t m_nextBatchId = 0;

    uint64_t m_batchesFlushed = 0;
    uint64_t m_opsCommitted = 0;
    uint64_t m_opsFailed = 0;
    uint64_t m_opsDeduplicated = 0;
    uint64_t m_opsRejected = 0;
};

#endif

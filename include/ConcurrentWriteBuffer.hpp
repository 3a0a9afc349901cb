#ifndef CONCURRENT_WRITE_BUFFER_HPP
#define CONCURRENT_WRITE_BUFFER_HPP

#include "BufferEngine.hpp"
#include "WriteBuffer.hpp"
#include "concurrentqueue.h"
#include <atomic>
#include <mutex>

/**
 * @brief Native backend with a lock-free producer intake
 *
 * Producers reserve a slot against an atomic occupancy counter and push into
 * a moodycamel queue without touching the engine mutex. Every other call
 * takes the mutex and first merges the intake into the engine in admission
 * sequence order, so observable state is the same as the portable backend.
 *
 * Occupancy counts operations in the engine plus operations still in the
 * intake. It can overstate the queue (pending dedup replacements, reserved
 * slots not yet pushed) but never understates it; a failed reservation is
 * rechecked exactly under the mutex before the write is rejected.
 *
 * A stats listener gives up the lock-free path: each notification builds a
 * full snapshot under the engine mutex, so with a listener installed every
 * accepted write serializes on that mutex like the portable backend does.
 */
class ConcurrentWriteBuffer : public IWriteBuffer
{
public:
    explicit ConcurrentWriteBuffer(const WriteBufferConfig &config);
    ~ConcurrentWriteBuffer() override = default;

    bool queueWriteWithDedup(std::string opId,
                             WriteOpType opType,
                             std::vector<uint8_t> payload,
                             WritePriority priority,
                             std::optional<std::string> dedupKey) override;

    bool shouldFlush() override;
    BatchResult getPendingBatch() override;

    ReconcileReport markBatchCommitted(const std::string &batchId) override;
    ReconcileReport markBatchFailed(const std::string &batchId, const std::string &error) override;
    ReconcileReport markOperationsFailed(const std::string &batchId,
                                         const std::vector<std::string> &failedOpIds) override;

    size_t totalQueued() override;
    size_t inFlightCount() override;
    int backpressure() override;
    bool isBackpressured() override;
    WriteBufferStats getStats() override;
    void resetStats() override;
    void setMaxQueueSize(size_t maxQueueSize) override;

    void clear() override;
    std::vector<WriteOperation> drainAll() override;
    void restore(std::vector<WriteOperation> operations) override;

    void dispose() override;
    bool isDisposed() const override { return m_disposed.load(std::memory_order_acquire); }

    BufferImplementation implementation() const override { return BufferImplementation::Native; }

    // Engine plus unmerged intake; approximate while producers are active
    size_t occupancy() const { return m_occupancy.load(std::memory_order_acquire); }

private:
    static constexpr size_t MERGE_CHUNK = 256;

    void ensureNotDisposed() const;
    bool tryReserve();
    void release() { m_occupancy.fetch_sub(1, std::memory_order_acq_rel); }
    void mergeIntakeLocked();

    std::mutex m_mutex;
    BufferEngine m_engine;
    moodycamel::ConcurrentQueue<WriteOperation> m_intake;
    std::atomic<size_t> m_occupancy{0};
    std::atomic<size_t> m_maxQueueSize;
    std::atomic<bool> m_disposed{false};
};

#endif

#ifndef WRITE_BUFFER_HPP
#define WRITE_BUFFER_HPP

#include "Config.hpp"
#include "WriteOperation.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class BufferImplementation
{
    Native,
    Portable,
};

const char *toString(BufferImplementation implementation);

// Per-operation verdict reported by a flush callback
struct BatchOperationResult
{
    std::string opId;
    bool success = true;
    std::optional<std::string> error = std::nullopt;
};

// Structured outcome a flush callback may return instead of nothing
struct BatchCallbackResult
{
    bool success = true;
    std::vector<BatchOperationResult> operationResults;
    std::optional<std::string> error = std::nullopt;
};

struct FlushResult
{
    bool success = false;
    std::string batchId;
    size_t operationCount = 0;
    size_t successCount = 0;
    size_t failureCount = 0;
    std::vector<std::string> failedOperationIds;
    std::vector<std::string> droppedOperationIds; // exhausted their retries
    std::optional<std::string> error = std::nullopt;
};

struct FlushAllResult
{
    size_t totalCommitted = 0;
    size_t totalFailed = 0;
    size_t batchCount = 0;
    std::vector<std::string> failedOperationIds;
    std::vector<std::string> droppedOperationIds;
    bool aborted = false; // stopped after too many consecutive failures
};

// Returning std::nullopt means every operation in the batch was accepted.
// Throwing marks the whole batch failed with the exception message.
using FlushCallback = std::function<std::optional<BatchCallbackResult>(const WriteBatch &)>;
using ProgressCallback = std::function<void(size_t committed, size_t remaining, size_t failed)>;
using StatsListener = std::function<void(const WriteBufferStats &)>;

/**
 * @brief Write-buffering and backpressure contract shared by all backends
 *
 * Producers queue operations, a driver forms batches and hands them to a
 * flush callback, and the outcome is reconciled back onto the lanes.
 * Backends implement the primitives; the flush protocol is implemented
 * once here on top of them.
 */
class IWriteBuffer
{
public:
    virtual ~IWriteBuffer() = default;

    IWriteBuffer(const IWriteBuffer &) = delete;
    IWriteBuffer &operator=(const IWriteBuffer &) = delete;

    /**
     * @brief Queue an operation without a dedup key
     * @return false when the buffer is at capacity; nothing is queued
     */
    bool queueWrite(std::string opId,
                    WriteOpType opType,
                    std::vector<uint8_t> payload,
                    WritePriority priority = WritePriority::Normal);

    /**
     * @brief Queue an operation, superseding any queued one with the same key
     * @return false when the buffer is at capacity; nothing is queued
     * @throws std::invalid_argument for an out-of-range priority or type
     */
    virtual bool queueWriteWithDedup(std::string opId,
                                     WriteOpType opType,
                                     std::vector<uint8_t> payload,
                                     WritePriority priority,
                                     std::optional<std::string> dedupKey) = 0;

    virtual bool shouldFlush() = 0;

    // Moves up to batchSize operations into a new in-flight batch
    virtual BatchResult getPendingBatch() = 0;

    virtual ReconcileReport markBatchCommitted(const std::string &batchId) = 0;
    virtual ReconcileReport markBatchFailed(const std::string &batchId, const std::string &error) = 0;
    virtual ReconcileReport markOperationsFailed(const std::string &batchId,
                                                 const std::vector<std::string> &failedOpIds) = 0;

    virtual size_t totalQueued() = 0;
    virtual size_t inFlightCount() = 0;
    virtual int backpressure() = 0;
    virtual bool isBackpressured() = 0;
    virtual WriteBufferStats getStats() = 0;
    virtual void resetStats() = 0;

    // Never evicts; a lower ceiling only blocks admission until occupancy drops
    virtual void setMaxQueueSize(size_t maxQueueSize) = 0;

    virtual void clear() = 0;
    virtual std::vector<WriteOperation> drainAll() = 0;
    virtual void restore(std::vector<WriteOperation> operations) = 0;

    // Releases queued and in-flight state; further mutating calls throw std::logic_error
    virtual void dispose() = 0;
    virtual bool isDisposed() const = 0;

    virtual BufferImplementation implementation() const = 0;
    const char *implementationName() const { return toString(implementation()); }

    /**
     * @brief Form one batch, transmit it and reconcile the outcome
     * @return std::nullopt when nothing was queued; the callback is not invoked
     */
    std::optional<FlushResult> flushBatch(const FlushCallback &flushFn);

    // Flush until empty or until too many consecutive failures; returns operations committed.
    // onProgress runs after every batch, including the one that aborts the flush.
    size_t flushAll(const FlushCallback &flushFn, const ProgressCallback &onProgress = nullptr);
    FlushAllResult flushAllWithDetails(const FlushCallback &flushFn,
                                       const ProgressCallback &onProgress = nullptr);

    // Pushed after every mutating call; an empty function removes the listener.
    // Each notification takes a locked snapshot, so producers on the native
    // backend contend on its mutex while a listener is installed.
    void setStatsListener(StatsListener listener);

protected:
    explicit IWriteBuffer(const WriteBufferConfig &config);

    void publishStats();

private:
    FlushResult reconcile(const WriteBatch &batch, const std::optional<BatchCallbackResult> &outcome);

    const size_t m_maxConsecutiveFailures;
    const std::chrono::milliseconds m_interBatchDelay;

    std::mutex m_listenerMutex;
    StatsListener m_statsListener;
    std::atomic<bool> m_hasListener{false};
};

#endif

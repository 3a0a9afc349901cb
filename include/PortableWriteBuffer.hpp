#ifndef PORTABLE_WRITE_BUFFER_HPP
#define PORTABLE_WRITE_BUFFER_HPP

#include "BufferEngine.hpp"
#include "WriteBuffer.hpp"
#include <atomic>
#include <mutex>

// Reference backend: every call takes one mutex around the engine
class PortableWriteBuffer : public IWriteBuffer
{
public:
    explicit PortableWriteBuffer(const WriteBufferConfig &config);
    ~PortableWriteBuffer() override = default;

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

    BufferImplementation implementation() const override { return BufferImplementation::Portable; }

private:
    void ensureNotDisposed() const;

    mutable std::mutex m_mutex;
    BufferEngine m_engine;
    std::atomic<bool> m_disposed{false};
};

#endif

#include "PortableWriteBuffer.hpp"
#include <stdexcept>

PortableWriteBuffer::PortableWriteBuffer(const WriteBufferConfig &config)
    : IWriteBuffer(config),
      m_engine(config) {}

void PortableWriteBuffer::ensureNotDisposed() const
{
    if (m_disposed.load(std::memory_order_acquire))
    {
        throw std::logic_error("Write buffer has been disposed");
    }
}

bool PortableWriteBuffer::queueWriteWithDedup(std::string opId,
                                              WriteOpType opType,
                                              std::vector<uint8_t> payload,
                                              WritePriority priority,
                                              std::optional<std::string> dedupKey)
{
    ensureNotDisposed();
    validatePriority(priority);
    validateOpType(opType);

    WriteOperation op(std::move(opId), opType, std::move(payload), priority, std::move(dedupKey));
    bool admitted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        op.sequence = m_engine.nextSequence();
        admitted = m_engine.admit(std::move(op));
    }
    publishStats();
    return admitted;
}

bool PortableWriteBuffer::shouldFlush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.shouldFlush();
}

BatchResult PortableWriteBuffer::getPendingBatch()
{
    ensureNotDisposed();
    BatchResult result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result = m_engine.formBatch();
    }
    if (result.hasBatch)
    {
        publishStats();
    }
    return result;
}

ReconcileReport PortableWriteBuffer::markBatchCommitted(const std::string &batchId)
{
    ensureNotDisposed();
    ReconcileReport report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        report = m_engine.commit(batchId);
    }
    publishStats();
    return report;
}

ReconcileReport PortableWriteBuffer::markBatchFailed(const std::string &batchId, const std::string &error)
{
    ensureNotDisposed();
    ReconcileReport report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        report = m_engine.fail(batchId, error);
    }
    publishStats();
    return report;
}

ReconcileReport PortableWriteBuffer::markOperationsFailed(const std::string &batchId,
                                                          const std::vector<std::string> &failedOpIds)
{
    ensureNotDisposed();
    ReconcileReport report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        report = m_engine.failOperations(batchId, failedOpIds);
    }
    publishStats();
    return report;
}

size_t PortableWriteBuffer::totalQueued()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.totalQueued();
}

size_t PortableWriteBuffer::inFlightCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.inFlightCount();
}

int PortableWriteBuffer::backpressure()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.backpressure();
}

bool PortableWriteBuffer::isBackpressured()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.isBackpressured();
}

WriteBufferStats PortableWriteBuffer::getStats()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.stats();
}

void PortableWriteBuffer::resetStats()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.resetStats();
    }
    publishStats();
}

void PortableWriteBuffer::setMaxQueueSize(size_t maxQueueSize)
{
    ensureNotDisposed();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.setMaxQueueSize(maxQueueSize);
    }
    publishStats();
}

void PortableWriteBuffer::clear()
{
    ensureNotDisposed();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.clear();
    }
    publishStats();
}

std::vector<WriteOperation> PortableWriteBuffer::drainAll()
{
    ensureNotDisposed();
    std::vector<WriteOperation> drained;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        drained = m_engine.drainAll();
    }
    publishStats();
    return drained;
}

void PortableWriteBuffer::restore(std::vector<WriteOperation> operations)
{
    ensureNotDisposed();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.restore(std::move(operations));
    }
    publishStats();
}

void PortableWriteBuffer::dispose()
{
    if (m_disposed.exchange(true))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_engine.reset();
}

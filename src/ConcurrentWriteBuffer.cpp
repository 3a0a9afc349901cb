#include "ConcurrentWriteBuffer.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace
{
    // Applies the change in engine size made under the lock to the occupancy counter
    class OccupancyGuard
    {
    public:
        OccupancyGuard(const BufferEngine &engine, std::atomic<size_t> &occupancy)
            : m_engine(engine),
              m_occupancy(occupancy),
              m_before(engine.totalQueued()) {}

        ~OccupancyGuard()
        {
            const size_t after = m_engine.totalQueued();
            if (after > m_before)
            {
                m_occupancy.fetch_add(after - m_before, std::memory_order_acq_rel);
            }
            else if (after < m_before)
            {
                m_occupancy.fetch_sub(m_before - after, std::memory_order_acq_rel);
            }
        }

        OccupancyGuard(const OccupancyGuard &) = delete;
        OccupancyGuard &operator=(const OccupancyGuard &) = delete;

    private:
        const BufferEngine &m_engine;
        std::atomic<size_t> &m_occupancy;
        const size_t m_before;
    };
}

ConcurrentWriteBuffer::ConcurrentWriteBuffer(const WriteBufferConfig &config)
    : IWriteBuffer(config),
      m_engine(config),
      m_intake(config.batchSize * 4),
      m_maxQueueSize(effectiveMaxQueueSize(config)) {}

void ConcurrentWriteBuffer::ensureNotDisposed() const
{
    if (m_disposed.load(std::memory_order_acquire))
    {
        throw std::logic_error("Write buffer has been disposed");
    }
}

bool ConcurrentWriteBuffer::tryReserve()
{
    size_t current = m_occupancy.load(std::memory_order_acquire);
    while (current < m_maxQueueSize.load(std::memory_order_acquire))
    {
        if (m_occupancy.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel))
        {
            return true;
        }
    }
    return false;
}

void ConcurrentWriteBuffer::mergeIntakeLocked()
{
    std::vector<WriteOperation> pending;
    std::vector<WriteOperation> chunk(MERGE_CHUNK);
    size_t count;
    while ((count = m_intake.try_dequeue_bulk(chunk.begin(), chunk.size())) > 0)
    {
        pending.insert(pending.end(),
                       std::make_move_iterator(chunk.begin()),
                       std::make_move_iterator(chunk.begin() + count));
    }
    if (pending.empty())
    {
        return;
    }

    // Producers push in whatever order they win the queue; admission order is the sequence
    std::sort(pending.begin(), pending.end(),
              [](const WriteOperation &a, const WriteOperation &b)
              { return a.sequence < b.sequence; });

    const size_t before = m_engine.totalQueued();
    for (auto &op : pending)
    {
        m_engine.insert(std::move(op));
    }
    const size_t growth = m_engine.totalQueued() - before;
    m_occupancy.fetch_sub(pending.size() - growth, std::memory_order_acq_rel);
}

bool ConcurrentWriteBuffer::queueWriteWithDedup(std::string opId,
                                                WriteOpType opType,
                                                std::vector<uint8_t> payload,
                                                WritePriority priority,
                                                std::optional<std::string> dedupKey)
{
    ensureNotDisposed();
    validatePriority(priority);
    validateOpType(opType);

    WriteOperation op(std::move(opId), opType, std::move(payload), priority, std::move(dedupKey));

    if (tryReserve())
    {
        op.sequence = m_engine.nextSequence();
        if (!m_intake.enqueue(std::move(op)))
        {
            release();
            throw std::runtime_error("ConcurrentWriteBuffer: Failed to allocate intake block");
        }
        publishStats();
        return true;
    }

    // The counter may be stale; decide exactly against the merged engine
    bool admitted = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        if (tryReserve())
        {
            op.sequence = m_engine.nextSequence();
            const size_t before = m_engine.totalQueued();
            m_engine.insert(std::move(op));
            const size_t growth = m_engine.totalQueued() - before;
            m_occupancy.fetch_sub(1 - growth, std::memory_order_acq_rel);
            admitted = true;
        }
        else
        {
            m_engine.recordRejected();
        }
    }
    publishStats();
    return admitted;
}

bool ConcurrentWriteBuffer::shouldFlush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    mergeIntakeLocked();
    return m_engine.shouldFlush();
}

BatchResult ConcurrentWriteBuffer::getPendingBatch()
{
    ensureNotDisposed();
    BatchResult result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        OccupancyGuard guard(m_engine, m_occupancy);
        result = m_engine.formBatch();
    }
    if (result.hasBatch)
    {
        publishStats();
    }
    return result;
}

ReconcileReport ConcurrentWriteBuffer::markBatchCommitted(const std::string &batchId)
{
    ensureNotDisposed();
    ReconcileReport report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        report = m_engine.commit(batchId);
    }
    publishStats();
    return report;
}

ReconcileReport ConcurrentWriteBuffer::markBatchFailed(const std::string &batchId, const std::string &error)
{
    ensureNotDisposed();
    ReconcileReport report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        OccupancyGuard guard(m_engine, m_occupancy);
        report = m_engine.fail(batchId, error);
    }
    publishStats();
    return report;
}

ReconcileReport ConcurrentWriteBuffer::markOperationsFailed(const std::string &batchId,
                                                            const std::vector<std::string> &failedOpIds)
{
    ensureNotDisposed();
    ReconcileReport report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        OccupancyGuard guard(m_engine, m_occupancy);
        report = m_engine.failOperations(batchId, failedOpIds);
    }
    publishStats();
    return report;
}

size_t ConcurrentWriteBuffer::totalQueued()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    mergeIntakeLocked();
    return m_engine.totalQueued();
}

size_t ConcurrentWriteBuffer::inFlightCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engine.inFlightCount();
}

int ConcurrentWriteBuffer::backpressure()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    mergeIntakeLocked();
    return m_engine.backpressure();
}

bool ConcurrentWriteBuffer::isBackpressured()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    mergeIntakeLocked();
    return m_engine.isBackpressured();
}

WriteBufferStats ConcurrentWriteBuffer::getStats()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    mergeIntakeLocked();
    return m_engine.stats();
}

void ConcurrentWriteBuffer::resetStats()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.resetStats();
    }
    publishStats();
}

void ConcurrentWriteBuffer::setMaxQueueSize(size_t maxQueueSize)
{
    ensureNotDisposed();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.setMaxQueueSize(maxQueueSize);
        m_maxQueueSize.store(maxQueueSize, std::memory_order_release);
    }
    publishStats();
}

void ConcurrentWriteBuffer::clear()
{
    ensureNotDisposed();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        OccupancyGuard guard(m_engine, m_occupancy);
        m_engine.clear();
    }
    publishStats();
}

std::vector<WriteOperation> ConcurrentWriteBuffer::drainAll()
{
    ensureNotDisposed();
    std::vector<WriteOperation> drained;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        OccupancyGuard guard(m_engine, m_occupancy);
        drained = m_engine.drainAll();
    }
    publishStats();
    return drained;
}

void ConcurrentWriteBuffer::restore(std::vector<WriteOperation> operations)
{
    ensureNotDisposed();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mergeIntakeLocked();
        OccupancyGuard guard(m_engine, m_occupancy);
        m_engine.restore(std::move(operations));
    }
    publishStats();
}

void ConcurrentWriteBuffer::dispose()
{
    if (m_disposed.exchange(true))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    mergeIntakeLocked();
    OccupancyGuard guard(m_engine, m_occupancy);
    m_engine.reset();
}

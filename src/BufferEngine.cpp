#include "BufferEngine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

BufferEngine::BufferEngine(const WriteBufferConfig &config)
    : m_batchSize(config.batchSize),
      m_flushInterval(config.flushInterval),
      m_maxRetries(config.maxRetries),
      m_maxQueueSize(effectiveMaxQueueSize(config))
{
    if (m_batchSize == 0)
    {
        throw std::invalid_argument("batchSize must be greater than zero");
    }
}

bool BufferEngine::admit(WriteOperation op)
{
    if (m_lanes.size() >= m_maxQueueSize)
    {
        ++m_opsRejected;
        return false;
    }
    insert(std::move(op));
    return true;
}

void BufferEngine::insert(WriteOperation op)
{
    validatePriority(op.priority);
    validateOpType(op.opType);
    const Lane lane = laneFor(op.priority);
    place(std::move(op), lane);
}

void BufferEngine::place(WriteOperation op, Lane lane)
{
    switch (m_lanes.insert(std::move(op), lane))
    {
    case PriorityLanes::InsertOutcome::Inserted:
        break;
    case PriorityLanes::InsertOutcome::Superseded:
    case PriorityLanes::InsertOutcome::Discarded:
        ++m_opsDeduplicated;
        break;
    }
}

bool BufferEngine::shouldFlush() const
{
    if (m_lanes.empty())
    {
        return false;
    }

    // High and retried work never waits for a full batch
    if (m_lanes.size(Lane::High) > 0 || m_lanes.size(Lane::Retry) > 0)
    {
        return true;
    }

    if (m_lanes.size(Lane::Normal) >= m_batchSize || m_lanes.size(Lane::Bulk) >= m_batchSize)
    {
        return true;
    }

    auto oldest = m_lanes.oldestQueuedAt();
    return oldest && std::chrono::system_clock::now() - *oldest >= m_flushInterval;
}

BatchResult BufferEngine::formBatch()
{
    BatchResult result;
    if (m_lanes.empty())
    {
        return result;
    }

    auto batch = std::make_shared<WriteBatch>();
    batch->batchId = "batch-" + std::to_string(m_nextBatchId++);
    batch->createdAt = std::chrono::system_clock::now();
    batch->operations = m_lanes.take(m_batchSize);

    WritePriority highest = WritePriority::Bulk;
    for (const auto &op : batch->operations)
    {
        if (static_cast<uint8_t>(op.priority) < static_cast<uint8_t>(highest))
        {
            highest = op.priority;
        }
    }
    batch->priority = highest;

    m_ledger.track(batch);
    ++m_batchesFlushed;

    result.hasBatch = true;
    result.batch = std::move(batch);
    result.remainingCount = m_lanes.size();
    return result;
}

ReconcileReport BufferEngine::commit(const std::string &batchId)
{
    ReconcileReport report;
    auto batch = m_ledger.resolve(batchId, BatchState::Committed);
    if (!batch)
    {
        std::cerr << "BufferEngine: Commit for unknown batch " << batchId << std::endl;
        return report;
    }

    report.found = true;
    report.committed = batch->operations.size();
    m_opsCommitted += report.committed;
    return report;
}

ReconcileReport BufferEngine::fail(const std::string &batchId, const std::string &error)
{
    ReconcileReport report;
    auto batch = m_ledger.resolve(batchId, BatchState::Failed);
    if (!batch)
    {
        std::cerr << "BufferEngine: Failure for unknown batch " << batchId << std::endl;
        return report;
    }

    report.found = true;
    for (const auto &op : batch->operations)
    {
        requeueOrDrop(op, error, report);
    }
    return report;
}

ReconcileReport BufferEngine::failOperations(const std::string &batchId,
                                             const std::vector<std::string> &failedOpIds)
{
    ReconcileReport report;
    auto batch = m_ledger.resolve(batchId, BatchState::Failed);
    if (!batch)
    {
        std::cerr << "BufferEngine: Partial failure for unknown batch " << batchId << std::endl;
        return report;
    }

    report.found = true;
    for (const auto &op : batch->operations)
    {
        if (std::find(failedOpIds.begin(), failedOpIds.end(), op.opId) != failedOpIds.end())
        {
            requeueOrDrop(op, "Operation rejected by backend", report);
        }
        else
        {
            ++report.committed;
        }
    }
    m_opsCommitted += report.committed;
    return report;
}

void BufferEngine::requeueOrDrop(WriteOperation op, const std::string &error, ReconcileReport &report)
{
    ++op.retryCount;
    if (op.retryCount <= m_maxRetries)
    {
        const size_t before = m_lanes.size();
        place(std::move(op), Lane::Retry);
        if (m_lanes.size() > before)
        {
            ++report.requeued;
        }
        return;
    }

    std::cerr << "BufferEngine: Dropping operation " << op.opId << " after "
              << op.retryCount << " attempts: " << error << std::endl;
    ++m_opsFailed;
    report.droppedOperationIds.push_back(std::move(op.opId));
}

int BufferEngine::backpressure() const
{
    const size_t total = m_lanes.size();
    if (total >= m_maxQueueSize)
    {
        return 100;
    }
    const double ratio = static_cast<double>(total) / static_cast<double>(m_maxQueueSize);
    // 100 is reserved for a queue that actually rejects admission
    return std::min(static_cast<int>(std::lround(ratio * 100.0)), 99);
}

WriteBufferStats BufferEngine::stats() const
{
    WriteBufferStats stats;
    stats.highQueueCount = m_lanes.size(Lane::High);
    stats.normalQueueCount = m_lanes.size(Lane::Normal);
    stats.bulkQueueCount = m_lanes.size(Lane::Bulk);
    stats.retryQueueCount = m_lanes.size(Lane::Retry);
    stats.inFlightBatches = m_ledger.size();
    stats.batchesFlushed = m_batchesFlushed;
    stats.opsCommitted = m_opsCommitted;
    stats.opsFailed = m_opsFailed;
    stats.opsDeduplicated = m_opsDeduplicated;
    stats.opsRejected = m_opsRejected;
    stats.backpressure = backpressure();
    return stats;
}

void BufferEngine::resetStats()
{
    m_batchesFlushed = 0;
    m_opsCommitted = 0;
    m_opsFailed = 0;
    m_opsDeduplicated = 0;
    m_opsRejected = 0;
}

void BufferEngine::setMaxQueueSize(size_t maxQueueSize)
{
    if (maxQueueSize == 0)
    {
        throw std::invalid_argument("maxQueueSize must be greater than zero");
    }
    m_maxQueueSize = maxQueueSize;
}

void BufferEngine::restore(std::vector<WriteOperation> operations)
{
    // Validate everything first so a bad record leaves the lanes untouched
    for (const auto &op : operations)
    {
        validatePriority(op.priority);
        validateOpType(op.opType);
    }

    for (auto &op : operations)
    {
        op.sequence = nextSequence();
        const Lane lane = op.retryCount > 0 ? Lane::Retry : laneFor(op.priority);
        place(std::move(op), lane);
    }
}

void BufferEngine::reset()
{
    m_lanes.clear();
    m_ledger.clear();
}

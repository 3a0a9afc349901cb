#include "WriteBuffer.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <unordered_set>

const char *toString(BufferImplementation implementation)
{
    switch (implementation)
    {
    case BufferImplementation::Native:
        return "native";
    case BufferImplementation::Portable:
        return "portable";
    }
    return "unknown";
}

IWriteBuffer::IWriteBuffer(const WriteBufferConfig &config)
    : m_maxConsecutiveFailures(config.maxConsecutiveFailures),
      m_interBatchDelay(config.interBatchDelay) {}

bool IWriteBuffer::queueWrite(std::string opId,
                              WriteOpType opType,
                              std::vector<uint8_t> payload,
                              WritePriority priority)
{
    return queueWriteWithDedup(std::move(opId), opType, std::move(payload), priority, std::nullopt);
}

std::optional<FlushResult> IWriteBuffer::flushBatch(const FlushCallback &flushFn)
{
    BatchResult pending = getPendingBatch();
    if (!pending.hasBatch || !pending.batch)
    {
        return std::nullopt;
    }

    const WriteBatch &batch = *pending.batch;
    std::optional<BatchCallbackResult> outcome;
    try
    {
        outcome = flushFn(batch);
    }
    catch (const std::exception &e)
    {
        ReconcileReport report = markBatchFailed(batch.batchId, e.what());

        FlushResult result;
        result.success = false;
        result.batchId = batch.batchId;
        result.operationCount = batch.operations.size();
        result.failureCount = batch.operations.size();
        for (const auto &op : batch.operations)
        {
            result.failedOperationIds.push_back(op.opId);
        }
        result.droppedOperationIds = std::move(report.droppedOperationIds);
        result.error = e.what();
        std::cerr << "WriteBuffer: Flush of " << batch.batchId << " failed: " << e.what() << std::endl;
        return result;
    }
    catch (...)
    {
        // Dissolve the batch so its operations are not stranded in flight
        markBatchFailed(batch.batchId, "Unknown error");
        throw;
    }

    return reconcile(batch, outcome);
}

FlushResult IWriteBuffer::reconcile(const WriteBatch &batch, const std::optional<BatchCallbackResult> &outcome)
{
    FlushResult result;
    result.batchId = batch.batchId;
    result.operationCount = batch.operations.size();

    if (!outcome || (outcome->success && outcome->operationResults.empty()))
    {
        markBatchCommitted(batch.batchId);
        result.success = true;
        result.successCount = result.operationCount;
        return result;
    }

    if (outcome->operationResults.empty())
    {
        const std::string error = outcome->error.value_or("Batch failed");
        ReconcileReport report = markBatchFailed(batch.batchId, error);
        result.success = false;
        result.failureCount = result.operationCount;
        for (const auto &op : batch.operations)
        {
            result.failedOperationIds.push_back(op.opId);
        }
        result.droppedOperationIds = std::move(report.droppedOperationIds);
        result.error = error;
        return result;
    }

    // Only verdicts for operations that are actually in this batch count
    std::unordered_set<std::string> members;
    for (const auto &op : batch.operations)
    {
        members.insert(op.opId);
    }

    std::optional<std::string> firstError;
    for (const auto &opResult : outcome->operationResults)
    {
        if (opResult.success || members.find(opResult.opId) == members.end())
        {
            continue;
        }
        if (std::find(result.failedOperationIds.begin(), result.failedOperationIds.end(), opResult.opId) !=
            result.failedOperationIds.end())
        {
            continue;
        }
        result.failedOperationIds.push_back(opResult.opId);
        if (!firstError && opResult.error)
        {
            firstError = opResult.error;
        }
    }
    if (!firstError)
    {
        firstError = outcome->error;
    }

    result.failureCount = result.failedOperationIds.size();
    result.successCount = result.operationCount - result.failureCount;

    if (result.failureCount == 0)
    {
        markBatchCommitted(batch.batchId);
        result.success = true;
        return result;
    }

    ReconcileReport report;
    if (result.failureCount == result.operationCount)
    {
        report = markBatchFailed(batch.batchId, firstError.value_or("All operations failed"));
    }
    else
    {
        report = markOperationsFailed(batch.batchId, result.failedOperationIds);
        std::cerr << "WriteBuffer: Partial success for " << batch.batchId << ": "
                  << result.successCount << "/" << result.operationCount << " committed, "
                  << result.failureCount << " queued for retry" << std::endl;
    }

    result.success = false;
    result.droppedOperationIds = std::move(report.droppedOperationIds);
    result.error = firstError;
    return result;
}

size_t IWriteBuffer::flushAll(const FlushCallback &flushFn, const ProgressCallback &onProgress)
{
    return flushAllWithDetails(flushFn, onProgress).totalCommitted;
}

FlushAllResult IWriteBuffer::flushAllWithDetails(const FlushCallback &flushFn, const ProgressCallback &onProgress)
{
    FlushAllResult summary;
    size_t consecutiveFailures = 0;

    while (totalQueued() > 0)
    {
        std::optional<FlushResult> result = flushBatch(flushFn);
        if (!result)
        {
            // Another driver took the remaining operations
            break;
        }

        ++summary.batchCount;
        summary.totalCommitted += result->successCount;
        summary.totalFailed += result->failureCount;
        summary.failedOperationIds.insert(summary.failedOperationIds.end(),
                                          result->failedOperationIds.begin(),
                                          result->failedOperationIds.end());
        summary.droppedOperationIds.insert(summary.droppedOperationIds.end(),
                                           result->droppedOperationIds.begin(),
                                           result->droppedOperationIds.end());

        if (result->success)
        {
            consecutiveFailures = 0;
        }
        else if (++consecutiveFailures >= m_maxConsecutiveFailures && result->successCount == 0)
        {
            std::cerr << "WriteBuffer: Stopping flush after " << consecutiveFailures
                      << " consecutive failures (" << summary.totalCommitted << " committed, "
                      << summary.totalFailed << " failed)" << std::endl;
            summary.aborted = true;
        }

        const size_t remaining = totalQueued();
        if (onProgress)
        {
            onProgress(summary.totalCommitted, remaining, summary.totalFailed);
        }

        if (summary.aborted)
        {
            break;
        }
        if (remaining > 0 && m_interBatchDelay.count() > 0)
        {
            std::this_thread::sleep_for(m_interBatchDelay);
        }
    }

    if (summary.totalFailed > 0 && !summary.aborted)
    {
        std::cerr << "WriteBuffer: Flush completed with partial success (" << summary.totalCommitted
                  << " committed, " << summary.totalFailed << " failed, " << summary.batchCount
                  << " batches)" << std::endl;
    }
    return summary;
}

void IWriteBuffer::setStatsListener(StatsListener listener)
{
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_hasListener.store(static_cast<bool>(listener), std::memory_order_release);
    m_statsListener = std::move(listener);
}

void IWriteBuffer::publishStats()
{
    if (!m_hasListener.load(std::memory_order_acquire))
    {
        return;
    }

    StatsListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listener = m_statsListener;
    }
    if (listener)
    {
        listener(getStats());
    }
}

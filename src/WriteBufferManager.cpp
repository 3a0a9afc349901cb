#include "WriteBufferManager.hpp"
#include <iostream>
#include <stdexcept>

WriteBufferManager::WriteBufferManager(const WriteBufferConfig &config, FlushCallback transport)
    : m_transport(std::move(transport)),
      m_numFlushWorkers(config.numFlushWorkers),
      m_pollInterval(config.pollInterval)
{
    if (!m_transport)
    {
        throw std::invalid_argument("WriteBufferManager requires a transport callback");
    }

    WriteBufferInitResult init = createWriteBuffer(config);
    m_buffer = std::move(init.buffer);
    m_implementation = init.implementation;

    if (!config.spoolPath.empty())
    {
        m_spool = std::make_unique<OperationSpool>(config);
        restoreFromSpool();
    }

    m_workers.reserve(m_numFlushWorkers);
}

void WriteBufferManager::restoreFromSpool()
{
    // The snapshot stays on disk until stop() replaces it, so a crash
    // before then redelivers rather than loses these operations
    std::vector<WriteOperation> spooled;
    try
    {
        spooled = m_spool->load();
    }
    catch (const std::exception &e)
    {
        std::cerr << "WriteBufferManager: Failed to load spool " << m_spool->path() << ": " << e.what() << std::endl;
        throw;
    }

    m_restoredCount = spooled.size();
    m_spoolHoldsPending = false;
    if (!spooled.empty())
    {
        m_buffer->restore(std::move(spooled));
        std::cout << "WriteBufferManager: Restored " << m_restoredCount
                  << " operations from " << m_spool->path() << std::endl;
    }
}

WriteBufferManager::~WriteBufferManager()
{
    try
    {
        stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "WriteBufferManager: Error during shutdown: " << e.what() << std::endl;
    }
}

bool WriteBufferManager::start()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (m_running.load(std::memory_order_acquire))
    {
        std::cerr << "WriteBufferManager: Already running" << std::endl;
        return false;
    }

    // Work spooled by an earlier stop() is only on disk
    if (m_spool && m_spoolHoldsPending)
    {
        restoreFromSpool();
    }

    m_running.store(true, std::memory_order_release);
    {
        std::unique_lock<std::shared_mutex> gate(m_writeGateMutex);
        m_acceptingWrites.store(true, std::memory_order_release);
    }

    for (size_t i = 0; i < m_numFlushWorkers; ++i)
    {
        auto worker = std::make_unique<FlushWorker>(*m_buffer, m_transport, m_pollInterval);
        worker->start();
        m_workers.push_back(std::move(worker));
    }

    std::cout << "WriteBufferManager: Started " << m_numFlushWorkers << " flush workers" << std::endl;
    std::cout << "Implementation: " << toString(m_implementation) << std::endl;
    std::cout << "Spool: " << (m_spool ? m_spool->path() : std::string("Disabled")) << std::endl;
    return true;
}

bool WriteBufferManager::stop()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (!m_running.load(std::memory_order_acquire))
    {
        return false;
    }

    // Once the gate is closed no producer is between its check and its enqueue
    {
        std::unique_lock<std::shared_mutex> gate(m_writeGateMutex);
        m_acceptingWrites.store(false, std::memory_order_release);
    }

    for (auto &worker : m_workers)
    {
        worker->stop();
    }
    m_workers.clear();

    m_lastShutdownFlush = m_buffer->flushAllWithDetails(m_transport);
    if (m_lastShutdownFlush.aborted)
    {
        std::cerr << "WriteBufferManager: Final flush aborted with "
                  << m_buffer->totalQueued() << " operations still queued" << std::endl;
    }

    persistRemaining();

    m_running.store(false, std::memory_order_release);

    std::cout << "WriteBufferManager: Stopped" << std::endl;
    return true;
}

void WriteBufferManager::persistRemaining()
{
    if (!m_spool)
    {
        const size_t remaining = m_buffer->totalQueued();
        if (remaining > 0)
        {
            std::cerr << "WriteBufferManager: No spool configured, " << remaining
                      << " operations remain queued in memory" << std::endl;
        }
        return;
    }

    std::vector<WriteOperation> remaining = m_buffer->drainAll();
    if (remaining.empty())
    {
        // Everything restored from the spool has been delivered
        m_spool->remove();
        m_spoolHoldsPending = false;
        return;
    }

    try
    {
        m_spool->save(remaining);
        m_spoolHoldsPending = true;
    }
    catch (const std::exception &e)
    {
        std::cerr << "WriteBufferManager: Failed to spool " << remaining.size()
                  << " operations: " << e.what() << std::endl;
        m_buffer->restore(std::move(remaining));
    }
}

FlushAllResult WriteBufferManager::getLastShutdownFlush() const
{
    std::lock_guard<std::mutex> lock(m_systemMutex);
    return m_lastShutdownFlush;
}

bool WriteBufferManager::queueWrite(std::string opId,
                                    WriteOpType opType,
                                    std::vector<uint8_t> payload,
                                    WritePriority priority)
{
    return queueWriteWithDedup(std::move(opId), opType, std::move(payload), priority, std::nullopt);
}

bool WriteBufferManager::queueWriteWithDedup(std::string opId,
                                             WriteOpType opType,
                                             std::vector<uint8_t> payload,
                                             WritePriority priority,
                                             std::optional<std::string> dedupKey)
{
    std::shared_lock<std::shared_mutex> gate(m_writeGateMutex);
    if (!m_acceptingWrites.load(std::memory_order_acquire))
    {
        std::cerr << "WriteBufferManager: Not accepting writes" << std::endl;
        return false;
    }

    return m_buffer->queueWriteWithDedup(std::move(opId), opType, std::move(payload), priority, std::move(dedupKey));
}

bool WriteBufferManager::queueCreateEntry(std::string opId,
                                          std::vector<uint8_t> payload,
                                          WritePriority priority)
{
    return queueWrite(std::move(opId), WriteOpType::CreateEntry, std::move(payload), priority);
}

bool WriteBufferManager::queueUpdateEntry(std::string opId,
                                          std::string entryHash,
                                          std::vector<uint8_t> payload,
                                          WritePriority priority)
{
    return queueWriteWithDedup(std::move(opId), WriteOpType::UpdateEntry, std::move(payload), priority,
                               std::move(entryHash));
}

bool WriteBufferManager::queueCreateLink(std::string opId,
                                         std::vector<uint8_t> payload,
                                         WritePriority priority)
{
    return queueWrite(std::move(opId), WriteOpType::CreateLink, std::move(payload), priority);
}

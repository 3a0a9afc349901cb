#ifndef WRITE_BUFFER_MANAGER_HPP
#define WRITE_BUFFER_MANAGER_HPP

#include "Config.hpp"
#include "FlushWorker.hpp"
#include "OperationSpool.hpp"
#include "WriteBuffer.hpp"
#include "WriteBufferFactory.hpp"
#include <memory>
#include <vector>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <optional>

/**
 * @brief Owns a write buffer, its flush workers and its shutdown spool
 *
 * On construction the buffer is created through the factory and any
 * snapshot left by a previous run is restored into it. stop() flushes what
 * it can and spools the rest, so accepted writes survive a restart. A
 * start() after stop() restores that spool again before accepting writes.
 */
class WriteBufferManager
{
public:
    explicit WriteBufferManager(const WriteBufferConfig &config, FlushCallback transport);
    ~WriteBufferManager();

    bool start();
    bool stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    bool queueWrite(std::string opId,
                    WriteOpType opType,
                    std::vector<uint8_t> payload,
                    WritePriority priority = WritePriority::Normal);
    bool queueWriteWithDedup(std::string opId,
                             WriteOpType opType,
                             std::vector<uint8_t> payload,
                             WritePriority priority,
                             std::optional<std::string> dedupKey);

    bool queueCreateEntry(std::string opId,
                          std::vector<uint8_t> payload,
                          WritePriority priority = WritePriority::Normal);
    // Last update for an entry hash wins
    bool queueUpdateEntry(std::string opId,
                          std::string entryHash,
                          std::vector<uint8_t> payload,
                          WritePriority priority = WritePriority::Normal);
    bool queueCreateLink(std::string opId,
                         std::vector<uint8_t> payload,
                         WritePriority priority = WritePriority::Normal);

    IWriteBuffer &getBuffer() { return *m_buffer; }
    BufferImplementation getImplementation() const { return m_implementation; }
    // Operations restored by the most recent spool load
    size_t getRestoredCount() const { return m_restoredCount; }
    FlushAllResult getLastShutdownFlush() const;

private:
    void restoreFromSpool();
    void persistRemaining();

    std::unique_ptr<IWriteBuffer> m_buffer;
    BufferImplementation m_implementation;
    FlushCallback m_transport;
    std::unique_ptr<OperationSpool> m_spool;            // null when spooling is disabled
    std::vector<std::unique_ptr<FlushWorker>> m_workers; // background flush threads
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_acceptingWrites{false};
    mutable std::mutex m_systemMutex;                    // For start/stop
    std::shared_mutex m_writeGateMutex;                  // shared for producers, exclusive to close the gate
    bool m_spoolHoldsPending = false;                    // spool has work that is not in the buffer

    size_t m_numFlushWorkers;
    std::chrono::milliseconds m_pollInterval;
    size_t m_restoredCount = 0;
    FlushAllResult m_lastShutdownFlush;
};

#endif

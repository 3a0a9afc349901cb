#ifndef FLUSH_WORKER_HPP
#define FLUSH_WORKER_HPP

#include "WriteBuffer.hpp"
#include <thread>
#include <atomic>
#include <chrono>
#include <memory>

// Background driver: flushes whenever the buffer asks for it, sleeps otherwise
class FlushWorker
{
public:
    explicit FlushWorker(IWriteBuffer &buffer,
                         FlushCallback transport,
                         std::chrono::milliseconds pollInterval = std::chrono::milliseconds(5));

    ~FlushWorker();

    void start();
    void stop();
    bool isRunning() const;

    uint64_t batchesFlushed() const { return m_batchesFlushed.load(std::memory_order_relaxed); }
    uint64_t failedFlushes() const { return m_failedFlushes.load(std::memory_order_relaxed); }

private:
    void processBatches();

    IWriteBuffer &m_buffer;
    FlushCallback m_transport;
    std::unique_ptr<std::thread> m_workerThread;
    std::atomic<bool> m_running{false};
    const std::chrono::milliseconds m_pollInterval;

    std::atomic<uint64_t> m_batchesFlushed{0};
    std::atomic<uint64_t> m_failedFlushes{0};
};
#endif

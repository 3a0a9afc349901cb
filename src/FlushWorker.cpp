#include "FlushWorker.hpp"
#include <iostream>
#include <stdexcept>

FlushWorker::FlushWorker(IWriteBuffer &buffer,
                         FlushCallback transport,
                         std::chrono::milliseconds pollInterval)
    : m_buffer(buffer),
      m_transport(std::move(transport)),
      m_pollInterval(pollInterval)
{
    if (!m_transport)
    {
        throw std::invalid_argument("FlushWorker requires a transport callback");
    }
}

FlushWorker::~FlushWorker()
{
    stop();
}

void FlushWorker::start()
{
    if (m_running.exchange(true))
    {
        return;
    }

    m_workerThread.reset(new std::thread(&FlushWorker::processBatches, this));
}

void FlushWorker::stop()
{
    if (m_running.exchange(false))
    {
        if (m_workerThread && m_workerThread->joinable())
        {
            m_workerThread->join();
        }
    }
}

bool FlushWorker::isRunning() const
{
    return m_running.load();
}

void FlushWorker::processBatches()
{
    while (m_running)
    {
        try
        {
            if (!m_buffer.shouldFlush())
            {
                std::this_thread::sleep_for(m_pollInterval);
                continue;
            }

            std::optional<FlushResult> result = m_buffer.flushBatch(m_transport);
            if (!result)
            {
                continue;
            }

            m_batchesFlushed.fetch_add(1, std::memory_order_relaxed);
            if (!result->success)
            {
                m_failedFlushes.fetch_add(1, std::memory_order_relaxed);
                // Back off so a failing backend is not hammered with the retry lane
                std::this_thread::sleep_for(m_pollInterval);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "FlushWorker: " << e.what() << std::endl;
            m_failedFlushes.fetch_add(1, std::memory_order_relaxed);
            std::this_thread::sleep_for(m_pollInterval);
        }
    }
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "FlushWorker.hpp"
#include "PortableWriteBuffer.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

class FlushWorkerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config.batchSize = 10;
        config.flushInterval = std::chrono::milliseconds(20);
        config.maxRetries = 100;
        config.interBatchDelay = std::chrono::milliseconds(0);
        buffer = std::make_unique<PortableWriteBuffer>(config);
    }

    void TearDown() override
    {
        if (worker)
        {
            worker->stop();
        }
    }

    // Polls until the condition holds or the timeout expires
    template <typename Predicate>
    bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return predicate();
    }

    WriteBufferConfig config;
    std::unique_ptr<PortableWriteBuffer> buffer;
    std::unique_ptr<FlushWorker> worker;
};

TEST_F(FlushWorkerTest, RequiresTransport)
{
    EXPECT_THROW((FlushWorker{*buffer, FlushCallback()}), std::invalid_argument);
}

// Test that the worker starts and stops correctly
TEST_F(FlushWorkerTest, StartAndStop)
{
    worker = std::make_unique<FlushWorker>(*buffer, [](const WriteBatch &) -> std::optional<BatchCallbackResult>
                                           { return std::nullopt; });
    EXPECT_FALSE(worker->isRunning());

    worker->start();
    EXPECT_TRUE(worker->isRunning());

    // Multiple start calls should not affect the running state
    worker->start();
    EXPECT_TRUE(worker->isRunning());

    worker->stop();
    EXPECT_FALSE(worker->isRunning());
    worker->stop();
}

TEST_F(FlushWorkerTest, FlushesHighPriorityImmediately)
{
    ::testing::MockFunction<std::optional<BatchCallbackResult>(const WriteBatch &)> transport;
    std::atomic<size_t> delivered{0};
    EXPECT_CALL(transport, Call(::testing::_))
        .WillRepeatedly([&](const WriteBatch &batch) -> std::optional<BatchCallbackResult>
                        {
            delivered += batch.operations.size();
            return std::nullopt; });

    worker = std::make_unique<FlushWorker>(*buffer, transport.AsStdFunction(), std::chrono::milliseconds(1));
    worker->start();

    ASSERT_TRUE(buffer->queueWrite("consent-1", WriteOpType::UpdateEntry, {1}, WritePriority::High));
    EXPECT_TRUE(waitFor([&]()
                        { return delivered.load() == 1; }));
    worker->stop();

    EXPECT_EQ(buffer->getStats().opsCommitted, 1u);
    EXPECT_GE(worker->batchesFlushed(), 1u);
    EXPECT_EQ(worker->failedFlushes(), 0u);
}

// A lone Normal operation goes out once the flush interval elapses
TEST_F(FlushWorkerTest, FlushesAgedOperations)
{
    std::atomic<size_t> delivered{0};
    worker = std::make_unique<FlushWorker>(*buffer, [&](const WriteBatch &batch) -> std::optional<BatchCallbackResult>
                                           {
        delivered += batch.operations.size();
        return std::nullopt; },
                                           std::chrono::milliseconds(1));
    worker->start();

    buffer->queueWrite("normal-1", WriteOpType::CreateEntry, {1});
    EXPECT_TRUE(waitFor([&]()
                        { return delivered.load() == 1; }));
    EXPECT_EQ(buffer->totalQueued(), 0u);
}

TEST_F(FlushWorkerTest, RetriesUntilBackendRecovers)
{
    std::atomic<int> attempts{0};
    worker = std::make_unique<FlushWorker>(*buffer, [&](const WriteBatch &) -> std::optional<BatchCallbackResult>
                                           {
        if (++attempts < 3)
        {
            throw std::runtime_error("backend unavailable");
        }
        return std::nullopt; },
                                           std::chrono::milliseconds(1));
    worker->start();

    buffer->queueWrite("op", WriteOpType::CreateEntry, {1}, WritePriority::High);
    EXPECT_TRUE(waitFor([&]()
                        { return buffer->getStats().opsCommitted == 1; }));
    worker->stop();

    EXPECT_EQ(attempts.load(), 3);
    EXPECT_EQ(worker->failedFlushes(), 2u);
    EXPECT_EQ(buffer->totalQueued(), 0u);
}

// A disposed buffer has nothing left to flush; the worker idles until stopped
TEST_F(FlushWorkerTest, IdlesOnDisposedBuffer)
{
    worker = std::make_unique<FlushWorker>(*buffer, [](const WriteBatch &) -> std::optional<BatchCallbackResult>
                                           { return std::nullopt; },
                                           std::chrono::milliseconds(1));
    buffer->queueWrite("op", WriteOpType::CreateEntry, {1}, WritePriority::High);
    buffer->dispose();
    worker->start();

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(worker->isRunning());
    worker->stop();
    EXPECT_FALSE(worker->isRunning());
}

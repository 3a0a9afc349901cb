#include <gtest/gtest.h>
#include "WriteBufferManager.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class WriteBufferManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        testDir = "./test_manager_spool";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);

        config.batchSize = 25;
        config.flushInterval = std::chrono::milliseconds(10);
        config.maxRetries = 10;
        config.maxConsecutiveFailures = 3;
        config.interBatchDelay = std::chrono::milliseconds(0);
        config.numFlushWorkers = 2;
        config.pollInterval = std::chrono::milliseconds(1);
        config.spoolPath = testDir + "/pending.spool";
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir);
    }

    // Transport that records every delivered operation
    FlushCallback recordingTransport()
    {
        return [this](const WriteBatch &batch) -> std::optional<BatchCallbackResult>
        {
            std::lock_guard<std::mutex> lock(deliveredMutex);
            for (const auto &op : batch.operations)
            {
                delivered.push_back(op);
            }
            return std::nullopt;
        };
    }

    static FlushCallback failingTransport()
    {
        return [](const WriteBatch &) -> std::optional<BatchCallbackResult>
        {
            throw std::runtime_error("storage offline");
        };
    }

    std::vector<uint8_t> bytes(const std::string &text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string testDir;
    WriteBufferConfig config;
    std::mutex deliveredMutex;
    std::vector<WriteOperation> delivered;
};

TEST_F(WriteBufferManagerTest, DeliversEverythingBeforeStopReturns)
{
    WriteBufferManager manager(config, recordingTransport());
    ASSERT_TRUE(manager.start());
    EXPECT_TRUE(manager.isRunning());

    const int total = 400;
    for (int i = 0; i < total; ++i)
    {
        WritePriority priority = static_cast<WritePriority>(i % 3);
        ASSERT_TRUE(manager.queueCreateEntry("entry-" + std::to_string(i), bytes("payload"), priority));
    }

    ASSERT_TRUE(manager.stop());
    EXPECT_FALSE(manager.isRunning());

    std::set<std::string> ids;
    for (const auto &op : delivered)
    {
        ids.insert(op.opId);
    }
    EXPECT_EQ(delivered.size(), static_cast<size_t>(total));
    EXPECT_EQ(ids.size(), static_cast<size_t>(total));
    EXPECT_EQ(manager.getBuffer().totalQueued(), 0u);
    EXPECT_EQ(manager.getBuffer().getStats().opsCommitted, static_cast<uint64_t>(total));
    EXPECT_FALSE(std::filesystem::exists(config.spoolPath));
}

TEST_F(WriteBufferManagerTest, WritesRequireRunningManager)
{
    WriteBufferManager manager(config, recordingTransport());
    EXPECT_FALSE(manager.queueCreateEntry("early", bytes("x")));

    ASSERT_TRUE(manager.start());
    EXPECT_FALSE(manager.start());
    EXPECT_TRUE(manager.queueCreateLink("link-1", bytes("a->b")));

    ASSERT_TRUE(manager.stop());
    EXPECT_FALSE(manager.stop());
    EXPECT_FALSE(manager.queueCreateEntry("late", bytes("x")));
}

TEST_F(WriteBufferManagerTest, RequiresTransport)
{
    EXPECT_THROW((WriteBufferManager{config, FlushCallback()}), std::invalid_argument);
}

// Without flush workers everything waits for the shutdown flush, so only the last update survives
TEST_F(WriteBufferManagerTest, UpdatesToSameEntryCollapse)
{
    config.numFlushWorkers = 0;
    WriteBufferManager manager(config, recordingTransport());
    ASSERT_TRUE(manager.start());

    for (int version = 0; version < 5; ++version)
    {
        ASSERT_TRUE(manager.queueUpdateEntry("update-" + std::to_string(version), "entry-hash-7",
                                             bytes("v" + std::to_string(version))));
    }
    ASSERT_TRUE(manager.queueUpdateEntry("other", "entry-hash-8", bytes("v0")));
    ASSERT_TRUE(manager.stop());

    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(manager.getBuffer().getStats().opsDeduplicated, 4u);
    bool sawLatest = false;
    for (const auto &op : delivered)
    {
        if (op.dedupKey && *op.dedupKey == "entry-hash-7")
        {
            EXPECT_EQ(op.opId, "update-4");
            EXPECT_EQ(op.payload, bytes("v4"));
            sawLatest = true;
        }
    }
    EXPECT_TRUE(sawLatest);
}

TEST_F(WriteBufferManagerTest, UndeliveredOperationsSurviveRestart)
{
    config.numFlushWorkers = 0;
    {
        WriteBufferManager first(config, failingTransport());
        EXPECT_EQ(first.getRestoredCount(), 0u);
        ASSERT_TRUE(first.start());
        for (int i = 0; i < 5; ++i)
        {
            ASSERT_TRUE(first.queueCreateEntry("pending-" + std::to_string(i), bytes("data")));
        }
        ASSERT_TRUE(first.queueUpdateEntry("keyed", "hash-1", bytes("latest"), WritePriority::High));
        ASSERT_TRUE(first.stop());

        FlushAllResult shutdown = first.getLastShutdownFlush();
        EXPECT_TRUE(shutdown.aborted);
        EXPECT_EQ(shutdown.totalCommitted, 0u);
    }
    ASSERT_TRUE(std::filesystem::exists(config.spoolPath));

    WriteBufferManager second(config, recordingTransport());
    EXPECT_EQ(second.getRestoredCount(), 6u);
    EXPECT_EQ(second.getBuffer().totalQueued(), 6u);
    // Retried work comes back on the retry lane
    EXPECT_EQ(second.getBuffer().getStats().retryQueueCount, 6u);
    // The snapshot is kept until it has been superseded
    EXPECT_TRUE(std::filesystem::exists(config.spoolPath));

    ASSERT_TRUE(second.start());
    ASSERT_TRUE(second.stop());

    ASSERT_EQ(delivered.size(), 6u);
    for (const auto &op : delivered)
    {
        EXPECT_EQ(op.retryCount, 3u);
        if (op.opId == "keyed")
        {
            ASSERT_TRUE(op.dedupKey.has_value());
            EXPECT_EQ(*op.dedupKey, "hash-1");
            EXPECT_EQ(op.payload, bytes("latest"));
        }
    }
    EXPECT_FALSE(std::filesystem::exists(config.spoolPath));
}

// A restart of the same manager picks the spooled work back up instead of discarding it
TEST_F(WriteBufferManagerTest, RestartRestoresSpooledOperations)
{
    config.numFlushWorkers = 0;
    std::atomic<bool> online{false};
    std::atomic<size_t> deliveredCount{0};
    WriteBufferManager manager(config, [&](const WriteBatch &batch) -> std::optional<BatchCallbackResult>
                               {
        if (!online.load())
        {
            throw std::runtime_error("storage offline");
        }
        deliveredCount += batch.operations.size();
        return std::nullopt; });

    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(manager.queueCreateEntry("a", bytes("1")));
    ASSERT_TRUE(manager.queueCreateEntry("b", bytes("2")));
    ASSERT_TRUE(manager.stop());
    ASSERT_TRUE(std::filesystem::exists(config.spoolPath));
    EXPECT_EQ(manager.getBuffer().totalQueued(), 0u);

    // Still offline: the work goes back to disk
    ASSERT_TRUE(manager.start());
    EXPECT_EQ(manager.getRestoredCount(), 2u);
    EXPECT_EQ(manager.getBuffer().totalQueued(), 2u);
    ASSERT_TRUE(manager.stop());
    ASSERT_TRUE(std::filesystem::exists(config.spoolPath));
    EXPECT_EQ(OperationSpool(config).load().size(), 2u);

    online.store(true);
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(manager.stop());
    EXPECT_EQ(deliveredCount.load(), 2u);
    EXPECT_FALSE(std::filesystem::exists(config.spoolPath));

    // Nothing pending any more, so another cycle restores nothing
    ASSERT_TRUE(manager.start());
    EXPECT_EQ(manager.getBuffer().totalQueued(), 0u);
    ASSERT_TRUE(manager.stop());
    EXPECT_EQ(deliveredCount.load(), 2u);
}

// Every write the manager accepted is either delivered or spooled, even when stop() races producers
TEST_F(WriteBufferManagerTest, StopRacingProducersLosesNothing)
{
    config.maxQueueSize = 1000000;
    std::atomic<bool> online{true};
    WriteBufferManager manager(config, [&](const WriteBatch &batch) -> std::optional<BatchCallbackResult>
                               {
        if (!online.load())
        {
            throw std::runtime_error("storage offline");
        }
        std::lock_guard<std::mutex> lock(deliveredMutex);
        for (const auto &op : batch.operations)
        {
            delivered.push_back(op);
        }
        return std::nullopt; });
    ASSERT_TRUE(manager.start());

    const int producers = 6;
    const int perProducer = 20000;
    std::atomic<bool> stopping{false};
    std::atomic<size_t> accepted{0};
    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p)
    {
        threads.emplace_back([&, p]()
                             {
            for (int i = 0; i < perProducer; ++i)
            {
                if (manager.queueCreateEntry("p" + std::to_string(p) + "-" + std::to_string(i), bytes("x")))
                {
                    ++accepted;
                }
                else if (stopping.load())
                {
                    break;
                }
            } });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    online.store(false);
    stopping.store(true);
    ASSERT_TRUE(manager.stop());
    for (auto &thread : threads)
    {
        thread.join();
    }

    const size_t spooled = std::filesystem::exists(config.spoolPath) ? OperationSpool(config).load().size() : 0;
    EXPECT_EQ(manager.getBuffer().totalQueued(), 0u);
    EXPECT_EQ(manager.getBuffer().inFlightCount(), 0u);
    EXPECT_EQ(delivered.size() + spooled, accepted.load());
}

TEST_F(WriteBufferManagerTest, EncryptedSpoolRequiresMatchingKey)
{
    config.numFlushWorkers = 0;
    config.spoolKeyHex = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    {
        WriteBufferManager first(config, failingTransport());
        ASSERT_TRUE(first.start());
        ASSERT_TRUE(first.queueCreateEntry("secret", bytes("personal data")));
        ASSERT_TRUE(first.stop());
    }
    ASSERT_TRUE(std::filesystem::exists(config.spoolPath));

    WriteBufferConfig wrongKey = config;
    wrongKey.spoolKeyHex = std::string(64, 'f');
    EXPECT_THROW((WriteBufferManager{wrongKey, recordingTransport()}), std::runtime_error);

    WriteBufferConfig noKey = config;
    noKey.spoolKeyHex.clear();
    EXPECT_THROW((WriteBufferManager{noKey, recordingTransport()}), std::runtime_error);

    WriteBufferManager restored(config, recordingTransport());
    EXPECT_EQ(restored.getRestoredCount(), 1u);
    ASSERT_TRUE(restored.start());
    ASSERT_TRUE(restored.stop());
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, bytes("personal data"));
}

TEST_F(WriteBufferManagerTest, CorruptSpoolFailsConstruction)
{
    {
        std::ofstream file(config.spoolPath, std::ios::binary);
        file << "definitely not a spool";
    }
    EXPECT_THROW((WriteBufferManager{config, recordingTransport()}), std::runtime_error);
    // Left in place for inspection
    EXPECT_TRUE(std::filesystem::exists(config.spoolPath));
}

// Without a spool, undelivered work stays in memory rather than being discarded
TEST_F(WriteBufferManagerTest, NoSpoolKeepsOperationsQueued)
{
    config.numFlushWorkers = 0;
    config.spoolPath.clear();
    WriteBufferManager manager(config, failingTransport());
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(manager.queueCreateEntry("stuck", bytes("x")));
    ASSERT_TRUE(manager.stop());

    EXPECT_EQ(manager.getBuffer().totalQueued(), 1u);
}

TEST_F(WriteBufferManagerTest, PortableBackendWhenNativeDisabled)
{
    config.preferNative = false;
    WriteBufferManager manager(config, recordingTransport());
    EXPECT_EQ(manager.getImplementation(), BufferImplementation::Portable);
    EXPECT_STREQ(manager.getBuffer().implementationName(), "portable");
}

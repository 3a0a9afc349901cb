#include "WriteBufferManager.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>
#include <atomic>

int main()
{
    // system parameters
    WriteBufferConfig config = presetConfig("seeding");
    config.batchSize = 25;
    config.maxQueueSize = 500;
    config.numFlushWorkers = 1;
    config.spoolPath = "./write_buffer.spool";
    config.compressionLevel = 4;
    config.spoolKeyHex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"; // demo key

    if (std::filesystem::exists(config.spoolPath))
    {
        std::filesystem::remove(config.spoolPath);
    }

    // A backend that accepts everything except links into missing entries
    std::atomic<size_t> transmitted{0};
    FlushCallback transport = [&transmitted](const WriteBatch &batch) -> std::optional<BatchCallbackResult>
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));

        BatchCallbackResult result;
        for (const auto &op : batch.operations)
        {
            bool accepted = op.opType != WriteOpType::CreateLink || op.retryCount > 0;
            result.operationResults.push_back({op.opId, accepted, accepted ? std::nullopt : std::optional<std::string>("target entry not found")});
            if (accepted)
            {
                ++transmitted;
            }
        }
        std::cout << "sent " << batch.batchId << " (" << batch.operations.size() << " ops, "
                  << toString(batch.priority) << ")" << std::endl;
        return result;
    };

    WriteBufferManager manager(config, transport);
    manager.getBuffer().setStatsListener([](const WriteBufferStats &stats)
                                         {
        if (stats.backpressure >= 80)
        {
            std::cout << "backpressure " << stats.backpressure << "%" << std::endl;
        } });
    manager.start();

    for (int i = 0; i < 200; ++i)
    {
        std::string text = "content node " + std::to_string(i);
        std::vector<uint8_t> payload(text.begin(), text.end());
        while (!manager.queueCreateEntry("create-" + std::to_string(i), payload, WritePriority::Bulk))
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    // Repeated edits of the same entry collapse into the last one
    for (int rev = 0; rev < 5; ++rev)
    {
        std::string text = "profile revision " + std::to_string(rev);
        manager.queueUpdateEntry("update-profile-" + std::to_string(rev), "entry-hash-profile",
                                 std::vector<uint8_t>(text.begin(), text.end()), WritePriority::High);
    }

    for (int i = 0; i < 10; ++i)
    {
        std::string text = "create-" + std::to_string(i) + " -> create-" + std::to_string(i + 1);
        manager.queueCreateLink("link-" + std::to_string(i), std::vector<uint8_t>(text.begin(), text.end()));
    }

    manager.stop();

    WriteBufferStats stats = manager.getBuffer().getStats();
    std::cout << "Transmitted: " << transmitted.load() << std::endl;
    std::cout << "Committed: " << stats.opsCommitted << ", deduplicated: " << stats.opsDeduplicated
              << ", dropped: " << stats.opsFailed << ", batches: " << stats.batchesFlushed << std::endl;

    return 0;
}

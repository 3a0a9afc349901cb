#include "BenchmarkUtils.hpp"
#include <stdexcept>
#include <thread>

SimulatedBackend::SimulatedBackend(std::chrono::microseconds roundTrip,
                                   std::chrono::microseconds perOperation,
                                   double failureRate)
    : m_roundTrip(roundTrip),
      m_perOperation(perOperation),
      m_failureRate(failureRate) {}

std::optional<BatchCallbackResult> SimulatedBackend::operator()(const WriteBatch &batch)
{
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> failureDist(0.0, 1.0);

    std::this_thread::sleep_for(m_roundTrip + m_perOperation * static_cast<int64_t>(batch.operations.size()));
    m_batchesReceived.fetch_add(1);

    if (m_failureRate > 0.0 && failureDist(rng) < m_failureRate)
    {
        throw std::runtime_error("simulated backend timeout");
    }

    m_operationsReceived.fetch_add(batch.operations.size());
    return std::nullopt;
}

FlushCallback SimulatedBackend::callback()
{
    return [this](const WriteBatch &batch)
    { return (*this)(batch); };
}

std::vector<uint8_t> generatePayload(size_t size, std::mt19937 &rng)
{
    static const std::vector<std::string> wordList = {"the", "entry", "content", "link", "path", "node"};

    // Zipfian distribution for payload words
    std::vector<double> weights;
    for (size_t k = 0; k < wordList.size(); ++k)
    {
        weights.push_back(1.0 / (k + 1.0));
    }
    std::discrete_distribution<size_t> wordDist(weights.begin(), weights.end());

    std::string payloadStr;
    while (payloadStr.size() < size)
    {
        if (!payloadStr.empty())
            payloadStr += " ";
        payloadStr += wordList[wordDist(rng)];
    }
    payloadStr.resize(size);
    return std::vector<uint8_t>(payloadStr.begin(), payloadStr.end());
}

ProducerResult produceOperations(IWriteBuffer &buffer,
                                 int producerId,
                                 int numOperations,
                                 int payloadSize,
                                 int dedupKeySpace,
                                 std::chrono::milliseconds rejectBackoff)
{
    ProducerResult result;
    result.latencies.reserve(numOperations);

    std::mt19937 rng(producerId);
    std::uniform_int_distribution<int> priorityDist(0, 9);
    std::uniform_int_distribution<int> keyDist(0, std::max(dedupKeySpace - 1, 0));

    for (int i = 0; i < numOperations; ++i)
    {
        // Mostly bulk seeding with a trickle of interactive writes
        int roll = priorityDist(rng);
        WritePriority priority = roll == 0 ? WritePriority::High : (roll < 3 ? WritePriority::Normal : WritePriority::Bulk);

        std::optional<std::string> dedupKey;
        if (dedupKeySpace > 0)
        {
            dedupKey = "entry-" + std::to_string(keyDist(rng));
        }

        std::string opId = "p" + std::to_string(producerId) + "-" + std::to_string(i);
        std::vector<uint8_t> payload = generatePayload(static_cast<size_t>(payloadSize), rng);

        while (true)
        {
            auto startTime = std::chrono::high_resolution_clock::now();
            bool accepted = buffer.queueWriteWithDedup(opId,
                                                       dedupKey ? WriteOpType::UpdateEntry : WriteOpType::CreateEntry,
                                                       payload, priority, dedupKey);
            auto endTime = std::chrono::high_resolution_clock::now();
            result.latencies.addMeasurement(std::chrono::duration_cast<std::chrono::nanoseconds>(endTime - startTime));

            if (accepted)
            {
                ++result.accepted;
                break;
            }
            ++result.rejected;
            std::this_thread::sleep_for(rejectBackoff);
        }
    }

    return result;
}

LatencyStats calculateLatencyStats(const LatencyCollector &collector)
{
    const auto &latencies = collector.getMeasurements();

    if (latencies.empty())
    {
        return {0.0, 0.0, 0.0, 0};
    }

    // Convert to milliseconds for easier reading
    std::vector<double> latenciesMs;
    latenciesMs.reserve(latencies.size());
    for (const auto &lat : latencies)
    {
        latenciesMs.push_back(static_cast<double>(lat.count()) / 1e6); // ns to ms
    }

    std::sort(latenciesMs.begin(), latenciesMs.end());

    LatencyStats stats;
    stats.count = latenciesMs.size();
    stats.maxMs = latenciesMs.back();
    stats.avgMs = std::accumulate(latenciesMs.begin(), latenciesMs.end(), 0.0) / latenciesMs.size();

    size_t medianIdx = latenciesMs.size() / 2;
    if (latenciesMs.size() % 2 == 0)
    {
        stats.medianMs = (latenciesMs[medianIdx - 1] + latenciesMs[medianIdx]) / 2.0;
    }
    else
    {
        stats.medianMs = latenciesMs[medianIdx];
    }

    return stats;
}

void printLatencyStats(const LatencyStats &stats)
{
    std::cout << "============== Latency Statistics ==============" << std::endl;
    std::cout << "Total enqueue attempts: " << stats.count << std::endl;
    std::cout << "Max latency: " << stats.maxMs << " ms" << std::endl;
    std::cout << "Average latency: " << stats.avgMs << " ms" << std::endl;
    std::cout << "Median latency: " << stats.medianMs << " ms" << std::endl;
    std::cout << "===============================================" << std::endl;
}

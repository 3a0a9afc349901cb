#include "BenchmarkUtils.hpp"
#include "ConcurrentWriteBuffer.hpp"
#include "FlushWorker.hpp"
#include "PortableWriteBuffer.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <future>
#include <iomanip>
#include <memory>

struct BenchmarkRun
{
    double throughput;
    double elapsedSeconds;
    size_t rejected;
    uint64_t committed;
    uint64_t deduplicated;
};

BenchmarkRun runBenchmark(BufferImplementation implementation, const WriteBufferConfig &config,
                          int numProducers, int operationsPerProducer, int payloadSize,
                          int dedupKeySpace, size_t numFlushWorkers)
{
    std::unique_ptr<IWriteBuffer> buffer;
    if (implementation == BufferImplementation::Native)
    {
        buffer = std::make_unique<ConcurrentWriteBuffer>(config);
    }
    else
    {
        buffer = std::make_unique<PortableWriteBuffer>(config);
    }

    SimulatedBackend backend(std::chrono::microseconds(500), std::chrono::microseconds(2), 0.01);

    std::vector<std::unique_ptr<FlushWorker>> workers;
    for (size_t i = 0; i < numFlushWorkers; ++i)
    {
        workers.push_back(std::make_unique<FlushWorker>(*buffer, backend.callback(), config.pollInterval));
        workers.back()->start();
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<std::future<ProducerResult>> futures;
    for (int i = 0; i < numProducers; ++i)
    {
        futures.push_back(std::async(std::launch::async, produceOperations, std::ref(*buffer), i,
                                     operationsPerProducer, payloadSize, dedupKeySpace,
                                     std::chrono::milliseconds(1)));
    }

    LatencyCollector latencies;
    size_t rejected = 0;
    for (auto &future : futures)
    {
        ProducerResult result = future.get();
        latencies.merge(result.latencies);
        rejected += result.rejected;
    }

    for (auto &worker : workers)
    {
        worker->stop();
    }
    buffer->flushAll(backend.callback());

    auto endTime = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = endTime - startTime;

    WriteBufferStats stats = buffer->getStats();
    std::cout << "\n"
              << toString(implementation) << " backend, " << numProducers << " producers" << std::endl;
    printLatencyStats(calculateLatencyStats(latencies));
    std::cout << "Committed: " << stats.opsCommitted << ", deduplicated: " << stats.opsDeduplicated
              << ", dropped: " << stats.opsFailed << ", rejected attempts: " << rejected << std::endl;

    BenchmarkRun run;
    run.elapsedSeconds = elapsed.count();
    run.throughput = (numProducers * operationsPerProducer) / run.elapsedSeconds;
    run.rejected = rejected;
    run.committed = stats.opsCommitted;
    run.deduplicated = stats.opsDeduplicated;
    return run;
}

int main()
{
    // system parameters
    WriteBufferConfig config = presetConfig("seeding");
    config.maxRetries = 5;
    config.pollInterval = std::chrono::milliseconds(1);
    config.interBatchDelay = std::chrono::milliseconds(0);
    // benchmark parameters
    const std::vector<int> producerCounts = {1, 2, 4, 8, 16};
    const int operationsPerProducer = 20000;
    const int payloadSize = 256;
    const int dedupKeySpace = 5000;
    const size_t numFlushWorkers = 2;

    std::vector<std::pair<BufferImplementation, std::vector<BenchmarkRun>>> results = {
        {BufferImplementation::Portable, {}},
        {BufferImplementation::Native, {}}};

    for (auto &[implementation, runs] : results)
    {
        for (int producers : producerCounts)
        {
            runs.push_back(runBenchmark(implementation, config, producers, operationsPerProducer,
                                        payloadSize, dedupKeySpace, numFlushWorkers));
        }
    }

    std::cout << "\n=================== WRITE BUFFER BENCHMARK SUMMARY ===================" << std::endl;
    std::cout << std::left << std::setw(12) << "Backend"
              << std::setw(12) << "Producers"
              << std::setw(22) << "Throughput (ops/s)"
              << std::setw(14) << "Time (s)"
              << std::setw(12) << "Rejected" << std::endl;
    std::cout << "----------------------------------------------------------------------" << std::endl;
    for (const auto &[implementation, runs] : results)
    {
        for (size_t i = 0; i < runs.size(); ++i)
        {
            std::cout << std::left << std::setw(12) << toString(implementation)
                      << std::setw(12) << producerCounts[i]
                      << std::setw(22) << std::fixed << std::setprecision(2) << runs[i].throughput
                      << std::setw(14) << std::fixed << std::setprecision(2) << runs[i].elapsedSeconds
                      << std::setw(12) << runs[i].rejected << std::endl;
        }
    }
    std::cout << "======================================================================" << std::endl;

    return 0;
}

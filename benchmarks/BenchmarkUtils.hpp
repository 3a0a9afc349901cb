#ifndef BENCHMARK_UTILS_HPP
#define BENCHMARK_UTILS_HPP

#include "WriteBuffer.hpp"
#include <vector>
#include <string>
#include <optional>
#include <iostream>
#include <chrono>
#include <algorithm>
#include <atomic>
#include <random>
#include <numeric>

class LatencyCollector
{
private:
    std::vector<std::chrono::nanoseconds> latencies;

public:
    void addMeasurement(std::chrono::nanoseconds latency)
    {
        latencies.push_back(latency);
    }

    void reserve(size_t capacity)
    {
        latencies.reserve(capacity);
    }

    const std::vector<std::chrono::nanoseconds> &getMeasurements() const
    {
        return latencies;
    }

    // Merge another collector's measurements into this one
    void merge(const LatencyCollector &other)
    {
        const auto &otherLatencies = other.getMeasurements();
        latencies.insert(latencies.end(), otherLatencies.begin(), otherLatencies.end());
    }
};

struct LatencyStats
{
    double maxMs;
    double avgMs;
    double medianMs;
    size_t count;
};

struct ProducerResult
{
    LatencyCollector latencies;
    size_t accepted = 0;
    size_t rejected = 0;
};

/**
 * @brief Stand-in for a slow, rate-sensitive storage backend
 *
 * Each batch costs a fixed round trip plus a per-operation cost, and a
 * configurable share of batches fail outright.
 */
class SimulatedBackend
{
public:
    SimulatedBackend(std::chrono::microseconds roundTrip,
                     std::chrono::microseconds perOperation,
                     double failureRate = 0.0);

    std::optional<BatchCallbackResult> operator()(const WriteBatch &batch);

    FlushCallback callback();

    uint64_t operationsReceived() const { return m_operationsReceived.load(); }
    uint64_t batchesReceived() const { return m_batchesReceived.load(); }

private:
    std::chrono::microseconds m_roundTrip;
    std::chrono::microseconds m_perOperation;
    double m_failureRate;
    std::atomic<uint64_t> m_operationsReceived{0};
    std::atomic<uint64_t> m_batchesReceived{0};
};

std::vector<uint8_t> generatePayload(size_t size, std::mt19937 &rng);

// Queues operations, backing off while the buffer reports backpressure
ProducerResult produceOperations(IWriteBuffer &buffer,
                                 int producerId,
                                 int numOperations,
                                 int payloadSize,
                                 int dedupKeySpace,
                                 std::chrono::milliseconds rejectBackoff);

LatencyStats calculateLatencyStats(const LatencyCollector &collector);

void printLatencyStats(const LatencyStats &stats);

#endif

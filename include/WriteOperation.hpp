#ifndef WRITE_OPERATION_HPP
#define WRITE_OPERATION_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class WritePriority : uint8_t
{
    High = 0,   // identity, auth, consent
    Normal = 1, // regular content updates
    Bulk = 2,   // seeding, imports, recovery sync
};

enum class WriteOpType : uint8_t
{
    CreateEntry = 0,
    UpdateEntry = 1,
    DeleteEntry = 2,
    CreateLink = 3,
    DeleteLink = 4,
};

enum class BatchState
{
    Pending,
    InFlight,
    Committed,
    Failed,
};

const char *toString(WritePriority priority);
const char *toString(WriteOpType opType);
const char *toString(BatchState state);

// Case-insensitive; throw std::invalid_argument on unknown names
WritePriority parsePriority(const std::string &name);
WriteOpType parseOpType(const std::string &name);

// Throw std::invalid_argument for values outside the declared enumerators
void validatePriority(WritePriority priority);
void validateOpType(WriteOpType opType);

struct WriteOperation
{
    std::string opId;
    WriteOpType opType = WriteOpType::CreateEntry;
    std::vector<uint8_t> payload;
    WritePriority priority = WritePriority::Normal;
    std::chrono::system_clock::time_point queuedAt;
    uint32_t retryCount = 0;
    std::optional<std::string> dedupKey = std::nullopt;
    uint64_t sequence = 0; // admission order, assigned by the buffer

    WriteOperation() = default;
    WriteOperation(std::string id,
                   WriteOpType type,
                   std::vector<uint8_t> data,
                   WritePriority prio,
                   std::optional<std::string> key = std::nullopt)
        : opId(std::move(id)),
          opType(type),
          payload(std::move(data)),
          priority(prio),
          queuedAt(std::chrono::system_clock::now()),
          dedupKey(std::move(key)) {}
};

/**
 * @brief Immutable slice of operations handed to a flush callback
 *
 * Operations are ordered retry-first, then by priority, then by age.
 * The priority of a batch is the highest priority among its operations.
 */
struct WriteBatch
{
    std::string batchId;
    std::vector<WriteOperation> operations;
    std::chrono::system_clock::time_point createdAt;
    WritePriority priority = WritePriority::Normal;
};

struct BatchResult
{
    bool hasBatch = false;
    std::shared_ptr<const WriteBatch> batch;
    size_t remainingCount = 0; // still queued after formation
};

struct WriteBufferStats
{
    size_t highQueueCount = 0;
    size_t normalQueueCount = 0;
    size_t bulkQueueCount = 0;
    size_t retryQueueCount = 0;
    size_t inFlightBatches = 0;
    uint64_t batchesFlushed = 0;
    uint64_t opsCommitted = 0;
    uint64_t opsFailed = 0;       // dropped after exhausting retries
    uint64_t opsDeduplicated = 0; // superseded by a newer write with the same key
    uint64_t opsRejected = 0;     // refused at admission
    int backpressure = 0;         // 0-100
};

// Outcome of reconciling one in-flight batch
struct ReconcileReport
{
    bool found = false;
    size_t committed = 0;
    size_t requeued = 0;
    std::vector<std::string> droppedOperationIds;
};

#endif

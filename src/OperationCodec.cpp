#include "OperationCodec.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

void OperationCodec::appendToVector(std::vector<uint8_t> &vec, const void *data, size_t size)
{
    const uint8_t *bytes = static_cast<const uint8_t *>(data);
    vec.insert(vec.end(), bytes, bytes + size);
}

void OperationCodec::appendStringToVector(std::vector<uint8_t> &vec, const std::string &str)
{
    uint32_t size = static_cast<uint32_t>(str.size());
    appendToVector(vec, &size, sizeof(size));
    if (size > 0)
    {
        appendToVector(vec, str.data(), size);
    }
}

bool OperationCodec::extractFromVector(const std::vector<uint8_t> &vec, size_t &offset, void *data, size_t size)
{
    if (offset + size > vec.size())
    {
        return false;
    }
    std::memcpy(data, vec.data() + offset, size);
    offset += size;
    return true;
}

bool OperationCodec::extractStringFromVector(const std::vector<uint8_t> &vec, size_t &offset, std::string &str)
{
    uint32_t size;
    if (!extractFromVector(vec, offset, &size, sizeof(size)))
    {
        return false;
    }
    if (offset + size > vec.size())
    {
        return false;
    }
    str.assign(reinterpret_cast<const char *>(vec.data() + offset), size);
    offset += size;
    return true;
}

std::vector<uint8_t> OperationCodec::serialize(const WriteOperation &op)
{
    size_t totalSize =
        sizeof(uint32_t) + op.opId.size() +   // Size + op id
        sizeof(uint8_t) +                     // Operation type
        sizeof(uint8_t) +                     // Priority
        sizeof(int64_t) +                     // queuedAt
        sizeof(uint32_t) +                    // Retry count
        sizeof(uint8_t) +                     // Dedup key flag
        (op.dedupKey ? sizeof(uint32_t) + op.dedupKey->size() : 0) +
        sizeof(uint32_t) + op.payload.size(); // Size + payload

    std::vector<uint8_t> result;
    result.reserve(totalSize);

    appendStringToVector(result, op.opId);

    uint8_t opType = static_cast<uint8_t>(op.opType);
    appendToVector(result, &opType, sizeof(opType));
    uint8_t priority = static_cast<uint8_t>(op.priority);
    appendToVector(result, &priority, sizeof(priority));

    int64_t queuedAt = std::chrono::duration_cast<std::chrono::milliseconds>(
                           op.queuedAt.time_since_epoch())
                           .count();
    appendToVector(result, &queuedAt, sizeof(queuedAt));

    uint32_t retryCount = op.retryCount;
    appendToVector(result, &retryCount, sizeof(retryCount));

    uint8_t hasDedupKey = op.dedupKey ? 1 : 0;
    appendToVector(result, &hasDedupKey, sizeof(hasDedupKey));
    if (op.dedupKey)
    {
        appendStringToVector(result, *op.dedupKey);
    }

    uint32_t payloadSize = static_cast<uint32_t>(op.payload.size());
    appendToVector(result, &payloadSize, sizeof(payloadSize));
    if (!op.payload.empty())
    {
        appendToVector(result, op.payload.data(), op.payload.size());
    }

    return result;
}

bool OperationCodec::deserialize(const std::vector<uint8_t> &data, WriteOperation &op)
{
    size_t offset = 0;
    WriteOperation decoded;

    if (!extractStringFromVector(data, offset, decoded.opId))
        return false;

    uint8_t opType;
    uint8_t priority;
    if (!extractFromVector(data, offset, &opType, sizeof(opType)) ||
        !extractFromVector(data, offset, &priority, sizeof(priority)))
        return false;
    if (opType > static_cast<uint8_t>(WriteOpType::DeleteLink) ||
        priority > static_cast<uint8_t>(WritePriority::Bulk))
        return false;
    decoded.opType = static_cast<WriteOpType>(opType);
    decoded.priority = static_cast<WritePriority>(priority);

    int64_t queuedAt;
    if (!extractFromVector(data, offset, &queuedAt, sizeof(queuedAt)))
        return false;
    decoded.queuedAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(queuedAt));

    if (!extractFromVector(data, offset, &decoded.retryCount, sizeof(decoded.retryCount)))
        return false;

    uint8_t hasDedupKey;
    if (!extractFromVector(data, offset, &hasDedupKey, sizeof(hasDedupKey)) || hasDedupKey > 1)
        return false;
    if (hasDedupKey)
    {
        std::string key;
        if (!extractStringFromVector(data, offset, key))
            return false;
        decoded.dedupKey = std::move(key);
    }

    uint32_t payloadSize;
    if (!extractFromVector(data, offset, &payloadSize, sizeof(payloadSize)))
        return false;
    if (offset + payloadSize != data.size())
        return false;
    decoded.payload.assign(data.begin() + offset, data.end());

    op = std::move(decoded);
    return true;
}

std::vector<uint8_t> OperationCodec::serializeBatch(const std::vector<WriteOperation> &operations)
{
    std::vector<uint8_t> result;

    uint32_t count = static_cast<uint32_t>(operations.size());
    appendToVector(result, &count, sizeof(count));

    for (const auto &op : operations)
    {
        std::vector<uint8_t> record = serialize(op);
        uint32_t recordSize = static_cast<uint32_t>(record.size());
        appendToVector(result, &recordSize, sizeof(recordSize));
        result.insert(result.end(), record.begin(), record.end());
    }

    return result;
}

std::vector<WriteOperation> OperationCodec::deserializeBatch(const std::vector<uint8_t> &batchData)
{
    size_t offset = 0;
    uint32_t count;
    if (!extractFromVector(batchData, offset, &count, sizeof(count)))
    {
        throw std::runtime_error("Operation batch too small - missing record count");
    }

    std::vector<WriteOperation> operations;
    // Every record takes at least its size prefix, so a bogus count cannot over-reserve
    operations.reserve(std::min<size_t>(count, (batchData.size() - offset) / sizeof(uint32_t)));

    for (uint32_t i = 0; i < count; ++i)
    {
        uint32_t recordSize;
        if (!extractFromVector(batchData, offset, &recordSize, sizeof(recordSize)) ||
            offset + recordSize > batchData.size())
        {
            throw std::runtime_error("Operation batch truncated at record " + std::to_string(i));
        }

        std::vector<uint8_t> record(batchData.begin() + offset, batchData.begin() + offset + recordSize);
        offset += recordSize;

        WriteOperation op;
        if (!deserialize(record, op))
        {
            throw std::runtime_error("Malformed operation record " + std::to_string(i));
        }
        operations.push_back(std::move(op));
    }

    if (offset != batchData.size())
    {
        throw std::runtime_error("Trailing bytes after operation batch");
    }
    return operations;
}

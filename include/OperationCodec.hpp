#ifndef OPERATION_CODEC_HPP
#define OPERATION_CODEC_HPP

#include "WriteOperation.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Binary encoding of queued operations for the spool
 *
 * Record layout (native byte order, lengths as uint32):
 *   opId (length + bytes) | opType u8 | priority u8 | queuedAt ms i64 |
 *   retryCount u32 | hasDedupKey u8 [dedupKey (length + bytes)] |
 *   payload (length + bytes)
 *
 * A batch is a uint32 record count followed by size-prefixed records.
 * The admission sequence is not encoded; it is reassigned on restore.
 */
class OperationCodec
{
public:
    static std::vector<uint8_t> serialize(const WriteOperation &op);

    // false if the record is truncated or names an unknown priority or type
    static bool deserialize(const std::vector<uint8_t> &data, WriteOperation &op);

    static std::vector<uint8_t> serializeBatch(const std::vector<WriteOperation> &operations);

    // Throws std::runtime_error on any malformed record; a spool is all or nothing
    static std::vector<WriteOperation> deserializeBatch(const std::vector<uint8_t> &batchData);

private:
    static void appendToVector(std::vector<uint8_t> &vec, const void *data, size_t size);
    static void appendStringToVector(std::vector<uint8_t> &vec, const std::string &str);
    static bool extractFromVector(const std::vector<uint8_t> &vec, size_t &offset, void *data, size_t size);
    static bool extractStringFromVector(const std::vector<uint8_t> &vec, size_t &offset, std::string &str);
};

#endif

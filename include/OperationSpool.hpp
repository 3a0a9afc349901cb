#ifndef OPERATION_SPOOL_HPP
#define OPERATION_SPOOL_HPP

#include "Config.hpp"
#include "WriteOperation.hpp"
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>  // for open flags
#include <unistd.h> // for close, pwrite, fsync
#include <stdexcept>

/**
 * @brief Durable snapshot of drained operations across restarts
 *
 * File format:
 * [4 bytes]    Magic "WBSP"
 * [2 bytes]    Format version
 * [2 bytes]    Flags (compressed, encrypted)
 * [12 bytes]   GCM IV (zero when not encrypted)
 * [8 bytes]    Size of the serialized operation batch
 * [8 bytes]    Size of the body
 * [N bytes]    Body: serialized batch, zlib compressed and/or AES-256-GCM
 *              sealed (ciphertext + tag, header authenticated as AAD)
 *
 * Saves go to "<path>.tmp", are fsynced and then renamed over the path,
 * so a crash leaves either the previous snapshot or the new one.
 */
class OperationSpool
{
public:
    static constexpr uint32_t MAGIC = 0x50534257; // "WBSP" little-endian
    static constexpr uint16_t FORMAT_VERSION = 1;
    static constexpr uint16_t FLAG_COMPRESSED = 0x1;
    static constexpr uint16_t FLAG_ENCRYPTED = 0x2;
    static constexpr size_t HEADER_SIZE = 4 + 2 + 2 + 12 + 8 + 8;

    // Uses spoolPath, compressionLevel, spoolKeyHex and the retry settings
    explicit OperationSpool(const WriteBufferConfig &config);

    // Throws std::runtime_error if the snapshot could not be made durable
    void save(const std::vector<WriteOperation> &operations);

    // Empty when no snapshot exists; throws std::runtime_error on a corrupt or forged one
    std::vector<WriteOperation> load() const;

    bool exists() const;
    bool remove();
    const std::string &path() const { return m_path; }
    bool isEncrypted() const { return !m_key.empty(); }

private:
    std::vector<uint8_t> buildHeader(uint16_t flags, const std::vector<uint8_t> &iv,
                                     uint64_t rawSize, uint64_t bodySize) const;

    template <typename Func>
    auto retryWithBackoff(Func &&f)
    {
        for (size_t attempt = 1;; ++attempt)
        {
            try
            {
                return f();
            }
            catch (const std::runtime_error &)
            {
                if (attempt >= m_maxAttempts)
                    throw;
                auto delay = m_baseRetryDelay * (1 << (attempt - 1));
                std::this_thread::sleep_for(delay);
            }
        }
    }

    int openWithRetry(const char *path, int flags, mode_t mode)
    {
        return retryWithBackoff([&]()
                                {
            int fd = ::open(path, flags, mode);
            if (fd < 0) throw std::runtime_error(std::string("open failed: ") + path);
            return fd; });
    }

    size_t pwriteFull(int fd, const uint8_t *buf, size_t count, off_t offset)
    {
        size_t total = 0;
        while (total < count)
        {
            ssize_t written = ::pwrite(fd, buf + total, count - total, offset + total);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error("pwrite failed");
            }
            total += written;
        }
        return total;
    }

    void fsyncRetry(int fd)
    {
        retryWithBackoff([&]()
                         {
            if (::fsync(fd) < 0) throw std::runtime_error("fsync failed");
            return 0; });
    }

    std::string m_path;
    int m_compressionLevel;
    std::vector<uint8_t> m_key;
    size_t m_maxAttempts;
    std::chrono::milliseconds m_baseRetryDelay;
};

#endif

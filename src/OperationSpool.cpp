#include "OperationSpool.hpp"
#include "Compression.hpp"
#include "Crypto.hpp"
#include "OperationCodec.hpp"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace
{
    // deflate never expands better than about 1032:1
    constexpr uint64_t MAX_INFLATE_RATIO = 1032;

    template <typename T>
    T readField(const std::vector<uint8_t> &data, size_t &offset)
    {
        T value;
        std::memcpy(&value, data.data() + offset, sizeof(value));
        offset += sizeof(value);
        return value;
    }

    template <typename T>
    void appendField(std::vector<uint8_t> &vec, T value)
    {
        const uint8_t *bytes = reinterpret_cast<const uint8_t *>(&value);
        vec.insert(vec.end(), bytes, bytes + sizeof(value));
    }
}

OperationSpool::OperationSpool(const WriteBufferConfig &config)
    : m_path(config.spoolPath),
      m_compressionLevel(config.compressionLevel),
      m_maxAttempts(config.spoolMaxAttempts),
      m_baseRetryDelay(config.spoolBaseRetryDelay)
{
    if (m_path.empty())
    {
        throw std::invalid_argument("Spool path must not be empty");
    }
    if (m_maxAttempts == 0)
    {
        throw std::invalid_argument("spoolMaxAttempts must be greater than zero");
    }
    if (!config.spoolKeyHex.empty())
    {
        m_key = Crypto::keyFromHex(config.spoolKeyHex);
    }
}

std::vector<uint8_t> OperationSpool::buildHeader(uint16_t flags, const std::vector<uint8_t> &iv,
                                                 uint64_t rawSize, uint64_t bodySize) const
{
    std::vector<uint8_t> header;
    header.reserve(HEADER_SIZE);
    appendField(header, MAGIC);
    appendField(header, FORMAT_VERSION);
    appendField(header, flags);
    header.insert(header.end(), iv.begin(), iv.end());
    appendField(header, rawSize);
    appendField(header, bodySize);
    return header;
}

void OperationSpool::save(const std::vector<WriteOperation> &operations)
{
    std::vector<uint8_t> raw = OperationCodec::serializeBatch(operations);

    uint16_t flags = 0;
    std::vector<uint8_t> body;
    if (m_compressionLevel > 0)
    {
        body = Compression::compress(raw, m_compressionLevel);
        flags |= FLAG_COMPRESSED;
    }
    else
    {
        body = raw;
    }

    std::vector<uint8_t> iv(Crypto::GCM_IV_SIZE, 0);
    std::vector<uint8_t> header;
    if (isEncrypted())
    {
        iv = Crypto::randomIV();
        flags |= FLAG_ENCRYPTED;
        header = buildHeader(flags, iv, raw.size(), body.size() + Crypto::GCM_TAG_SIZE);
        body = Crypto::encrypt(body, m_key, iv, header);
    }
    else
    {
        header = buildHeader(flags, iv, raw.size(), body.size());
    }

    const std::string tmpPath = m_path + ".tmp";
    int fd = openWithRetry(tmpPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    try
    {
        pwriteFull(fd, header.data(), header.size(), 0);
        pwriteFull(fd, body.data(), body.size(), static_cast<off_t>(header.size()));
        fsyncRetry(fd);
    }
    catch (const std::exception &)
    {
        ::close(fd);
        ::unlink(tmpPath.c_str());
        throw;
    }

    if (::close(fd) < 0)
    {
        ::unlink(tmpPath.c_str());
        throw std::runtime_error("close failed: " + tmpPath);
    }
    if (::rename(tmpPath.c_str(), m_path.c_str()) != 0)
    {
        ::unlink(tmpPath.c_str());
        throw std::runtime_error("rename failed: " + tmpPath + " -> " + m_path);
    }

    // Persist the rename itself
    std::filesystem::path directory = std::filesystem::path(m_path).parent_path();
    if (directory.empty())
    {
        directory = ".";
    }
    int dirFd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (dirFd >= 0)
    {
        fsyncRetry(dirFd);
        ::close(dirFd);
    }

    std::cout << "OperationSpool: Saved " << operations.size() << " operations to " << m_path << std::endl;
}

std::vector<WriteOperation> OperationSpool::load() const
{
    if (!exists())
    {
        return {};
    }

    std::ifstream inputFile(m_path, std::ios::binary | std::ios::ate);
    if (!inputFile)
    {
        throw std::runtime_error("Failed to open spool: " + m_path);
    }
    const std::streamsize fileSize = inputFile.tellg();
    inputFile.seekg(0, std::ios::beg);

    std::vector<uint8_t> fileData(static_cast<size_t>(fileSize));
    if (fileSize > 0 && !inputFile.read(reinterpret_cast<char *>(fileData.data()), fileSize))
    {
        throw std::runtime_error("Failed to read spool: " + m_path);
    }

    if (fileData.size() < HEADER_SIZE)
    {
        throw std::runtime_error("Spool too small - missing header: " + m_path);
    }

    size_t offset = 0;
    const uint32_t magic = readField<uint32_t>(fileData, offset);
    const uint16_t version = readField<uint16_t>(fileData, offset);
    const uint16_t flags = readField<uint16_t>(fileData, offset);
    std::vector<uint8_t> iv(fileData.begin() + offset, fileData.begin() + offset + Crypto::GCM_IV_SIZE);
    offset += Crypto::GCM_IV_SIZE;
    const uint64_t rawSize = readField<uint64_t>(fileData, offset);
    const uint64_t bodySize = readField<uint64_t>(fileData, offset);

    if (magic != MAGIC)
    {
        throw std::runtime_error("Not a write buffer spool: " + m_path);
    }
    if (version != FORMAT_VERSION)
    {
        throw std::runtime_error("Unsupported spool version " + std::to_string(version));
    }
    if ((flags & ~(FLAG_COMPRESSED | FLAG_ENCRYPTED)) != 0)
    {
        throw std::runtime_error("Unknown spool flags");
    }
    if (bodySize != fileData.size() - HEADER_SIZE)
    {
        throw std::runtime_error("Spool body truncated: " + m_path);
    }

    std::vector<uint8_t> header(fileData.begin(), fileData.begin() + HEADER_SIZE);
    std::vector<uint8_t> body(fileData.begin() + HEADER_SIZE, fileData.end());

    if (flags & FLAG_ENCRYPTED)
    {
        if (!isEncrypted())
        {
            throw std::runtime_error("Spool is encrypted but no key is configured");
        }
        body = Crypto::decrypt(body, m_key, iv, header);
    }
    else if (isEncrypted())
    {
        throw std::runtime_error("Spool is not encrypted but a key is configured");
    }

    std::vector<uint8_t> raw;
    if (flags & FLAG_COMPRESSED)
    {
        if (rawSize > body.size() * MAX_INFLATE_RATIO + 64)
        {
            throw std::runtime_error("Spool announces an implausible size");
        }
        raw = Compression::decompress(body, static_cast<size_t>(rawSize));
    }
    else
    {
        if (rawSize != body.size())
        {
            throw std::runtime_error("Spool size mismatch");
        }
        raw = std::move(body);
    }

    return OperationCodec::deserializeBatch(raw);
}

bool OperationSpool::exists() const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(m_path, ec);
}

bool OperationSpool::remove()
{
    std::error_code ec;
    bool removed = std::filesystem::remove(m_path, ec);
    if (ec)
    {
        std::cerr << "OperationSpool: Failed to remove " << m_path << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

#include "Compression.hpp"
#include <stdexcept>
#include <cstring>
#include <string>

std::vector<uint8_t> Compression::compress(const std::vector<uint8_t> &data, int level)
{
    if (level != Z_DEFAULT_COMPRESSION && (level < 1 || level > 9))
    {
        throw std::invalid_argument("Invalid zlib compression level: " + std::to_string(level));
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (deflateInit(&zs, level) != Z_OK)
    {
        throw std::runtime_error("Failed to initialize zlib deflate");
    }

    // deflateBound guarantees a single Z_FINISH call completes the stream
    std::vector<uint8_t> compressedData(deflateBound(&zs, static_cast<uLong>(data.size())));

    zs.next_in = const_cast<Bytef *>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = compressedData.data();
    zs.avail_out = static_cast<uInt>(compressedData.size());

    int ret = deflate(&zs, Z_FINISH);
    const size_t produced = zs.total_out;
    deflateEnd(&zs);

    if (ret != Z_STREAM_END)
    {
        throw std::runtime_error("Exception during zlib compression");
    }

    compressedData.resize(produced);
    return compressedData;
}

std::vector<uint8_t> Compression::decompress(const std::vector<uint8_t> &compressedData, size_t expectedSize)
{
    if (compressedData.empty())
    {
        throw std::runtime_error("Cannot decompress an empty zlib stream");
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (inflateInit(&zs) != Z_OK)
    {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }

    // One spare byte so a stream longer than announced is detected
    std::vector<uint8_t> decompressedData(expectedSize + 1);

    zs.next_in = const_cast<Bytef *>(compressedData.data());
    zs.avail_in = static_cast<uInt>(compressedData.size());
    zs.next_out = decompressedData.data();
    zs.avail_out = static_cast<uInt>(decompressedData.size());

    int ret = inflate(&zs, Z_FINISH);
    const size_t produced = zs.total_out;
    inflateEnd(&zs);

    if (ret != Z_STREAM_END)
    {
        throw std::runtime_error("Exception during zlib decompression");
    }
    if (produced != expectedSize)
    {
        throw std::runtime_error("Decompressed size " + std::to_string(produced) +
                                 " does not match expected " + std::to_string(expectedSize));
    }

    decompressedData.resize(produced);
    return decompressedData;
}

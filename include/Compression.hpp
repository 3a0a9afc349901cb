#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <vector>
#include <cstdint>
#include <zlib.h>

class Compression
{
public:
    // level is 1-9 or Z_DEFAULT_COMPRESSION; throws std::invalid_argument otherwise
    static std::vector<uint8_t> compress(const std::vector<uint8_t> &data, int level = Z_DEFAULT_COMPRESSION);

    // Throws std::runtime_error unless the stream inflates to exactly expectedSize bytes
    static std::vector<uint8_t> decompress(const std::vector<uint8_t> &compressedData, size_t expectedSize);
};

#endif

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <chrono>

struct WriteBufferConfig
{
    // batching
    size_t batchSize = 50;                                        // max operations per batch and per-lane flush threshold
    std::chrono::milliseconds flushInterval = std::chrono::milliseconds(100);
    // retries
    size_t maxRetries = 3;
    // admission
    size_t maxQueueSize = 0; // 0 = batchSize * 100
    // flushAll
    size_t maxConsecutiveFailures = 3;
    std::chrono::milliseconds interBatchDelay = std::chrono::milliseconds(10);
    // backend selection
    bool preferNative = true;
    // background flushing
    size_t numFlushWorkers = 1;
    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(5);
    // spool
    std::string spoolPath = "";    // empty disables persistence on shutdown
    int compressionLevel = 6;      // 0 = no compression, 1-9 = zlib levels
    std::string spoolKeyHex = "";  // 64 hex chars for AES-256, empty disables encryption
    size_t spoolMaxAttempts = 5;
    std::chrono::milliseconds spoolBaseRetryDelay = std::chrono::milliseconds(1);
};

// "seeding", "interactive" or "recovery"; throws std::invalid_argument otherwise
WriteBufferConfig presetConfig(const std::string &preset);

size_t effectiveMaxQueueSize(const WriteBufferConfig &config);

// Throws std::invalid_argument describing the first invalid field
void validateConfig(const WriteBufferConfig &config);

// key=value per line, '#' comments; a "preset" key must come first
WriteBufferConfig loadConfigFromFile(const std::string &configFilePath);
bool saveConfigToFile(const WriteBufferConfig &config, const std::string &configFilePath);

#endif

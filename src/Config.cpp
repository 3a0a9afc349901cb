#include "Config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(),
                                      [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(),
                                    [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    size_t parseSize(const std::string &key, const std::string &value)
    {
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                                          [](unsigned char c)
                                          { return std::isdigit(c); }))
        {
            throw std::invalid_argument("Invalid unsigned value for '" + key + "': '" + value + "'");
        }
        try
        {
            return static_cast<size_t>(std::stoull(value));
        }
        catch (const std::out_of_range &)
        {
            throw std::invalid_argument("Value out of range for '" + key + "': '" + value + "'");
        }
    }

    int parseInt(const std::string &key, const std::string &value)
    {
        size_t consumed = 0;
        int parsed = 0;
        try
        {
            parsed = std::stoi(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid integer value for '" + key + "': '" + value + "'");
        }
        if (consumed != value.size())
        {
            throw std::invalid_argument("Invalid integer value for '" + key + "': '" + value + "'");
        }
        return parsed;
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        std::string lowered = value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (lowered == "true" || lowered == "1" || lowered == "yes")
            return true;
        if (lowered == "false" || lowered == "0" || lowered == "no")
            return false;
        throw std::invalid_argument("Invalid boolean value for '" + key + "': '" + value + "'");
    }

    void applySetting(WriteBufferConfig &config, const std::string &key, const std::string &value)
    {
        if (key == "batchSize")
            config.batchSize = parseSize(key, value);
        else if (key == "flushIntervalMs")
            config.flushInterval = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "maxRetries")
            config.maxRetries = parseSize(key, value);
        else if (key == "maxQueueSize")
            config.maxQueueSize = parseSize(key, value);
        else if (key == "maxConsecutiveFailures")
            config.maxConsecutiveFailures = parseSize(key, value);
        else if (key == "interBatchDelayMs")
            config.interBatchDelay = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "preferNative")
            config.preferNative = parseBool(key, value);
        else if (key == "numFlushWorkers")
            config.numFlushWorkers = parseSize(key, value);
        else if (key == "pollIntervalMs")
            config.pollInterval = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "spoolPath")
            config.spoolPath = value;
        else if (key == "compressionLevel")
            config.compressionLevel = parseInt(key, value);
        else if (key == "spoolKeyHex")
            config.spoolKeyHex = value;
        else if (key == "spoolMaxAttempts")
            config.spoolMaxAttempts = parseSize(key, value);
        else if (key == "spoolBaseRetryDelayMs")
            config.spoolBaseRetryDelay = std::chrono::milliseconds(parseSize(key, value));
        else
            throw std::invalid_argument("Unknown configuration key: '" + key + "'");
    }
}

WriteBufferConfig presetConfig(const std::string &preset)
{
    WriteBufferConfig config;
    if (preset == "seeding")
    {
        // larger batches, faster flush, more retries
        config.batchSize = 100;
        config.flushInterval = std::chrono::milliseconds(50);
        config.maxRetries = 5;
        config.maxQueueSize = 10000;
    }
    else if (preset == "interactive")
    {
        config.batchSize = 20;
        config.flushInterval = std::chrono::milliseconds(100);
        config.maxRetries = 3;
        config.maxQueueSize = 1000;
    }
    else if (preset == "recovery")
    {
        config.batchSize = 200;
        config.flushInterval = std::chrono::milliseconds(25);
        config.maxRetries = 10;
        config.maxQueueSize = 50000;
    }
    else
    {
        throw std::invalid_argument("Unknown write buffer preset: '" + preset + "'");
    }
    return config;
}

size_t effectiveMaxQueueSize(const WriteBufferConfig &config)
{
    return config.maxQueueSize != 0 ? config.maxQueueSize : config.batchSize * 100;
}

void validateConfig(const WriteBufferConfig &config)
{
    if (config.batchSize == 0)
    {
        throw std::invalid_argument("batchSize must be greater than zero");
    }
    if (config.flushInterval.count() < 0)
    {
        throw std::invalid_argument("flushInterval must not be negative");
    }
    if (config.maxConsecutiveFailures == 0)
    {
        throw std::invalid_argument("maxConsecutiveFailures must be greater than zero");
    }
    if (config.interBatchDelay.count() < 0 || config.pollInterval.count() < 0)
    {
        throw std::invalid_argument("delays must not be negative");
    }
    if (config.compressionLevel < 0 || config.compressionLevel > 9)
    {
        throw std::invalid_argument("compressionLevel must be between 0 and 9");
    }
    if (!config.spoolKeyHex.empty())
    {
        if (config.spoolKeyHex.size() != 64 ||
            !std::all_of(config.spoolKeyHex.begin(), config.spoolKeyHex.end(),
                         [](unsigned char c)
                         { return std::isxdigit(c); }))
        {
            throw std::invalid_argument("spoolKeyHex must be 64 hexadecimal characters");
        }
    }
    if (config.spoolMaxAttempts == 0)
    {
        throw std::invalid_argument("spoolMaxAttempts must be greater than zero");
    }
}

WriteBufferConfig loadConfigFromFile(const std::string &configFilePath)
{
    std::ifstream file(configFilePath);
    if (!file)
    {
        throw std::runtime_error("Failed to open config file: " + configFilePath);
    }

    WriteBufferConfig config;
    bool anySetting = false;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#')
        {
            continue;
        }

        const size_t separator = stripped.find('=');
        if (separator == std::string::npos || separator == 0)
        {
            throw std::invalid_argument("Malformed line " + std::to_string(lineNumber) +
                                        " in " + configFilePath + ": '" + stripped + "'");
        }
        const std::string key = trim(stripped.substr(0, separator));
        const std::string value = trim(stripped.substr(separator + 1));

        if (key == "preset")
        {
            if (anySetting)
            {
                throw std::invalid_argument("'preset' must be the first setting in " + configFilePath);
            }
            config = presetConfig(value);
        }
        else
        {
            applySetting(config, key, value);
        }
        anySetting = true;
    }

    validateConfig(config);
    return config;
}

bool saveConfigToFile(const WriteBufferConfig &config, const std::string &configFilePath)
{
    std::ofstream file(configFilePath);
    if (!file)
    {
        return false;
    }
    file << "batchSize=" << config.batchSize << "\n"
         << "flushIntervalMs=" << config.flushInterval.count() << "\n"
         << "maxRetries=" << config.maxRetries << "\n"
         << "maxQueueSize=" << config.maxQueueSize << "\n"
         << "maxConsecutiveFailures=" << config.maxConsecutiveFailures << "\n"
         << "interBatchDelayMs=" << config.interBatchDelay.count() << "\n"
         << "preferNative=" << (config.preferNative ? "true" : "false") << "\n"
         << "numFlushWorkers=" << config.numFlushWorkers << "\n"
         << "pollIntervalMs=" << config.pollInterval.count() << "\n"
         << "spoolPath=" << config.spoolPath << "\n"
         << "compressionLevel=" << config.compressionLevel << "\n"
         << "spoolKeyHex=" << config.spoolKeyHex << "\n"
         << "spoolMaxAttempts=" << config.spoolMaxAttempts << "\n"
         << "spoolBaseRetryDelayMs=" << config.spoolBaseRetryDelay.count() << "\n";
    return static_cast<bool>(file);
}

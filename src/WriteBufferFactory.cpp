#include "WriteBufferFactory.hpp"
#include "ConcurrentWriteBuffer.hpp"
#include "PortableWriteBuffer.hpp"
#include <atomic>
#include <iostream>
#include <thread>

bool checkNativeAvailable()
{
    return std::thread::hardware_concurrency() > 1 && std::atomic<size_t>::is_always_lock_free;
}

WriteBufferInitResult createWriteBuffer(const WriteBufferConfig &config)
{
    return createWriteBuffer(config, [](const WriteBufferConfig &cfg)
                             { return std::unique_ptr<IWriteBuffer>(new ConcurrentWriteBuffer(cfg)); });
}

WriteBufferInitResult createWriteBuffer(const WriteBufferConfig &config,
                                        const NativeBufferFactory &nativeFactory)
{
    return createWriteBuffer(config, nativeFactory, checkNativeAvailable);
}

WriteBufferInitResult createWriteBuffer(const WriteBufferConfig &config,
                                        const NativeBufferFactory &nativeFactory,
                                        const NativeCapabilityCheck &nativeAvailable)
{
    validateConfig(config);

    WriteBufferInitResult result;

    if (!config.preferNative)
    {
        result.fallbackReason = "native backend not requested";
    }
    else if (!nativeAvailable || !nativeAvailable())
    {
        result.fallbackReason = "native backend not supported on this platform";
    }
    else if (!nativeFactory)
    {
        result.fallbackReason = "no native backend constructor";
    }
    else
    {
        try
        {
            result.buffer = nativeFactory(config);
            if (result.buffer)
            {
                result.implementation = BufferImplementation::Native;
                std::cout << "WriteBufferFactory: Using " << toString(result.implementation)
                          << " write buffer" << std::endl;
                return result;
            }
            result.fallbackReason = "native backend constructor returned no buffer";
        }
        catch (const std::exception &e)
        {
            result.fallbackReason = std::string("native backend failed: ") + e.what();
        }
        std::cerr << "WriteBufferFactory: " << *result.fallbackReason
                  << ", falling back to portable" << std::endl;
    }

    result.buffer = std::make_unique<PortableWriteBuffer>(config);
    result.implementation = BufferImplementation::Portable;
    std::cout << "WriteBufferFactory: Using " << toString(result.implementation)
              << " write buffer" << std::endl;
    return result;
}

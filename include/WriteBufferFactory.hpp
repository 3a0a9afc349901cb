#ifndef WRITE_BUFFER_FACTORY_HPP
#define WRITE_BUFFER_FACTORY_HPP

#include "Config.hpp"
#include "WriteBuffer.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct WriteBufferInitResult
{
    std::unique_ptr<IWriteBuffer> buffer;
    BufferImplementation implementation = BufferImplementation::Portable;
    std::optional<std::string> fallbackReason = std::nullopt; // why the native backend was not used
};

using NativeBufferFactory = std::function<std::unique_ptr<IWriteBuffer>(const WriteBufferConfig &)>;
using NativeCapabilityCheck = std::function<bool()>;

// True when the lock-free intake can actually run in parallel with flushing
bool checkNativeAvailable();

/**
 * @brief Build the preferred backend, falling back to the portable one
 *
 * The native backend is attempted when config.preferNative is set and
 * checkNativeAvailable() holds. Any failure to construct it is logged and
 * answered with a PortableWriteBuffer. Failure of the portable backend
 * propagates.
 *
 * @throws std::invalid_argument if the configuration is invalid
 */
WriteBufferInitResult createWriteBuffer(const WriteBufferConfig &config);

// Same, with the native constructor supplied by the caller
WriteBufferInitResult createWriteBuffer(const WriteBufferConfig &config,
                                        const NativeBufferFactory &nativeFactory);

// Same, with the platform capability check supplied by the caller as well
WriteBufferInitResult createWriteBuffer(const WriteBufferConfig &config,
                                        const NativeBufferFactory &nativeFactory,
                                        const NativeCapabilityCheck &nativeAvailable);

#endif

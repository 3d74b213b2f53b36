#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace mcpstub {

/// Callback for incoming requests
using MessageCallback = std::function<void(Request)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input or shutdown().
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Write one response. Throws TransportError if it cannot be written.
    virtual void send(const Response& resp) = 0;

    /// Graceful shutdown. Safe to call from another thread.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpstub

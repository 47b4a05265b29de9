#pragma once
#include <functional>
#include <optional>
#include <string>

namespace mcpfs {

/// One logical client. Frames are complete JSON texts without terminators.
class IConnection {
public:
    virtual ~IConnection() = default;

    /// Block for the next frame. Returns nullopt on EOF or shutdown.
    /// Throws McpTransportError if the channel fails.
    virtual std::optional<std::string> read_frame() = 0;

    /// Send one frame. Throws McpTransportError if the channel fails.
    virtual void write_frame(const std::string& frame) = 0;
};

/// Runs for the lifetime of one connection.
using ConnectionHandler = std::function<void(IConnection& connection)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Accept connections and run `on_connection` for each. Blocks until the
    /// transport is exhausted or shut down.
    virtual void start(ConnectionHandler on_connection) = 0;

    /// Graceful shutdown. Safe to call from any thread, and before start().
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

} // namespace mcpfs

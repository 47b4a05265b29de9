#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "sandbox.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include <functional>
#include <memory>
#include <string>

namespace mcpfs {

using TransportFactory = std::function<std::unique_ptr<ITransport>(const Config&)>;

/// Stdio or SSE, as `config.mode` selects. Throws ConfigError on a bad
/// listen address.
[[nodiscard]] std::unique_ptr<ITransport> make_default_transport(const Config& config);

class McpServer {
public:
    struct Options {
        Config config;
        std::string start_dir;                 // captured once at startup
        TransportFactory transport_factory;    // null selects make_default_transport
    };

    /// Builds the sandbox and tool catalogue. Throws ConfigError.
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Serve on the transport from the factory until it stops.
    void serve();
    void serve(std::unique_ptr<ITransport> transport);

    /// Stop the active transport. Safe from any thread.
    void shutdown();

    [[nodiscard]] bool is_running() const;

    [[nodiscard]] const PathSandbox& sandbox() const;
    [[nodiscard]] const ToolRegistry& tools() const;
    [[nodiscard]] Dispatcher& dispatcher();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpfs

#pragma once
#include "router.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mcpfs {

/// Per-connection request loop: frame in, at most one frame out, strictly
/// in arrival order. Per-request failures become error replies; only the
/// transport can end the loop.
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& tools,
                        Implementation server_info = default_server_info());

    /// Handle one frame. Returns the reply, or nullopt for notifications.
    [[nodiscard]] std::optional<std::string> handle_frame(std::string_view frame);

    /// Serve `connection` until EOF. Read and write failures propagate.
    void run(IConnection& connection);

    [[nodiscard]] Router& router() { return router_; }

    static Implementation default_server_info();

private:
    void register_methods();

    const ToolRegistry& tools_;
    Implementation server_info_;
    Router router_;
};

} // namespace mcpfs

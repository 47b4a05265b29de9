#include "mcpfs/server.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"
#include "mcpfs/tools.hpp"
#include "mcpfs/transport/sse_transport.hpp"
#include "mcpfs/transport/stdio_transport.hpp"

#include <atomic>
#include <mutex>

namespace mcpfs {

std::unique_ptr<ITransport> make_default_transport(const Config& config) {
    if (config.mode == ServerMode::Sse) {
        auto addr = parse_listen_address(config.listen_addr);
        SseServerTransport::Options opts;
        opts.host = addr.host;
        opts.port = addr.port;
        return std::make_unique<SseServerTransport>(std::move(opts));
    }
    return std::make_unique<StdioTransport>();
}

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    PathSandbox sandbox;
    ToolRegistry tools;
    Dispatcher dispatcher;

    std::mutex transport_mutex;
    ITransport* transport{nullptr};
    std::atomic<bool> running{false};
    std::atomic<bool> shutdown_requested{false};

    explicit Impl(Options o)
        : opts(std::move(o))
        , sandbox(opts.config.allowed_dirs, opts.start_dir)
        , dispatcher(tools) {
        register_filesystem_tools(tools, sandbox);
        if (!opts.transport_factory) opts.transport_factory = make_default_transport;
    }
};

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    auto logger = log::get("server");
    for (const auto& root : impl_->sandbox.roots()) {
        if (root.path == root.canonical) {
            logger->info("allowed directory: {}", root.path);
        } else {
            logger->info("allowed directory: {} ({})", root.path, root.canonical);
        }
    }
}

McpServer::~McpServer() {
    shutdown();
}

void McpServer::serve() {
    serve(impl_->opts.transport_factory(impl_->opts.config));
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) throw McpTransportError("No transport");
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        if (impl_->shutdown_requested) return;
        impl_->transport = transport.get();
        impl_->running = true;
    }
    log::get("server")->info("serving {} tools over {}", impl_->tools.size(),
                             mode_name(impl_->opts.config.mode));

    auto clear = [this] {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        impl_->running = false;
    };
    try {
        transport->start([this](IConnection& connection) {
            impl_->dispatcher.run(connection);
        });
    } catch (...) {
        clear();
        throw;
    }
    clear();
    log::get("server")->info("server stopped");
}

void McpServer::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->shutdown_requested = true;
    if (impl_->transport) impl_->transport->shutdown();
}

bool McpServer::is_running() const {
    return impl_->running;
}

const PathSandbox& McpServer::sandbox() const { return impl_->sandbox; }
const ToolRegistry& McpServer::tools() const { return impl_->tools; }
Dispatcher& McpServer::dispatcher() { return impl_->dispatcher; }

} // namespace mcpfs

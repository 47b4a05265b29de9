#pragma once
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace mcpfs {

struct SseSession;

/// HTTP+SSE server transport. GET on the stream path opens a session and
/// announces its POST endpoint; each POSTed frame is answered on that
/// session's stream. Every session runs the connection handler on its own
/// worker thread.
class SseServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 38085;  // 0 binds an ephemeral port
        std::string sse_path = "/sse";
        std::string message_path = "/message";
        std::chrono::milliseconds keepalive{15000};
        int thread_pool_size = 64;  // each open stream holds one thread
        /// Streams beyond this get 503. Must be below thread_pool_size so
        /// POSTs still find a free thread.
        int max_sessions = 32;
    };

    explicit SseServerTransport(Options opts);
    ~SseServerTransport() override;

    SseServerTransport(const SseServerTransport&) = delete;
    SseServerTransport& operator=(const SseServerTransport&) = delete;

    /// Throws McpTransportError if the address cannot be bound or the
    /// session limit leaves no thread for POSTs.
    void start(ConnectionHandler on_connection) override;
    void shutdown() override;
    bool is_running() const override;

    /// Bound port, valid once is_running() is true.
    [[nodiscard]] uint16_t port() const { return bound_port_; }
    [[nodiscard]] size_t session_count() const;

private:
    void setup_routes();
    std::shared_ptr<SseSession> open_session();
    std::shared_ptr<SseSession> find_session(const std::string& id) const;
    void finish_session(const std::string& id);
    void close_all_sessions();

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};

    // Guards the hand-off between start() committing to listen and shutdown().
    std::mutex lifecycle_mutex_;
    bool shutdown_requested_ = false;
    bool listening_ = false;
    std::atomic<bool> accept_loop_done_{false};
    std::atomic<uint16_t> bound_port_{0};
    ConnectionHandler on_connection_;

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<SseSession>> sessions_;
};

} // namespace mcpfs

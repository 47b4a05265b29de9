#pragma once
#include "transport.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace mcpfs {

/// StdioTransport reads newline-delimited frames from stdin and writes them
/// to stdout. It carries exactly one connection.
class StdioTransport : public ITransport, private IConnection {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are closed on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(ConnectionHandler on_connection) override;
    void shutdown() override;
    bool is_running() const override;

private:
    std::optional<std::string> read_frame() override;
    void write_frame(const std::string& frame) override;

    void init_wakeup_pipe();
    std::optional<std::string> take_line();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    bool eof_ = false;

    std::string buffer_;
    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll()
};

} // namespace mcpfs

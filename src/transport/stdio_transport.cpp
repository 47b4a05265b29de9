#include "mcpfs/transport/stdio_transport.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace mcpfs {

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    init_wakeup_pipe();
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    init_wakeup_pipe();
}

void StdioTransport::init_wakeup_pipe() {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(ConnectionHandler on_connection) {
    // If shutdown() was called before start(), don't block.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    // shutdown() may have raced the exchange above
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }

    log::get("stdio")->debug("stdio transport started");
    try {
        on_connection(*this);
    } catch (...) {
        running_ = false;
        throw;
    }
    running_ = false;
    log::get("stdio")->debug("stdio transport stopped");
}

std::optional<std::string> StdioTransport::take_line() {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) return std::nullopt;

        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);

        // Remove trailing \r if present (CRLF)
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        return line;
    }
}

std::optional<std::string> StdioTransport::read_frame() {
    char chunk[4096];

    while (true) {
        if (auto line = take_line()) return line;

        if (eof_ || !running_) {
            if (eof_ && !buffer_.empty()) {
                // Final line without a terminator
                std::string line = std::move(buffer_);
                buffer_.clear();
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) return line;
            }
            return std::nullopt;
        }

        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Poll error: ") + std::strerror(errno));
        }

        // Wakeup pipe has data: shutdown() was called
        if (fds[1].revents & POLLIN) return std::nullopt;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) return std::nullopt;
            throw McpTransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            log::get("stdio")->debug("EOF on input");
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void StdioTransport::write_frame(const std::string& frame) {
    std::string out = frame;
    out += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* data = out.data();
    size_t remaining = out.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) return;
    // Write to wakeup pipe to interrupt poll() in read_frame().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;  // pipe already full means a wakeup is pending
    }
}

bool StdioTransport::is_running() const {
    return running_;
}

} // namespace mcpfs

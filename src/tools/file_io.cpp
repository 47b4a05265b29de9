#include "file_io.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

namespace mcpfs::tools {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    /// Close now so the error from close() is not lost.
    std::error_code close() {
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) < 0 && errno != EINTR) return last_error();
        return {};
    }

private:
    int fd_;
};

} // anonymous namespace

std::error_code read_all(const std::string& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return last_error();
    FdGuard guard(fd);

    struct stat st;
    if (::fstat(fd, &st) < 0) return last_error();
    if (S_ISDIR(st.st_mode)) return std::make_error_code(std::errc::is_a_directory);

    out.clear();
    if (st.st_size > 0) out.reserve(static_cast<size_t>(st.st_size));

    char chunk[65536];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        if (n == 0) break;
        out.append(chunk, static_cast<size_t>(n));
    }
    return {};
}

std::error_code write_all(const std::string& path, const std::string& content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return last_error();
    FdGuard guard(fd);

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return guard.close();
}

} // namespace mcpfs::tools

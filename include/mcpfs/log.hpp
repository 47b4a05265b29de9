#pragma once
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mcpfs::log {

enum class Level { Debug, Info, Warn, Error, Fatal };

/// Called after a FATAL record is written. Receives the exit status.
using ExitHandler = std::function<void(int)>;

/// Parse DEBUG/INFO/WARN/ERROR/FATAL, case-insensitive.
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);
[[nodiscard]] std::string_view level_name(Level level);

/// Configure every component logger. All of them share one sink, stderr by
/// default. A null exit handler means std::exit.
void init(Level level, ExitHandler on_fatal = nullptr, spdlog::sink_ptr sink = nullptr);

void set_level(Level level);
[[nodiscard]] Level current_level();

/// Logger for a component, created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& component);

namespace detail {
void exit_after_fatal(int status);
} // namespace detail

/// Log at FATAL, flush, then hand status 1 to the exit handler.
template <typename... Args>
void fatal(spdlog::logger& logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger.critical(fmt, std::forward<Args>(args)...);
    logger.flush();
    detail::exit_after_fatal(1);
}

} // namespace mcpfs::log

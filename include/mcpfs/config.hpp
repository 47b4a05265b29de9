#pragma once
#include "log.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpfs {

enum class ServerMode { Stdio, Sse };

[[nodiscard]] std::optional<ServerMode> parse_mode(std::string_view name);
[[nodiscard]] std::string_view mode_name(ServerMode mode);

constexpr std::string_view DEFAULT_LISTEN_ADDR = "0.0.0.0:38085";

struct Config {
    std::vector<std::string> allowed_dirs;  // normalized, existing directories
    ServerMode mode = ServerMode::Stdio;
    std::string listen_addr = std::string(DEFAULT_LISTEN_ADDR);
    log::Level log_level = log::Level::Info;
    bool show_help = false;
};

struct ListenAddress {
    std::string host;
    uint16_t port = 0;
};

/// Split "host:port" at the last colon. An empty host means all interfaces
/// and brackets around an IPv6 host are removed. Throws ConfigError.
[[nodiscard]] ListenAddress parse_listen_address(const std::string& addr);

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Environment lookup backed by the process environment.
[[nodiscard]] EnvLookup process_env();

/// Build the configuration from defaults, then the environment
/// (MCP_SERVER_MODE, MCP_LISTEN_ADDR, LOG_LEVEL), then `args` (argv without
/// the program name). Relative roots are taken against `start_dir`.
/// Throws ConfigError. When --help is present nothing else is validated.
[[nodiscard]] Config parse_config(const std::vector<std::string>& args,
                                  const EnvLookup& env,
                                  const std::string& start_dir);

[[nodiscard]] std::string usage_text();

} // namespace mcpfs

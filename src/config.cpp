#include "mcpfs/config.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/sandbox.hpp"
#include "mcpfs/version.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace mcpfs {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

ServerMode require_mode(const std::string& value, const char* source) {
    auto mode = parse_mode(value);
    if (!mode) {
        throw ConfigError(std::string("invalid server mode '") + value + "' from " + source
                          + " (expected 'stdio' or 'sse')");
    }
    return *mode;
}

log::Level require_level(const std::string& value, const char* source) {
    auto level = log::parse_level(value);
    if (!level) {
        throw ConfigError(std::string("invalid log level '") + value + "' from " + source
                          + " (expected DEBUG, INFO, WARN, ERROR or FATAL)");
    }
    return *level;
}

} // anonymous namespace

std::optional<ServerMode> parse_mode(std::string_view name) {
    std::string lower = to_lower(std::string(name));
    if (lower == "stdio") return ServerMode::Stdio;
    if (lower == "sse") return ServerMode::Sse;
    return std::nullopt;
}

std::string_view mode_name(ServerMode mode) {
    return mode == ServerMode::Sse ? "sse" : "stdio";
}

ListenAddress parse_listen_address(const std::string& addr) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) {
        throw ConfigError("invalid listen address '" + addr + "' (expected host:port)");
    }
    ListenAddress out;
    out.host = addr.substr(0, colon);
    if (out.host.size() >= 2 && out.host.front() == '[' && out.host.back() == ']') {
        out.host = out.host.substr(1, out.host.size() - 2);
    }
    if (out.host.empty()) out.host = "0.0.0.0";

    const std::string port = addr.substr(colon + 1);
    if (port.empty() || port.size() > 5
        || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("invalid port in listen address '" + addr + "'");
    }
    long value = std::stol(port);
    if (value < 1 || value > 65535) {
        throw ConfigError("port out of range in listen address '" + addr + "'");
    }
    out.port = static_cast<uint16_t>(value);
    return out;
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };
}

Config parse_config(const std::vector<std::string>& args,
                    const EnvLookup& env,
                    const std::string& start_dir) {
    Config cfg;

    for (const auto& arg : args) {
        if (arg == "--") break;
        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
            return cfg;
        }
    }

    if (env) {
        if (auto v = env("MCP_SERVER_MODE")) cfg.mode = require_mode(*v, "MCP_SERVER_MODE");
        if (auto v = env("MCP_LISTEN_ADDR")) cfg.listen_addr = *v;
        if (auto v = env("LOG_LEVEL")) cfg.log_level = require_level(*v, "LOG_LEVEL");
    }

    std::vector<std::string> positional;
    bool options_done = false;
    for (const auto& arg : args) {
        if (options_done || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
        } else if (starts_with(arg, "--mode=")) {
            cfg.mode = require_mode(arg.substr(7), "--mode");
        } else if (starts_with(arg, "--listen=")) {
            cfg.listen_addr = arg.substr(9);
        } else if (starts_with(arg, "--log-level=")) {
            cfg.log_level = require_level(arg.substr(12), "--log-level");
        } else {
            throw ConfigError("invalid flag: " + arg);
        }
    }

    if (positional.empty()) {
        throw ConfigError("at least one allowed directory is required");
    }
    for (const auto& raw : positional) {
        std::string dir = normalize_root(raw, start_dir);
        if (std::find(cfg.allowed_dirs.begin(), cfg.allowed_dirs.end(), dir) == cfg.allowed_dirs.end()) {
            cfg.allowed_dirs.push_back(std::move(dir));
        }
    }

    if (cfg.mode == ServerMode::Sse) {
        (void)parse_listen_address(cfg.listen_addr);
    }
    return cfg;
}

std::string usage_text() {
    std::ostringstream oss;
    oss << SERVER_NAME << " v" << SERVER_VERSION << " - MCP filesystem server\n\n"
        << "Usage: mcpfs-server [options] <allowed-directory> [additional-directories...]\n\n"
        << "Options:\n"
        << "  --help, -h           Show this help message\n"
        << "  --mode=<mode>        Server mode: 'stdio' (default) or 'sse'\n"
        << "  --listen=<address>   HTTP listen address for SSE mode (default: " << DEFAULT_LISTEN_ADDR << ")\n"
        << "  --log-level=<level>  Log level: DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n\n"
        << "Environment Variables:\n"
        << "  MCP_SERVER_MODE      Server mode (overridden by --mode)\n"
        << "  MCP_LISTEN_ADDR      HTTP listen address (overridden by --listen)\n"
        << "  LOG_LEVEL            Log level (overridden by --log-level)\n\n"
        << "The server will only allow operations within the specified directories.\n\n"
        << "Examples:\n"
        << "  mcpfs-server /path/to/dir1 /path/to/dir2\n"
        << "  mcpfs-server --mode=sse --listen=0.0.0.0:38085 --log-level=DEBUG /path/to/dir\n"
        << "  MCP_SERVER_MODE=sse MCP_LISTEN_ADDR=0.0.0.0:38086 mcpfs-server /path/to/dir\n";
    return oss.str();
}

} // namespace mcpfs

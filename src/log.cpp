#include "mcpfs/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <mutex>

namespace mcpfs::log {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

struct Registry {
    std::mutex mutex;
    spdlog::sink_ptr sink;
    Level level = Level::Info;
    ExitHandler on_fatal;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

Registry& registry() {
    static Registry r;
    return r;
}

spdlog::level::level_enum to_spdlog(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Caller holds the registry mutex.
spdlog::sink_ptr sink_locked(Registry& r) {
    if (!r.sink) {
        r.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        r.sink->set_pattern(kPattern);
    }
    return r.sink;
}

} // anonymous namespace

std::optional<Level> parse_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return Level::Debug;
    if (upper == "INFO")  return Level::Info;
    if (upper == "WARN")  return Level::Warn;
    if (upper == "ERROR") return Level::Error;
    if (upper == "FATAL") return Level::Fatal;
    return std::nullopt;
}

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "INFO";
}

void init(Level level, ExitHandler on_fatal, spdlog::sink_ptr sink) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    if (sink) {
        sink->set_pattern(kPattern);
        r.sink = std::move(sink);
    } else {
        r.sink.reset();
    }
    auto active = sink_locked(r);
    r.level = level;
    r.on_fatal = std::move(on_fatal);
    for (auto& [name, logger] : r.loggers) {
        logger->sinks().clear();
        logger->sinks().push_back(active);
        logger->set_level(to_spdlog(level));
    }
}

void set_level(Level level) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.level = level;
    for (auto& [name, logger] : r.loggers) {
        logger->set_level(to_spdlog(level));
    }
}

Level current_level() {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    return r.level;
}

std::shared_ptr<spdlog::logger> get(const std::string& component) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto it = r.loggers.find(component);
    if (it != r.loggers.end()) return it->second;

    auto logger = std::make_shared<spdlog::logger>(component, sink_locked(r));
    logger->set_level(to_spdlog(r.level));
    logger->flush_on(spdlog::level::err);
    r.loggers.emplace(component, logger);
    return logger;
}

namespace detail {

void exit_after_fatal(int status) {
    ExitHandler handler;
    {
        auto& r = registry();
        std::lock_guard<std::mutex> lock(r.mutex);
        handler = r.on_fatal;
    }
    if (handler) {
        handler(status);
        return;
    }
    std::exit(status);
}

} // namespace detail

} // namespace mcpfs::log

#pragma once
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpfs {

/// Typed view over a call's "arguments" object. Extraction never throws;
/// the first missing or mistyped argument is recorded and later calls are
/// no-ops, so a handler can pull everything and then test ok() once.
class ToolArguments {
public:
    explicit ToolArguments(const nlohmann::json& args);

    std::string require_string(const std::string& name);
    std::vector<std::string> require_string_array(const std::string& name);
    std::vector<std::string> optional_string_array(const std::string& name);
    bool optional_bool(const std::string& name, bool fallback);
    int64_t optional_int(const std::string& name, int64_t fallback);
    /// The raw array, or an empty one after recording an error.
    nlohmann::json require_array(const std::string& name);

    /// Record a handler-specific validation failure.
    void fail(std::string message);

    [[nodiscard]] bool ok() const { return !error_; }
    [[nodiscard]] const std::string& error() const;
    [[nodiscard]] CallToolResult error_result() const;

private:
    const nlohmann::json* find(const std::string& name);
    void missing(const std::string& name);
    void mistyped(const std::string& name, const char* expected);

    const nlohmann::json& args_;
    std::optional<std::string> error_;
};

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Fixed catalogue of tools. Built once at startup, read-only afterwards.
class ToolRegistry {
public:
    /// Throws std::invalid_argument on a duplicate name.
    void add(ToolDefinition def, ToolHandler handler);

    /// Definitions in registration order.
    [[nodiscard]] std::vector<ToolDefinition> list() const;

    [[nodiscard]] const ToolHandler* find(const std::string& name) const;

    /// Run a tool. Unknown names and handler exceptions come back as
    /// isError results.
    [[nodiscard]] CallToolResult call(const std::string& name,
                                      const nlohmann::json& arguments) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    struct Entry {
        ToolDefinition def;
        ToolHandler handler;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcpfs

#include "mcpfs/tool_registry.hpp"
#include "mcpfs/log.hpp"
#include <stdexcept>

namespace mcpfs {

// ---------- ToolArguments ----------

ToolArguments::ToolArguments(const nlohmann::json& args) : args_(args) {
    if (!args_.is_object()) {
        error_ = "arguments must be an object";
    }
}

const nlohmann::json* ToolArguments::find(const std::string& name) {
    if (error_) return nullptr;
    auto it = args_.find(name);
    if (it == args_.end() || it->is_null()) return nullptr;
    return &*it;
}

void ToolArguments::missing(const std::string& name) {
    if (!error_) error_ = "missing required argument: " + name;
}

void ToolArguments::mistyped(const std::string& name, const char* expected) {
    if (!error_) error_ = "invalid argument " + name + ": expected " + expected;
}

void ToolArguments::fail(std::string message) {
    if (!error_) error_ = std::move(message);
}

std::string ToolArguments::require_string(const std::string& name) {
    const auto* v = find(name);
    if (!v) {
        missing(name);
        return {};
    }
    if (!v->is_string()) {
        mistyped(name, "string");
        return {};
    }
    return v->get<std::string>();
}

std::vector<std::string> ToolArguments::require_string_array(const std::string& name) {
    if (!error_ && !find(name)) {
        missing(name);
        return {};
    }
    return optional_string_array(name);
}

std::vector<std::string> ToolArguments::optional_string_array(const std::string& name) {
    const auto* v = find(name);
    if (!v) return {};
    if (!v->is_array()) {
        mistyped(name, "array of strings");
        return {};
    }
    std::vector<std::string> out;
    out.reserve(v->size());
    for (const auto& item : *v) {
        if (!item.is_string()) {
            mistyped(name, "array of strings");
            return {};
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

bool ToolArguments::optional_bool(const std::string& name, bool fallback) {
    const auto* v = find(name);
    if (!v) return fallback;
    if (!v->is_boolean()) {
        mistyped(name, "boolean");
        return fallback;
    }
    return v->get<bool>();
}

int64_t ToolArguments::optional_int(const std::string& name, int64_t fallback) {
    const auto* v = find(name);
    if (!v) return fallback;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) {
        double d = v->get<double>();
        auto i = static_cast<int64_t>(d);
        if (static_cast<double>(i) == d) return i;
    }
    mistyped(name, "integer");
    return fallback;
}

nlohmann::json ToolArguments::require_array(const std::string& name) {
    const auto* v = find(name);
    if (!v) {
        missing(name);
        return nlohmann::json::array();
    }
    if (!v->is_array()) {
        mistyped(name, "array");
        return nlohmann::json::array();
    }
    return *v;
}

const std::string& ToolArguments::error() const {
    static const std::string none;
    return error_ ? *error_ : none;
}

CallToolResult ToolArguments::error_result() const {
    return CallToolResult::error("Error: " + error());
}

// ---------- ToolRegistry ----------

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (index_.count(def.name) > 0) {
        throw std::invalid_argument("Duplicate tool: " + def.name);
    }
    index_.emplace(def.name, entries_.size());
    entries_.push_back(Entry{std::move(def), std::move(handler)});
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    std::vector<ToolDefinition> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.def);
    return out;
}

const ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].handler;
}

CallToolResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
    const ToolHandler* handler = find(name);
    if (!handler) {
        return CallToolResult::error("unknown tool: " + name);
    }
    try {
        return (*handler)(arguments);
    } catch (const std::exception& e) {
        log::get("tools")->error("tool {} failed: {}", name, e.what());
        return CallToolResult::error("Error: " + name + ": " + e.what());
    }
}

} // namespace mcpfs

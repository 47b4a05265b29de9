#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpfs {

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

/// Outcome of a tool call. Tool-level failures set is_error and still
/// travel as a successful JSON-RPC result.
struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }

    static CallToolResult text(std::string body) {
        CallToolResult r;
        r.content.push_back(TextContent{std::move(body)});
        return r;
    }

    static CallToolResult error(std::string message) {
        CallToolResult r = text(std::move(message));
        r.is_error = true;
        return r;
    }
};

void to_json(nlohmann::json& j, const CallToolResult& t);

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

void from_json(const nlohmann::json& j, CallToolParams& p);

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

struct InitializeParams {
    std::optional<std::string> protocol_version;
    std::optional<Implementation> client_info;
    nlohmann::json capabilities = nlohmann::json::object();
};

void from_json(const nlohmann::json& j, InitializeParams& p);

struct InitializeResult {
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    Implementation server_info;
};

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

struct ListToolsResult {
    std::vector<ToolDefinition> tools;
};

void to_json(nlohmann::json& j, const ListToolsResult& t);

} // namespace mcpfs

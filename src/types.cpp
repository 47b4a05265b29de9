#include "mcpfs/types.hpp"
#include <stdexcept>

namespace mcpfs {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    if (j.at("type").get<std::string>() != "text") {
        throw std::invalid_argument("Unsupported content type");
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    t.input_schema = j.at("inputSchema");
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        j["content"].push_back(c);
    }
    if (t.is_error) j["isError"] = true;
}

// ---------- CallToolParams ----------

void from_json(const nlohmann::json& j, CallToolParams& p) {
    if (!j.is_object()) {
        throw std::invalid_argument("params must be an object");
    }
    auto name = j.find("name");
    if (name == j.end() || !name->is_string()) {
        throw std::invalid_argument("missing or invalid tool name");
    }
    p.name = name->get<std::string>();
    auto args = j.find("arguments");
    if (args == j.end() || args->is_null()) {
        p.arguments = nlohmann::json::object();
    } else if (args->is_object()) {
        p.arguments = *args;
    } else {
        throw std::invalid_argument("arguments must be an object");
    }
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

// ---------- Initialize ----------

void from_json(const nlohmann::json& j, InitializeParams& p) {
    if (j.is_null()) return;
    if (!j.is_object()) {
        throw std::invalid_argument("params must be an object");
    }
    if (auto it = j.find("protocolVersion"); it != j.end()) {
        if (!it->is_string()) throw std::invalid_argument("protocolVersion must be a string");
        p.protocol_version = it->get<std::string>();
    }
    if (auto it = j.find("clientInfo"); it != j.end()) {
        if (!it->is_object()) throw std::invalid_argument("clientInfo must be an object");
        Implementation info;
        info.name = it->value("name", std::string());
        info.version = it->value("version", std::string());
        p.client_info = std::move(info);
    }
    if (auto it = j.find("capabilities"); it != j.end()) {
        if (!it->is_object()) throw std::invalid_argument("capabilities must be an object");
        p.capabilities = *it;
    }
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities");
    t.server_info = j.at("serverInfo").get<Implementation>();
}

// ---------- ListToolsResult ----------

void to_json(nlohmann::json& j, const ListToolsResult& t) {
    j = nlohmann::json::object();
    j["tools"] = nlohmann::json::array();
    for (const auto& tool : t.tools) {
        j["tools"].push_back(tool);
    }
}

} // namespace mcpfs

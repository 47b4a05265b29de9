#include "mcpfs/dispatcher.hpp"
#include "mcpfs/codec.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"
#include "mcpfs/version.hpp"

namespace mcpfs {

namespace {

JsonRpcResponse error_response(RequestId id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

template <typename T>
T parse_params(const nlohmann::json& params) {
    T out;
    try {
        from_json(params, out);
    } catch (const std::exception& e) {
        throw McpProtocolError(error::InvalidParams, std::string("Invalid params: ") + e.what());
    }
    return out;
}

} // anonymous namespace

Implementation Dispatcher::default_server_info() {
    return Implementation{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
}

Dispatcher::Dispatcher(const ToolRegistry& tools, Implementation server_info)
    : tools_(tools), server_info_(std::move(server_info)) {
    register_methods();
}

void Dispatcher::register_methods() {
    router_.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
        auto p = parse_params<InitializeParams>(params);
        if (p.client_info) {
            log::get("dispatcher")->info("client {} {} connected (protocol {})",
                                         p.client_info->name, p.client_info->version,
                                         p.protocol_version.value_or("unspecified"));
        }
        InitializeResult result;
        result.protocol_version = std::string(PROTOCOL_VERSION);
        result.capabilities = nlohmann::json::object();
        result.server_info = server_info_;
        return nlohmann::json(result);
    });

    auto list_tools = [this](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json(ListToolsResult{tools_.list()});
    };
    router_.on_request("mcp.list_tools", list_tools);
    router_.on_request("tools/list", list_tools);

    auto call_tool = [this](const nlohmann::json& params) -> HandlerResult {
        auto p = parse_params<CallToolParams>(params);
        log::get("dispatcher")->debug("call_tool {}", p.name);
        return nlohmann::json(tools_.call(p.name, p.arguments));
    };
    router_.on_request("mcp.call_tool", call_tool);
    router_.on_request("tools/call", call_tool);

    router_.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });

    router_.on_notification("notifications/initialized", [](const nlohmann::json&) {});
}

std::optional<std::string> Dispatcher::handle_frame(std::string_view frame) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(frame);
    } catch (const McpParseError& e) {
        log::get("dispatcher")->debug("parse error: {}", e.what());
        return Codec::serialize(error_response(nullptr, error::ParseError,
                                               std::string("Parse error: ") + e.what()));
    } catch (const McpProtocolError& e) {
        RequestId id = nullptr;
        if (e.id) from_json(*e.id, id);
        return Codec::serialize(error_response(std::move(id), e.code, e.what()));
    }

    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        log::get("dispatcher")->debug("request {}", req->method);
    }
    auto resp = router_.dispatch(msg);
    if (!resp) return std::nullopt;
    return Codec::serialize(*resp);
}

void Dispatcher::run(IConnection& connection) {
    auto logger = log::get("dispatcher");
    while (auto frame = connection.read_frame()) {
        logger->debug("<- {}", *frame);
        auto reply = handle_frame(*frame);
        if (!reply) continue;
        logger->debug("-> {}", *reply);
        connection.write_frame(*reply);
    }
    logger->debug("connection closed");
}

} // namespace mcpfs

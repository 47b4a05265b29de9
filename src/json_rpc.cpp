#include "mcpfs/json_rpc.hpp"
#include "mcpfs/version.hpp"

namespace mcpfs {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

} // anonymous namespace

// Requests are never sent by this server; they serialize for logging and
// benchmarks.
void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

// Exactly one of "result" and "error", and "id" is always present.
void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    to_json(j["id"], r.id);
    if (r.error) {
        j["error"] = *r.error;
        return;
    }
    j["result"] = r.result.value_or(nlohmann::json::object());
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace mcpfs

#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpfs {

class Codec {
public:
    /// Parse one inbound frame.
    /// Throws McpParseError when the frame is not a JSON object with a usable
    /// id and method, and McpProtocolError (InvalidRequest) when the envelope
    /// is well formed but not JSON-RPC 2.0. A frame without an id is a
    /// notification only under `notifications/`; otherwise it is a request
    /// with a null id.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw JSON into a document without envelope checks.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize compactly. Invalid UTF-8 in strings is replaced, never thrown.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
    [[nodiscard]] static std::string dump(const nlohmann::json& j, int indent = -1);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpfs

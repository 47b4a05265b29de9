#include "mcpfs/codec.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpfs {

namespace {

constexpr std::string_view NOTIFICATION_PREFIX = "notifications/";

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Keep the integer/unsigned/float distinction so ids round-trip
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unexpected JSON token");
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
    }
    nlohmann::json j = simdjson_to_nlohmann(val.value());
    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON value");
    }
    return j;
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        return simdjson_doc_to_nlohmann(doc);
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto id_it = j.find("id");
    bool has_id = id_it != j.end();

    RequestId id = nullptr;
    if (has_id) {
        try {
            from_json(*id_it, id);
        } catch (const std::invalid_argument& e) {
            throw McpParseError(e.what());
        }
    }
    std::optional<nlohmann::json> echo_id;
    if (has_id) echo_id = *id_it;

    auto method_it = j.find("method");
    if (method_it != j.end() && !method_it->is_string()) {
        throw McpParseError("'method' must be a string");
    }

    auto ver_it = j.find("jsonrpc");
    if (ver_it == j.end()) {
        throw McpProtocolError(error::InvalidRequest, "Missing 'jsonrpc' field", echo_id);
    }
    if (!ver_it->is_string() || ver_it->get<std::string>() != JSONRPC_VERSION) {
        throw McpProtocolError(error::InvalidRequest,
                               "Invalid jsonrpc version, expected '2.0'", echo_id);
    }
    if (method_it == j.end()) {
        throw McpProtocolError(error::InvalidRequest, "Missing 'method' field", echo_id);
    }

    std::optional<nlohmann::json> params;
    if (auto p = j.find("params"); p != j.end()) params = *p;

    std::string method = method_it->get<std::string>();
    // Only the notifications/ namespace is silent; any other id-less frame
    // is answered with a null id.
    if (!has_id && method.rfind(NOTIFICATION_PREFIX, 0) == 0) {
        JsonRpcNotification notif;
        notif.method = std::move(method);
        notif.params = std::move(params);
        return notif;
    }

    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = std::move(method);
    req.params = std::move(params);
    return req;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::dump(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return dump(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return dump(j);
}

} // namespace mcpfs

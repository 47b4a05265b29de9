#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpfs {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Frame could not be read as a JSON-RPC envelope. Answered with a null id.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Envelope parsed but is not acceptable. Carries the request id when known.
class McpProtocolError : public McpError {
public:
    int code;
    std::optional<nlohmann::json> id;
    McpProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> id = std::nullopt)
        : McpError(msg), code(code), id(std::move(id)) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class ConfigError : public McpError {
public:
    using McpError::McpError;
};

/// A failed filesystem operation, rendered as "<op> <path>: <cause>".
class FileSystemError : public McpError {
public:
    FileSystemError(std::string op, std::string path, std::string cause)
        : McpError(format(op, path, cause))
        , op_(std::move(op)), path_(std::move(path)), cause_(std::move(cause)) {}

    const std::string& op() const { return op_; }
    const std::string& path() const { return path_; }
    const std::string& cause() const { return cause_; }

    static std::string format(const std::string& op, const std::string& path,
                              const std::string& cause) {
        if (path.empty()) return op + ": " + cause;
        return op + " " + path + ": " + cause;
    }

private:
    std::string op_;
    std::string path_;
    std::string cause_;
};

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
    constexpr int ServerError    = -32000;
} // namespace error

} // namespace mcpfs

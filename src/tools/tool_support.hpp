#pragma once
#include "mcpfs/error.hpp"
#include "mcpfs/sandbox.hpp"
#include "mcpfs/types.hpp"
#include <optional>
#include <string>
#include <system_error>

namespace mcpfs::tools {

inline CallToolResult failure(const std::string& op, const std::string& path,
                              const std::string& cause) {
    return CallToolResult::error("Error: " + FileSystemError::format(op, path, cause));
}

inline CallToolResult failure(const std::string& op, const std::string& path,
                              const std::error_code& ec) {
    return failure(op, path, ec.message());
}

/// Sandbox verdict for one client path: the path to use, or the result to
/// return to the client.
struct PathCheck {
    std::string path;
    std::optional<CallToolResult> failure;
};

inline PathCheck check_path(const PathSandbox& sandbox, const std::string& op,
                            const std::string& requested,
                            MissingParents mode = MissingParents::Reject) {
    auto resolution = sandbox.resolve(requested, mode);
    if (const auto* rejection = std::get_if<Rejection>(&resolution)) {
        return PathCheck{{}, failure(op, requested, rejection->message())};
    }
    return PathCheck{std::get<ResolvedPath>(resolution).path, std::nullopt};
}

inline nlohmann::json string_property(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

inline nlohmann::json string_array_property(const char* description) {
    return {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", description}};
}

} // namespace mcpfs::tools

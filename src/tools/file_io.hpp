#pragma once
#include <string>
#include <system_error>

namespace mcpfs::tools {

/// Whole-file read. Directories fail with EISDIR.
std::error_code read_all(const std::string& path, std::string& out);

/// Create or truncate `path` (mode 0644) and write `content`.
std::error_code write_all(const std::string& path, const std::string& content);

} // namespace mcpfs::tools

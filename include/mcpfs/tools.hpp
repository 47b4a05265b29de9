#pragma once
#include "sandbox.hpp"
#include "tool_registry.hpp"

namespace mcpfs {

/// Default directory_tree depth when the caller gives none.
constexpr int DEFAULT_TREE_DEPTH = 3;

/// Register the full filesystem catalogue in its fixed order. The registry
/// keeps a reference to `sandbox`, which must outlive it.
void register_filesystem_tools(ToolRegistry& registry, const PathSandbox& sandbox);

void register_file_tools(ToolRegistry& registry, const PathSandbox& sandbox);
void register_directory_tools(ToolRegistry& registry, const PathSandbox& sandbox);
void register_search_tools(ToolRegistry& registry, const PathSandbox& sandbox);
void register_info_tools(ToolRegistry& registry, const PathSandbox& sandbox);

} // namespace mcpfs

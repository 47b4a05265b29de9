#include "mcpfs/tools.hpp"

namespace mcpfs {

void register_filesystem_tools(ToolRegistry& registry, const PathSandbox& sandbox) {
    register_file_tools(registry, sandbox);
    register_directory_tools(registry, sandbox);
    register_search_tools(registry, sandbox);
    register_info_tools(registry, sandbox);
}

} // namespace mcpfs

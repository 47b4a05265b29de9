#include "mcpfs/tools.hpp"
#include "tool_support.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpfs {

using tools::check_path;
using tools::failure;
using tools::string_property;

namespace {

// RFC 3339 in local time, e.g. 2024-05-01T12:30:00+02:00
std::string rfc3339(const struct timespec& ts) {
    std::time_t secs = ts.tv_sec;
    struct tm local;
    if (!::localtime_r(&secs, &local)) return std::to_string(secs);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
    std::ostringstream oss;
    oss << buf;
    long offset = local.tm_gmtoff;
    if (offset == 0) {
        oss << 'Z';
    } else {
        oss << (offset < 0 ? '-' : '+') << std::setfill('0')
            << std::setw(2) << std::labs(offset) / 3600 << ':'
            << std::setw(2) << (std::labs(offset) % 3600) / 60;
    }
    return oss.str();
}

CallToolResult get_file_info(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "get_file_info", path);
    if (target.failure) return *target.failure;

    struct stat st;
    if (::stat(target.path.c_str(), &st) < 0) {
        return failure("get_file_info", path, std::error_code(errno, std::generic_category()));
    }

    const bool is_dir = S_ISDIR(st.st_mode);
    std::ostringstream oss;
    oss << "size: " << st.st_size << "\n"
        << "created: " << rfc3339(st.st_ctim) << "\n"
        << "modified: " << rfc3339(st.st_mtim) << "\n"
        << "accessed: " << rfc3339(st.st_atim) << "\n"
        << "isDirectory: " << (is_dir ? "true" : "false") << "\n"
        << "isFile: " << (is_dir ? "false" : "true") << "\n"
        << "permissions: " << std::oct << (st.st_mode & 0777);
    return CallToolResult::text(oss.str());
}

CallToolResult list_allowed_directories(const PathSandbox& sandbox) {
    std::string out = "Allowed directories:\n";
    const auto& roots = sandbox.roots();
    for (size_t i = 0; i < roots.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += roots[i].path;
    }
    return CallToolResult::text(std::move(out));
}

} // anonymous namespace

void register_info_tools(ToolRegistry& registry, const PathSandbox& sandbox) {
    const PathSandbox* sb = &sandbox;

    registry.add(ToolDefinition{
        "get_file_info",
        "Retrieve detailed metadata about a file or directory. Returns comprehensive "
        "information including size, creation time, last modified time, permissions, "
        "and type. This tool is perfect for understanding file characteristics "
        "without reading the actual content. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {{"path", string_property("Path to the file or directory to get info for")}}},
            {"required", {"path"}}
        }
    }, [sb](const nlohmann::json& a) { return get_file_info(*sb, a); });

    registry.add(ToolDefinition{
        "list_allowed_directories",
        "Returns the list of directories that this server is allowed to access. "
        "Use this to understand which directories are available before trying to access files.",
        {
            {"type", "object"},
            {"properties", nlohmann::json::object()},
            {"required", nlohmann::json::array()}
        }
    }, [sb](const nlohmann::json&) { return list_allowed_directories(*sb); });
}

} // namespace mcpfs

#include "mcpfs/tools.hpp"
#include "mcpfs/codec.hpp"
#include "mcpfs/log.hpp"
#include "tool_support.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace mcpfs {

using tools::check_path;
using tools::failure;
using tools::string_property;

namespace {

struct Entry {
    std::string name;
    bool is_dir;
};

// Entries sorted by name. Links are reported as what they are, not followed.
std::vector<Entry> read_entries(const std::string& dir, std::error_code& ec) {
    std::vector<Entry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) return entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return entries;
        std::error_code st_ec;
        auto st = it->symlink_status(st_ec);
        entries.push_back(Entry{it->path().filename().string(),
                                !st_ec && st.type() == fs::file_type::directory});
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return entries;
}

CallToolResult create_directory(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "create_directory", path, MissingParents::Allow);
    if (target.failure) return *target.failure;

    std::error_code ec;
    fs::create_directories(target.path, ec);
    if (ec) return failure("create_directory", path, ec);
    return CallToolResult::text("Successfully created directory " + path);
}

CallToolResult list_directory(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "list_directory", path);
    if (target.failure) return *target.failure;

    std::error_code ec;
    auto entries = read_entries(target.path, ec);
    if (ec) return failure("list_directory", path, ec);

    std::string out;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += entries[i].is_dir ? "[DIR] " : "[FILE] ";
        out += entries[i].name;
    }
    return CallToolResult::text(std::move(out));
}

nlohmann::json build_tree(const std::string& dir, int64_t depth, std::error_code& ec) {
    nlohmann::json out = nlohmann::json::array();
    auto entries = read_entries(dir, ec);
    if (ec) return out;

    for (const auto& e : entries) {
        nlohmann::json node = {{"name", e.name}, {"type", e.is_dir ? "directory" : "file"}};
        if (e.is_dir) {
            nlohmann::json children = nlohmann::json::array();
            if (depth > 1) {
                std::error_code sub_ec;
                children = build_tree(dir + "/" + e.name, depth - 1, sub_ec);
                if (sub_ec) {
                    log::get("tools")->debug("skipping unreadable {}/{}: {}", dir, e.name, sub_ec.message());
                    continue;
                }
            }
            node["children"] = std::move(children);
        }
        out.push_back(std::move(node));
    }
    return out;
}

CallToolResult directory_tree(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    int64_t max_depth = args.optional_int("maxDepth", DEFAULT_TREE_DEPTH);
    if (args.ok() && max_depth < 1) args.fail("invalid argument maxDepth: must be at least 1");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "directory_tree", path);
    if (target.failure) return *target.failure;

    std::error_code ec;
    auto tree = build_tree(target.path, max_depth, ec);
    if (ec) return failure("directory_tree", path, ec);
    return CallToolResult::text(Codec::dump(tree, 2));
}

CallToolResult move_file(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto source = args.require_string("source");
    auto destination = args.require_string("destination");
    if (!args.ok()) return args.error_result();

    auto from = check_path(sandbox, "move_file", source);
    if (from.failure) return *from.failure;
    auto to = check_path(sandbox, "move_file", destination, MissingParents::Allow);
    if (to.failure) return *to.failure;

    std::error_code ec;
    auto existing = fs::symlink_status(to.path, ec);
    if (existing.type() != fs::file_type::not_found) {
        return failure("move_file", destination, "destination already exists");
    }

    fs::create_directories(fs::path(to.path).parent_path(), ec);
    if (ec) {
        return failure("move_file", destination, "cannot create parent directory: " + ec.message());
    }
    fs::rename(from.path, to.path, ec);
    if (ec) return failure("move_file", source, ec);

    return CallToolResult::text("Successfully moved " + source + " to " + destination);
}

} // anonymous namespace

void register_directory_tools(ToolRegistry& registry, const PathSandbox& sandbox) {
    const PathSandbox* sb = &sandbox;

    registry.add(ToolDefinition{
        "create_directory",
        "Create a new directory or ensure a directory exists. Can create multiple "
        "nested directories in one operation. If the directory already exists, "
        "this operation will succeed silently. Perfect for setting up directory "
        "structures for projects or ensuring required paths exist. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {{"path", string_property("Path to the directory to create")}}},
            {"required", {"path"}}
        }
    }, [sb](const nlohmann::json& a) { return create_directory(*sb, a); });

    registry.add(ToolDefinition{
        "list_directory",
        "Get a detailed listing of all files and directories in a specified path. "
        "Results clearly distinguish between files and directories with [FILE] and [DIR] "
        "prefixes. This tool is essential for understanding directory structure and "
        "finding specific files within a directory. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {{"path", string_property("Path to the directory to list")}}},
            {"required", {"path"}}
        }
    }, [sb](const nlohmann::json& a) { return list_directory(*sb, a); });

    registry.add(ToolDefinition{
        "directory_tree",
        "Get a recursive tree view of files and directories as a JSON structure. "
        "Each entry includes 'name', 'type' (file/directory), and 'children' for directories. "
        "Files have no children array, while directories always have a children array (which may be empty). "
        "The output is formatted with 2-space indentation for readability. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {
                {"path", string_property("Path to the directory to get tree for")},
                {"maxDepth", {
                    {"type", "integer"},
                    {"description", "Maximum depth to descend (default 3)"}
                }}
            }},
            {"required", {"path"}}
        }
    }, [sb](const nlohmann::json& a) { return directory_tree(*sb, a); });

    registry.add(ToolDefinition{
        "move_file",
        "Move or rename files and directories. Can move files between directories "
        "and rename them in a single operation. If the destination exists, the "
        "operation will fail. Works across different directories and can be used "
        "for simple renaming within the same directory. Both source and destination must be within allowed directories.",
        {
            {"type", "object"},
            {"properties", {
                {"source", string_property("Path to the source file or directory")},
                {"destination", string_property("Path to the destination file or directory")}
            }},
            {"required", {"source", "destination"}}
        }
    }, [sb](const nlohmann::json& a) { return move_file(*sb, a); });
}

} // namespace mcpfs

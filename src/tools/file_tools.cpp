#include "mcpfs/tools.hpp"
#include "mcpfs/diff.hpp"
#include "mcpfs/edit.hpp"
#include "mcpfs/log.hpp"
#include "file_io.hpp"
#include "tool_support.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace mcpfs {

using tools::check_path;
using tools::failure;
using tools::string_array_property;
using tools::string_property;

namespace {

CallToolResult read_file(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "read_file", path);
    if (target.failure) return *target.failure;

    std::string content;
    if (auto ec = tools::read_all(target.path, content)) {
        return failure("read_file", path, ec);
    }
    return CallToolResult::text(std::move(content));
}

CallToolResult read_multiple_files(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto paths = args.require_string_array("paths");
    if (!args.ok()) return args.error_result();

    std::string out;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out += "\n---\n";
        const auto& path = paths[i];
        out += path + ":\n";

        auto resolution = sandbox.resolve(path);
        if (const auto* rejection = std::get_if<Rejection>(&resolution)) {
            out += "Error - " + rejection->message();
            continue;
        }
        std::string content;
        if (auto ec = tools::read_all(std::get<ResolvedPath>(resolution).path, content)) {
            out += "Error - " + ec.message();
            continue;
        }
        out += content + "\n";
    }
    return CallToolResult::text(std::move(out));
}

CallToolResult write_file(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    auto content = args.require_string("content");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "write_file", path, MissingParents::Allow);
    if (target.failure) return *target.failure;

    std::error_code ec;
    fs::create_directories(fs::path(target.path).parent_path(), ec);
    if (ec) {
        return failure("write_file", path, "cannot create parent directory: " + ec.message());
    }
    if (auto wec = tools::write_all(target.path, content)) {
        return failure("write_file", path, wec);
    }
    log::get("tools")->debug("wrote {} bytes to {}", content.size(), target.path);
    return CallToolResult::text("Successfully wrote to " + path);
}

std::vector<EditOperation> parse_edits(ToolArguments& args, const nlohmann::json& raw) {
    std::vector<EditOperation> edits;
    edits.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        const auto& item = raw[i];
        const std::string where = " in edit at index " + std::to_string(i);
        if (!item.is_object()) {
            args.fail("invalid edit at index " + std::to_string(i));
            break;
        }
        auto old_it = item.find("oldText");
        if (old_it == item.end() || !old_it->is_string()) {
            args.fail("missing or invalid oldText" + where);
            break;
        }
        auto new_it = item.find("newText");
        if (new_it == item.end() || !new_it->is_string()) {
            args.fail("missing or invalid newText" + where);
            break;
        }
        if (old_it->get_ref<const std::string&>().empty()) {
            args.fail("oldText must not be empty" + where);
            break;
        }
        edits.push_back(EditOperation{old_it->get<std::string>(), new_it->get<std::string>()});
    }
    return edits;
}

CallToolResult edit_file(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    auto raw_edits = args.require_array("edits");
    bool dry_run = args.optional_bool("dryRun", false);
    auto edits = parse_edits(args, raw_edits);
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "edit_file", path);
    if (target.failure) return *target.failure;

    std::string original;
    if (auto ec = tools::read_all(target.path, original)) {
        return failure("edit_file", path, ec);
    }

    auto outcome = apply_edits(original, edits);
    if (outcome.unmatched) {
        return failure("edit_file", path, "could not find exact match for edit:\n" + *outcome.unmatched);
    }

    std::string diff = format_git_diff(original, outcome.content, path);
    if (!dry_run) {
        if (auto ec = tools::write_all(target.path, outcome.content)) {
            return failure("edit_file", path, ec);
        }
    }
    return CallToolResult::text(std::move(diff));
}

} // anonymous namespace

void register_file_tools(ToolRegistry& registry, const PathSandbox& sandbox) {
    const PathSandbox* sb = &sandbox;

    registry.add(ToolDefinition{
        "read_file",
        "Read the complete contents of a file from the file system. "
        "Handles various text encodings and provides detailed error messages "
        "if the file cannot be read. Use this tool when you need to examine "
        "the contents of a single file. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {{"path", string_property("Path to the file to read")}}},
            {"required", {"path"}}
        }
    }, [sb](const nlohmann::json& a) { return read_file(*sb, a); });

    registry.add(ToolDefinition{
        "read_multiple_files",
        "Read the contents of multiple files simultaneously. This is more "
        "efficient than reading files one by one when you need to analyze "
        "or compare multiple files. Each file's content is returned with its "
        "path as a reference. Failed reads for individual files won't stop "
        "the entire operation. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {{"paths", string_array_property("Paths to the files to read")}}},
            {"required", {"paths"}}
        }
    }, [sb](const nlohmann::json& a) { return read_multiple_files(*sb, a); });

    registry.add(ToolDefinition{
        "write_file",
        "Create a new file or completely overwrite an existing file with new content. "
        "Use with caution as it will overwrite existing files without warning. "
        "Handles text content with proper encoding. Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {
                {"path", string_property("Path to the file to write")},
                {"content", string_property("Content to write to the file")}
            }},
            {"required", {"path", "content"}}
        }
    }, [sb](const nlohmann::json& a) { return write_file(*sb, a); });

    registry.add(ToolDefinition{
        "edit_file",
        "Make line-based edits to a text file. Each edit replaces exact line sequences "
        "with new content. Returns a git-style diff showing the changes made. "
        "Only works within allowed directories.",
        {
            {"type", "object"},
            {"properties", {
                {"path", string_property("Path to the file to edit")},
                {"edits", {
                    {"type", "array"},
                    {"items", {
                        {"type", "object"},
                        {"properties", {
                            {"oldText", string_property("Text to search for - must match exactly")},
                            {"newText", string_property("Text to replace with")}
                        }},
                        {"required", {"oldText", "newText"}}
                    }},
                    {"description", "List of edit operations to perform"}
                }},
                {"dryRun", {
                    {"type", "boolean"},
                    {"description", "Preview changes using git-style diff format"}
                }}
            }},
            {"required", {"path", "edits"}}
        }
    }, [sb](const nlohmann::json& a) { return edit_file(*sb, a); });
}

} // namespace mcpfs

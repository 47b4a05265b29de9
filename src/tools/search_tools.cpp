#include "mcpfs/tools.hpp"
#include "mcpfs/log.hpp"
#include "tool_support.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

namespace mcpfs {

using tools::check_path;
using tools::failure;
using tools::string_array_property;
using tools::string_property;

namespace {

enum class WalkAction { Continue, SkipDirectory };

struct WalkEntry {
    std::string path;      // absolute
    std::string relative;  // from the walk root
    std::string name;
    bool is_dir;
};

using WalkVisitor = std::function<WalkAction(const WalkEntry&)>;

/// Depth-first, name-ordered walk below `dir`. Links are not followed and
/// unreadable directories are skipped.
void walk(const std::string& dir, const std::string& relative, const WalkVisitor& visit) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        log::get("tools")->debug("walk: cannot read {}: {}", dir, ec.message());
        return;
    }

    std::vector<WalkEntry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log::get("tools")->debug("walk: error in {}: {}", dir, ec.message());
            break;
        }
        std::error_code st_ec;
        auto st = it->symlink_status(st_ec);
        std::string name = it->path().filename().string();
        entries.push_back(WalkEntry{
            dir + "/" + name,
            relative.empty() ? name : relative + "/" + name,
            name,
            !st_ec && st.type() == fs::file_type::directory
        });
    }
    std::sort(entries.begin(), entries.end(),
              [](const WalkEntry& a, const WalkEntry& b) { return a.name < b.name; });

    for (const auto& entry : entries) {
        if (visit(entry) == WalkAction::SkipDirectory || !entry.is_dir) continue;
        walk(entry.path, entry.relative, visit);
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool excluded(const std::vector<std::string>& patterns, const std::string& relative) {
    for (const auto& p : patterns) {
        if (::fnmatch(p.c_str(), relative.c_str(), FNM_PATHNAME) == 0) return true;
    }
    return false;
}

CallToolResult search_files(const PathSandbox& sandbox, const nlohmann::json& arguments) {
    ToolArguments args(arguments);
    auto path = args.require_string("path");
    auto pattern = lower(args.require_string("pattern"));
    auto excludes = args.optional_string_array("excludePatterns");
    if (!args.ok()) return args.error_result();

    auto target = check_path(sandbox, "search_files", path);
    if (target.failure) return *target.failure;

    std::error_code ec;
    if (!fs::is_directory(target.path, ec)) {
        return failure("search_files", path, ec ? ec.message() : std::string("not a directory"));
    }

    std::vector<std::string> matches;
    walk(target.path, "", [&](const WalkEntry& entry) {
        if (excluded(excludes, entry.relative)) {
            return WalkAction::SkipDirectory;
        }
        if (lower(entry.name).find(pattern) != std::string::npos) {
            matches.push_back(entry.path);
        }
        return WalkAction::Continue;
    });

    if (matches.empty()) return CallToolResult::text("No matches found");

    std::string out;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += matches[i];
    }
    return CallToolResult::text(std::move(out));
}

} // anonymous namespace

void register_search_tools(ToolRegistry& registry, const PathSandbox& sandbox) {
    const PathSandbox* sb = &sandbox;

    registry.add(ToolDefinition{
        "search_files",
        "Recursively search for files and directories matching a pattern. "
        "Searches through all subdirectories from the starting path. The search "
        "is case-insensitive and matches partial names. Returns full paths to all "
        "matching items. Great for finding files when you don't know their exact location. "
        "Only searches within allowed directories.",
        {
            {"type", "object"},
            {"properties", {
                {"path", string_property("Path to the directory to search in")},
                {"pattern", string_property("Pattern to search for")},
                {"excludePatterns", string_array_property("Patterns to exclude from search")}
            }},
            {"required", {"path", "pattern"}}
        }
    }, [sb](const nlohmann::json& a) { return search_files(*sb, a); });
}

} // namespace mcpfs

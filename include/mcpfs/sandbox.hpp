#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpfs {

/// Home directory from $HOME, falling back to the password database.
[[nodiscard]] std::optional<std::string> home_directory();

/// Expand a leading "~" or "~/". Other tilde forms are left alone, as is
/// everything when the home directory is unknown.
[[nodiscard]] std::string expand_home(const std::string& path,
                                      const std::optional<std::string>& home);
[[nodiscard]] std::string expand_home(const std::string& path);

/// Purely lexical normalization: collapses ".", ".." and repeated
/// separators. Never touches the filesystem.
[[nodiscard]] std::string clean_path(std::string_view path);

/// True when `path` equals `root` or lies beneath it. Both must be cleaned.
[[nodiscard]] bool is_within(std::string_view path, std::string_view root);

/// Expand, absolutize against `start_dir` and clean an operator-supplied
/// root, then require it to be an existing directory. Throws ConfigError.
[[nodiscard]] std::string normalize_root(const std::string& raw, const std::string& start_dir);

struct AllowedRoot {
    std::string path;       // cleaned absolute form, as configured
    std::string canonical;  // symlinks resolved at startup
};

enum class RejectionKind {
    InvalidPath,
    PathNotAllowed,
    SymlinkEscape,
    ParentMissing,
    ResolutionError,
};

struct Rejection {
    RejectionKind kind;
    std::string path;    // lexical candidate, or the raw request when unusable
    std::string detail;

    [[nodiscard]] std::string message() const;
};

struct ResolvedPath {
    std::string path;
};

using Resolution = std::variant<ResolvedPath, Rejection>;

/// How a target that does not exist yet is checked.
enum class MissingParents {
    Reject,  // the immediate parent must exist
    Allow,   // the nearest existing ancestor is checked instead
};

/// Maps client-supplied paths onto locations inside the allowed roots.
/// Immutable after construction and safe to share between threads.
class PathSandbox {
public:
    /// Throws ConfigError if `roots` is empty or any root is not a directory.
    PathSandbox(const std::vector<std::string>& roots, std::string start_dir);

    [[nodiscard]] Resolution resolve(std::string_view requested,
                                     MissingParents mode = MissingParents::Reject) const;

    [[nodiscard]] const std::vector<AllowedRoot>& roots() const { return roots_; }
    [[nodiscard]] const std::string& start_dir() const { return start_dir_; }

    /// Allow-list check on a cleaned absolute path.
    [[nodiscard]] bool contains(std::string_view cleaned) const;

private:
    std::optional<Rejection> check_ancestor(const std::string& candidate,
                                            MissingParents mode) const;

    std::vector<AllowedRoot> roots_;
    std::string start_dir_;
};

} // namespace mcpfs

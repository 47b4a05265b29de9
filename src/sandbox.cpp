#include "mcpfs/sandbox.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"
#include <pwd.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace mcpfs {

namespace {

std::string parent_of(const std::string& cleaned) {
    return clean_path(cleaned + "/..");
}

std::string absolutize(const std::string& path, const std::string& start_dir) {
    if (!path.empty() && path.front() == '/') return path;
    return start_dir + "/" + path;
}

Rejection reject(RejectionKind kind, std::string path, std::string detail = {}) {
    Rejection r{kind, std::move(path), std::move(detail)};
    log::get("sandbox")->warn("rejected {}: {}", r.path, r.message());
    return r;
}

} // anonymous namespace

std::optional<std::string> home_directory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home);
    }
    struct passwd pwd;
    struct passwd* result = nullptr;
    char buf[4096];
    if (::getpwuid_r(::getuid(), &pwd, buf, sizeof(buf), &result) == 0 && result
        && result->pw_dir && *result->pw_dir) {
        return std::string(result->pw_dir);
    }
    return std::nullopt;
}

std::string expand_home(const std::string& path, const std::optional<std::string>& home) {
    if (!home) return path;
    if (path == "~") return *home;
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return *home + "/" + path.substr(2);
    }
    return path;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    return expand_home(path, home_directory());
}

std::string clean_path(std::string_view path) {
    if (path.empty()) return ".";
    const bool rooted = path.front() == '/';

    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        std::string_view seg = path.substr(pos, next - pos);
        pos = next + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(seg);
            }
            continue;
        }
        parts.push_back(seg);
    }

    std::string out;
    if (rooted) out.push_back('/');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.push_back('/');
        out.append(parts[i]);
    }
    if (out.empty()) return rooted ? "/" : ".";
    return out;
}

bool is_within(std::string_view path, std::string_view root) {
    if (path == root) return true;
    if (root == "/") return !path.empty() && path.front() == '/';
    return path.size() > root.size()
        && path.compare(0, root.size(), root) == 0
        && path[root.size()] == '/';
}

std::string normalize_root(const std::string& raw, const std::string& start_dir) {
    if (raw.empty()) {
        throw ConfigError("allowed directory must not be empty");
    }
    std::string path = clean_path(absolutize(expand_home(raw), start_dir));

    std::error_code ec;
    auto st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        throw ConfigError("allowed directory does not exist: " + path);
    }
    if (ec) {
        throw ConfigError("cannot access allowed directory " + path + ": " + ec.message());
    }
    if (!fs::is_directory(st)) {
        throw ConfigError("allowed path is not a directory: " + path);
    }
    return path;
}

std::string Rejection::message() const {
    switch (kind) {
        case RejectionKind::InvalidPath:
            return "invalid path: " + detail;
        case RejectionKind::PathNotAllowed:
            return "path not within allowed directories";
        case RejectionKind::SymlinkEscape:
            return "symlink target outside allowed directories: " + detail;
        case RejectionKind::ParentMissing:
            return "parent directory does not exist: " + detail;
        case RejectionKind::ResolutionError:
            return "cannot resolve path: " + detail;
    }
    return detail;
}

PathSandbox::PathSandbox(const std::vector<std::string>& roots, std::string start_dir)
    : start_dir_(clean_path(start_dir)) {
    if (start_dir_.empty() || start_dir_.front() != '/') {
        throw ConfigError("starting directory must be absolute: " + start_dir);
    }
    if (roots.empty()) {
        throw ConfigError("at least one allowed directory is required");
    }
    for (const auto& raw : roots) {
        std::string path = normalize_root(raw, start_dir_);
        bool seen = std::any_of(roots_.begin(), roots_.end(),
                                [&](const AllowedRoot& r) { return r.path == path; });
        if (seen) continue;

        std::error_code ec;
        auto canonical = fs::canonical(path, ec);
        if (ec) {
            throw ConfigError("cannot resolve allowed directory " + path + ": " + ec.message());
        }
        roots_.push_back(AllowedRoot{path, canonical.string()});
    }
}

bool PathSandbox::contains(std::string_view cleaned) const {
    for (const auto& root : roots_) {
        if (is_within(cleaned, root.path) || is_within(cleaned, root.canonical)) {
            return true;
        }
    }
    return false;
}

Resolution PathSandbox::resolve(std::string_view requested, MissingParents mode) const {
    if (requested.empty()) {
        return reject(RejectionKind::InvalidPath, std::string(), "empty path");
    }
    if (requested.find('\0') != std::string_view::npos) {
        return reject(RejectionKind::InvalidPath, "<contains NUL>", "path contains NUL byte");
    }

    std::string candidate = clean_path(absolutize(expand_home(std::string(requested)), start_dir_));
    if (!contains(candidate)) {
        return reject(RejectionKind::PathNotAllowed, candidate);
    }

    std::error_code ec;
    auto canonical = fs::canonical(candidate, ec);
    if (!ec) {
        std::string real = canonical.string();
        if (!contains(real)) {
            return reject(RejectionKind::SymlinkEscape, candidate, real);
        }
        return ResolvedPath{real};
    }
    if (ec != std::errc::no_such_file_or_directory) {
        return reject(RejectionKind::ResolutionError, candidate, ec.message());
    }

    if (auto rejection = check_ancestor(candidate, mode)) {
        return *rejection;
    }
    return ResolvedPath{candidate};
}

std::optional<Rejection> PathSandbox::check_ancestor(const std::string& candidate,
                                                     MissingParents mode) const {
    std::error_code ec;

    // A dangling link could send a later create anywhere.
    auto self = fs::symlink_status(candidate, ec);
    if (fs::is_symlink(self)) {
        std::error_code link_ec;
        auto target = fs::read_symlink(candidate, link_ec);
        return reject(RejectionKind::SymlinkEscape, candidate,
                      link_ec ? std::string("dangling symlink") : target.string());
    }

    std::string dir = parent_of(candidate);
    if (mode == MissingParents::Reject) {
        auto real = fs::canonical(dir, ec);
        if (ec) {
            return reject(RejectionKind::ParentMissing, candidate, dir);
        }
        if (!contains(real.string())) {
            return reject(RejectionKind::SymlinkEscape, candidate, real.string());
        }
        return std::nullopt;
    }

    while (true) {
        std::error_code st_ec;
        auto st = fs::symlink_status(dir, st_ec);
        if (st.type() == fs::file_type::not_found) {
            std::string up = parent_of(dir);
            if (up == dir) {
                return reject(RejectionKind::ParentMissing, candidate, dir);
            }
            dir = std::move(up);
            continue;
        }
        if (st_ec) {
            return reject(RejectionKind::ResolutionError, candidate, st_ec.message());
        }

        auto real = fs::canonical(dir, ec);
        if (ec) {
            if (fs::is_symlink(st)) {
                return reject(RejectionKind::SymlinkEscape, candidate, dir + " (dangling symlink)");
            }
            return reject(RejectionKind::ResolutionError, candidate, ec.message());
        }
        if (!contains(real.string())) {
            return reject(RejectionKind::SymlinkEscape, candidate, real.string());
        }
        return std::nullopt;
    }
}

} // namespace mcpfs

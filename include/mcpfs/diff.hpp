#pragma once
#include <string>
#include <vector>

namespace mcpfs {

enum class DiffOp { Equal, Delete, Insert };

struct DiffLine {
    DiffOp op;
    std::string text;

    bool operator==(const DiffLine& o) const { return op == o.op && text == o.text; }
};

/// Line-level edit script turning `before` into `after`. CRLF is treated as LF.
/// A last line without a terminator carries diff(1)'s
/// "\ No newline at end of file" marker, so adding or dropping the final
/// newline shows up as a change.
[[nodiscard]] std::vector<DiffLine> diff_lines(const std::string& before, const std::string& after);

/// Unified-diff hunks ("@@ -a,b +c,d @@" plus body), empty when equal.
[[nodiscard]] std::string unified_hunks(const std::string& before, const std::string& after,
                                        int context = 3);

/// Hunks under a git-style header, fenced with enough backticks that the
/// fence cannot occur inside the diff.
[[nodiscard]] std::string format_git_diff(const std::string& before, const std::string& after,
                                          const std::string& path);

} // namespace mcpfs

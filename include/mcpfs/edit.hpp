#pragma once
#include <optional>
#include <string>
#include <vector>

namespace mcpfs {

struct EditOperation {
    std::string old_text;
    std::string new_text;
};

struct EditOutcome {
    std::string content;
    /// oldText of the first edit that matched nowhere; content is then unusable.
    std::optional<std::string> unmatched;
};

/// Apply edits in order. Each replaces the first exact occurrence of its
/// oldText. Failing that, a block of lines equal to oldText after trimming
/// surrounding whitespace is replaced and the new lines are re-indented from
/// the first matched line.
[[nodiscard]] EditOutcome apply_edits(std::string content, const std::vector<EditOperation>& edits);

} // namespace mcpfs

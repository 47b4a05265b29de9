#include "mcpfs/edit.hpp"
#include <cstddef>
#include <string_view>

namespace mcpfs {

namespace {

constexpr std::string_view kSpace = " \t\n\v\f\r";

std::vector<std::string> split(const std::string& text) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            out.push_back(text.substr(pos));
            return out;
        }
        out.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
}

std::string join(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = s.find_first_not_of(kSpace);
    if (b == std::string_view::npos) return {};
    size_t e = s.find_last_not_of(kSpace);
    return s.substr(b, e - b + 1);
}

std::string leading_space(std::string_view s) {
    size_t n = s.find_first_not_of(kSpace);
    return std::string(s.substr(0, n == std::string_view::npos ? s.size() : n));
}

std::string_view trim_indent(std::string_view s) {
    size_t n = s.find_first_not_of(" \t");
    return n == std::string_view::npos ? std::string_view{} : s.substr(n);
}

bool replace_by_lines(std::string& content, const EditOperation& edit) {
    const auto old_lines = split(edit.old_text);
    auto lines = split(content);
    if (old_lines.size() > lines.size()) return false;

    for (size_t i = 0; i + old_lines.size() <= lines.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < old_lines.size(); ++j) {
            if (trim(old_lines[j]) != trim(lines[i + j])) {
                match = false;
                break;
            }
        }
        if (!match) continue;

        const std::string indent = leading_space(lines[i]);
        auto new_lines = split(edit.new_text);
        for (size_t j = 0; j < new_lines.size(); ++j) {
            std::string body(trim_indent(new_lines[j]));
            if (j == 0) {
                new_lines[j] = indent + body;
                continue;
            }
            // Keep only the extra indentation the new line has over the old one.
            size_t old_indent = j < old_lines.size() ? leading_space(old_lines[j]).size() : 0;
            size_t new_indent = leading_space(new_lines[j]).size();
            std::string relative = new_indent > old_indent
                ? std::string(new_indent - old_indent, ' ') : std::string();
            new_lines[j] = indent + relative + body;
        }

        lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(i),
                    lines.begin() + static_cast<std::ptrdiff_t>(i + old_lines.size()));
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(i), new_lines.begin(), new_lines.end());
        content = join(lines);
        return true;
    }
    return false;
}

} // anonymous namespace

EditOutcome apply_edits(std::string content, const std::vector<EditOperation>& edits) {
    for (const auto& edit : edits) {
        size_t pos = content.find(edit.old_text);
        if (pos != std::string::npos) {
            content.replace(pos, edit.old_text.size(), edit.new_text);
            continue;
        }
        if (!replace_by_lines(content, edit)) {
            return EditOutcome{std::move(content), edit.old_text};
        }
    }
    return EditOutcome{std::move(content), std::nullopt};
}

} // namespace mcpfs

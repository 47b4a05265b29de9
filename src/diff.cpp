#include "mcpfs/diff.hpp"
#include <algorithm>
#include <cstdint>
#include <string_view>

namespace mcpfs {

namespace {

// Above this many DP cells the changed middle is reported as one block.
constexpr size_t kMaxLcsCells = size_t{1} << 22;

constexpr const char* kNoNewlineMarker = "\n\\ No newline at end of file";

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;
        if (c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    // An unterminated last line differs from the same text with a newline
    if (!current.empty()) lines.push_back(std::move(current) + kNoNewlineMarker);
    return lines;
}

void lcs_middle(const std::vector<std::string>& a, size_t a0, size_t a1,
                const std::vector<std::string>& b, size_t b0, size_t b1,
                std::vector<DiffLine>& out) {
    const size_t n = a1 - a0;
    const size_t m = b1 - b0;
    if (n == 0 || m == 0 || n * m > kMaxLcsCells) {
        for (size_t i = a0; i < a1; ++i) out.push_back({DiffOp::Delete, a[i]});
        for (size_t j = b0; j < b1; ++j) out.push_back({DiffOp::Insert, b[j]});
        return;
    }

    // len[i][j] = LCS of a[a0+i..a1) and b[b0+j..b1)
    std::vector<uint32_t> len((n + 1) * (m + 1), 0);
    auto at = [m](size_t i, size_t j) { return i * (m + 1) + j; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            if (a[a0 + i] == b[b0 + j]) {
                len[at(i, j)] = len[at(i + 1, j + 1)] + 1;
            } else {
                len[at(i, j)] = std::max(len[at(i + 1, j)], len[at(i, j + 1)]);
            }
        }
    }

    size_t i = 0, j = 0;
    while (i < n && j < m) {
        if (a[a0 + i] == b[b0 + j]) {
            out.push_back({DiffOp::Equal, a[a0 + i]});
            ++i;
            ++j;
        } else if (len[at(i + 1, j)] >= len[at(i, j + 1)]) {
            out.push_back({DiffOp::Delete, a[a0 + i]});
            ++i;
        } else {
            out.push_back({DiffOp::Insert, b[b0 + j]});
            ++j;
        }
    }
    for (; i < n; ++i) out.push_back({DiffOp::Delete, a[a0 + i]});
    for (; j < m; ++j) out.push_back({DiffOp::Insert, b[b0 + j]});
}

std::string range(size_t start, size_t count) {
    if (count == 1) return std::to_string(start);
    return std::to_string(start) + "," + std::to_string(count);
}

} // anonymous namespace

std::vector<DiffLine> diff_lines(const std::string& before, const std::string& after) {
    auto a = split_lines(before);
    auto b = split_lines(after);

    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix
           && a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<DiffLine> out;
    out.reserve(a.size() + b.size() - prefix - suffix);
    for (size_t i = 0; i < prefix; ++i) out.push_back({DiffOp::Equal, a[i]});
    lcs_middle(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix, out);
    for (size_t i = a.size() - suffix; i < a.size(); ++i) out.push_back({DiffOp::Equal, a[i]});
    return out;
}

std::string unified_hunks(const std::string& before, const std::string& after, int context) {
    const auto ops = diff_lines(before, after);
    const size_t ctx = context < 0 ? 0 : static_cast<size_t>(context);

    // Lines of each side consumed before op k.
    std::vector<size_t> old_pos(ops.size() + 1, 0), new_pos(ops.size() + 1, 0);
    for (size_t k = 0; k < ops.size(); ++k) {
        old_pos[k + 1] = old_pos[k] + (ops[k].op != DiffOp::Insert ? 1 : 0);
        new_pos[k + 1] = new_pos[k] + (ops[k].op != DiffOp::Delete ? 1 : 0);
    }

    std::string out;
    size_t k = 0;
    while (k < ops.size()) {
        while (k < ops.size() && ops[k].op == DiffOp::Equal) ++k;
        if (k == ops.size()) break;

        size_t start = k > ctx ? k - ctx : 0;
        size_t end = k;  // one past the last change in this hunk
        size_t scan = k;
        while (scan < ops.size()) {
            if (ops[scan].op != DiffOp::Equal) {
                end = scan + 1;
                ++scan;
                continue;
            }
            size_t run = scan;
            while (run < ops.size() && ops[run].op == DiffOp::Equal) ++run;
            if (run == ops.size() || run - scan > 2 * ctx) break;
            scan = run;
        }
        size_t stop = std::min(ops.size(), end + ctx);

        size_t old_count = old_pos[stop] - old_pos[start];
        size_t new_count = new_pos[stop] - new_pos[start];
        size_t old_start = old_count ? old_pos[start] + 1 : old_pos[start];
        size_t new_start = new_count ? new_pos[start] + 1 : new_pos[start];

        out += "@@ -" + range(old_start, old_count) + " +" + range(new_start, new_count) + " @@\n";
        for (size_t i = start; i < stop; ++i) {
            char tag = ops[i].op == DiffOp::Equal ? ' ' : (ops[i].op == DiffOp::Delete ? '-' : '+');
            out.push_back(tag);
            out += ops[i].text;
            out.push_back('\n');
        }
        k = stop;
    }
    return out;
}

std::string format_git_diff(const std::string& before, const std::string& after,
                            const std::string& path) {
    std::string hunks = unified_hunks(before, after);

    size_t ticks = 3;
    while (hunks.find(std::string(ticks, '`')) != std::string::npos) ++ticks;
    const std::string fence(ticks, '`');

    std::string out;
    out += fence + "\n";
    out += "diff --git a/" + path + " b/" + path + "\n";
    out += "--- a/" + path + "\n";
    out += "+++ b/" + path + "\n";
    out += hunks;
    out += fence + "\n\n";
    return out;
}

} // namespace mcpfs

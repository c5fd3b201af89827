#include "mutation/unified_diff.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace tollgate::mutation {

namespace {

// Above this many LCS cells the middle section is emitted as one replacement.
constexpr std::size_t kMaxLcsCells = 4 * 1024 * 1024;

enum class OpType {
    Equal,
    Delete,
    Insert
};

struct Op {
    OpType type;
    std::size_t old_index;
    std::size_t new_index;
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<Op> diff_ops(const std::vector<std::string>& old_lines,
                         const std::vector<std::string>& new_lines) {
    std::vector<Op> ops;
    const std::size_t n = old_lines.size();
    const std::size_t m = new_lines.size();

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && old_lines[prefix] == new_lines[prefix]) {
        ops.push_back({OpType::Equal, prefix, prefix});
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix &&
           old_lines[n - 1 - suffix] == new_lines[m - 1 - suffix]) {
        ++suffix;
    }

    const std::size_t rows = n - prefix - suffix;
    const std::size_t cols = m - prefix - suffix;
    if (rows * cols > kMaxLcsCells) {
        for (std::size_t i = 0; i < rows; ++i) {
            ops.push_back({OpType::Delete, prefix + i, prefix});
        }
        for (std::size_t j = 0; j < cols; ++j) {
            ops.push_back({OpType::Insert, prefix + rows, prefix + j});
        }
    } else {
        std::vector<std::vector<std::size_t>> lcs(rows + 1,
                                                  std::vector<std::size_t>(cols + 1, 0));
        for (std::size_t i = rows; i-- > 0;) {
            for (std::size_t j = cols; j-- > 0;) {
                if (old_lines[prefix + i] == new_lines[prefix + j]) {
                    lcs[i][j] = lcs[i + 1][j + 1] + 1;
                } else {
                    lcs[i][j] = std::max(lcs[i + 1][j], lcs[i][j + 1]);
                }
            }
        }

        std::size_t i = 0;
        std::size_t j = 0;
        while (i < rows || j < cols) {
            if (i < rows && j < cols &&
                old_lines[prefix + i] == new_lines[prefix + j]) {
                ops.push_back({OpType::Equal, prefix + i, prefix + j});
                ++i;
                ++j;
            } else if (i < rows && (j == cols || lcs[i + 1][j] >= lcs[i][j + 1])) {
                ops.push_back({OpType::Delete, prefix + i, prefix + j});
                ++i;
            } else {
                ops.push_back({OpType::Insert, prefix + i, prefix + j});
                ++j;
            }
        }
    }

    for (std::size_t k = 0; k < suffix; ++k) {
        ops.push_back({OpType::Equal, n - suffix + k, m - suffix + k});
    }
    return ops;
}

std::string format_range(const std::size_t start, const std::size_t length) {
    if (length == 1) {
        return std::to_string(start + 1);
    }
    const std::size_t beginning = length == 0 ? start : start + 1;
    return std::to_string(beginning) + "," + std::to_string(length);
}

}  // namespace

std::string unified_diff(const std::string& old_text, const std::string& new_text,
                         const std::string& label, const std::size_t context) {
    const auto old_lines = split_lines(old_text);
    const auto new_lines = split_lines(new_text);
    const auto ops = diff_ops(old_lines, new_lines);

    std::vector<std::size_t> changes;
    for (std::size_t k = 0; k < ops.size(); ++k) {
        if (ops[k].type != OpType::Equal) {
            changes.push_back(k);
        }
    }
    if (changes.empty()) {
        return "";
    }

    std::ostringstream diff;
    diff << "--- a/" << label << "\n";
    diff << "+++ b/" << label << "\n";

    std::size_t c = 0;
    while (c < changes.size()) {
        const std::size_t hunk_begin = changes[c] > context ? changes[c] - context : 0;
        std::size_t last_change = changes[c];
        while (c + 1 < changes.size() && changes[c + 1] - last_change <= 2 * context + 1) {
            last_change = changes[++c];
        }
        ++c;
        const std::size_t hunk_end = std::min(ops.size(), last_change + context + 1);

        std::size_t old_count = 0;
        std::size_t new_count = 0;
        for (std::size_t k = hunk_begin; k < hunk_end; ++k) {
            if (ops[k].type != OpType::Insert) {
                ++old_count;
            }
            if (ops[k].type != OpType::Delete) {
                ++new_count;
            }
        }

        diff << "@@ -" << format_range(ops[hunk_begin].old_index, old_count) << " +"
             << format_range(ops[hunk_begin].new_index, new_count) << " @@\n";
        for (std::size_t k = hunk_begin; k < hunk_end; ++k) {
            switch (ops[k].type) {
                case OpType::Equal:
                    diff << " " << old_lines[ops[k].old_index] << "\n";
                    break;
                case OpType::Delete:
                    diff << "-" << old_lines[ops[k].old_index] << "\n";
                    break;
                case OpType::Insert:
                    diff << "+" << new_lines[ops[k].new_index] << "\n";
                    break;
            }
        }
    }
    return diff.str();
}

}  // namespace tollgate::mutation

#include "unified_diff.hpp"
#include <algorithm>
#include <cstdint>
#include <sstream>
#include <vector>

namespace tollgate {

namespace {

// Above this many LCS cells the changed middle is shown as a plain
// delete-then-insert instead (16 MB of table).
constexpr size_t MAX_TABLE_CELLS = 4000000;

struct Edit {
    char op;       // ' ', '-', '+'
    size_t a_pos;  // original lines before this edit
    size_t b_pos;  // proposed lines before this edit
    const std::string* line;
};

// Lines keep their trailing '\n', so a final line without one compares
// unequal to the same text with one.
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

// Line-level edit script. The common prefix and suffix are matched
// directly; the rest comes from a longest-common-subsequence table.
std::vector<Edit> diff_lines(const std::vector<std::string>& a,
                             const std::vector<std::string>& b) {
    size_t n = a.size();
    size_t m = b.size();

    size_t prefix = 0;
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix &&
           a[n - 1 - suffix] == b[m - 1 - suffix]) {
        ++suffix;
    }

    std::vector<Edit> edits;
    for (size_t k = 0; k < prefix; ++k) edits.push_back({' ', k, k, &a[k]});

    size_t a_end = n - suffix;
    size_t b_end = m - suffix;
    size_t rows = a_end - prefix;
    size_t cols = b_end - prefix;

    if (rows != 0 && cols != 0 && rows > MAX_TABLE_CELLS / cols) {
        for (size_t i = prefix; i < a_end; ++i) edits.push_back({'-', i, prefix, &a[i]});
        for (size_t j = prefix; j < b_end; ++j) edits.push_back({'+', a_end, j, &b[j]});
    } else {
        // lcs[i][j] = LCS length of a[prefix + i..a_end) and b[prefix + j..b_end)
        std::vector<std::vector<uint32_t>> lcs(rows + 1, std::vector<uint32_t>(cols + 1, 0));
        for (size_t i = rows; i-- > 0; ) {
            for (size_t j = cols; j-- > 0; ) {
                lcs[i][j] = (a[prefix + i] == b[prefix + j])
                                ? lcs[i + 1][j + 1] + 1
                                : std::max(lcs[i + 1][j], lcs[i][j + 1]);
            }
        }

        size_t i = 0, j = 0;
        while (i < rows || j < cols) {
            size_t ai = prefix + i;
            size_t bj = prefix + j;
            if (i < rows && j < cols && a[ai] == b[bj]) {
                edits.push_back({' ', ai, bj, &a[ai]});
                ++i; ++j;
            } else if (i < rows && (j == cols || lcs[i + 1][j] >= lcs[i][j + 1])) {
                edits.push_back({'-', ai, bj, &a[ai]});
                ++i;
            } else {
                edits.push_back({'+', ai, bj, &b[bj]});
                ++j;
            }
        }
    }

    for (size_t k = 0; k < suffix; ++k) {
        edits.push_back({' ', a_end + k, b_end + k, &a[a_end + k]});
    }
    return edits;
}

void write_line(std::ostringstream& out, char op, const std::string& line) {
    out << op << line;
    if (line.empty() || line.back() != '\n') {
        out << "\n\\ No newline at end of file\n";
    }
}

std::string hunk_range(size_t start, size_t count) {
    size_t shown = count == 0 ? start : start + 1;
    if (count == 1) return std::to_string(shown);
    return std::to_string(shown) + "," + std::to_string(count);
}

} // namespace

std::string unified_diff(const std::string& original, const std::string& proposed,
                         const std::string& name, size_t context) {
    if (original == proposed) return "";

    auto a = split_lines(original);
    auto b = split_lines(proposed);
    auto edits = diff_lines(a, b);
    size_t n = edits.size();

    std::ostringstream out;
    out << "--- a/" << name << "\n";
    out << "+++ b/" << name << "\n";

    size_t next = 0;
    while (next < n) {
        size_t first = next;
        while (first < n && edits[first].op == ' ') ++first;
        if (first == n) break;

        // Extend over changes separated by at most 2 * context equal lines.
        size_t last = first;
        size_t k = first + 1;
        while (k < n) {
            if (edits[k].op != ' ') {
                last = k++;
                continue;
            }
            size_t run_end = k;
            while (run_end < n && edits[run_end].op == ' ') ++run_end;
            if (run_end == n || run_end - k > 2 * context) break;
            k = run_end;
        }

        size_t start = first > context ? first - context : 0;
        start = std::max(start, next);
        size_t end = std::min(n, last + 1 + context);

        size_t a_count = 0, b_count = 0;
        for (size_t e = start; e < end; ++e) {
            if (edits[e].op != '+') ++a_count;
            if (edits[e].op != '-') ++b_count;
        }

        out << "@@ -" << hunk_range(edits[start].a_pos, a_count)
            << " +" << hunk_range(edits[start].b_pos, b_count) << " @@\n";
        for (size_t e = start; e < end; ++e) {
            write_line(out, edits[e].op, *edits[e].line);
        }
        next = end;
    }
    return out.str();
}

} // namespace tollgate

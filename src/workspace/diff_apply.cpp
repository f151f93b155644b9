#include "workspace/diff_apply.hpp"

#include <cstddef>
#include <regex>
#include <sstream>

namespace protoforge::workspace {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (const char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string rstrip(const std::string& value) {
    const auto last = value.find_last_not_of(" \t\r");
    if (last == std::string::npos) {
        return "";
    }
    return value.substr(0, last + 1);
}

std::string strip(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    return rstrip(value.substr(first));
}

bool is_header_line(const std::string& line) {
    return line.rfind("--- ", 0) == 0 || line.rfind("+++ ", 0) == 0 ||
           line.rfind("diff ", 0) == 0 || line.rfind("index ", 0) == 0 ||
           line.rfind("new file mode", 0) == 0 ||
           line.rfind("deleted file mode", 0) == 0;
}

bool matches_at(const std::vector<std::string>& lines, const std::size_t pos,
                const std::vector<std::string>& expected, const bool lenient) {
    if (pos + expected.size() > lines.size()) {
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        const bool equal = lenient ? rstrip(lines[pos + i]) == rstrip(expected[i])
                                   : lines[pos + i] == expected[i];
        if (!equal) {
            return false;
        }
    }
    return true;
}

std::optional<std::size_t> find_block(const std::vector<std::string>& lines,
                                      const std::size_t from,
                                      const std::vector<std::string>& expected) {
    for (const bool lenient : {false, true}) {
        for (std::size_t pos = from; pos + expected.size() <= lines.size(); ++pos) {
            if (matches_at(lines, pos, expected, lenient)) {
                return pos;
            }
        }
    }
    return std::nullopt;
}

ForgeError mismatch(const std::size_t hunk_number, const std::string& detail) {
    return ForgeError{ErrorCategory::Conflict,
                      "hunk " + std::to_string(hunk_number) + ": " + detail,
                      "context_mismatch"};
}

}  // namespace

core::errors::Result<std::vector<DiffHunk>> parse_hunks(const std::string& diff) {
    static const std::regex kNumberedHeader(
        R"(^@@ -(\d{1,9})(?:,(\d{1,9}))? \+(\d{1,9})(?:,(\d{1,9}))? @@.*$)");

    std::vector<DiffHunk> hunks;
    std::istringstream in(diff);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.rfind("@@", 0) == 0) {
            DiffHunk hunk;
            std::smatch match;
            if (std::regex_match(line, match, kNumberedHeader)) {
                hunk.old_start = static_cast<std::size_t>(std::stoul(match[1].str()));
                hunk.old_count =
                    match[2].matched ? static_cast<std::size_t>(std::stoul(match[2].str())) : 1;
            } else {
                hunk.anchor = strip(line.substr(2));
            }
            hunks.push_back(std::move(hunk));
            continue;
        }
        if (line == "*** End of File") {
            if (hunks.empty()) {
                return ForgeError{ErrorCategory::Validation,
                                  "End-of-file marker outside a hunk at line " +
                                      std::to_string(line_no),
                                  "invalid_diff"};
            }
            hunks.back().end_of_file = true;
            continue;
        }
        if (line.rfind("\\ No newline", 0) == 0) {
            continue;
        }
        if (hunks.empty() && is_header_line(line)) {
            continue;
        }
        if (line.empty()) {
            // Editors and models routinely drop the single space of a blank context line.
            if (!hunks.empty()) {
                hunks.back().lines.push_back(" ");
            }
            continue;
        }
        const char prefix = line.front();
        if (prefix != ' ' && prefix != '-' && prefix != '+') {
            return ForgeError{ErrorCategory::Validation,
                              "Unexpected diff line " + std::to_string(line_no) + ": " +
                                  line,
                              "invalid_diff"};
        }
        if (hunks.empty()) {
            hunks.emplace_back();
        }
        hunks.back().lines.push_back(line);
    }

    if (hunks.empty()) {
        return ForgeError{ErrorCategory::Validation, "Diff body contains no hunks.",
                          "invalid_diff"};
    }
    return hunks;
}

core::errors::Result<std::string> apply_diff(const std::string& original,
                                             const std::string& diff) {
    auto parsed = parse_hunks(diff);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& hunks = core::errors::get_value(parsed);

    std::vector<std::string> lines = split_lines(original);
    std::size_t cursor = 0;
    std::size_t hunk_number = 0;
    // Lines added minus lines removed by the hunks applied so far. Numbered
    // headers refer to the original file, so they are shifted by this.
    std::ptrdiff_t delta = 0;

    for (const auto& hunk : hunks) {
        ++hunk_number;
        std::vector<std::string> old_block;
        std::vector<std::string> new_block;
        for (const auto& hunk_line : hunk.lines) {
            const std::string body = hunk_line.substr(1);
            if (hunk_line.front() != '+') {
                old_block.push_back(body);
            }
            if (hunk_line.front() != '-') {
                new_block.push_back(body);
            }
        }

        if (!hunk.anchor.empty()) {
            bool found = false;
            for (std::size_t i = cursor; i < lines.size(); ++i) {
                if (strip(lines[i]) == hunk.anchor) {
                    cursor = i + 1;
                    found = true;
                    break;
                }
            }
            if (!found) {
                return mismatch(hunk_number, "anchor line not found: " + hunk.anchor);
            }
        }

        std::size_t pos = 0;
        if (hunk.old_start.has_value()) {
            const std::size_t start = hunk.old_start.value();
            const auto original_pos = static_cast<std::ptrdiff_t>(
                hunk.old_count == 0 ? start : (start == 0 ? 0 : start - 1));
            const std::ptrdiff_t shifted = original_pos + delta;
            if (shifted < 0) {
                return mismatch(hunk_number, "line " + std::to_string(start) +
                                                 " lies before the start of the file");
            }
            pos = static_cast<std::size_t>(shifted);
            if (pos < cursor || !matches_at(lines, pos, old_block, false)) {
                return mismatch(hunk_number, "expected content at line " +
                                                 std::to_string(start) +
                                                 " does not match the file");
            }
        } else if (old_block.empty()) {
            pos = (hunk.anchor.empty() || hunk.end_of_file) ? lines.size() : cursor;
        } else if (hunk.end_of_file) {
            if (old_block.size() > lines.size() ||
                !matches_at(lines, lines.size() - old_block.size(), old_block, true)) {
                return mismatch(hunk_number, "expected content at end of file does not match");
            }
            pos = lines.size() - old_block.size();
            if (pos < cursor) {
                return mismatch(hunk_number, "hunk overlaps the previous hunk");
            }
        } else {
            const auto found = find_block(lines, cursor, old_block);
            if (!found.has_value()) {
                return mismatch(hunk_number, "context lines not found after line " +
                                                 std::to_string(cursor));
            }
            pos = found.value();
        }

        lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(pos),
                    lines.begin() + static_cast<std::ptrdiff_t>(pos + old_block.size()));
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(pos), new_block.begin(),
                     new_block.end());
        cursor = pos + new_block.size();
        delta += static_cast<std::ptrdiff_t>(new_block.size()) -
                 static_cast<std::ptrdiff_t>(old_block.size());
    }

    std::string out;
    for (const auto& line : lines) {
        out += line;
        out.push_back('\n');
    }
    return out;
}

}  // namespace protoforge::workspace

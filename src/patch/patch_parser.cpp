#include "patch/patch_parser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace protoforge::patch {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;
using protocol::FileOp;
using protocol::FileOpKind;
using protocol::GenerationResponse;
using protocol::MalformedResponse;
using protocol::NoChange;
using protocol::PatchSet;

namespace {

constexpr const char* kBeginPatch = "*** Begin Patch";
constexpr const char* kEndPatch = "*** End Patch";
constexpr const char* kAddFile = "*** Add File: ";
constexpr const char* kDeleteFile = "*** Delete File: ";
constexpr const char* kUpdateFile = "*** Update File: ";
constexpr const char* kMoveTo = "*** Move to: ";
constexpr std::size_t kExcerptLength = 200;

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string excerpt(const std::string& raw) {
    if (raw.size() <= kExcerptLength) {
        return raw;
    }
    return raw.substr(0, kExcerptLength) + "...";
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out.push_back('\n');
    }
    return out;
}

ForgeError malformed(const std::string& message) {
    return ForgeError{ErrorCategory::Validation, message, "malformed_patch"};
}

bool is_section_header(const std::string& line) {
    return starts_with(line, kAddFile) || starts_with(line, kDeleteFile) ||
           starts_with(line, kUpdateFile) || line == kEndPatch;
}

std::string strip_git_prefix(std::string path) {
    const auto tab = path.find('\t');
    if (tab != std::string::npos) {
        path = path.substr(0, tab);
    }
    path = trim(path);
    if (starts_with(path, "a/") || starts_with(path, "b/")) {
        path = path.substr(2);
    }
    return path;
}

// Models like to wrap JSON answers in markdown fences.
std::string strip_code_fence(const std::string& text) {
    const std::string trimmed = trim(text);
    if (!starts_with(trimmed, "```")) {
        return trimmed;
    }
    const auto first_newline = trimmed.find('\n');
    const auto closing = trimmed.rfind("```");
    if (first_newline == std::string::npos || closing <= first_newline) {
        return trimmed;
    }
    return trim(trimmed.substr(first_newline + 1, closing - first_newline - 1));
}

core::errors::Result<PatchSet> parse_patch_text(const std::string& text) {
    if (text.find(kBeginPatch) != std::string::npos) {
        return parse_envelope(text);
    }
    if (text.find("--- ") != std::string::npos && text.find("+++ ") != std::string::npos) {
        return parse_unified_diff(text);
    }
    return malformed("Patch text is neither an apply_patch envelope nor a unified diff.");
}

core::errors::Result<PatchSet> parse_operations(const json& operations) {
    if (!operations.is_array()) {
        return malformed("\"operations\" must be an array.");
    }

    PatchSet patch;
    for (const auto& entry : operations) {
        if (!entry.is_object()) {
            return malformed("Each operation must be an object.");
        }
        const std::string op_name = lowercase(entry.value("op", std::string()));
        FileOp op;
        if (op_name == "create" || op_name == "add") {
            op.kind = FileOpKind::Create;
        } else if (op_name == "modify" || op_name == "update") {
            op.kind = FileOpKind::Modify;
        } else if (op_name == "delete") {
            op.kind = FileOpKind::Delete;
        } else if (op_name == "rename" || op_name == "move") {
            op.kind = FileOpKind::Rename;
        } else {
            return malformed("Unknown operation: \"" + op_name + "\"");
        }

        op.path = entry.value("path", std::string());
        op.new_path = entry.value("new_path", entry.value("to", std::string()));
        op.overwrite = entry.value("overwrite", false);
        if (entry.contains("content") && !entry.at("content").is_null()) {
            op.content = entry.at("content").get<std::string>();
        }
        if (entry.contains("diff") && !entry.at("diff").is_null()) {
            op.diff = entry.at("diff").get<std::string>();
        }
        patch.ops.push_back(std::move(op));
    }
    return patch;
}

GenerationResponse from_result(const core::errors::Result<PatchSet>& parsed,
                               const std::string& raw) {
    if (core::errors::is_error(parsed)) {
        return MalformedResponse{core::errors::get_error(parsed).message, excerpt(raw)};
    }
    return core::errors::get_value(parsed);
}

GenerationResponse parse_json_response(const json& payload, const std::string& raw) {
    if (!payload.is_object()) {
        return MalformedResponse{"JSON response is not an object.", excerpt(raw)};
    }

    if (payload.contains("operations")) {
        return from_result(parse_operations(payload.at("operations")), raw);
    }

    const std::string action = lowercase(payload.value("action", std::string()));
    if (action == "no_change" || action == "no-change" || action == "done") {
        return NoChange{};
    }
    if (action == "apply_patch") {
        if (!payload.contains("patch") || !payload.at("patch").is_string()) {
            return MalformedResponse{"apply_patch action without a patch body.", excerpt(raw)};
        }
        return from_result(parse_patch_text(payload.at("patch").get<std::string>()), raw);
    }
    if (action.empty()) {
        return MalformedResponse{"JSON response has no action.", excerpt(raw)};
    }
    return MalformedResponse{"Unsupported action: \"" + action + "\"", excerpt(raw)};
}

}  // namespace

core::errors::Result<PatchSet> parse_envelope(const std::string& text) {
    const auto lines = split_lines(text);
    std::size_t i = 0;
    while (i < lines.size() && trim(lines[i]) != kBeginPatch) {
        ++i;
    }
    if (i == lines.size()) {
        return malformed("Missing \"*** Begin Patch\" marker.");
    }
    ++i;

    PatchSet patch;
    bool ended = false;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        if (trim(line) == kEndPatch) {
            ended = true;
            break;
        }

        if (starts_with(line, kAddFile)) {
            FileOp op;
            op.kind = FileOpKind::Create;
            op.path = trim(line.substr(std::string(kAddFile).size()));
            std::vector<std::string> content;
            ++i;
            while (i < lines.size() && !is_section_header(trim(lines[i]))) {
                const std::string& body = lines[i];
                if (body.empty()) {
                    content.emplace_back();
                } else if (body.front() == '+') {
                    content.push_back(body.substr(1));
                } else {
                    return malformed("Added file lines must start with '+': " + body);
                }
                ++i;
            }
            op.content = join_lines(content);
            patch.ops.push_back(std::move(op));
            continue;
        }

        if (starts_with(line, kDeleteFile)) {
            FileOp op;
            op.kind = FileOpKind::Delete;
            op.path = trim(line.substr(std::string(kDeleteFile).size()));
            patch.ops.push_back(std::move(op));
            ++i;
            continue;
        }

        if (starts_with(line, kUpdateFile)) {
            FileOp op;
            op.kind = FileOpKind::Modify;
            op.path = trim(line.substr(std::string(kUpdateFile).size()));
            ++i;
            if (i < lines.size() && starts_with(lines[i], kMoveTo)) {
                op.kind = FileOpKind::Rename;
                op.new_path = trim(lines[i].substr(std::string(kMoveTo).size()));
                ++i;
            }
            std::vector<std::string> body;
            while (i < lines.size() && !is_section_header(trim(lines[i]))) {
                body.push_back(lines[i]);
                ++i;
            }
            while (!body.empty() && trim(body.back()).empty()) {
                body.pop_back();
            }
            if (!body.empty()) {
                op.diff = join_lines(body);
            } else if (op.kind == FileOpKind::Modify) {
                return malformed("Update of " + op.path + " has no hunks.");
            }
            patch.ops.push_back(std::move(op));
            continue;
        }

        if (!trim(line).empty()) {
            return malformed("Unexpected line in patch: " + line);
        }
        ++i;
    }

    if (!ended) {
        return malformed("Missing \"*** End Patch\" marker.");
    }
    return patch;
}

core::errors::Result<PatchSet> parse_unified_diff(const std::string& text) {
    struct FileSection {
        std::string old_path;
        std::string new_path;
        bool is_new = false;
        bool is_deleted = false;
        bool header_done = false;
        std::vector<std::string> body;
        // Lines still owed by the current "@@ -L,N +L,M @@" hunk. While either
        // is non-zero, "--- " and "diff " lines are hunk content.
        std::size_t old_left = 0;
        std::size_t new_left = 0;
    };
    static const std::regex kHunkHeader(
        R"(^@@ -\d+(?:,(\d{1,9}))? \+\d+(?:,(\d{1,9}))? @@.*$)");

    std::vector<FileSection> sections;
    FileSection current;
    bool have_current = false;

    auto flush = [&]() {
        if (have_current) {
            sections.push_back(std::move(current));
        }
        current = FileSection{};
        have_current = false;
    };

    for (const auto& line : split_lines(text)) {
        if (have_current && (current.old_left > 0 || current.new_left > 0)) {
            current.body.push_back(line);
            const char prefix = line.empty() ? ' ' : line.front();
            if (prefix == '\\') {
                continue;
            }
            if (prefix != '+' && current.old_left > 0) {
                --current.old_left;
            }
            if (prefix != '-' && current.new_left > 0) {
                --current.new_left;
            }
            continue;
        }
        if (starts_with(line, "diff --git ")) {
            flush();
            have_current = true;
            std::istringstream tokens(line);
            std::string skip;
            tokens >> skip >> skip >> current.old_path >> current.new_path;
            current.old_path = strip_git_prefix(current.old_path);
            current.new_path = strip_git_prefix(current.new_path);
            continue;
        }
        if (starts_with(line, "--- ") && (!have_current || current.header_done ||
                                          !current.body.empty())) {
            flush();
            have_current = true;
        }
        if (!have_current) {
            continue;
        }
        if (starts_with(line, "new file mode")) {
            current.is_new = true;
            continue;
        }
        if (starts_with(line, "deleted file mode")) {
            current.is_deleted = true;
            continue;
        }
        if (!current.header_done && starts_with(line, "--- ")) {
            const std::string path = line.substr(4);
            if (trim(path) == "/dev/null") {
                current.is_new = true;
            } else {
                current.old_path = strip_git_prefix(path);
            }
            continue;
        }
        if (!current.header_done && starts_with(line, "+++ ")) {
            const std::string path = line.substr(4);
            if (trim(path) == "/dev/null") {
                current.is_deleted = true;
            } else {
                current.new_path = strip_git_prefix(path);
            }
            current.header_done = true;
            continue;
        }
        if (current.header_done) {
            current.body.push_back(line);
            std::smatch counts;
            if (std::regex_match(line, counts, kHunkHeader)) {
                current.old_left = counts[1].matched ? std::stoul(counts[1].str()) : 1;
                current.new_left = counts[2].matched ? std::stoul(counts[2].str()) : 1;
            }
        }
    }
    flush();

    PatchSet patch;
    for (auto& section : sections) {
        while (!section.body.empty() && trim(section.body.back()).empty()) {
            section.body.pop_back();
        }

        FileOp op;
        if (section.is_deleted) {
            op.kind = FileOpKind::Delete;
            op.path = section.old_path;
        } else if (section.is_new) {
            op.kind = FileOpKind::Create;
            op.path = section.new_path;
            std::vector<std::string> content;
            for (const auto& body_line : section.body) {
                if (!body_line.empty() && body_line.front() == '+') {
                    content.push_back(body_line.substr(1));
                }
            }
            op.content = join_lines(content);
        } else {
            op.path = section.old_path.empty() ? section.new_path : section.old_path;
            op.kind = FileOpKind::Modify;
            if (!section.new_path.empty() && section.new_path != op.path) {
                op.kind = FileOpKind::Rename;
                op.new_path = section.new_path;
            }
            if (!section.body.empty()) {
                op.diff = join_lines(section.body);
            } else if (op.kind == FileOpKind::Modify) {
                return malformed("Diff for " + op.path + " has no hunks.");
            }
        }
        patch.ops.push_back(std::move(op));
    }

    if (patch.ops.empty()) {
        return malformed("Unified diff does not name any file.");
    }
    return patch;
}

GenerationResponse parse_generation_output(const std::string& raw) {
    const std::string trimmed = trim(raw);
    if (trimmed.empty()) {
        return MalformedResponse{"Generator returned an empty response.", ""};
    }

    const std::string lowered = lowercase(trimmed);
    if (lowered == "no_change" || lowered == "no-change" || lowered == "no change") {
        return NoChange{};
    }

    const std::string unfenced = strip_code_fence(trimmed);
    if (!unfenced.empty() && unfenced.front() == '{') {
        try {
            return parse_json_response(json::parse(unfenced), raw);
        } catch (const json::exception& e) {
            // Falls through: the text may still embed a patch envelope.
            if (trimmed.find(kBeginPatch) == std::string::npos) {
                return MalformedResponse{"Invalid JSON response: " + std::string(e.what()),
                                         excerpt(raw)};
            }
        }
    }

    return from_result(parse_patch_text(raw), raw);
}

}  // namespace protoforge::patch

#include "feedback/feedback_composer.hpp"

#include <sstream>
#include <utility>
#include <variant>

namespace protoforge::feedback {

using protocol::ConflictReport;
using protocol::IterationRecord;
using protocol::TestStatus;

namespace {

constexpr const char* kTruncationMarker = "\n...\n[TRUNCATED]\n...\n";
constexpr const char* kBinaryPlaceholder = "[Binary file or read error]\n";

bool is_continuation_byte(const char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Strict UTF-8 check; NUL bytes count as binary too.
bool is_text(const std::string& content) {
    std::size_t i = 0;
    while (i < content.size()) {
        const auto lead = static_cast<unsigned char>(content[i]);
        std::size_t extra = 0;
        if (lead == 0) {
            return false;
        } else if (lead < 0x80) {
            extra = 0;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= content.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if (!is_continuation_byte(content[i + k])) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

constexpr const char* kPatchFormat =
    "Respond with exactly one JSON object and nothing else:\n"
    "  {\"action\":\"apply_patch\",\"patch\":\"*** Begin Patch\\n...\\n*** End Patch\"}\n"
    "  {\"action\":\"no_change\"} when the project already satisfies the goal.\n"
    "Patch envelope:\n"
    "*** Begin Patch\n"
    "*** Add File: <path>        every following line starts with '+'\n"
    "*** Delete File: <path>\n"
    "*** Update File: <path>\n"
    "*** Move to: <new path>     optional, directly after Update File\n"
    "@@ <line near the change>   then ' ' context, '-' removed, '+' added lines\n"
    "*** End of File             optional, pins the hunk to the end of the file\n"
    "*** End Patch\n"
    "Paths are relative to the project root. Touch each path at most once.\n";

void append_failing_tests(std::ostringstream& out, const protocol::TestResult& result) {
    bool header = false;
    for (const auto& test_case : result.cases) {
        if (test_case.passed) {
            continue;
        }
        if (!header) {
            out << "Failing tests:\n";
            header = true;
        }
        out << "- " << test_case.name << "\n";
    }
}

}  // namespace

FeedbackComposer::FeedbackComposer(ComposerLimits limits) : limits_(std::move(limits)) {}

protocol::GenerationRequest FeedbackComposer::compose(const session::Session& session) const {
    protocol::GenerationRequest request;
    request.spec_text = session.spec_text;
    request.iteration = session.counter + 1;
    request.budget = session.budget;
    if (session.current) {
        request.tree_digest = render_tree_digest(*session.current, limits_.max_tree_bytes);
    }
    const auto last = session.transcript ? session.transcript->last_record()
                                         : std::optional<IterationRecord>();
    request.feedback_digest = render_feedback_digest(last, limits_.max_feedback_bytes);
    request.system_prompt = build_system_prompt(
        session.test_command, session.working_directory.generic_string(), request.tree_digest);
    request.user_prompt = build_user_prompt(session.spec_text, request.feedback_digest);
    return request;
}

std::string truncate_middle(const std::string& text, const std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    // Both cuts land on code point boundaries so a multi-byte character is
    // never split.
    std::size_t head = max_bytes / 2;
    while (head > 0 && is_continuation_byte(text[head])) {
        --head;
    }
    std::size_t tail = text.size() - max_bytes / 2;
    while (tail < text.size() && is_continuation_byte(text[tail])) {
        ++tail;
    }
    return text.substr(0, head) + kTruncationMarker + text.substr(tail);
}

std::string render_tree_digest(const workspace::Snapshot& snapshot, const std::size_t max_bytes) {
    std::string digest;
    // Entries are a std::map, so iteration is already sorted by path.
    for (const auto& entry : snapshot.entries()) {
        digest += "=== " + entry.first + " ===\n";
        if (entry.second && !is_text(*entry.second)) {
            digest += kBinaryPlaceholder;
        } else if (entry.second) {
            digest += *entry.second;
            if (!entry.second->empty() && entry.second->back() != '\n') {
                digest.push_back('\n');
            }
        }
        digest.push_back('\n');
    }
    return truncate_middle(digest, max_bytes);
}

std::string render_feedback_digest(const std::optional<IterationRecord>& record,
                                   const std::size_t max_bytes) {
    if (!record.has_value()) {
        return "";
    }

    std::ostringstream out;
    const auto index = record->index;

    if (const auto* report = std::get_if<ConflictReport>(&record->apply_result)) {
        out << "Previous iteration " << index << " produced a patch that was rejected.\n";
        for (const auto& conflict : report->conflicts) {
            out << "- " << (conflict.path.empty() ? "<patch>" : conflict.path) << ": "
                << protocol::to_string(conflict.reason);
            if (!conflict.detail.empty()) {
                out << " (" << conflict.detail << ")";
            }
            out << "\n";
        }
        return truncate_middle(out.str(), max_bytes);
    }

    if (!record->test_result.has_value() || record->test_result->all_passed()) {
        return "";
    }
    const auto& result = record->test_result.value();

    if (record->no_change) {
        out << "Previous iteration " << index
            << " declared the project complete, but the tests do not pass.\n";
    }
    switch (result.status) {
        case TestStatus::TimedOut:
            out << "Previous iteration " << index << " timed out while running the tests.\n";
            break;
        case TestStatus::ExecutionError:
            out << "Previous iteration " << index << " could not run the test command.\n";
            break;
        default:
            out << "Previous iteration " << index << " failed with exit code "
                << result.exit_code << ".\n";
            break;
    }
    append_failing_tests(out, result);
    if (!result.output.empty()) {
        out << "Test output:\n" << result.output;
        if (result.output.back() != '\n') {
            out << "\n";
        }
    }
    return truncate_middle(out.str(), max_bytes);
}

std::string build_system_prompt(const std::string& test_command,
                                const std::string& working_directory,
                                const std::string& tree_digest) {
    std::ostringstream out;
    out << "You are a coding agent that edits the project below until its test command "
           "exits 0.\n\n"
        << "Current working directory: " << working_directory << "\n"
        << "Test command: " << test_command << "\n\n"
        << "Project context:\n"
        << tree_digest << "\n"
        << "Requirements:\n"
        << "- Never emit an empty patch.\n"
        << "- Do not modify the tests to make them pass.\n"
        << "- When patching, use the exact current content from the files above and "
           "include 3 or more lines of context when available.\n"
        << "- When tests fail, read the error messages and fix the specific errors they "
           "report.\n\n"
        << kPatchFormat;
    return out.str();
}

std::string build_user_prompt(const std::string& spec_text, const std::string& feedback_digest) {
    if (feedback_digest.empty()) {
        return "Goal: " + spec_text;
    }
    return "Goal: " + spec_text +
           "\n\nPrevious iteration failed. Here are the details:\n" + feedback_digest +
           "\nRead the errors above and adjust the code to fix them.";
}

nlohmann::json request_to_json(const protocol::GenerationRequest& request) {
    nlohmann::json payload;
    payload["iteration"] = request.iteration;
    payload["budget"] = request.budget;
    payload["spec_text"] = request.spec_text;
    payload["tree_digest"] = request.tree_digest;
    payload["feedback_digest"] = request.feedback_digest;
    payload["system_prompt"] = request.system_prompt;
    payload["user_prompt"] = request.user_prompt;
    return payload;
}

}  // namespace protoforge::feedback

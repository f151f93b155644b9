#include "session/transcript_writer.hpp"

#include <chrono>
#include <fstream>
#include <optional>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "session/transcript.hpp"

namespace protoforge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

json request_to_json(const protocol::SessionRequest& request, const std::uint32_t budget,
                     const std::string& test_command) {
    json payload;
    payload["working_directory"] = request.working_directory.string();
    payload["max_iterations"] = budget;
    payload["test_command"] = test_command;
    payload["generator_command"] =
        request.generator_command.has_value() ? request.generator_command.value() : "";
    payload["debug"] = request.debug;
    return payload;
}

json patch_to_json(const protocol::PatchSet& patch) {
    json ops = json::array();
    for (const auto& op : patch.ops) {
        json entry;
        entry["op"] = protocol::to_string(op.kind);
        entry["path"] = op.path;
        if (op.kind == protocol::FileOpKind::Rename) {
            entry["new_path"] = op.new_path;
        }
        if (op.content.has_value()) {
            entry["content"] = op.content.value();
        }
        if (op.diff.has_value()) {
            entry["diff"] = op.diff.value();
        }
        if (op.overwrite) {
            entry["overwrite"] = true;
        }
        ops.push_back(entry);
    }
    return ops;
}

json apply_result_to_json(const protocol::ApplyResult& result) {
    json payload;
    if (const auto* applied = std::get_if<protocol::Applied>(&result)) {
        payload["applied"] = true;
        if (applied->snapshot) {
            payload["generation"] = applied->snapshot->generation();
            payload["digest"] = applied->snapshot->digest();
        }
        return payload;
    }
    payload["applied"] = false;
    json conflicts = json::array();
    for (const auto& conflict : std::get<protocol::ConflictReport>(result).conflicts) {
        conflicts.push_back({{"path", conflict.path},
                             {"reason", protocol::to_string(conflict.reason)},
                             {"detail", conflict.detail}});
    }
    payload["conflicts"] = conflicts;
    return payload;
}

json test_result_to_json(const protocol::TestResult& result) {
    json cases = json::array();
    for (const auto& test_case : result.cases) {
        cases.push_back({{"name", test_case.name}, {"passed", test_case.passed}});
    }
    json payload;
    payload["status"] = protocol::to_string(result.status);
    payload["exit_code"] = result.exit_code;
    payload["duration_ms"] = result.duration_ms;
    payload["cases"] = cases;
    payload["output"] = result.output;
    return payload;
}

json record_to_json(const protocol::IterationRecord& record) {
    json payload;
    payload["index"] = record.index;
    payload["timestamp_unix_ms"] = record.timestamp_unix_ms;
    payload["no_change"] = record.no_change;
    payload["patch"] = patch_to_json(record.patch);
    payload["apply_result"] = apply_result_to_json(record.apply_result);
    payload["test_result"] = record.test_result.has_value()
                                 ? test_result_to_json(record.test_result.value())
                                 : json(nullptr);
    return payload;
}

// Test output is arbitrary bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
std::string to_line(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

TranscriptWriter::TranscriptWriter(std::filesystem::path workspace_root,
                                   std::filesystem::path transcript_subdir)
    : workspace_root_(std::move(workspace_root)),
      transcript_subdir_(std::move(transcript_subdir)) {}

core::errors::Result<std::filesystem::path> TranscriptWriter::transcript_path(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return ForgeError{ErrorCategory::Input, "Session ID cannot be empty.",
                          "invalid_session_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root is not a directory: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto sessions_dir = canonical_root / transcript_subdir_;
    std::filesystem::create_directories(sessions_dir, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to create transcript directory: " + sessions_dir.string(),
                          "transcript_dir_create_failed"};
    }

    return sessions_dir / (session_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> TranscriptWriter::append_event(
    const std::string& session_id, const std::string& event_json) const {
    auto path_result = transcript_path(session_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to open transcript file: " + path.string(),
                          "transcript_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to write transcript event: " + path.string(),
                          "transcript_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_request(
    const std::string& session_id, const protocol::SessionRequest& request,
    const std::uint32_t budget, const std::string& test_command) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["session_id"] = session_id;
    event["payload"] = request_to_json(request, budget, test_command);
    return append_event(session_id, to_line(event));
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_iteration(
    const std::string& session_id, const protocol::IterationRecord& record) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "iteration";
    event["session_id"] = session_id;
    event["payload"] = record_to_json(record);
    return append_event(session_id, to_line(event));
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_final(
    const std::string& session_id, const protocol::SessionStatus status,
    const std::string& summary, const std::optional<std::string>& error_message) const {
    json payload;
    payload["status"] = protocol::to_string(status);
    payload["summary"] = summary;
    payload["error_message"] = error_message.has_value() ? error_message.value() : "";

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["session_id"] = session_id;
    event["payload"] = payload;
    return append_event(session_id, to_line(event));
}

core::errors::Result<std::size_t> stream_iterations(
    const Transcript& transcript, const TranscriptWriter& writer,
    const std::string& session_id,
    const std::function<void(const protocol::IterationRecord&)>& on_record) {
    std::optional<ForgeError> failure;
    std::size_t written = 0;
    std::uint64_t next = 0;
    while (true) {
        const auto events = transcript.wait_for(next, std::chrono::milliseconds(200));
        for (const auto& event : events) {
            next = event.sequence + 1;
            if (!event.record.has_value()) {
                continue;
            }
            if (!failure.has_value()) {
                auto line = writer.write_iteration(session_id, event.record.value());
                if (core::errors::is_error(line)) {
                    failure = core::errors::get_error(line);
                } else {
                    ++written;
                }
            }
            if (on_record) {
                on_record(event.record.value());
            }
        }
        if (events.empty() && transcript.closed()) {
            break;
        }
    }
    if (failure.has_value()) {
        return failure.value();
    }
    return written;
}

}  // namespace protoforge::session

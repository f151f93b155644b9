#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/iteration_contract.hpp"
#include "protocol/session_request.hpp"
#include "session/transcript.hpp"

namespace protoforge::session {

// Appends a session's transcript to <root>/.qernel/sessions/<id>.jsonl:
// one "request" line, one "iteration" line per record, one "final" line.
class TranscriptWriter {
public:
    explicit TranscriptWriter(std::filesystem::path workspace_root,
                              std::filesystem::path transcript_subdir = ".qernel/sessions");

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& session_id, const protocol::SessionRequest& request,
        std::uint32_t budget, const std::string& test_command) const;

    core::errors::Result<std::filesystem::path> write_iteration(
        const std::string& session_id, const protocol::IterationRecord& record) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& session_id, protocol::SessionStatus status,
        const std::string& summary,
        const std::optional<std::string>& error_message = std::nullopt) const;

    core::errors::Result<std::filesystem::path> transcript_path(
        const std::string& session_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& session_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path transcript_subdir_;
};

// Follows a live transcript until it is closed. Each iteration record is
// appended to the JSONL file as soon as it arrives, then handed to on_record.
// After the first failed write nothing more is appended and that error is
// returned once the transcript closes; on_record still sees every record.
core::errors::Result<std::size_t> stream_iterations(
    const Transcript& transcript, const TranscriptWriter& writer,
    const std::string& session_id,
    const std::function<void(const protocol::IterationRecord&)>& on_record);

}  // namespace protoforge::session

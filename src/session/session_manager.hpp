#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/forge_errors.hpp"
#include "protocol/iteration_contract.hpp"
#include "protocol/session_request.hpp"

namespace protoforge::session {

struct SessionEntry {
    std::string session_id;
    protocol::SessionRequest request;
    protocol::SessionStatus status = protocol::SessionStatus::Running;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Process-wide registry of sessions and their cancellation flags. Sessions
// never share state through it; it only hands out ids and tokens.
class SessionManager {
public:
    core::errors::Result<std::string> start_session(const protocol::SessionRequest& request);
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& session_id) const;

    // Records the controller's terminal status, whichever it is. Finishing as
    // Aborted also raises the session's cancellation token.
    core::errors::Result<protocol::SessionStatus> finish(
        const std::string& session_id, protocol::SessionStatus status,
        const std::optional<std::string>& failure_reason = std::nullopt);

    std::size_t session_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionEntry> sessions_;
};

}  // namespace protoforge::session

#include "session/session_manager.hpp"

#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace protoforge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::SessionRequest;
using protocol::SessionStatus;

core::errors::Result<std::string> SessionManager::start_session(const SessionRequest& request) {
    if (request.max_iterations.has_value() && request.max_iterations.value() == 0) {
        return ForgeError{ErrorCategory::Input, "Iteration budget must be at least 1.",
                          "invalid_session_request"};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(request.working_directory, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Working directory is not a directory: " +
                              request.working_directory.string(),
                          "invalid_session_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        if (sessions_.find(session_id) != sessions_.end()) {
            continue;
        }

        SessionEntry entry;
        entry.session_id = session_id;
        entry.request = request;
        entry.status = SessionStatus::Running;
        entry.cancel_token = std::make_shared<std::atomic_bool>(false);
        sessions_.emplace(session_id, std::move(entry));
        LOG_INFO("SessionManager: session " + session_id + " started");
        return session_id;
    }

    return ForgeError{ErrorCategory::Internal, "Unable to allocate unique session ID.",
                      "session_id_generation_failed"};
}

core::errors::Result<SessionStatus> SessionManager::finish(
    const std::string& session_id, const SessionStatus status,
    const std::optional<std::string>& failure_reason) {
    if (status == SessionStatus::Running) {
        return ForgeError{ErrorCategory::Input, "Running is not a terminal status.",
                          "invalid_state_transition"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return ForgeError{ErrorCategory::Input, "Session ID not found: " + session_id,
                          "session_not_found"};
    }

    if (it->second.status != SessionStatus::Running) {
        return ForgeError{ErrorCategory::Input,
                          "Session is already terminal: " +
                              protocol::to_string(it->second.status),
                          "invalid_state_transition"};
    }

    if (status == SessionStatus::Aborted) {
        it->second.cancel_token->store(true);
    }
    it->second.status = status;
    LOG_INFO("SessionManager: session " + session_id + " transition running -> " +
             protocol::to_string(status) +
             (failure_reason.has_value() ? " (" + failure_reason.value() + ")" : ""));
    return it->second.status;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> SessionManager::get_cancel_token(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return ForgeError{ErrorCategory::Input, "Session ID not found: " + session_id,
                          "session_not_found"};
    }
    return it->second.cancel_token;
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace protoforge::session

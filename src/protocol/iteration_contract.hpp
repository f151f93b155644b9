#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/patch_contract.hpp"
#include "protocol/test_contract.hpp"

namespace protoforge::protocol {

enum class SessionStatus {
    Running,
    Succeeded,
    Failed,
    Aborted
};

enum class ControllerState {
    Idle,
    Generating,
    Applying,
    Testing,
    Evaluating,
    Succeeded,
    Failed,
    Aborted
};

struct IterationRecord {
    std::uint32_t index = 0;  // 1-based
    PatchSet patch;
    ApplyResult apply_result = ConflictReport{};
    std::optional<TestResult> test_result;  // empty when the apply did not go through
    std::int64_t timestamp_unix_ms = 0;
    bool no_change = false;  // generator declared the current snapshot final
};

inline bool is_terminal(const ControllerState state) {
    return state == ControllerState::Succeeded || state == ControllerState::Failed ||
           state == ControllerState::Aborted;
}

inline std::string to_string(const SessionStatus status) {
    switch (status) {
        case SessionStatus::Running:
            return "running";
        case SessionStatus::Succeeded:
            return "succeeded";
        case SessionStatus::Failed:
            return "failed";
        case SessionStatus::Aborted:
            return "aborted";
        default:
            return "unknown";
    }
}

inline std::string to_string(const ControllerState state) {
    switch (state) {
        case ControllerState::Idle:
            return "idle";
        case ControllerState::Generating:
            return "generating";
        case ControllerState::Applying:
            return "applying";
        case ControllerState::Testing:
            return "testing";
        case ControllerState::Evaluating:
            return "evaluating";
        case ControllerState::Succeeded:
            return "succeeded";
        case ControllerState::Failed:
            return "failed";
        case ControllerState::Aborted:
            return "aborted";
        default:
            return "unknown";
    }
}

}  // namespace protoforge::protocol

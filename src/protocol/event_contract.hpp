#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/iteration_contract.hpp"

namespace protoforge::protocol {

    // One entry of the transcript event stream. Emitted once per controller
    // state transition; sequence numbers start at 0 and have no gaps.
    struct TranscriptEvent {
        std::uint64_t sequence = 0;
        ControllerState state = ControllerState::Idle;
        SessionStatus status = SessionStatus::Running;
        std::uint32_t iteration = 0;
        std::optional<IterationRecord> record;  // set when a round was completed
        std::string detail;
        std::int64_t timestamp_unix_ms = 0;
    };

} // namespace protoforge::protocol

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "protocol/iteration_contract.hpp"
#include "session/transcript.hpp"
#include "workspace/snapshot.hpp"

namespace protoforge::session {

// State of one prototyping session. Only the iteration controller mutates it.
struct Session {
    std::string id;
    std::string spec_text;
    workspace::SnapshotPtr current;
    std::shared_ptr<Transcript> transcript = std::make_shared<Transcript>();
    std::uint32_t budget = 0;
    std::uint32_t counter = 0;  // completed rounds
    protocol::SessionStatus status = protocol::SessionStatus::Running;
    std::filesystem::path working_directory;  // shown to the generator only
    std::string test_command;
};

}  // namespace protoforge::session

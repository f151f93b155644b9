#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "feedback/feedback_composer.hpp"
#include "generation/generation_service.hpp"
#include "harness/test_harness.hpp"
#include "patch/patch_engine.hpp"
#include "protocol/iteration_contract.hpp"
#include "session/session.hpp"
#include "workspace/snapshot_store.hpp"

namespace protoforge::session {

struct ControllerOptions {
    std::uint32_t max_execution_retries = 2;  // extra test attempts within one round
};

struct SessionOutcome {
    protocol::SessionStatus status = protocol::SessionStatus::Failed;
    workspace::SnapshotPtr final_snapshot;
    std::vector<protocol::IterationRecord> records;
    std::uint32_t iterations = 0;
    std::optional<core::errors::ForgeError> error;  // why the session did not succeed
};

// Drives Idle -> Generating -> Applying -> Testing -> Evaluating until the
// tests pass, the budget is spent or the session is cancelled. Every state
// change is appended to the session transcript; the record of a finished
// round rides on the first event after it.
class IterationController {
public:
    IterationController(workspace::SnapshotStore& store,
                        generation::GenerationService& generator,
                        const patch::PatchEngine& patch_engine,
                        const harness::TestHarness& test_harness,
                        const feedback::FeedbackComposer& composer,
                        std::shared_ptr<std::atomic_bool> cancel_token = nullptr,
                        ControllerOptions options = {});

    // Runs the session to a terminal state. The transcript is closed on return.
    SessionOutcome run(Session& session);

    protocol::ControllerState state() const { return state_.load(); }

private:
    enum class RoundEnd { Continue, Terminal };

    RoundEnd generate_round(Session& session);
    RoundEnd evaluate(Session& session, protocol::IterationRecord record);
    RoundEnd reject(protocol::IterationRecord record, protocol::ConflictReason reason,
                    const std::string& detail);
    RoundEnd terminate(Session& session, protocol::ControllerState state,
                       core::errors::ForgeError error,
                       std::optional<protocol::IterationRecord> record = std::nullopt);

    void transition(Session& session, protocol::ControllerState next,
                    const std::string& detail,
                    std::optional<protocol::IterationRecord> record = std::nullopt);
    bool cancelled() const;
    protocol::TestResult test_snapshot(const workspace::SnapshotPtr& snapshot);

    workspace::SnapshotStore& store_;
    generation::GenerationService& generator_;
    const patch::PatchEngine& patch_engine_;
    const harness::TestHarness& test_harness_;
    const feedback::FeedbackComposer& composer_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    ControllerOptions options_;

    std::atomic<protocol::ControllerState> state_{protocol::ControllerState::Idle};
    std::optional<protocol::IterationRecord> pending_record_;
    std::optional<core::errors::ForgeError> terminal_error_;
    std::map<std::uint64_t, protocol::TestResult> test_cache_;  // by snapshot generation
};

}  // namespace protoforge::session

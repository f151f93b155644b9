#include "session/iteration_controller.hpp"

#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace protoforge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::Applied;
using protocol::ConflictReason;
using protocol::ConflictReport;
using protocol::ControllerState;
using protocol::IterationRecord;
using protocol::SessionStatus;
using protocol::TestStatus;

namespace {

constexpr std::size_t kErrorExcerpt = 500;

SessionStatus status_for(const ControllerState state) {
    switch (state) {
        case ControllerState::Succeeded:
            return SessionStatus::Succeeded;
        case ControllerState::Aborted:
            return SessionStatus::Aborted;
        case ControllerState::Failed:
            return SessionStatus::Failed;
        default:
            return SessionStatus::Running;
    }
}

ForgeError cancelled_error() {
    return ForgeError{ErrorCategory::Cancelled, "Session cancelled.", "session_cancelled"};
}

}  // namespace

IterationController::IterationController(workspace::SnapshotStore& store,
                                         generation::GenerationService& generator,
                                         const patch::PatchEngine& patch_engine,
                                         const harness::TestHarness& test_harness,
                                         const feedback::FeedbackComposer& composer,
                                         std::shared_ptr<std::atomic_bool> cancel_token,
                                         ControllerOptions options)
    : store_(store),
      generator_(generator),
      patch_engine_(patch_engine),
      test_harness_(test_harness),
      composer_(composer),
      cancel_token_(std::move(cancel_token)),
      options_(std::move(options)) {}

bool IterationController::cancelled() const {
    return cancel_token_ && cancel_token_->load();
}

void IterationController::transition(Session& session, const ControllerState next,
                                     const std::string& detail,
                                     std::optional<IterationRecord> record) {
    if (!record.has_value()) {
        record = std::exchange(pending_record_, std::nullopt);
    }

    const ControllerState previous = state_.exchange(next);
    LOG_INFO("Controller: session " + session.id + " " + protocol::to_string(previous) +
             " -> " + protocol::to_string(next) + (detail.empty() ? "" : " (" + detail + ")"));

    protocol::TranscriptEvent event;
    event.state = next;
    event.status = session.status;
    event.iteration = session.counter;
    event.record = std::move(record);
    event.detail = detail;
    session.transcript->append(std::move(event));
}

IterationController::RoundEnd IterationController::terminate(
    Session& session, const ControllerState state, ForgeError error,
    std::optional<IterationRecord> record) {
    session.status = status_for(state);
    const std::string detail = error.message;
    terminal_error_ = std::move(error);
    if (record.has_value()) {
        pending_record_ = std::move(record);
    }
    transition(session, state, detail);
    return RoundEnd::Terminal;
}

SessionOutcome IterationController::run(Session& session) {
    test_cache_.clear();
    pending_record_.reset();
    terminal_error_.reset();
    state_.store(ControllerState::Idle);
    session.counter = 0;
    session.status = SessionStatus::Running;

    transition(session, ControllerState::Idle,
               "budget " + std::to_string(session.budget) + " iteration(s)");

    if (!session.current) {
        terminate(session, ControllerState::Failed,
                  ForgeError{ErrorCategory::Internal, "Session has no initial snapshot.",
                             "invalid_snapshot"});
    } else {
        while (true) {
            if (session.counter >= session.budget) {
                terminate(session, ControllerState::Failed,
                          ForgeError{ErrorCategory::BudgetExhausted,
                                     "Iteration budget of " + std::to_string(session.budget) +
                                         " exhausted without passing tests.",
                                     "budget_exhausted"});
                break;
            }
            if (cancelled()) {
                terminate(session, ControllerState::Aborted, cancelled_error());
                break;
            }
            if (generate_round(session) == RoundEnd::Terminal) {
                break;
            }
        }
    }

    session.transcript->close();

    SessionOutcome outcome;
    outcome.status = session.status;
    outcome.final_snapshot = session.current;
    outcome.records = session.transcript->records();
    outcome.iterations = session.counter;
    outcome.error = terminal_error_;
    return outcome;
}

IterationController::RoundEnd IterationController::generate_round(Session& session) {
    transition(session, ControllerState::Generating,
               "iteration " + std::to_string(session.counter + 1) + " of " +
                   std::to_string(session.budget));

    // Composed after the transition so the previous round's record is visible.
    const auto request = composer_.compose(session);
    auto generated = generator_.generate(request);

    IterationRecord record;
    record.index = ++session.counter;
    record.timestamp_unix_ms = now_unix_ms();

    if (core::errors::is_error(generated)) {
        const auto& error = core::errors::get_error(generated);
        LOG_WARN("Controller: generation failed [" + error.code + "]: " + error.message);
        const auto reason = error.category == ErrorCategory::Timeout
                                ? ConflictReason::GenerationTimeout
                                : ConflictReason::GenerationFailed;
        return reject(std::move(record), reason, error.message);
    }

    const auto& response = core::errors::get_value(generated);

    if (const auto* malformed = std::get_if<protocol::MalformedResponse>(&response)) {
        LOG_WARN("Controller: malformed generator response: " + malformed->reason);
        return reject(std::move(record), ConflictReason::MalformedResponse,
                      malformed->reason);
    }

    if (std::holds_alternative<protocol::NoChange>(response)) {
        record.no_change = true;
        record.apply_result = Applied{session.current};
        if (cancelled()) {
            return terminate(session, ControllerState::Aborted, cancelled_error(),
                             std::move(record));
        }
        transition(session, ControllerState::Evaluating, "generator reported no change");
        return evaluate(session, std::move(record));
    }

    record.patch = std::get<protocol::PatchSet>(response);
    if (cancelled()) {
        return terminate(session, ControllerState::Aborted, cancelled_error(),
                         std::move(record));
    }
    transition(session, ControllerState::Applying,
               std::to_string(record.patch.ops.size()) + " operation(s)");

    auto applied = patch_engine_.apply(store_, session.current, record.patch);
    if (core::errors::is_error(applied)) {
        const auto& error = core::errors::get_error(applied);
        LOG_ERROR("Controller: snapshot store fault [" + error.code + "]: " + error.message);
        return terminate(session, ControllerState::Failed, error, std::move(record));
    }
    record.apply_result = core::errors::get_value(applied);

    if (const auto* report = std::get_if<ConflictReport>(&record.apply_result)) {
        LOG_INFO("Controller: patch rejected with " +
                 std::to_string(report->conflicts.size()) + " conflict(s)");
        pending_record_ = std::move(record);
        return RoundEnd::Continue;
    }

    session.current = std::get<Applied>(record.apply_result).snapshot;
    if (cancelled()) {
        return terminate(session, ControllerState::Aborted, cancelled_error(),
                         std::move(record));
    }
    transition(session, ControllerState::Testing,
               "generation " + std::to_string(session.current->generation()));

    // The test run is never interrupted; cancellation is looked at once it returns.
    record.test_result = test_snapshot(session.current);
    if (cancelled()) {
        return terminate(session, ControllerState::Aborted, cancelled_error(),
                         std::move(record));
    }
    transition(session, ControllerState::Evaluating,
               protocol::to_string(record.test_result->status));
    return evaluate(session, std::move(record));
}

IterationController::RoundEnd IterationController::reject(IterationRecord record,
                                                          const ConflictReason reason,
                                                          const std::string& detail) {
    record.apply_result = ConflictReport{{protocol::Conflict{"", reason, detail}}};
    pending_record_ = std::move(record);
    return RoundEnd::Continue;
}

IterationController::RoundEnd IterationController::evaluate(Session& session,
                                                            IterationRecord record) {
    if (!record.test_result.has_value()) {
        record.test_result = test_snapshot(session.current);
    }
    const auto& result = record.test_result.value();

    if (result.all_passed()) {
        session.status = SessionStatus::Succeeded;
        terminal_error_.reset();
        pending_record_ = std::move(record);
        transition(session, ControllerState::Succeeded,
                   "tests passed at iteration " + std::to_string(session.counter));
        return RoundEnd::Terminal;
    }

    if (result.status == TestStatus::ExecutionError) {
        return terminate(session, ControllerState::Failed,
                         ForgeError{ErrorCategory::Execution,
                                    "Test command could not be executed after " +
                                        std::to_string(options_.max_execution_retries + 1) +
                                        " attempt(s): " +
                                        result.output.substr(0, kErrorExcerpt),
                                    "test_execution_failed"},
                         std::move(record));
    }

    pending_record_ = std::move(record);
    return RoundEnd::Continue;
}

protocol::TestResult IterationController::test_snapshot(const workspace::SnapshotPtr& snapshot) {
    const auto cached = test_cache_.find(snapshot->generation());
    if (cached != test_cache_.end()) {
        LOG_DEBUG("Controller: reusing test result for generation " +
                  std::to_string(snapshot->generation()));
        return cached->second;
    }

    protocol::TestResult result;
    for (std::uint32_t attempt = 0; attempt <= options_.max_execution_retries; ++attempt) {
        result = test_harness_.run(*snapshot);
        if (result.status != TestStatus::ExecutionError) {
            test_cache_[snapshot->generation()] = result;
            break;
        }
        LOG_WARN("Controller: test command could not run (attempt " +
                 std::to_string(attempt + 1) + ")");
    }
    return result;
}

}  // namespace protoforge::session

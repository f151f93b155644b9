#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include "app/cli_parser.hpp"
#include "core/config/project_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/forge_errors.hpp"
#include "core/logging/logger.hpp"
#include "feedback/feedback_composer.hpp"
#include "generation/command_generation_service.hpp"
#include "harness/test_harness.hpp"
#include "patch/patch_engine.hpp"
#include "session/iteration_controller.hpp"
#include "session/session_manager.hpp"
#include "session/transcript_writer.hpp"
#include "workspace/snapshot_store.hpp"

namespace {

using protoforge::core::errors::ErrorCategory;
using protoforge::core::errors::ForgeError;

std::atomic_bool* g_cancel_flag = nullptr;

extern "C" void handle_interrupt(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

void report(const std::string& what, const ForgeError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

protoforge::core::errors::Result<std::string> read_spec(const std::filesystem::path& root) {
    const auto spec_path = root / ".qernel" / "spec.md";
    std::ifstream in(spec_path);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Input, "Unable to read " + spec_path.string(),
                          "missing_spec", "Describe the goal in .qernel/spec.md."};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (buffer.str().find_first_not_of(" \t\r\n") == std::string::npos) {
        return ForgeError{ErrorCategory::Input, spec_path.string() + " is empty",
                          "missing_spec", "Describe the goal in .qernel/spec.md."};
    }
    return buffer.str();
}

// One console line per iteration record.
void print_record(const protoforge::protocol::IterationRecord& record) {
    std::string line = "Iteration " + std::to_string(record.index) + ": ";
    if (const auto* report =
            std::get_if<protoforge::protocol::ConflictReport>(&record.apply_result)) {
        line += "patch rejected";
        for (const auto& conflict : report->conflicts) {
            line += " [" + protoforge::protocol::to_string(conflict.reason) +
                    (conflict.path.empty() ? "" : " " + conflict.path) + "]";
        }
    } else {
        line += record.no_change ? "no change" : "patch applied";
        if (record.test_result.has_value()) {
            line += ", tests " + protoforge::protocol::to_string(record.test_result->status);
        }
    }
    LOG_INFO(line);
    if (record.test_result.has_value() && !record.test_result->output.empty()) {
        LOG_DEBUG("Test output:\n" + record.test_result->output);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = protoforge::core::errors;
    auto& logger = protoforge::core::logging::Logger::get();

    // 1. Parse CLI input and return normalized input errors
    logger.set_session_id(protoforge::core::config::generate_id("boot"));
    auto parsed = protoforge::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report("Input error", errors::get_error(parsed));
        return 2;
    }
    const auto& req = errors::get_value(parsed);
    if (req.debug) {
        logger.set_min_level(protoforge::core::logging::LogLevel::DEBUG);
    }
    const auto& root = req.working_directory;

    // 2. Project configuration, with CLI overrides
    auto loaded = protoforge::core::config::load_project_config(
        protoforge::core::config::config_path_for(root));
    if (errors::is_error(loaded)) {
        report("Config error", errors::get_error(loaded));
        return 2;
    }
    auto config = errors::get_value(loaded);
    if (req.max_iterations) config.agent.max_iterations = req.max_iterations.value();
    if (req.test_command) config.benchmarks.test_command = req.test_command.value();
    if (req.generator_command) config.agent.generator_command = req.generator_command.value();
    if (config.agent.generator_command.empty()) {
        report("Config error",
               ForgeError{ErrorCategory::Input, "No generator command configured.",
                          "missing_generator",
                          "Pass --generator CMD or set agent.generator_command."});
        return 2;
    }

    auto spec = read_spec(root);
    if (errors::is_error(spec)) {
        report("Input error", errors::get_error(spec));
        return 2;
    }

    // 3. Register the session and wire up cancellation
    protoforge::session::SessionManager session_manager;
    auto started = session_manager.start_session(req);
    if (errors::is_error(started)) {
        report("Failed to start session", errors::get_error(started));
        return 3;
    }
    const std::string session_id = errors::get_value(started);
    logger.set_session_id(session_id);
    if (!logger.open_debug_file(root / ".qernel" / "logs" / (session_id + ".log"))) {
        LOG_WARN("Unable to open the debug log under .qernel/logs");
    }

    auto cancel_token_result = session_manager.get_cancel_token(session_id);
    if (errors::is_error(cancel_token_result)) {
        report("Failed to get cancellation token", errors::get_error(cancel_token_result));
        return 3;
    }
    auto cancel_token = errors::get_value(cancel_token_result);
    g_cancel_flag = cancel_token.get();
    std::signal(SIGINT, handle_interrupt);

    // 4. Initial snapshot
    protoforge::workspace::SnapshotStore store;
    auto tree = protoforge::workspace::SnapshotStore::load_tree(root);
    if (errors::is_error(tree)) {
        report("Failed to read project", errors::get_error(tree));
        return 3;
    }
    const auto initial = store.create(errors::get_value(tree));
    LOG_INFO("Loaded " + std::to_string(initial->file_count()) + " files (" +
             std::to_string(initial->total_bytes()) + " bytes) from " + root.string());

    protoforge::session::TranscriptWriter transcript_writer(root);
    auto request_line = transcript_writer.write_request(
        session_id, req, config.agent.max_iterations, config.benchmarks.test_command);
    if (errors::is_error(request_line)) {
        report("Failed to write transcript", errors::get_error(request_line));
        return 6;
    }

    // 5. Run the loop
    const protoforge::patch::PatchEngine patch_engine(
        protoforge::patch::PatchLimits{config.patch.max_total_bytes});
    protoforge::harness::HarnessOptions harness_options;
    harness_options.test_command = config.benchmarks.test_command;
    harness_options.timeout_ms = config.benchmarks.test_timeout_ms;
    harness_options.project_root = root;
    const protoforge::harness::TestHarness test_harness(harness_options);
    const protoforge::feedback::FeedbackComposer composer(protoforge::feedback::ComposerLimits{
        config.context.max_tree_bytes, config.context.max_feedback_bytes});
    protoforge::generation::CommandGeneratorOptions generator_options;
    generator_options.command = config.agent.generator_command;
    generator_options.timeout_ms = config.agent.generation_timeout_ms;
    generator_options.working_directory = root;
    protoforge::generation::CommandGenerationService generator(generator_options);

    protoforge::session::Session session;
    session.id = session_id;
    session.spec_text = errors::get_value(spec);
    session.current = initial;
    session.budget = config.agent.max_iterations;
    session.working_directory = root;
    session.test_command = config.benchmarks.test_command;

    // Records reach the JSONL file and the console while the loop is still running.
    errors::Result<std::size_t> streamed = std::size_t{0};
    std::thread follower([&]() {
        streamed = protoforge::session::stream_iterations(*session.transcript,
                                                          transcript_writer, session_id,
                                                          print_record);
    });
    protoforge::session::IterationController controller(store, generator, patch_engine,
                                                        test_harness, composer, cancel_token);
    const auto outcome = controller.run(session);
    follower.join();
    std::signal(SIGINT, SIG_DFL);
    g_cancel_flag = nullptr;

    // 6. Persist the final snapshot and the transcript
    int exit_code = 0;
    if (outcome.final_snapshot && outcome.final_snapshot != initial) {
        auto written = protoforge::workspace::SnapshotStore::checkout(
            *outcome.final_snapshot, root, initial.get());
        if (errors::is_error(written)) {
            report("Failed to write the final snapshot", errors::get_error(written));
            exit_code = 6;
        } else {
            LOG_INFO("Wrote generation " + std::to_string(outcome.final_snapshot->generation()) +
                     " to " + root.string());
        }
    }

    if (errors::is_error(streamed)) {
        report("Failed to write transcript", errors::get_error(streamed));
        return 6;
    }

    const std::string summary = protoforge::protocol::to_string(outcome.status) + " after " +
                                std::to_string(outcome.iterations) + " iteration(s)";
    std::optional<std::string> error_message;
    if (outcome.error.has_value()) {
        error_message = outcome.error->message;
    }
    auto final_line =
        transcript_writer.write_final(session_id, outcome.status, summary, error_message);
    if (errors::is_error(final_line)) {
        report("Failed to write transcript", errors::get_error(final_line));
        return 6;
    }

    auto finished = session_manager.finish(session_id, outcome.status, error_message);
    if (errors::is_error(finished)) {
        report("Failed to record the final status", errors::get_error(finished));
        return 4;
    }

    LOG_INFO("Session " + summary);
    if (error_message) {
        LOG_INFO("Reason: " + error_message.value());
    }
    LOG_INFO("Transcript: " + errors::get_value(final_line).string());
    logger.close_debug_file();

    if (exit_code != 0) {
        return exit_code;
    }
    switch (outcome.status) {
        case protoforge::protocol::SessionStatus::Succeeded:
            return 0;
        case protoforge::protocol::SessionStatus::Aborted:
            return 130;
        default:
            return 1;
    }
}

#include "generation/command_generation_service.hpp"

#include <fstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "feedback/feedback_composer.hpp"
#include "harness/process_runner.hpp"
#include "harness/test_harness.hpp"
#include "patch/patch_parser.hpp"

namespace protoforge::generation {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

constexpr std::size_t kStderrExcerpt = 2000;

}  // namespace

CommandGenerationService::CommandGenerationService(CommandGeneratorOptions options,
                                                   policy::PolicyGuard policy_guard)
    : options_(std::move(options)), policy_guard_(std::move(policy_guard)) {}

core::errors::Result<protocol::GenerationResponse> CommandGenerationService::generate(
    const protocol::GenerationRequest& request) {
    auto command = policy_guard_.validate_command(options_.command);
    if (core::errors::is_error(command)) {
        const auto& error = core::errors::get_error(command);
        return ForgeError{ErrorCategory::Provider,
                          "Generator command rejected: " + error.message, error.code,
                          "Set agent.generator_command in .qernel/qernel.json or pass "
                          "--generator."};
    }

    harness::ScopedDirectory scratch(options_.scratch_root);
    if (!scratch.created()) {
        return ForgeError{ErrorCategory::Provider,
                          "Unable to create a scratch directory under " +
                              options_.scratch_root.string(),
                          "generator_scratch_failed"};
    }

    const auto request_path = scratch.path() / "request.json";
    {
        std::ofstream out(request_path, std::ios::trunc);
        if (!out.is_open()) {
            return ForgeError{ErrorCategory::Provider,
                              "Unable to write generation request: " + request_path.string(),
                              "generator_request_failed"};
        }
        // Invalid UTF-8 from project files or test output becomes U+FFFD.
        out << feedback::request_to_json(request).dump(
                   2, ' ', false, nlohmann::json::error_handler_t::replace)
            << "\n";
        if (!out.good()) {
            return ForgeError{ErrorCategory::Provider,
                              "Unable to write generation request: " + request_path.string(),
                              "generator_request_failed"};
        }
    }

    harness::ProcessRequest process;
    process.command = core::errors::get_value(command) + " '" +
                      harness::shell_escape_single_quotes(request_path.string()) + "'";
    process.working_directory = options_.working_directory;
    process.timeout_ms = options_.timeout_ms;

    LOG_DEBUG("CommandGenerationService: iteration " + std::to_string(request.iteration) +
              " -> " + process.command);
    auto launched = harness::run_process(process);
    if (core::errors::is_error(launched)) {
        const auto& error = core::errors::get_error(launched);
        return ForgeError{ErrorCategory::Provider,
                          "Generator failed to start: " + error.message, error.code};
    }
    const auto& capture = core::errors::get_value(launched);

    if (capture.timed_out) {
        return ForgeError{ErrorCategory::Timeout,
                          "Generator exceeded " + std::to_string(options_.timeout_ms) + " ms",
                          "generation_timeout"};
    }
    if (capture.exit_code != 0) {
        return ForgeError{ErrorCategory::Provider,
                          "Generator exited with code " + std::to_string(capture.exit_code) +
                              ": " + capture.stderr_text.substr(0, kStderrExcerpt),
                          "generator_failed"};
    }
    if (!capture.stderr_text.empty()) {
        LOG_DEBUG("CommandGenerationService: generator stderr:\n" + capture.stderr_text);
    }
    return patch::parse_generation_output(capture.stdout_text);
}

}  // namespace protoforge::generation

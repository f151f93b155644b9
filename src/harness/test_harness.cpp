#include "harness/test_harness.hpp"

#include <cstdlib>
#include <regex>
#include <set>
#include <sstream>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "harness/exec_environment.hpp"
#include "harness/process_runner.hpp"
#include "workspace/snapshot_store.hpp"

namespace protoforge::harness {

using protocol::TestCaseResult;
using protocol::TestResult;
using protocol::TestStatus;

namespace {

TestResult execution_error(const std::string& message, const double duration_ms = 0.0) {
    TestResult result;
    result.status = TestStatus::ExecutionError;
    result.exit_code = -1;
    result.output = message;
    result.duration_ms = duration_ms;
    return result;
}

}  // namespace

ScopedDirectory::ScopedDirectory(const std::filesystem::path& parent) {
    std::error_code ec;
    for (int attempt = 0; attempt < 8 && !created_; ++attempt) {
        path_ = parent / core::config::generate_id("protoforge-run");
        if (std::filesystem::exists(path_, ec)) {
            continue;
        }
        created_ = std::filesystem::create_directories(path_, ec) && !ec;
    }
}

ScopedDirectory::~ScopedDirectory() {
    if (!created_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("TestHarness: unable to remove " + path_.string() + ": " + ec.message());
    }
}

TestHarness::TestHarness(HarnessOptions options, policy::PolicyGuard policy_guard)
    : options_(std::move(options)), policy_guard_(std::move(policy_guard)) {}

TestResult TestHarness::run(const workspace::Snapshot& snapshot) const {
    auto command = policy_guard_.validate_command(options_.test_command);
    if (core::errors::is_error(command)) {
        const auto& error = core::errors::get_error(command);
        LOG_WARN("TestHarness: test command rejected [" + error.code + "]: " + error.message);
        return execution_error(error.message);
    }

    ScopedDirectory scratch(options_.scratch_root);
    if (!scratch.created()) {
        return execution_error("Unable to create a scratch directory under " +
                               options_.scratch_root.string());
    }

    auto written = workspace::SnapshotStore::checkout(snapshot, scratch.path());
    if (core::errors::is_error(written)) {
        return execution_error("Unable to materialize snapshot: " +
                               core::errors::get_error(written).message);
    }
    LOG_DEBUG("TestHarness: generation " + std::to_string(snapshot.generation()) +
              " materialized into " + scratch.path().string() + " (" +
              std::to_string(core::errors::get_value(written)) + " files)");

    const char* inherited = std::getenv("PATH");
    const std::string inherited_path = inherited != nullptr ? inherited : "";

    ProcessRequest request;
    request.environment = build_exec_environment(options_.project_root, inherited_path);
    const auto path_override = request.environment.find("PATH");
    const std::string search_path =
        path_override != request.environment.end() ? path_override->second : inherited_path;
    request.command = normalize_command(core::errors::get_value(command), search_path);
    if (request.command != core::errors::get_value(command)) {
        LOG_INFO("TestHarness: 'python' not found, using 'python3'");
    }
    if (request.environment.count("VIRTUAL_ENV") > 0) {
        LOG_DEBUG("TestHarness: using virtualenv " + request.environment.at("VIRTUAL_ENV"));
    }
    request.working_directory = scratch.path();
    request.timeout_ms = options_.timeout_ms;

    auto launched = run_process(request);
    if (core::errors::is_error(launched)) {
        const auto& error = core::errors::get_error(launched);
        LOG_WARN("TestHarness: test command failed to start [" + error.code +
                 "]: " + error.message);
        return execution_error(error.message);
    }
    const auto& capture = core::errors::get_value(launched);

    TestResult result;
    result.exit_code = capture.exit_code;
    result.output = capture.stdout_text + capture.stderr_text;
    result.duration_ms = capture.duration_ms;
    result.cases = parse_test_cases(result.output);

    if (capture.timed_out) {
        result.status = TestStatus::TimedOut;
    } else if (capture.exit_code == 126 || capture.exit_code == 127) {
        result.status = TestStatus::ExecutionError;
    } else if (capture.exit_code == 0) {
        result.status = TestStatus::Passed;
    } else {
        result.status = TestStatus::Failed;
    }

    LOG_INFO("TestHarness: " + protocol::to_string(result.status) + " (exit " +
             std::to_string(result.exit_code) + ", " +
             std::to_string(result.cases.size()) + " cases, " +
             std::to_string(static_cast<long long>(result.duration_ms)) + " ms)");
    return result;
}

std::vector<TestCaseResult> parse_test_cases(const std::string& output) {
    static const std::regex kPytest(R"(^(\S+::\S+)\s+(PASSED|FAILED|ERROR)\b.*$)");
    static const std::regex kGtestOk(R"(^\[\s+OK\s+\]\s+([A-Za-z_][\w/]*\.[\w/]+).*$)");
    static const std::regex kGtestFailed(
        R"(^\[\s+FAILED\s+\]\s+([A-Za-z_][\w/]*\.[\w/]+).*$)");

    std::vector<TestCaseResult> cases;
    std::set<std::string> seen;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::smatch match;
        bool passed = false;
        if (std::regex_match(line, match, kPytest)) {
            passed = match[2].str() == "PASSED";
        } else if (std::regex_match(line, match, kGtestOk)) {
            passed = true;
        } else if (!std::regex_match(line, match, kGtestFailed)) {
            continue;
        }

        const std::string name = match[1].str();
        // GoogleTest repeats failures in its summary.
        if (!seen.insert(name).second) {
            continue;
        }
        cases.push_back(TestCaseResult{name, passed, line});
    }
    return cases;
}

}  // namespace protoforge::harness

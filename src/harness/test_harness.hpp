#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "policy/policy_guard.hpp"
#include "protocol/test_contract.hpp"
#include "workspace/snapshot.hpp"

namespace protoforge::harness {

struct HarnessOptions {
    std::string test_command;
    std::uint32_t timeout_ms = 120000;
    std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
    // Real project directory; its .qernel/.venv is used when present.
    std::filesystem::path project_root;
};

// Owns a fresh directory and removes it, with everything in it, on destruction.
class ScopedDirectory {
public:
    explicit ScopedDirectory(const std::filesystem::path& parent);
    ~ScopedDirectory();

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool created() const { return created_; }

private:
    std::filesystem::path path_;
    bool created_ = false;
};

class TestHarness {
public:
    explicit TestHarness(HarnessOptions options, policy::PolicyGuard policy_guard = {});

    // Materializes the snapshot into a transient directory and runs the test
    // command there. Every outcome, including a command that never started,
    // is expressed as a TestResult.
    protocol::TestResult run(const workspace::Snapshot& snapshot) const;

    const HarnessOptions& options() const { return options_; }

private:
    HarnessOptions options_;
    policy::PolicyGuard policy_guard_;
};

// Best-effort per-test results from pytest -v or GoogleTest output.
std::vector<protocol::TestCaseResult> parse_test_cases(const std::string& output);

}  // namespace protoforge::harness

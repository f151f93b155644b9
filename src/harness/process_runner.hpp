#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace protoforge::harness {

struct ProcessRequest {
    std::string command;  // run through /bin/sh -c
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 5000;  // 0 disables the timeout
    std::shared_ptr<std::atomic_bool> cancel_token;  // kills the child when set
    std::size_t max_output_bytes = 4 * 1024 * 1024;  // per stream
    // Set on top of the inherited environment; an entry here wins.
    std::map<std::string, std::string> environment;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs the command in its own process group, collecting stdout/stderr until
// the child exits. On timeout or cancellation the whole group is killed.
// Only a failure to launch is reported as an error.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// The inherited environment with the overrides applied, as NAME=value strings.
std::vector<std::string> merge_environment(const std::map<std::string, std::string>& overrides);

std::string shell_escape_single_quotes(const std::string& value);

}  // namespace protoforge::harness

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace protoforge::harness {

// Variables a test run needs on top of the inherited environment. When
// <project_root>/.qernel/.venv/bin exists it goes first on PATH and
// VIRTUAL_ENV points at the venv. Empty otherwise.
std::map<std::string, std::string> build_exec_environment(
    const std::filesystem::path& project_root, const std::string& inherited_path);

// First executable named `program` in a colon-separated search path.
std::optional<std::filesystem::path> which_in_path(const std::string& program,
                                                   const std::string& search_path);

// Rewrites a leading `python` to `python3` when only the latter is on the path.
std::string normalize_command(const std::string& command, const std::string& search_path);

}  // namespace protoforge::harness

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/forge_errors.hpp"

namespace protoforge::core::config {

struct ProjectSection {
    std::string name = "qernel-project";
    std::string description = "A qernel prototype project";
};

struct AgentSection {
    std::uint32_t max_iterations = 15;
    std::string generator_command;
    std::uint32_t generation_timeout_ms = 600000;
};

struct BenchmarkSection {
    std::string test_command = "python -m pytest src/tests.py -v";
    std::uint32_t test_timeout_ms = 120000;
};

struct PatchSection {
    std::size_t max_total_bytes = 512 * 1024;
};

struct ContextSection {
    std::size_t max_tree_bytes = 120000;
    std::size_t max_feedback_bytes = 8000;
};

struct ProjectConfig {
    ProjectSection project;
    AgentSection agent;
    BenchmarkSection benchmarks;
    PatchSection patch;
    ContextSection context;
};

// <root>/.qernel/qernel.json
std::filesystem::path config_path_for(const std::filesystem::path& project_root);

// Missing file yields defaults; a file that exists but does not parse is an Input error.
errors::Result<ProjectConfig> load_project_config(const std::filesystem::path& config_path);

errors::Result<std::filesystem::path> save_project_config(
    const ProjectConfig& config, const std::filesystem::path& config_path);

}  // namespace protoforge::core::config

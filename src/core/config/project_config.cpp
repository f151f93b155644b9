#include "core/config/project_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace protoforge::core::config {

using errors::ErrorCategory;
using errors::ForgeError;
using nlohmann::json;

namespace {

json to_json(const ProjectConfig& config) {
    json payload;
    payload["project"]["name"] = config.project.name;
    payload["project"]["description"] = config.project.description;
    payload["agent"]["max_iterations"] = config.agent.max_iterations;
    payload["agent"]["generator_command"] = config.agent.generator_command;
    payload["agent"]["generation_timeout_ms"] = config.agent.generation_timeout_ms;
    payload["benchmarks"]["test_command"] = config.benchmarks.test_command;
    payload["benchmarks"]["test_timeout_ms"] = config.benchmarks.test_timeout_ms;
    payload["patch"]["max_total_bytes"] = config.patch.max_total_bytes;
    payload["context"]["max_tree_bytes"] = config.context.max_tree_bytes;
    payload["context"]["max_feedback_bytes"] = config.context.max_feedback_bytes;
    return payload;
}

// Absent keys keep their defaults; present keys must have the right type.
void read_sections(const json& payload, ProjectConfig& config) {
    if (payload.contains("project")) {
        const auto& project = payload.at("project");
        config.project.name = project.value("name", config.project.name);
        config.project.description =
            project.value("description", config.project.description);
    }
    if (payload.contains("agent")) {
        const auto& agent = payload.at("agent");
        config.agent.max_iterations =
            agent.value("max_iterations", config.agent.max_iterations);
        config.agent.generator_command =
            agent.value("generator_command", config.agent.generator_command);
        config.agent.generation_timeout_ms =
            agent.value("generation_timeout_ms", config.agent.generation_timeout_ms);
    }
    if (payload.contains("benchmarks")) {
        const auto& benchmarks = payload.at("benchmarks");
        config.benchmarks.test_command =
            benchmarks.value("test_command", config.benchmarks.test_command);
        config.benchmarks.test_timeout_ms =
            benchmarks.value("test_timeout_ms", config.benchmarks.test_timeout_ms);
    }
    if (payload.contains("patch")) {
        config.patch.max_total_bytes =
            payload.at("patch").value("max_total_bytes", config.patch.max_total_bytes);
    }
    if (payload.contains("context")) {
        const auto& context = payload.at("context");
        config.context.max_tree_bytes =
            context.value("max_tree_bytes", config.context.max_tree_bytes);
        config.context.max_feedback_bytes =
            context.value("max_feedback_bytes", config.context.max_feedback_bytes);
    }
}

}  // namespace

std::filesystem::path config_path_for(const std::filesystem::path& project_root) {
    return project_root / ".qernel" / "qernel.json";
}

errors::Result<ProjectConfig> load_project_config(
    const std::filesystem::path& config_path) {
    ProjectConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec) || ec) {
        return config;
    }

    std::ifstream in(config_path);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Input,
                          "Failed to open project config: " + config_path.string(),
                          "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        const json payload = json::parse(buffer.str());
        if (!payload.is_object()) {
            return ForgeError{ErrorCategory::Input,
                              "Project config must be a JSON object: " +
                                  config_path.string(),
                              "config_parse_failed"};
        }
        read_sections(payload, config);
    } catch (const json::exception& e) {
        return ForgeError{ErrorCategory::Input,
                          "Failed to parse project config: " + std::string(e.what()),
                          "config_parse_failed",
                          "Check " + config_path.string() + " for JSON syntax errors."};
    }

    if (config.agent.max_iterations == 0) {
        return ForgeError{ErrorCategory::Input,
                          "agent.max_iterations must be greater than zero.",
                          "bounds_error"};
    }
    return config;
}

errors::Result<std::filesystem::path> save_project_config(
    const ProjectConfig& config, const std::filesystem::path& config_path) {
    std::error_code ec;
    std::filesystem::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to create config directory: " +
                              config_path.parent_path().string(),
                          "config_dir_create_failed"};
    }

    std::ofstream out(config_path);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to open config for writing: " + config_path.string(),
                          "config_open_failed"};
    }
    out << to_json(config).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to write config: " + config_path.string(),
                          "config_write_failed"};
    }
    return config_path;
}

}  // namespace protoforge::core::config

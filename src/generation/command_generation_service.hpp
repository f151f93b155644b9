#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "generation/generation_service.hpp"
#include "policy/policy_guard.hpp"

namespace protoforge::generation {

struct CommandGeneratorOptions {
    std::string command;
    std::uint32_t timeout_ms = 600000;
    std::filesystem::path working_directory = ".";
    std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
};

// Runs an external generator: the request is written to a JSON file whose
// path is passed as the last argument, and stdout is parsed as the response.
class CommandGenerationService : public GenerationService {
public:
    explicit CommandGenerationService(CommandGeneratorOptions options,
                                      policy::PolicyGuard policy_guard = {});

    core::errors::Result<protocol::GenerationResponse> generate(
        const protocol::GenerationRequest& request) override;

private:
    CommandGeneratorOptions options_;
    policy::PolicyGuard policy_guard_;
};

}  // namespace protoforge::generation

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace protoforge::protocol {

    // Validated `prototype` input. Unset optionals fall back to .qernel/qernel.json.
    struct SessionRequest {
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::optional<std::uint32_t> max_iterations;
        std::optional<std::string> test_command;
        std::optional<std::string> generator_command;
        bool debug = false;
    };

} // namespace protoforge::protocol

#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace protoforge::app::cli {

    using namespace protoforge::core::errors;
    using protoforge::protocol::SessionRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> cwd;
        std::optional<std::string> max_iterations;
        std::optional<std::string> test_command;
        std::optional<std::string> generator;
        bool debug = false;
    };

    Result<SessionRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ForgeError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: protoforge prototype [--cwd DIR] [--max-iterations N]"};
        }

        static const std::set<std::string> kExternalCommands = {"new", "explain", "auth", "push", "pull"};
        std::string command = argv[1];
        if (kExternalCommands.count(command) != 0) {
            return ForgeError{ErrorCategory::Input, "Command not supported by this binary: " + command, "unsupported_command", "Only 'prototype' is handled here."};
        }
        if (command != "prototype") {
            return ForgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'prototype' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'prototype' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--max-iterations") {
                if (i + 1 < args.size()) raw.max_iterations = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --max-iterations", "missing_value"};
            } else if (args[i] == "--test-command") {
                if (i + 1 < args.size()) raw.test_command = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --test-command", "missing_value"};
            } else if (args[i] == "--generator") {
                if (i + 1 < args.size()) raw.generator = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --generator", "missing_value"};
            } else if (args[i] == "--debug") {
                raw.debug = true;
            } else {
                return ForgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        SessionRequest req;
        req.debug = raw.debug;

        // Exception-free integer parsing
        if (raw.max_iterations) {
            uint32_t iterations = 0;
            const char* begin = raw.max_iterations->data();
            const char* end = raw.max_iterations->data() + raw.max_iterations->size();
            auto [ptr, ec] = std::from_chars(begin, end, iterations);
            if (ec != std::errc() || ptr != end) {
                return ForgeError{ErrorCategory::Input, "Invalid number for --max-iterations", "invalid_integer", "Provide a positive integer."};
            }
            if (iterations == 0 || iterations > 1000) {
                return ForgeError{ErrorCategory::Input, "--max-iterations out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            req.max_iterations = iterations;
        }

        if (raw.test_command) {
            if (raw.test_command->find_first_not_of(" \t") == std::string::npos) {
                return ForgeError{ErrorCategory::Input, "--test-command cannot be empty", "empty_command"};
            }
            req.test_command = raw.test_command.value();
        }
        if (raw.generator) {
            if (raw.generator->find_first_not_of(" \t") == std::string::npos) {
                return ForgeError{ErrorCategory::Input, "--generator cannot be empty", "empty_command"};
            }
            req.generator_command = raw.generator.value();
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return ForgeError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ForgeError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ForgeError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return req;
    }

} // namespace protoforge::app::cli

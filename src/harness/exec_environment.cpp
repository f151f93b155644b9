#include "harness/exec_environment.hpp"

#include <sstream>
#include <unistd.h>

namespace protoforge::harness {

std::map<std::string, std::string> build_exec_environment(
    const std::filesystem::path& project_root, const std::string& inherited_path) {
    std::map<std::string, std::string> environment;
    if (project_root.empty()) {
        return environment;
    }
    const auto venv = project_root / ".qernel" / ".venv";
    const auto bin = venv / "bin";
    std::error_code ec;
    if (!std::filesystem::is_directory(bin, ec) || ec) {
        return environment;
    }
    environment["PATH"] =
        inherited_path.empty() ? bin.string() : bin.string() + ":" + inherited_path;
    environment["VIRTUAL_ENV"] = venv.string();
    environment["PIP_DISABLE_PIP_VERSION_CHECK"] = "1";
    return environment;
}

std::optional<std::filesystem::path> which_in_path(const std::string& program,
                                                   const std::string& search_path) {
    std::istringstream in(search_path);
    std::string dir;
    while (std::getline(in, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const auto candidate = std::filesystem::path(dir) / program;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string normalize_command(const std::string& command, const std::string& search_path) {
    const std::string program = "python";
    if (command.rfind(program, 0) != 0) {
        return command;
    }
    if (command.size() > program.size() && command[program.size()] != ' ' &&
        command[program.size()] != '\t') {
        return command;
    }
    if (which_in_path(program, search_path).has_value() ||
        !which_in_path("python3", search_path).has_value()) {
        return command;
    }
    return "python3" + command.substr(program.size());
}

}  // namespace protoforge::harness

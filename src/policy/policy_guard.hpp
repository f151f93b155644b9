#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace protoforge::policy {

struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf /",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
};

// Directory and file names that belong to tools rather than to the project:
// VCS metadata, protoforge's own .qernel state, virtualenvs, caches and build
// output. Project scans skip them and patches may not write into them.
bool is_reserved_name(const std::string& name);

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {});

    // Checks a path on disk against an existing workspace root.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Checks a path named by a patch without touching the filesystem and
    // returns it in normalized, '/'-separated form. Paths with a reserved
    // component are a Policy error ("reserved_path").
    core::errors::Result<std::string> validate_patch_path(const std::string& raw_path) const;

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
};

}  // namespace protoforge::policy

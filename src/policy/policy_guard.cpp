#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>
#include <utility>

namespace protoforge::policy {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

bool is_reserved_name(const std::string& name) {
    static const std::set<std::string> kReserved = {
        ".git",         ".hg",    ".svn",  ".qernel", "__pycache__",
        "node_modules", "target", "build", "dist",    ".pytest_cache",
        ".mypy_cache",  ".venv",  ".logs"};
    if (kReserved.count(name) != 0) {
        return true;
    }
    return name.size() > 4 && name.compare(name.size() - 4, 4, ".pyc") == 0;
}

PolicyGuard::PolicyGuard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root does not exist: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root is not a directory: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ForgeError{ErrorCategory::Policy,
                          "Path escapes workspace root: " +
                              canonical_candidate.string(),
                          "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<std::string> PolicyGuard::validate_patch_path(
    const std::string& raw_path) const {
    const std::string trimmed = trim(raw_path);
    if (trimmed.empty()) {
        return ForgeError{ErrorCategory::Validation, "Patch path cannot be empty.",
                          "empty_patch_path"};
    }
    if (trimmed.find('\0') != std::string::npos) {
        return ForgeError{ErrorCategory::Policy,
                          "Patch path contains a NUL byte.", "path_outside_workspace"};
    }
    // Drive letters and URL-ish prefixes are never project-relative.
    if (trimmed.front() == '/' || trimmed.front() == '\\' ||
        trimmed.find(':') != std::string::npos) {
        return ForgeError{ErrorCategory::Policy,
                          "Absolute path not allowed in patch: " + trimmed,
                          "path_outside_workspace"};
    }

    std::string normalized;
    std::size_t start = 0;
    while (start <= trimmed.size()) {
        std::size_t end = trimmed.find_first_of("/\\", start);
        if (end == std::string::npos) {
            end = trimmed.size();
        }
        const std::string part = trimmed.substr(start, end - start);
        start = end + 1;

        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            return ForgeError{ErrorCategory::Policy,
                              "Parent traversal not allowed in patch: " + trimmed,
                              "path_outside_workspace"};
        }
        if (is_reserved_name(part)) {
            return ForgeError{ErrorCategory::Policy,
                              "Patch may not write into tool or build directory '" + part +
                                  "': " + trimmed,
                              "reserved_path"};
        }
        if (!normalized.empty()) {
            normalized.push_back('/');
        }
        normalized += part;
    }

    if (normalized.empty()) {
        return ForgeError{ErrorCategory::Validation,
                          "Patch path does not name a file: " + trimmed,
                          "empty_patch_path"};
    }
    return normalized;
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& command) const {
    if (trim(command).empty()) {
        return ForgeError{ErrorCategory::Input, "Command cannot be empty.",
                          "empty_command"};
    }

    const std::string lowered = lowercase(command);
    for (const auto& blocked : command_policy_.blocked_substrings) {
        const std::string blocked_lowered = lowercase(blocked);
        if (lowered.find(blocked_lowered) == std::string::npos) {
            continue;
        }
        return ForgeError{ErrorCategory::Policy,
                          "Command contains blocked operation: " + blocked,
                          "blocked_command"};
    }

    return command;
}

}  // namespace protoforge::policy

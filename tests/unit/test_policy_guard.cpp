#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/forge_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using protoforge::core::errors::ErrorCategory;
using protoforge::core::errors::get_error;
using protoforge::core::errors::get_value;
using protoforge::core::errors::is_error;
using protoforge::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + protoforge::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, AllowsNotYetExistingPathInsideWorkspace) {
    TempWorkspace workspace;

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "new/dir/file.py");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).filename().string(), "file.py");
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsInvalidWorkspaceRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_workspace_root__" + protoforge::core::config::generate_id("ws"));
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_workspace(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PolicyGuardTest, NormalizesPatchPath) {
    PolicyGuard guard;
    auto result = guard.validate_patch_path("./src//pkg\\main.py");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "src/pkg/main.py");
}

TEST(PolicyGuardTest, RejectsPatchPathsEscapingTheRoot) {
    PolicyGuard guard;
    for (const std::string raw : {"/etc/passwd", "\\share\\x", "C:/Windows/x.dll",
                                  "../outside.txt", "src/../../outside.txt"}) {
        auto result = guard.validate_patch_path(raw);
        ASSERT_TRUE(is_error(result)) << raw;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Policy) << raw;
        EXPECT_EQ(get_error(result).code, "path_outside_workspace") << raw;
    }
}

TEST(PolicyGuardTest, RejectsPatchPathsIntoToolDirectories) {
    PolicyGuard guard;
    for (const std::string raw : {".git/config", ".git/hooks/pre-commit", ".qernel/qernel.json",
                                  "src/__pycache__/main.cpython-311.pyc",
                                  "web/node_modules/x/index.js", ".venv/bin/python",
                                  "src/stale.pyc"}) {
        auto result = guard.validate_patch_path(raw);
        ASSERT_TRUE(is_error(result)) << raw;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Policy) << raw;
        EXPECT_EQ(get_error(result).code, "reserved_path") << raw;
    }

    auto lookalike = guard.validate_patch_path("src/gitignore_rules.py");
    ASSERT_FALSE(is_error(lookalike));
    EXPECT_EQ(get_value(lookalike), "src/gitignore_rules.py");
}

TEST(PolicyGuardTest, RejectsEmptyPatchPath) {
    PolicyGuard guard;
    for (const std::string raw : {"", "   ", "./", "."}) {
        auto result = guard.validate_patch_path(raw);
        ASSERT_TRUE(is_error(result)) << raw;
        EXPECT_EQ(get_error(result).code, "empty_patch_path") << raw;
    }
}

TEST(PolicyGuardTest, RejectsBlockedCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("sudo apt update");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

TEST(PolicyGuardTest, RejectsBlockedCommandCaseInsensitive) {
    PolicyGuard guard;
    auto result = guard.validate_command("ReBoOt now");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

TEST(PolicyGuardTest, AllowsTestCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("python -m pytest src/tests.py -v");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "python -m pytest src/tests.py -v");
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("  ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace

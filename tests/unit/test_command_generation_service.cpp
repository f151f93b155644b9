#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/forge_errors.hpp"
#include "generation/command_generation_service.hpp"
#include "protocol/generation_contract.hpp"

namespace {

using protoforge::core::errors::ErrorCategory;
using protoforge::core::errors::get_error;
using protoforge::core::errors::get_value;
using protoforge::core::errors::is_error;
using protoforge::generation::CommandGenerationService;
using protoforge::generation::CommandGeneratorOptions;
using protoforge::protocol::FileOpKind;
using protoforge::protocol::GenerationRequest;
using protoforge::protocol::MalformedResponse;
using protoforge::protocol::NoChange;
using protoforge::protocol::PatchSet;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_generation_" + protoforge::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_ / "scratch");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    void write_file(const std::string& name, const std::string& contents) const {
        std::ofstream out(root_ / name);
        out << contents;
    }

    CommandGeneratorOptions options(const std::string& command) const {
        CommandGeneratorOptions options;
        options.command = command;
        options.timeout_ms = 10000;
        options.working_directory = root_;
        options.scratch_root = root_ / "scratch";
        return options;
    }

private:
    std::filesystem::path root_;
};

GenerationRequest make_request() {
    GenerationRequest request;
    request.spec_text = "build a calculator";
    request.iteration = 1;
    request.budget = 3;
    request.user_prompt = "Goal: build a calculator";
    return request;
}

TEST(CommandGenerationServiceTest, NoChangeOutputIsRecognised) {
    TempWorkspace workspace;
    CommandGenerationService service(workspace.options("printf 'no_change\\n' #"));

    auto result = service.generate(make_request());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(std::holds_alternative<NoChange>(get_value(result)));
}

TEST(CommandGenerationServiceTest, GeneratorReadsRequestFileAndReturnsPatch) {
    TempWorkspace workspace;
    workspace.write_file("gen.sh",
                         "grep -q '\"spec_text\": \"build a calculator\"' \"$1\" || exit 3\n"
                         "cat <<'PATCH'\n"
                         "*** Begin Patch\n"
                         "*** Add File: calc.py\n"
                         "+def add(a, b):\n"
                         "+    return a + b\n"
                         "*** End Patch\n"
                         "PATCH\n");
    CommandGenerationService service(workspace.options("sh gen.sh"));

    auto result = service.generate(make_request());
    ASSERT_FALSE(is_error(result));
    const auto* patch = std::get_if<PatchSet>(&get_value(result));
    ASSERT_TRUE(patch != nullptr);
    ASSERT_EQ(patch->ops.size(), 1u);
    EXPECT_EQ(patch->ops[0].kind, FileOpKind::Create);
    EXPECT_EQ(patch->ops[0].path, "calc.py");
    ASSERT_TRUE(patch->ops[0].content.has_value());
    EXPECT_NE(patch->ops[0].content->find("return a + b"), std::string::npos);
}

TEST(CommandGenerationServiceTest, ScratchRequestFileIsRemovedAfterTheCall) {
    TempWorkspace workspace;
    CommandGenerationService service(workspace.options("printf 'no_change' #"));

    ASSERT_FALSE(is_error(service.generate(make_request())));
    EXPECT_TRUE(std::filesystem::is_empty(workspace.root() / "scratch"));
}

TEST(CommandGenerationServiceTest, UnparseableOutputIsMalformed) {
    TempWorkspace workspace;
    CommandGenerationService service(workspace.options("echo 'I could not do it' #"));

    auto result = service.generate(make_request());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(std::holds_alternative<MalformedResponse>(get_value(result)));
}

TEST(CommandGenerationServiceTest, SlowGeneratorTimesOut) {
    TempWorkspace workspace;
    auto options = workspace.options("sleep 5 #");
    options.timeout_ms = 200;
    CommandGenerationService service(options);

    auto result = service.generate(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(result).code, "generation_timeout");
}

TEST(CommandGenerationServiceTest, NonZeroExitIsProviderError) {
    TempWorkspace workspace;
    CommandGenerationService service(workspace.options("echo quota >&2; exit 4 #"));

    auto result = service.generate(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(result).code, "generator_failed");
    EXPECT_NE(get_error(result).message.find("quota"), std::string::npos);
}

TEST(CommandGenerationServiceTest, BlockedCommandIsRejectedBeforeLaunch) {
    TempWorkspace workspace;
    CommandGenerationService service(workspace.options("sudo ./gen.sh"));

    auto result = service.generate(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

}  // namespace

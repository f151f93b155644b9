#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "feedback/feedback_composer.hpp"
#include "session/session.hpp"
#include "session/transcript.hpp"
#include "workspace/snapshot_store.hpp"

namespace {

using protoforge::feedback::ComposerLimits;
using protoforge::feedback::FeedbackComposer;
using protoforge::feedback::render_feedback_digest;
using protoforge::feedback::render_tree_digest;
using protoforge::feedback::request_to_json;
using protoforge::feedback::truncate_middle;
using protoforge::protocol::Applied;
using protoforge::protocol::Conflict;
using protoforge::protocol::ConflictReason;
using protoforge::protocol::ConflictReport;
using protoforge::protocol::ControllerState;
using protoforge::protocol::IterationRecord;
using protoforge::protocol::TestCaseResult;
using protoforge::protocol::TestResult;
using protoforge::protocol::TestStatus;
using protoforge::protocol::TranscriptEvent;
using protoforge::session::Session;
using protoforge::workspace::FileTree;
using protoforge::workspace::SnapshotStore;

Session make_session(SnapshotStore& store) {
    Session session;
    session.id = "session-test";
    session.spec_text = "Implement add(a, b) in src/main.py";
    session.current = store.create(FileTree{{"src/tests.py", "from main import add\n"},
                                            {"src/main.py", "def add(a, b):\n    pass\n"}});
    session.budget = 5;
    session.counter = 1;
    session.working_directory = "/work/demo";
    session.test_command = "python -m pytest src/tests.py -v";
    return session;
}

IterationRecord failed_record() {
    IterationRecord record;
    record.index = 1;
    TestResult result;
    result.status = TestStatus::Failed;
    result.exit_code = 1;
    result.cases = {TestCaseResult{"src/tests.py::test_add", false, ""},
                    TestCaseResult{"src/tests.py::test_sub", true, ""}};
    result.output = "E   assert None == 3\n";
    record.test_result = result;
    return record;
}

void append_record(Session& session, const IterationRecord& record) {
    TranscriptEvent event;
    event.state = ControllerState::Generating;
    event.record = record;
    session.transcript->append(event);
}

TEST(FeedbackComposerTest, TreeDigestIsSortedWithHeadings) {
    SnapshotStore store;
    auto snapshot = store.create(FileTree{{"b.py", "b"}, {"a.py", "a\n"}});
    EXPECT_EQ(render_tree_digest(*snapshot, 1000), "=== a.py ===\na\n\n=== b.py ===\nb\n\n");
}

TEST(FeedbackComposerTest, TruncationKeepsHeadAndTail) {
    const std::string text = std::string(100, 'h') + std::string(100, 't');
    const auto truncated = truncate_middle(text, 20);
    EXPECT_EQ(truncated.substr(0, 10), std::string(10, 'h'));
    EXPECT_EQ(truncated.substr(truncated.size() - 10), std::string(10, 't'));
    EXPECT_NE(truncated.find("[TRUNCATED]"), std::string::npos);
    EXPECT_EQ(truncate_middle("short", 20), "short");
}

TEST(FeedbackComposerTest, FirstRoundHasNoFeedback) {
    SnapshotStore store;
    auto session = make_session(store);
    session.counter = 0;

    FeedbackComposer composer;
    const auto request = composer.compose(session);
    EXPECT_EQ(request.iteration, 1u);
    EXPECT_EQ(request.budget, 5u);
    EXPECT_TRUE(request.feedback_digest.empty());
    EXPECT_EQ(request.user_prompt, "Goal: Implement add(a, b) in src/main.py");
    EXPECT_NE(request.system_prompt.find("Test command: python -m pytest src/tests.py -v"),
              std::string::npos);
    EXPECT_NE(request.system_prompt.find("=== src/main.py ==="), std::string::npos);
    EXPECT_NE(request.system_prompt.find("*** Begin Patch"), std::string::npos);
}

TEST(FeedbackComposerTest, FailedTestsBecomeFeedback) {
    const auto digest = render_feedback_digest(failed_record(), 8000);
    EXPECT_NE(digest.find("Previous iteration 1 failed with exit code 1."), std::string::npos);
    EXPECT_NE(digest.find("- src/tests.py::test_add"), std::string::npos);
    EXPECT_EQ(digest.find("test_sub"), std::string::npos);
    EXPECT_NE(digest.find("E   assert None == 3"), std::string::npos);
}

TEST(FeedbackComposerTest, ConflictsBecomeFeedback) {
    IterationRecord record;
    record.index = 2;
    record.apply_result = ConflictReport{
        {Conflict{"src/main.py", ConflictReason::ContextMismatch, "hunk 1: not found"},
         Conflict{"", ConflictReason::EmptyPatch, ""}}};

    const auto digest = render_feedback_digest(record, 8000);
    EXPECT_NE(digest.find("Previous iteration 2 produced a patch that was rejected."),
              std::string::npos);
    EXPECT_NE(digest.find("- src/main.py: context-mismatch (hunk 1: not found)"),
              std::string::npos);
    EXPECT_NE(digest.find("- <patch>: empty-patch"), std::string::npos);
}

TEST(FeedbackComposerTest, PassingRecordNeedsNoFeedback) {
    IterationRecord record;
    record.index = 1;
    SnapshotStore store;
    record.apply_result = Applied{store.create(FileTree{})};
    TestResult result;
    result.status = TestStatus::Passed;
    result.exit_code = 0;
    record.test_result = result;
    EXPECT_TRUE(render_feedback_digest(record, 8000).empty());
    EXPECT_TRUE(render_feedback_digest(std::nullopt, 8000).empty());
}

TEST(FeedbackComposerTest, FeedbackIsBounded) {
    auto record = failed_record();
    record.test_result->output = std::string(50000, 'x');
    const auto digest = render_feedback_digest(record, 1000);
    EXPECT_LT(digest.size(), 1100u);
    EXPECT_NE(digest.find("[TRUNCATED]"), std::string::npos);
}

TEST(FeedbackComposerTest, SameSessionGivesByteIdenticalRequests) {
    SnapshotStore store;
    auto session = make_session(store);
    append_record(session, failed_record());

    FeedbackComposer composer(ComposerLimits{4096, 512});
    const auto first = composer.compose(session);
    const auto second = composer.compose(session);

    EXPECT_EQ(first.user_prompt, second.user_prompt);
    EXPECT_EQ(first.system_prompt, second.system_prompt);
    EXPECT_EQ(request_to_json(first).dump(), request_to_json(second).dump());
    EXPECT_EQ(first.iteration, 2u);
    EXPECT_NE(first.user_prompt.find("Previous iteration failed. Here are the details:"),
              std::string::npos);
}

TEST(FeedbackComposerTest, BinaryFilesAreReplacedInTreeDigest) {
    SnapshotStore store;
    auto snapshot = store.create(FileTree{{"logo.png", std::string("\x89PNG\r\n\x1a\n\0\0", 10)},
                                          {"main.py", "print('caf\xc3\xa9')\n"}});

    const auto digest = render_tree_digest(*snapshot, 10000);
    EXPECT_NE(digest.find("=== logo.png ===\n[Binary file or read error]\n"), std::string::npos);
    EXPECT_NE(digest.find("print('caf\xc3\xa9')"), std::string::npos);
    EXPECT_NO_THROW(nlohmann::json(digest).dump());
}

TEST(FeedbackComposerTest, TruncationNeverSplitsACharacter) {
    std::string text;
    for (int i = 0; i < 100; ++i) {
        text += "\xc3\xa9";
    }
    const auto truncated = truncate_middle(text, 51);
    EXPECT_LE(truncated.size(), 51 + std::string("\n...\n[TRUNCATED]\n...\n").size());
    EXPECT_NO_THROW(nlohmann::json(truncated).dump());
}

TEST(FeedbackComposerTest, RequestWithInvalidBytesStillSerializes) {
    SnapshotStore store;
    Session session = make_session(store);
    IterationRecord record = failed_record();
    record.test_result->output = "garbled \xff\xfe output\n";
    append_record(session, record);

    FeedbackComposer composer;
    const auto request = composer.compose(session);
    const auto json = request_to_json(request);
    std::string dumped;
    EXPECT_NO_THROW(dumped = json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    EXPECT_NE(dumped.find("garbled"), std::string::npos);
}

}  // namespace

#include <string>
#include <gtest/gtest.h>
#include "core/errors/forge_errors.hpp"
#include "workspace/diff_apply.hpp"

namespace {

using protoforge::core::errors::ErrorCategory;
using protoforge::core::errors::get_error;
using protoforge::core::errors::get_value;
using protoforge::core::errors::is_error;
using protoforge::workspace::apply_diff;
using protoforge::workspace::parse_hunks;

const std::string kOriginal =
    "import math\n"
    "\n"
    "def area(r):\n"
    "    return 0\n"
    "\n"
    "def perimeter(r):\n"
    "    return 0\n";

TEST(DiffApplyTest, ParsesNumberedAndAnchoredHeaders) {
    auto parsed = parse_hunks(
        "--- a/x.py\n"
        "+++ b/x.py\n"
        "@@ -3,2 +3,2 @@ def area(r):\n"
        " def area(r):\n"
        "-    return 0\n"
        "+    return math.pi * r * r\n"
        "@@ def perimeter(r):\n"
        "-    return 0\n"
        "+    return 2 * math.pi * r\n"
        "*** End of File\n");
    ASSERT_FALSE(is_error(parsed));
    const auto& hunks = get_value(parsed);
    ASSERT_EQ(hunks.size(), 2u);
    ASSERT_TRUE(hunks[0].old_start.has_value());
    EXPECT_EQ(hunks[0].old_start.value(), 3u);
    EXPECT_EQ(hunks[0].old_count, 2u);
    EXPECT_EQ(hunks[0].lines.size(), 3u);
    EXPECT_FALSE(hunks[1].old_start.has_value());
    EXPECT_EQ(hunks[1].anchor, "def perimeter(r):");
    EXPECT_TRUE(hunks[1].end_of_file);
}

TEST(DiffApplyTest, RejectsGarbageLines) {
    auto parsed = parse_hunks("@@\n-a\n?b\n");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(parsed).code, "invalid_diff");

    auto empty = parse_hunks("");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "invalid_diff");
}

TEST(DiffApplyTest, AppliesAnchoredHunksInOrder) {
    auto result = apply_diff(kOriginal,
                             "@@ def area(r):\n"
                             "-    return 0\n"
                             "+    return math.pi * r * r\n"
                             "@@ def perimeter(r):\n"
                             "-    return 0\n"
                             "+    return 2 * math.pi * r\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              "import math\n"
              "\n"
              "def area(r):\n"
              "    return math.pi * r * r\n"
              "\n"
              "def perimeter(r):\n"
              "    return 2 * math.pi * r\n");
}

TEST(DiffApplyTest, NumberedHunkMustMatchAtItsLine) {
    auto ok = apply_diff(kOriginal,
                         "@@ -7,1 +7,1 @@\n"
                         "-    return 0\n"
                         "+    return 1\n");
    ASSERT_FALSE(is_error(ok));
    EXPECT_NE(get_value(ok).find("def perimeter(r):\n    return 1\n"), std::string::npos);
    EXPECT_NE(get_value(ok).find("def area(r):\n    return 0\n"), std::string::npos);

    auto stale = apply_diff(kOriginal,
                            "@@ -1,1 +1,1 @@\n"
                            "-import numpy\n"
                            "+import numpy as np\n");
    ASSERT_TRUE(is_error(stale));
    EXPECT_EQ(get_error(stale).category, ErrorCategory::Conflict);
    EXPECT_EQ(get_error(stale).code, "context_mismatch");
    EXPECT_NE(get_error(stale).message.find("hunk 1"), std::string::npos);
}

TEST(DiffApplyTest, LaterNumberedHunksFollowEarlierLineCountChanges) {
    auto grown = apply_diff("a\nb\nc\nd\ne\n",
                            "@@ -1,1 +1,2 @@\n"
                            " a\n"
                            "+a2\n"
                            "@@ -5,1 +6,1 @@\n"
                            "-e\n"
                            "+E\n");
    ASSERT_FALSE(is_error(grown)) << get_error(grown).message;
    EXPECT_EQ(get_value(grown), "a\na2\nb\nc\nd\nE\n");

    auto shrunk = apply_diff("a\nb\nc\nd\ne\n",
                             "@@ -1,2 +1,1 @@\n"
                             " a\n"
                             "-b\n"
                             "@@ -4,0 +4,1 @@\n"
                             "+d2\n");
    ASSERT_FALSE(is_error(shrunk)) << get_error(shrunk).message;
    EXPECT_EQ(get_value(shrunk), "a\nc\nd\nd2\ne\n");
}

TEST(DiffApplyTest, PureAdditionAppendsToEnd) {
    auto result = apply_diff("a\n", "@@\n+b\n+c\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "a\nb\nc\n");
}

TEST(DiffApplyTest, AdditionIntoEmptyFile) {
    auto result = apply_diff("", "@@\n+def main():\n+    pass\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "def main():\n    pass\n");
}

TEST(DiffApplyTest, EndOfFileHunkMatchesTail) {
    auto result = apply_diff("x\ny\nx\n", "@@\n-x\n+z\n*** End of File\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "x\ny\nz\n");
}

TEST(DiffApplyTest, ToleratesTrailingWhitespaceDrift) {
    auto result = apply_diff("value = 1   \n", "@@\n-value = 1\n+value = 2\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "value = 2\n");
}

TEST(DiffApplyTest, MissingAnchorIsAConflict) {
    auto result = apply_diff(kOriginal, "@@ def volume(r):\n-    return 0\n+    return 1\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "context_mismatch");
}

TEST(DiffApplyTest, AddsTrailingNewline) {
    auto result = apply_diff("a\nb", "@@\n-b\n+c\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "a\nc\n");
}

}  // namespace

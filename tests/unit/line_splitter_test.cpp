#include "process/line_splitter.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using qode::process::LineSplitter;

namespace {
std::vector<std::string> push(LineSplitter &splitter, const std::string &chunk) {
    return splitter.push(chunk.data(), chunk.size());
}
}  // namespace

TEST(LineSplitterTest, SplitsCompleteLines) {
    LineSplitter splitter;
    auto lines = push(splitter, "first\nsecond\n");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_TRUE(splitter.pending().empty());
}

TEST(LineSplitterTest, HoldsFragmentUntilNewline) {
    LineSplitter splitter;
    EXPECT_TRUE(push(splitter, "Analy").empty());
    EXPECT_EQ(splitter.pending(), "Analy");

    auto lines = push(splitter, "zing\nDo");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "Analyzing");
    EXPECT_EQ(splitter.pending(), "Do");
}

TEST(LineSplitterTest, StripsCarriageReturn) {
    LineSplitter splitter;
    auto lines = push(splitter, "windows\r\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "windows");
}

TEST(LineSplitterTest, KeepsEmptyLines) {
    LineSplitter splitter;
    auto lines = push(splitter, "a\n\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "");
}

TEST(LineSplitterTest, FinishFlushesTrailingFragment) {
    LineSplitter splitter;
    push(splitter, "done\nno newline");

    auto lines = splitter.finish();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "no newline");
    EXPECT_TRUE(splitter.pending().empty());
    EXPECT_TRUE(splitter.finish().empty());
}

TEST(LineSplitterTest, FinishIgnoresLoneCarriageReturn) {
    LineSplitter splitter;
    push(splitter, "line\n\r");
    EXPECT_TRUE(splitter.finish().empty());
}

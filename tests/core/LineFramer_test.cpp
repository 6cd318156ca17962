#include <gtest/gtest.h>
#include "core/LineFramer.hpp"

using namespace mcp_host;

TEST(LineFramerTest, SplitsCompleteLines) {
    LineFramer framer;
    auto lines = framer.feed("one\ntwo\n");

    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_TRUE(framer.buffered().empty());
}

TEST(LineFramerTest, KeepsPartialLineAcrossChunks) {
    LineFramer framer;

    EXPECT_TRUE(framer.feed("{\"a\":").empty());
    EXPECT_EQ(framer.buffered(), "{\"a\":");

    auto lines = framer.feed("1}\n{\"b\"");
    ASSERT_EQ(lines.size(), 1);
    EXPECT_EQ(lines[0], "{\"a\":1}");
    EXPECT_EQ(framer.buffered(), "{\"b\"");
}

TEST(LineFramerTest, TrimsCarriageReturnsAndSkipsBlankLines) {
    LineFramer framer;
    auto lines = framer.feed("first\r\n\r\n   \n  second  \n");

    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
}

TEST(LineFramerTest, ClearDropsBufferedData) {
    LineFramer framer;
    framer.feed("partial");
    framer.clear();

    auto lines = framer.feed("next\n");
    ASSERT_EQ(lines.size(), 1);
    EXPECT_EQ(lines[0], "next");
}

TEST(NdjsonFramerTest, ParsesOneMessagePerLine) {
    NdjsonFramer framer("test");
    auto messages = framer.feed("{\"id\":1}\n{\"id\":2}\n");

    ASSERT_EQ(messages.size(), 2);
    EXPECT_EQ(messages[0]["id"], 1);
    EXPECT_EQ(messages[1]["id"], 2);
}

TEST(NdjsonFramerTest, MessageSplitAcrossManyChunks) {
    NdjsonFramer framer("test");
    std::string line = "{\"jsonrpc\":\"2.0\",\"id\":7,\"result\":{\"ok\":true}}\n";

    std::vector<json> messages;
    for (char c : line) {
        for (auto& message : framer.feed(std::string(1, c))) {
            messages.push_back(std::move(message));
        }
    }

    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0]["id"], 7);
    EXPECT_TRUE(messages[0]["result"]["ok"].get<bool>());
}

TEST(NdjsonFramerTest, MalformedLinesAreDroppedWithoutLosingOthers) {
    NdjsonFramer framer("test");
    auto messages = framer.feed(
        "Server starting...\n"
        "{\"id\":1,\"result\":{}}\n"
        "{not json\n"
        "[1,2,3]\n"
        "{\"id\":2,\"result\":{}}\n");

    ASSERT_EQ(messages.size(), 2);
    EXPECT_EQ(messages[0]["id"], 1);
    EXPECT_EQ(messages[1]["id"], 2);
    EXPECT_EQ(framer.dropped(), 3);
}

TEST(NdjsonFramerTest, CrlfTerminatedMessages) {
    NdjsonFramer framer("test");
    auto messages = framer.feed("{\"method\":\"ping\"}\r\n");

    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0]["method"], "ping");
}

#include <gtest/gtest.h>

#include "mcplink/protocol/line_framer.h"

namespace mcplink {
namespace protocol {
namespace {

TEST(LineFramerTest, SplitsCompleteLines) {
  LineFramer framer;

  auto lines = framer.feed(std::string("{\"a\":1}\n{\"b\":2}\n"));

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "{\"a\":1}");
  EXPECT_EQ(lines[1], "{\"b\":2}");
  EXPECT_EQ(framer.buffered(), 0u);
}

TEST(LineFramerTest, HoldsPartialLine) {
  LineFramer framer;

  EXPECT_TRUE(framer.feed(std::string("{\"jsonrpc\":")).empty());
  EXPECT_EQ(framer.buffered(), 11u);

  auto lines = framer.feed(std::string("\"2.0\"}\n{\"next\""));
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "{\"jsonrpc\":\"2.0\"}");
  EXPECT_EQ(framer.buffered(), 8u);
}

TEST(LineFramerTest, StripsCarriageReturnAndSkipsBlankLines) {
  LineFramer framer;

  auto lines = framer.feed(std::string("one\r\n\n  \t\ntwo\n"));

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "one");
  EXPECT_EQ(lines[1], "two");
}

TEST(LineFramerTest, DropsOversizedLine) {
  LineFramer framer(8);

  auto lines = framer.feed(std::string("0123456789abcdef"));
  EXPECT_TRUE(lines.empty());
  EXPECT_EQ(framer.droppedLines(), 1u);
  EXPECT_EQ(framer.buffered(), 0u);

  // Rest of the runaway line is discarded up to its newline
  lines = framer.feed(std::string("more\nok\n"));
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "ok");
  EXPECT_EQ(framer.droppedLines(), 1u);
}

TEST(LineFramerTest, ResetDiscardsPartialLine) {
  LineFramer framer;
  framer.feed(std::string("partial"));

  framer.reset();

  auto lines = framer.feed(std::string("fresh\n"));
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "fresh");
}

TEST(LineFramerTest, FrameEscapesEmbeddedNewlines) {
  nlohmann::json message = {{"text", "line1\nline2"}};

  std::string framed = LineFramer::frame(message);

  ASSERT_FALSE(framed.empty());
  EXPECT_EQ(framed.back(), '\n');
  EXPECT_EQ(framed.find('\n'), framed.size() - 1);

  LineFramer framer;
  auto lines = framer.feed(framed);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(nlohmann::json::parse(lines[0]), message);
}

}  // namespace
}  // namespace protocol
}  // namespace mcplink

#include "text_processor.hpp"
#include "utf16.hpp"

#include <gtest/gtest.h>

using Opaque::text::TextProcessor;

TEST(TextProcessorTests, Utf8Validation) {
  EXPECT_TRUE(TextProcessor::isValidUTF8(""));
  EXPECT_TRUE(TextProcessor::isValidUTF8("plain ascii\t\n"));
  EXPECT_TRUE(TextProcessor::isValidUTF8("a\xc3\xa7\xc3\xa3o"));       // ação
  EXPECT_TRUE(TextProcessor::isValidUTF8("\xf0\x9f\x8e\x89"));         // 🎉
  EXPECT_FALSE(TextProcessor::isValidUTF8("\xff"));
  EXPECT_FALSE(TextProcessor::isValidUTF8("\xc3"));                    // truncated
  EXPECT_FALSE(TextProcessor::isValidUTF8("\xe0\x80\xaf"));            // overlong
  EXPECT_FALSE(TextProcessor::isValidUTF8("\xed\xa0\x80"));            // surrogate
  EXPECT_FALSE(TextProcessor::isValidUTF8("\xf4\x90\x80\x80"));        // > U+10FFFF
}

TEST(TextProcessorTests, DigitHelpers) {
  EXPECT_EQ(TextProcessor::digitsOnly("529.982.247-25"), "52998224725");
  EXPECT_EQ(TextProcessor::alnumUpper("12.345.678-k"), "12345678K");
  EXPECT_TRUE(TextProcessor::isAllDigits("0123"));
  EXPECT_FALSE(TextProcessor::isAllDigits(""));
  EXPECT_FALSE(TextProcessor::isAllDigits("12a"));
  EXPECT_TRUE(TextProcessor::allSameChar("1111"));
  EXPECT_FALSE(TextProcessor::allSameChar("1112"));
}

TEST(TextProcessorTests, SplitLinesDropsCarriageReturns) {
  auto lines = TextProcessor::splitLines("one\r\ntwo\n\nthree");
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "one");
  EXPECT_EQ(lines[1], "two");
  EXPECT_EQ(lines[2], "");
  EXPECT_EQ(lines[3], "three");
  EXPECT_TRUE(TextProcessor::splitLines("").empty());
}

TEST(TextProcessorTests, ReplaceAllCountsReplacements) {
  std::string text = "token and token";
  EXPECT_EQ(TextProcessor::replaceAll(text, "token", "[X]"), 2u);
  EXPECT_EQ(text, "[X] and [X]");
  // Replacement containing the needle must not loop
  text = "aa";
  EXPECT_EQ(TextProcessor::replaceAll(text, "a", "aa"), 2u);
  EXPECT_EQ(text, "aaaa");
  EXPECT_EQ(TextProcessor::replaceAll(text, "", "x"), 0u);
}

TEST(Utf16Tests, LineStarts) {
  auto starts = Opaque::computeLineStarts("a\nbc\n");
  ASSERT_EQ(starts.size(), 3u);
  EXPECT_EQ(starts[0], 0u);
  EXPECT_EQ(starts[1], 2u);
  EXPECT_EQ(starts[2], 5u);
}

TEST(Utf16Tests, PositionsCountUtf16Units) {
  std::string text = "x\n\xc3\xa9\xf0\x9f\x8e\x89z"; // x \n é 🎉 z
  auto starts = Opaque::computeLineStarts(text);

  Opaque::Position pos = Opaque::byteOffsetToPosition(text, starts, 0);
  EXPECT_EQ(pos.line, 0);
  EXPECT_EQ(pos.character, 0);

  // 'z' sits after é (1 unit) and 🎉 (2 units)
  pos = Opaque::byteOffsetToPosition(text, starts, text.size() - 1);
  EXPECT_EQ(pos.line, 1);
  EXPECT_EQ(pos.character, 3);

  // Offsets past the end clamp
  pos = Opaque::byteOffsetToPosition(text, starts, 1000);
  EXPECT_EQ(pos.line, 1);
  EXPECT_EQ(pos.character, 4);
}

TEST(Utf16Tests, Length) {
  EXPECT_EQ(Opaque::utf8ToUtf16Length(""), 0u);
  EXPECT_EQ(Opaque::utf8ToUtf16Length("abc"), 3u);
  EXPECT_EQ(Opaque::utf8ToUtf16Length("\xf0\x9f\x8e\x89"), 2u);
  // A truncated sequence counts byte by byte
  EXPECT_EQ(Opaque::utf8ToUtf16Length("\xf0\x9f"), 2u);
}

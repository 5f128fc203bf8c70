#include <gtest/gtest.h>

#include "policylens_core/text/utf8_text.hpp"

namespace policylens_core::text {

TEST(Utf8TextTest, CharLengthCountsCodePoints) {
  EXPECT_EQ(char_length(""), 0u);
  EXPECT_EQ(char_length("abc"), 3u);
  EXPECT_EQ(char_length("caf\xC3\xA9"), 4u);
  EXPECT_EQ(char_length("\xE2\x80\xA2 item"), 6u);
}

TEST(Utf8TextTest, CharLengthFallsBackToBytesForInvalidInput) {
  EXPECT_EQ(char_length("ab\xFF"), 3u);
}

TEST(Utf8TextTest, TailCharsNeverSplitsACodePoint) {
  EXPECT_EQ(tail_chars("caf\xC3\xA9", 2), "f\xC3\xA9");
  EXPECT_EQ(tail_chars("abc", 10), "abc");
  EXPECT_EQ(tail_chars("abc", 0), "");
}

TEST(Utf8TextTest, SingleWordChar) {
  EXPECT_TRUE(is_single_word_char("M"));
  EXPECT_TRUE(is_single_word_char("7"));
  EXPECT_TRUE(is_single_word_char("\xC3\xA9"));
  EXPECT_FALSE(is_single_word_char("-"));
  EXPECT_FALSE(is_single_word_char("ab"));
  EXPECT_FALSE(is_single_word_char("\xE2\x80\xA2"));  // bullet
  EXPECT_FALSE(is_single_word_char("\xC3\x97"));      // multiplication sign
  EXPECT_FALSE(is_single_word_char(""));
}

}  // namespace policylens_core::text

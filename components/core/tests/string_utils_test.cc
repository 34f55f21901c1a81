// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include <gtest/gtest.h>

#include <vector>

#include "vd/string_utils.h"

namespace vd {
using namespace std::string_view_literals;

TEST(StringUtilsTest, TestJoin) {
  EXPECT_EQ("", join(", ", std::vector<int>{}, [](auto x) { return std::to_string(x); }));
  EXPECT_EQ("alone", join(", ", std::vector<std::string_view>{"alone"}, [](auto x) { return x; }));
  EXPECT_EQ("1, 2, 3", join(", ", std::vector{1, 2, 3}, [](auto x) { return std::to_string(x); }));
}

TEST(StringUtilsTest, TestEscapeNullCharacters) {
  EXPECT_EQ("abc", escape_null_characters("abc"));
  EXPECT_EQ("a\\0b\\0", escape_null_characters("a\0b\0"sv));
  // Other control characters are left alone.
  EXPECT_EQ("tab\there\n", escape_null_characters("tab\there\n"));
}

TEST(StringUtilsTest, TestEscapeControlChars) {
  EXPECT_EQ("", escape_control_chars(""));
  EXPECT_EQ("plain text", escape_control_chars("plain text"));
  EXPECT_EQ("\\0\\a\\b\\f\\n\\r\\t\\v", escape_control_chars("\0\a\b\f\n\r\t\v"sv));
  EXPECT_EQ("esc\\x1B[0m", escape_control_chars("esc\x1B[0m"));
  EXPECT_EQ("del\\x7F", escape_control_chars("del\x7F"));
  // UTF-8 continuation bytes are not control characters.
  EXPECT_EQ("caf\xC3\xA9", escape_control_chars("caf\xC3\xA9"));
}

TEST(StringUtilsTest, TestEscapeIsIdempotent) {
  const std::string once = escape_control_chars("line one\nline two\t\0"sv);
  EXPECT_EQ("line one\\nline two\\t\\0", once);
  EXPECT_EQ(once, escape_control_chars(once));
  EXPECT_EQ("back\\slash", escape_control_chars("back\\slash"));
}

TEST(StringUtilsTest, TestUtf8CharacterOffsets) {
  using offsets = std::vector<std::size_t>;
  EXPECT_EQ(offsets({0}), utf8_character_offsets(""));
  EXPECT_EQ(offsets({0, 1, 2}), utf8_character_offsets("ab"));
  // Two, three and four byte characters: e acute, the euro sign and an emoji.
  EXPECT_EQ(offsets({0, 1, 3, 4}), utf8_character_offsets("h\xC3\xA9l"));
  EXPECT_EQ(offsets({0, 3, 7}), utf8_character_offsets("\xE2\x82\xAC\xF0\x9F\x98\x80"));
}

TEST(StringUtilsTest, TestUtf8MalformedBytes) {
  using offsets = std::vector<std::size_t>;
  // A truncated sequence, and stray continuation bytes.
  EXPECT_EQ(offsets({0, 1, 2}), utf8_character_offsets("\xC3" "a"));
  EXPECT_EQ(offsets({0, 1}), utf8_character_offsets("\xC3"));
  EXPECT_EQ(offsets({0, 1, 2}), utf8_character_offsets("\xA9\xA9"));
  // Overlong encodings and surrogates are not characters.
  EXPECT_EQ(offsets({0, 1, 2}), utf8_character_offsets("\xC0\xAF"));
  EXPECT_EQ(offsets({0, 1, 2, 3}), utf8_character_offsets("\xE0\x80\xAF"));
  EXPECT_EQ(offsets({0, 1, 2, 3}), utf8_character_offsets("\xED\xA0\x80"));
  EXPECT_EQ(offsets({0, 1, 2, 3, 4}), utf8_character_offsets("\xF4\x90\x80\x80"));
}

TEST(StringUtilsTest, TestDecodeUtf8Character) {
  EXPECT_EQ(U'a', decode_utf8_character("a"));
  EXPECT_EQ(char32_t{0xE9}, decode_utf8_character("\xC3\xA9"));
  EXPECT_EQ(char32_t{0x20AC}, decode_utf8_character("\xE2\x82\xAC"));
  EXPECT_EQ(char32_t{0x1F600}, decode_utf8_character("\xF0\x9F\x98\x80"));
  EXPECT_EQ(char32_t{0xA9}, decode_utf8_character("\xA9"));
}

TEST(StringUtilsTest, TestFoldCase) {
  EXPECT_EQ(U'a', fold_case(U'A'));
  EXPECT_EQ(U'z', fold_case(U'z'));
  EXPECT_EQ(U'1', fold_case(U'1'));
  EXPECT_EQ(char32_t{0xE9}, fold_case(0xC9));    // E acute
  EXPECT_EQ(char32_t{0xD7}, fold_case(0xD7));    // multiplication sign
  EXPECT_EQ(char32_t{0x101}, fold_case(0x100));  // A macron
  EXPECT_EQ(char32_t{0x101}, fold_case(0x101));
  EXPECT_EQ(char32_t{0x13A}, fold_case(0x139));  // L acute
  EXPECT_EQ(char32_t{0x138}, fold_case(0x138));
  EXPECT_EQ(char32_t{0x14B}, fold_case(0x14A));  // eng
  EXPECT_EQ(char32_t{0xFF}, fold_case(0x178));   // Y diaeresis
  EXPECT_EQ(char32_t{0x17E}, fold_case(0x17D));  // Z caron
  EXPECT_EQ(char32_t{0x3C3}, fold_case(0x3A3));  // sigma
  EXPECT_EQ(char32_t{0x436}, fold_case(0x416));  // zhe
  EXPECT_EQ(char32_t{0x451}, fold_case(0x401));  // io
  EXPECT_EQ(char32_t{0x4E2D}, fold_case(0x4E2D));
}

}  // namespace vd

#include "text_util.hpp"

#include <gtest/gtest.h>

namespace pdf_mt {
namespace {

TEST(TextUtilTest, DecodesMultibyteUtf8) {
    const std::u32string runes = utf8_to_runes("a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
    EXPECT_EQ(runes, (std::u32string{U'a', U'é', U'中', U'\U0001F600'}));
    EXPECT_EQ(runes_to_utf8(runes), "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
}

TEST(TextUtilTest, InvalidSequencesBecomeReplacementCharacters) {
    EXPECT_EQ(utf8_to_runes("\xFF" "a"), (std::u32string{U'�', U'a'}));
    EXPECT_EQ(utf8_to_runes("a\xE4\xB8"), (std::u32string{U'a', U'�'}));
}

TEST(TextUtilTest, LetterDetection) {
    EXPECT_TRUE(has_letters(U"Figure 3"));
    EXPECT_TRUE(has_letters(U"数据"));
    EXPECT_FALSE(has_letters(U"12.5 %"));
    EXPECT_FALSE(has_letters(U"(3) – [4]"));
    EXPECT_FALSE(has_letters(U""));
}

TEST(TextUtilTest, NormalizeWhitespaceCollapsesAndTrims) {
    EXPECT_EQ(normalize_whitespace(U"  hello \n\t world  "), U"hello world");
    EXPECT_EQ(normalize_whitespace(U"　"), U"");
}

TEST(TextUtilTest, CjkRanges) {
    EXPECT_TRUE(is_cjk_rune(0x4E2D));
    EXPECT_TRUE(is_cjk_rune(0x30A2));
    EXPECT_TRUE(is_cjk_rune(0xAC00));
    EXPECT_FALSE(is_cjk_rune('A'));
}

}  // namespace
}  // namespace pdf_mt

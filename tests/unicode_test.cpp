#include "storyguard/unicode.hpp"

#include <gtest/gtest.h>

using namespace storyguard;

TEST(Unicode, DecodesMultiByteSequences) {
    const std::u32string decoded = decode_utf8("Zo\xC3\xAB \xD0\x90");
    ASSERT_EQ(decoded.size(), 5u);
    EXPECT_EQ(decoded[2], U'ë');
    EXPECT_EQ(decoded[4], U'А');
}

TEST(Unicode, MalformedBytesBecomeReplacementCharacters) {
    const std::u32string decoded = decode_utf8("a\xFF" "b\xC3");
    ASSERT_EQ(decoded.size(), 4u);
    EXPECT_EQ(decoded[1], kReplacementCharacter);
    EXPECT_EQ(decoded[3], kReplacementCharacter);
}

TEST(Unicode, CountsCodePointsWithoutDecoding) {
    EXPECT_EQ(count_code_points("Zo\xC3\xAB"), 3u);
    EXPECT_EQ(count_code_points(""), 0u);
}

TEST(Unicode, EncodeRoundTripsAstralPlane) {
    const std::u32string text = U"a\U0001F600";
    EXPECT_EQ(decode_utf8(encode_utf8(text)), text);
}

TEST(Unicode, ClassifiesInvisibleCodePoints) {
    EXPECT_TRUE(is_invisible(U'\u200B'));
    EXPECT_TRUE(is_invisible(U'\u202E'));
    EXPECT_TRUE(is_invisible(U'\uFEFF'));
    EXPECT_FALSE(is_invisible(U'a'));
    EXPECT_FALSE(is_invisible(U' '));
}

TEST(Unicode, NameLettersCoverLatinGreekAndCyrillic) {
    EXPECT_TRUE(is_name_letter(U'Q'));
    EXPECT_TRUE(is_name_letter(U'é'));
    EXPECT_TRUE(is_name_letter(U'α'));
    EXPECT_TRUE(is_name_letter(U'ж'));
    EXPECT_FALSE(is_name_letter(U'×'));
    EXPECT_FALSE(is_name_letter(U'7'));
    EXPECT_FALSE(is_name_letter(U'中'));
}

TEST(Unicode, ScriptOfDistinguishesLookAlikes) {
    EXPECT_EQ(script_of(U'a'), Script::Latin);
    EXPECT_EQ(script_of(U'а'), Script::Cyrillic);
    EXPECT_EQ(script_of(U'ο'), Script::Greek);
    EXPECT_EQ(script_of(U'-'), Script::Common);
    EXPECT_STREQ(script_name(Script::Cyrillic), "cyrillic");
}

TEST(Unicode, FoldingMappings) {
    EXPECT_EQ(fold_case(U'B'), U'b');
    EXPECT_EQ(fold_case(U'É'), U'é');
    EXPECT_EQ(fold_fullwidth(U'Ａ'), U'A');
    EXPECT_EQ(strip_diacritic(U'é'), U'e');
    EXPECT_EQ(strip_diacritic(U'ł'), U'l');
    EXPECT_EQ(canonical_punctuation(U'’'), U'\'');
    EXPECT_EQ(canonical_punctuation(U'–'), U'-');
}

TEST(Unicode, ConfusableFoldMapsOnlyLookAlikes) {
    EXPECT_EQ(fold_confusable(U'\u0430'), U'a');
    EXPECT_EQ(fold_confusable(U'\u0455'), U's');
    EXPECT_EQ(fold_confusable(U'\u0445'), U'x');
    EXPECT_EQ(fold_confusable(U'\u03BF'), U'o');
    EXPECT_EQ(fold_confusable(U'\u03C1'), U'p');
    EXPECT_EQ(fold_confusable(U'\u0436'), U'\u0436');
    EXPECT_EQ(fold_confusable(U'\u03BB'), U'\u03BB');
    EXPECT_EQ(fold_confusable(U'a'), U'a');
    EXPECT_EQ(fold_confusable(fold_confusable(U'\u0440')), fold_confusable(U'\u0440'));
}

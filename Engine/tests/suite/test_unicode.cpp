/**
 * @file test_unicode.cpp
 * @brief UTF-8 decoding, script classes, case folding
 */

#include <gtest/gtest.h>
#include <utils/unicode.hpp>

using namespace Lexigraph;

TEST(UnicodeTest, RoundTrip) {
    const std::string text = "abc 猫 ñ 😀";
    std::u32string cps = utf8_to_utf32(text);
    ASSERT_EQ(cps.size(), 9u);
    EXPECT_EQ(cps[4], U'猫');
    EXPECT_EQ(cps[8], static_cast<char32_t>(0x1F600));
    EXPECT_EQ(utf32_to_utf8(cps), text);
}

TEST(UnicodeTest, InvalidBytesSkipped) {
    std::string bad = "a\xFF" "b\x80" "c";
    EXPECT_EQ(utf32_to_utf8(utf8_to_utf32(bad)), "abc");

    std::string truncated = "ok\xE7\x8C";
    EXPECT_EQ(utf32_to_utf8(utf8_to_utf32(truncated)), "ok");
}

TEST(UnicodeTest, ValidUtf8DropsSurrogatesAndOutOfRange) {
    EXPECT_EQ(valid_utf8("x\xED\xA0\x80y"), "xy");
    EXPECT_EQ(valid_utf8("x\xF5\x80\x80\x80y"), "xy");
    EXPECT_EQ(valid_utf8("猫\xFE.txt"), "猫.txt");
    EXPECT_EQ(valid_utf8("\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");
}

TEST(UnicodeTest, ScriptClasses) {
    EXPECT_EQ(script_class(U'a'), ScriptClass::Latin);
    EXPECT_EQ(script_class(U'7'), ScriptClass::Latin);
    EXPECT_EQ(script_class(U'猫'), ScriptClass::Han);
    EXPECT_EQ(script_class(U'が'), ScriptClass::Hiragana);
    EXPECT_EQ(script_class(U'ネ'), ScriptClass::Katakana);
    EXPECT_EQ(script_class(U'한'), ScriptClass::Hangul);
    EXPECT_EQ(script_class(U'Ω'), ScriptClass::Greek);
    EXPECT_EQ(script_class(U'Ж'), ScriptClass::Cyrillic);
    EXPECT_EQ(script_class(U'。'), ScriptClass::None);
    EXPECT_EQ(script_class(U' '), ScriptClass::None);
}

TEST(UnicodeTest, CaseFolding) {
    EXPECT_EQ(fold_case_utf8("HeLLo"), "hello");
    EXPECT_EQ(fold_case_utf8("ÉCOLE"), "école");
    EXPECT_EQ(fold_case_utf8("ΑΒΓ"), "αβγ");
    EXPECT_EQ(fold_case_utf8("ЖУК"), "жук");
    EXPECT_EQ(fold_case_utf8("ＡＢＣ"), "ａｂｃ");
    EXPECT_EQ(fold_case_utf8("猫"), "猫");
}

TEST(UnicodeTest, TrimIncludesIdeographicSpace) {
    EXPECT_EQ(utf32_to_utf8(trim(U"　 text\t\n")), "text");
    EXPECT_TRUE(trim(U"   ").empty());
}

TEST(UnicodeTest, LanguageGuess) {
    EXPECT_EQ(detect_language(utf8_to_utf32("猫が座った")), "ja");
    EXPECT_EQ(detect_language(utf8_to_utf32("The cat sat")), "en");
    EXPECT_EQ(detect_language(utf8_to_utf32("...")), "unknown");
}

/**
 * @file tokenizer.hpp
 * @brief Script-run tokenizer
 *
 * A token is a maximal run of code points of one script class (Latin letters
 * and digits, Han, Hiragana, Katakana, Hangul, Greek, Cyrillic). Everything
 * else separates tokens. No dictionary, so Japanese splits at script
 * changes: "猫が座った" → 猫 / が / 座 / った.
 */

#pragma once

#include <utils/unicode.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace Lexigraph {

struct Token {
    std::u32string surface;   // As it appeared
    std::u32string folded;    // Case-folded, used as lookup key
    ScriptClass script;
    uint32_t position;        // Code point offset in the source
};

std::vector<Token> tokenize(const std::u32string& text);

inline std::vector<Token> tokenize(const std::string& utf8) {
    return tokenize(utf8_to_utf32(utf8));
}

} // namespace Lexigraph

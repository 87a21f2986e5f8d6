#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace Lexigraph {

/**
 * @brief UTF-8 to UTF-32 conversion.
 *
 * Invalid start bytes are skipped, so any byte input normalizes to a
 * well-formed code point sequence.
 */
inline std::u32string utf8_to_utf32(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
        else { ++i; continue; } // Invalid start byte

        if (i + len > s.size()) break; // Truncated tail

        bool valid = true;
        for (size_t j = 1; j < len; ++j) {
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) { valid = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) { ++i; continue; }

        out.push_back(cp);
        i += len;
    }
    return out;
}

inline std::string utf32_to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char32_t cp : s) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

/// Drops bytes that do not form valid UTF-8 (including encoded surrogates).
inline std::string valid_utf8(const std::string& s) {
    return utf32_to_utf8(utf8_to_utf32(s));
}

/**
 * @brief Script class of a code point, as used by the tokenizer.
 *
 * A token is a maximal run of one class. Digits group with Latin.
 */
enum class ScriptClass : uint8_t {
    None = 0,
    Latin,
    Greek,
    Cyrillic,
    Han,
    Hiragana,
    Katakana,
    Hangul
};

inline ScriptClass script_class(char32_t cp) {
    if ((cp >= U'0' && cp <= U'9') || (cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z'))
        return ScriptClass::Latin;
    if (cp < 0x80) return ScriptClass::None;
    if (cp >= 0xC0 && cp <= 0x24F && cp != 0xD7 && cp != 0xF7) return ScriptClass::Latin;
    if ((cp >= 0xFF10 && cp <= 0xFF19) || (cp >= 0xFF21 && cp <= 0xFF3A) || (cp >= 0xFF41 && cp <= 0xFF5A))
        return ScriptClass::Latin;
    if (cp >= 0x370 && cp <= 0x3FF && cp != 0x37E && cp != 0x387) return ScriptClass::Greek;
    if (cp >= 0x400 && cp <= 0x4FF) return ScriptClass::Cyrillic;
    if ((cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
        (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0x20000 && cp <= 0x2FA1F) ||
        cp == 0x3005 || cp == 0x3006)
        return ScriptClass::Han;
    if (cp >= 0x3041 && cp <= 0x309F) return ScriptClass::Hiragana;
    if ((cp >= 0x30A1 && cp <= 0x30FF && cp != 0x30FB) || (cp >= 0x31F0 && cp <= 0x31FF) ||
        (cp >= 0xFF66 && cp <= 0xFF9F))
        return ScriptClass::Katakana;
    if ((cp >= 0xAC00 && cp <= 0xD7AF) || (cp >= 0x1100 && cp <= 0x11FF) || (cp >= 0x3130 && cp <= 0x318F))
        return ScriptClass::Hangul;
    return ScriptClass::None;
}

/**
 * @brief Simple case folding (upper → lower).
 *
 * Covers ASCII, Latin-1, Latin Extended-A pairs, Greek, Cyrillic and
 * full-width Latin. Scripts without case pass through.
 */
inline char32_t fold_case(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    if (cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;
    return cp;
}

inline std::u32string fold_case(const std::u32string& s) {
    std::u32string out(s);
    for (auto& cp : out) cp = fold_case(cp);
    return out;
}

inline std::string fold_case_utf8(const std::string& s) {
    return utf32_to_utf8(fold_case(utf8_to_utf32(s)));
}

inline bool is_space(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\v' || cp == U'\f' ||
           cp == 0xA0 || cp == 0x3000 || (cp >= 0x2000 && cp <= 0x200B);
}

inline std::u32string trim(const std::u32string& s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

/**
 * @brief Guess a language tag from the dominant script.
 * @return "ja" when Han and kana dominate, "en" when Latin does, else "unknown"
 */
inline std::string detect_language(const std::u32string& text) {
    size_t latin = 0, japanese = 0, other = 0;
    for (char32_t cp : text) {
        switch (script_class(cp)) {
            case ScriptClass::Latin: ++latin; break;
            case ScriptClass::Han:
            case ScriptClass::Hiragana:
            case ScriptClass::Katakana: ++japanese; break;
            case ScriptClass::None: break;
            default: ++other; break;
        }
    }
    if (japanese > latin && japanese > other) return "ja";
    if (latin > japanese && latin > other) return "en";
    return "unknown";
}

} // namespace Lexigraph

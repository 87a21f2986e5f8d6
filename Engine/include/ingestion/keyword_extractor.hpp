/**
 * @file keyword_extractor.hpp
 * @brief Frequency-based salient term extraction
 *
 * Filters the token stream (stopwords, per-script minimum length), counts
 * term frequencies and returns the top N. Ties keep first-occurrence order,
 * so the same tokenizer output always yields the same list.
 */

#pragma once

#include <ingestion/tokenizer.hpp>
#include <string>
#include <vector>
#include <unordered_set>
#include <cstdint>

namespace Lexigraph {

/**
 * @brief Salient term with frequency data
 */
struct Keyword {
    std::u32string folded;       // Case-folded term (dedup key)
    std::u32string surface;      // Surface form of the first occurrence
    uint32_t frequency = 0;
    uint32_t first_position = 0; // Code point offset of the first occurrence
};

/**
 * @brief Configuration for keyword extraction
 */
struct KeywordConfig {
    uint32_t min_length_han = 1;       // Single ideographs carry meaning
    uint32_t min_length_katakana = 2;
    uint32_t min_length_default = 3;   // Latin, kana runs, everything else
    std::unordered_set<std::u32string> stopwords = default_stopwords();

    static std::unordered_set<std::u32string> default_stopwords();
};

class KeywordExtractor {
public:
    explicit KeywordExtractor(KeywordConfig config = KeywordConfig());

    /**
     * @brief Top terms of a token stream
     * @param top_n Maximum number of terms returned
     */
    std::vector<Keyword> extract(const std::vector<Token>& tokens, size_t top_n) const;

    std::vector<Keyword> extract(const std::u32string& text, size_t top_n) const {
        return extract(tokenize(text), top_n);
    }

    /**
     * @brief Whether a token survives stopword and length filtering
     */
    bool is_salient(const Token& token) const;

    const KeywordConfig& config() const { return config_; }

private:
    uint32_t min_length(ScriptClass script) const;

    KeywordConfig config_;
};

} // namespace Lexigraph

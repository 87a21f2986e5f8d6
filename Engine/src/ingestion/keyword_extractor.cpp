/**
 * @file keyword_extractor.cpp
 * @brief Frequency counting over the filtered token stream
 */

#include <ingestion/keyword_extractor.hpp>
#include <algorithm>
#include <unordered_map>

namespace Lexigraph {

std::unordered_set<std::u32string> KeywordConfig::default_stopwords() {
    return {
        // English function words
        U"the", U"and", U"for", U"are", U"with", U"that", U"this", U"from", U"have", U"has",
        U"were", U"was", U"been", U"their", U"which", U"such", U"into", U"there", U"here",
        U"also", U"these", U"some", U"when", U"than", U"then", U"over", U"under", U"while",
        U"each", U"other", U"they", U"them", U"our", U"your", U"what", U"where", U"who",
        U"will", U"shall", U"would", U"could", U"should", U"not", U"but", U"you", U"his",
        U"her", U"its", U"had", U"she", U"him", U"all", U"one",
        // Japanese function words long enough to pass the length filter
        U"ところ", U"それから", U"けれど", U"しかし", U"ました", U"ている", U"でした",
        U"ません", U"ですが", U"という", U"ような", U"これは", U"それは", U"だった",
        U"こと", U"もの", U"ため", U"よう",
    };
}

KeywordExtractor::KeywordExtractor(KeywordConfig config) : config_(std::move(config)) {}

uint32_t KeywordExtractor::min_length(ScriptClass script) const {
    switch (script) {
        case ScriptClass::Han:      return config_.min_length_han;
        case ScriptClass::Katakana: return config_.min_length_katakana;
        default:                    return config_.min_length_default;
    }
}

bool KeywordExtractor::is_salient(const Token& token) const {
    if (token.folded.size() < min_length(token.script)) return false;
    return config_.stopwords.find(token.folded) == config_.stopwords.end();
}

std::vector<Keyword> KeywordExtractor::extract(const std::vector<Token>& tokens, size_t top_n) const {
    std::vector<Keyword> terms;   // First-occurrence order
    std::unordered_map<std::u32string, size_t> index;

    for (const auto& tok : tokens) {
        if (!is_salient(tok)) continue;
        auto [it, inserted] = index.try_emplace(tok.folded, terms.size());
        if (inserted) {
            terms.push_back({tok.folded, tok.surface, 0, tok.position});
        }
        terms[it->second].frequency++;
    }

    std::stable_sort(terms.begin(), terms.end(), [](const Keyword& a, const Keyword& b) {
        return a.frequency > b.frequency;
    });
    if (terms.size() > top_n) terms.resize(top_n);
    return terms;
}

} // namespace Lexigraph

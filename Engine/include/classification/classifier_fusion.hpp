/**
 * @file classifier_fusion.hpp
 * @brief Two-taxonomy document classification and concept-weight fusion
 *
 * Three normalization policies live here and share one rule: a zero total
 * never produces a zero vector, it produces a uniform distribution and
 * raises a fallback flag.
 *
 *   taxonomy score   = matched keywords / total matched keywords
 *   concept weights  = Σ top-category sub-distribution × score
 *                    + lexical marker densities, renormalized
 *
 * Pure computation: no I/O, no logging.
 */

#pragma once

#include <classification/concept_weights.hpp>
#include <classification/taxonomy.hpp>
#include <ingestion/tokenizer.hpp>
#include <string>
#include <vector>

namespace Lexigraph {

struct RankedCategory {
    std::string code;
    std::string name;
    double score = 0.0;
    uint32_t matches = 0;
};

/**
 * @brief Result of scoring one taxonomy
 */
struct TaxonomyScores {
    std::string scheme;
    std::vector<double> scores;          // One per category, declaration order, sums to 1
    std::vector<RankedCategory> top;     // Best first, ties by declaration order
    bool fallback = false;               // No keyword matched; scores are uniform
};

struct Classification {
    TaxonomyScores primary;              // NDC unless replaced
    TaxonomyScores secondary;            // Kindle unless replaced
    ConceptVector concepts = uniform_concepts();
    bool concept_fallback = false;       // All raw contributions were zero

    bool any_fallback() const { return primary.fallback || secondary.fallback || concept_fallback; }
};

/**
 * @brief Lexical marker lists for the density features
 */
struct FusionConfig {
    size_t top_k = 3;
    double feature_scale = 1.0;          // Multiplier on the density features
    std::vector<std::u32string> temporal_markers = {
        U"時", U"日", U"年", U"今", U"昔", U"未来", U"過去", U"時間",
        U"when", U"time", U"yesterday", U"tomorrow"
    };
    std::vector<std::u32string> spatial_markers = {
        U"場所", U"ここ", U"そこ", U"上", U"下", U"中", U"外",
        U"where", U"place", U"location", U"here", U"there"
    };
    std::vector<std::u32string> emotion_markers = {
        U"嬉しい", U"悲しい", U"怒り", U"喜び", U"心", U"感情", U"笑",
        U"happy", U"sad", U"angry", U"joy", U"emotion"
    };
};

class ClassifierFusion {
public:
    explicit ClassifierFusion(Taxonomy primary = Taxonomy::ndc(),
                              Taxonomy secondary = Taxonomy::kindle(),
                              FusionConfig config = FusionConfig());

    /**
     * @brief Classify a token stream with its source text.
     * @param tokens Output of tokenize(text)
     * @param text Source text, used for the density features
     */
    Classification classify(const std::vector<Token>& tokens, const std::u32string& text) const;

    Classification classify(const std::u32string& text) const {
        return classify(tokenize(text), text);
    }

    /**
     * @brief Score one taxonomy against a set of case-folded tokens.
     */
    TaxonomyScores score(const Taxonomy& taxonomy, const std::vector<Token>& tokens) const;

    /**
     * @brief Temporal, spatial and emotion marker densities per code point.
     *
     * Other concept keys are zero.
     */
    ConceptVector lexical_features(const std::u32string& text) const;

    const Taxonomy& primary() const { return primary_; }
    const Taxonomy& secondary() const { return secondary_; }

private:
    Taxonomy primary_;
    Taxonomy secondary_;
    FusionConfig config_;
};

} // namespace Lexigraph

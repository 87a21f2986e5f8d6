/**
 * @file classifier_fusion.cpp
 * @brief Keyword-overlap scoring, stable top-k ranking, concept fusion
 */

#include <classification/classifier_fusion.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace Lexigraph {

namespace {

size_t count_occurrences(const std::u32string& haystack, const std::u32string& needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::u32string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

ClassifierFusion::ClassifierFusion(Taxonomy primary, Taxonomy secondary, FusionConfig config)
    : primary_(std::move(primary)), secondary_(std::move(secondary)), config_(std::move(config)) {}

TaxonomyScores ClassifierFusion::score(const Taxonomy& taxonomy, const std::vector<Token>& tokens) const {
    std::unordered_set<std::string> token_set;
    token_set.reserve(tokens.size());
    for (const auto& tok : tokens) token_set.insert(utf32_to_utf8(tok.folded));

    const auto& cats = taxonomy.categories();
    const size_t n = cats.size();

    std::vector<uint32_t> matches(n, 0);
    uint64_t total = 0;
    for (size_t i = 0; i < n; ++i) {
        for (const auto& kw : cats[i].keywords) {
            if (token_set.count(kw)) matches[i]++;
        }
        total += matches[i];
    }

    TaxonomyScores out;
    out.scheme = taxonomy.scheme();
    out.scores.resize(n);
    if (total == 0) {
        out.fallback = true;
        std::fill(out.scores.begin(), out.scores.end(), 1.0 / static_cast<double>(n));
    } else {
        for (size_t i = 0; i < n; ++i) {
            out.scores[i] = static_cast<double>(matches[i]) / static_cast<double>(total);
        }
    }

    // Rank by score; stable_sort keeps declaration order among equal scores.
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return out.scores[a] > out.scores[b];
    });

    const size_t k = std::min(config_.top_k, n);
    out.top.reserve(k);
    for (size_t r = 0; r < k; ++r) {
        const size_t i = order[r];
        out.top.push_back({cats[i].code, cats[i].name, out.scores[i], matches[i]});
    }
    return out;
}

ConceptVector ClassifierFusion::lexical_features(const std::u32string& text) const {
    ConceptVector features = ConceptVector::Zero();
    if (text.empty()) return features;

    const std::u32string folded = fold_case(text);
    const double length = static_cast<double>(folded.size());

    auto density = [&](const std::vector<std::u32string>& markers) {
        size_t hits = 0;
        for (const auto& m : markers) hits += count_occurrences(folded, m);
        return static_cast<double>(hits) / length;
    };

    features[static_cast<Eigen::Index>(*concept_index("temporal"))] = density(config_.temporal_markers);
    features[static_cast<Eigen::Index>(*concept_index("spatial"))] = density(config_.spatial_markers);
    features[static_cast<Eigen::Index>(*concept_index("emotion"))] = density(config_.emotion_markers);
    return features * config_.feature_scale;
}

Classification ClassifierFusion::classify(const std::vector<Token>& tokens, const std::u32string& text) const {
    Classification result;
    result.primary = score(primary_, tokens);
    result.secondary = score(secondary_, tokens);

    ConceptVector raw = ConceptVector::Zero();

    // A taxonomy in fallback has no signal; its arbitrary first category must not leak weight.
    auto contribute = [&](const Taxonomy& taxonomy, const TaxonomyScores& scores) {
        if (scores.fallback || scores.top.empty()) return;
        const auto& best = scores.top.front();
        for (const auto& cat : taxonomy.categories()) {
            if (cat.code == best.code) {
                raw += cat.concepts * best.score;
                break;
            }
        }
    };
    contribute(primary_, result.primary);
    contribute(secondary_, result.secondary);

    raw += lexical_features(text);

    result.concepts = normalize_concepts(raw, &result.concept_fallback);
    return result;
}

} // namespace Lexigraph

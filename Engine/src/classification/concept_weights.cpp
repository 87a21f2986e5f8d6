#include <classification/concept_weights.hpp>

namespace Lexigraph {

std::optional<size_t> concept_index(std::string_view key) {
    for (size_t i = 0; i < kConceptCount; ++i) {
        if (kConceptKeys[i] == key) return i;
    }
    return std::nullopt;
}

ConceptVector uniform_concepts() {
    return ConceptVector::Constant(1.0 / static_cast<double>(kConceptCount));
}

ConceptVector normalize_concepts(const ConceptVector& raw, bool* fell_back) {
    // Negative contributions are not meaningful; clamp before summing.
    ConceptVector clamped = raw.cwiseMax(0.0);
    const double total = clamped.sum();

    if (!(total > 0.0)) {
        if (fell_back) *fell_back = true;
        return uniform_concepts();
    }
    if (fell_back) *fell_back = false;
    return clamped / total;
}

size_t dominant_concept(const ConceptVector& weights) {
    size_t best = 0;
    for (size_t i = 1; i < kConceptCount; ++i) {
        if (weights[static_cast<Eigen::Index>(i)] > weights[static_cast<Eigen::Index>(best)]) best = i;
    }
    return best;
}

} // namespace Lexigraph

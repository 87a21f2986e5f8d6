/**
 * @file concept_weights.hpp
 * @brief Fixed concept key set and normalized weight vectors over it
 */

#pragma once

#include <Eigen/Core>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace Lexigraph {

inline constexpr size_t kConceptCount = 14;

/// Concept keys in declaration order. Index order is the tie-break order.
inline constexpr std::array<std::string_view, kConceptCount> kConceptKeys = {
    "temporal", "spatial", "emotion", "sensation", "natural",
    "relationship", "causality", "action",
    "narrative_structure", "character_function", "discourse_structure",
    "story_classification", "food_culture",
    "indirect_emotion"
};

using ConceptVector = Eigen::Matrix<double, static_cast<int>(kConceptCount), 1>;

/**
 * @brief Look up a concept key.
 * @return index into kConceptKeys, or nullopt if unknown
 */
std::optional<size_t> concept_index(std::string_view key);

/// 1/kConceptCount everywhere.
ConceptVector uniform_concepts();

/**
 * @brief Scale to sum 1, or fall back to uniform when the sum is not positive.
 * @param fell_back Set to true when the uniform fallback was taken
 */
ConceptVector normalize_concepts(const ConceptVector& raw, bool* fell_back = nullptr);

/**
 * @brief Arg-max index; ties go to the earliest declared key.
 */
size_t dominant_concept(const ConceptVector& weights);

inline std::string_view dominant_concept_key(const ConceptVector& weights) {
    return kConceptKeys[dominant_concept(weights)];
}

} // namespace Lexigraph

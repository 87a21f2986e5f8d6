#pragma once

#include <classification/classifier_fusion.hpp>
#include <classification/concept_weights.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Lexigraph {

/**
 * @brief Opaque reference to a vector held by an external embedding service.
 */
struct EmbeddingHandle {
    std::string model;
    std::string ref;

    bool operator==(const EmbeddingHandle& other) const {
        return model == other.model && ref == other.ref;
    }
};

struct DocumentNode {
    std::string id;
    std::string title;
    std::string source_path;
    std::string fingerprint;                 // BLAKE3 hex of the raw bytes
    uint64_t ingested_at_ms = 0;             // ID epoch: the timestamp field of id, frozen in deterministic mode
    uint64_t token_count = 0;                // Hint only
    std::string language = "unknown";        // ja | en | unknown
    std::vector<RankedCategory> ndc;         // Top-3, best first
    std::vector<RankedCategory> kindle;
    ConceptVector concepts = uniform_concepts();
};

struct SegmentNode {
    std::string id;
    uint32_t ordinal = 0;
    std::vector<std::string> key_terms;      // Top-5 across member sentences
    std::vector<std::string> sentence_ids;   // Members, in order
};

struct SentenceNode {
    std::string id;
    uint32_t ordinal = 0;                    // Document-global
    std::string segment_id;
    ConceptVector concepts = uniform_concepts();
    std::optional<EmbeddingHandle> embedding;
};

struct EntityNode {
    std::string id;
    std::string label;                       // Case-folded, unique per document
    std::string type = "concept";
    ConceptVector concepts = uniform_concepts();
    std::vector<EmbeddingHandle> embeddings;
};

struct Mention {
    std::string sentence_id;
    std::string entity_id;
    std::string surface;                     // As written in the sentence
    std::string concept_key;                 // Entity's dominant concept at creation
    double weight = 1.0;
};

/**
 * @brief Everything one document contributes to the graph.
 */
struct DocumentGraph {
    DocumentNode document;
    std::vector<SegmentNode> segments;
    std::vector<SentenceNode> sentences;
    std::vector<EntityNode> entities;
    std::vector<Mention> mentions;

    size_t node_count() const {
        return 1 + document.ndc.size() + document.kindle.size() +
               segments.size() + sentences.size() + entities.size();
    }
};

} // namespace Lexigraph

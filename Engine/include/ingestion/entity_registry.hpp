/**
 * @file entity_registry.hpp
 * @brief Per-document canonical entities and their mentions
 *
 * One entity per case-folded label. The first occurrence creates it (ID,
 * concept weights, embedding handles); later occurrences only add mentions.
 * Sentences must be fed in document order.
 */

#pragma once

#include <classification/classifier_fusion.hpp>
#include <graph/graph_model.hpp>
#include <ingestion/embedding_catalog.hpp>
#include <ingestion/id_allocator.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexigraph {

class EntityRegistry {
public:
    /**
     * @param allocator Issues entity IDs; must outlive the registry
     * @param fusion Computes entity concept weights from the label text
     * @param document_id Parent context for every entity ID
     * @param embeddings Optional handle source, may be null
     */
    EntityRegistry(IdAllocator& allocator, const ClassifierFusion& fusion,
                   std::string document_id, const EmbeddingCatalog* embeddings = nullptr,
                   std::string type_tag = "concept");

    /**
     * @brief Record one occurrence of a term in a sentence.
     * @return ID of the (new or existing) entity
     * @throws AllocatorExhaustedError if a new entity cannot get an ID
     */
    std::string register_term(const std::string& sentence_id, const std::u32string& surface);

    /// Entity ID for a label in any case, or empty if unseen.
    std::string find(const std::string& label) const;

    const std::vector<EntityNode>& entities() const { return entities_; }
    const std::vector<Mention>& mentions() const { return mentions_; }

    /// Entities whose concept weights fell back to uniform.
    size_t concept_fallbacks() const { return concept_fallbacks_; }

    std::vector<EntityNode> release_entities() { return std::move(entities_); }
    std::vector<Mention> release_mentions() { return std::move(mentions_); }

private:
    size_t create_entity(const std::string& label);

    IdAllocator& allocator_;
    const ClassifierFusion& fusion_;
    std::string document_id_;
    const EmbeddingCatalog* embeddings_;
    std::string type_tag_;

    std::unordered_map<std::string, size_t> by_label_;
    std::vector<EntityNode> entities_;
    std::vector<std::string> dominant_keys_;   // Parallel to entities_
    std::vector<Mention> mentions_;
    size_t concept_fallbacks_ = 0;
};

} // namespace Lexigraph

#include <ingestion/entity_registry.hpp>
#include <utils/unicode.hpp>

namespace Lexigraph {

EntityRegistry::EntityRegistry(IdAllocator& allocator, const ClassifierFusion& fusion,
                               std::string document_id, const EmbeddingCatalog* embeddings,
                               std::string type_tag)
    : allocator_(allocator),
      fusion_(fusion),
      document_id_(std::move(document_id)),
      embeddings_(embeddings),
      type_tag_(std::move(type_tag)) {}

size_t EntityRegistry::create_entity(const std::string& label) {
    const uint32_t index = static_cast<uint32_t>(entities_.size());

    EntityNode entity;
    entity.id = allocator_.entity_id(document_id_, index, type_tag_);
    entity.label = label;
    entity.type = type_tag_;

    const Classification c = fusion_.classify(utf8_to_utf32(label));
    entity.concepts = c.concepts;
    if (c.concept_fallback) concept_fallbacks_++;

    if (embeddings_) entity.embeddings = embeddings_->for_entity(label);

    dominant_keys_.emplace_back(dominant_concept_key(entity.concepts));
    entities_.push_back(std::move(entity));
    by_label_.emplace(label, index);
    return index;
}

std::string EntityRegistry::register_term(const std::string& sentence_id, const std::u32string& surface) {
    const std::string label = utf32_to_utf8(fold_case(surface));

    size_t index;
    auto it = by_label_.find(label);
    if (it == by_label_.end()) {
        index = create_entity(label);
    } else {
        index = it->second;
    }

    Mention m;
    m.sentence_id = sentence_id;
    m.entity_id = entities_[index].id;
    m.surface = utf32_to_utf8(surface);
    m.concept_key = dominant_keys_[index];
    m.weight = 1.0;
    mentions_.push_back(std::move(m));

    return entities_[index].id;
}

std::string EntityRegistry::find(const std::string& label) const {
    auto it = by_label_.find(fold_case_utf8(label));
    return it == by_label_.end() ? std::string() : entities_[it->second].id;
}

} // namespace Lexigraph

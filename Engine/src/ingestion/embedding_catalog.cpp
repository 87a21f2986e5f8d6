#include <ingestion/embedding_catalog.hpp>
#include <errors.hpp>
#include <utils/unicode.hpp>
#include <charconv>
#include <fstream>

namespace Lexigraph {

namespace {

EmbeddingHandle parse_handle(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object() || !j.contains("model") || !j.contains("ref")) {
        throw ConfigError("Embedding handle for " + where + " needs \"model\" and \"ref\"");
    }
    if (!j["model"].is_string() || !j["ref"].is_string()) {
        throw ConfigError("Embedding handle for " + where + " must use string fields");
    }
    return {j["model"].get<std::string>(), j["ref"].get<std::string>()};
}

uint32_t parse_ordinal(const std::string& key) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
    if (key.empty() || ec != std::errc() || ptr != key.data() + key.size()) {
        throw ConfigError("Sentence embedding key is not an ordinal: '" + key + "'");
    }
    return value;
}

} // namespace

EmbeddingCatalog EmbeddingCatalog::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) throw ConfigError("Embedding catalog must be a JSON object");

    EmbeddingCatalog catalog;

    if (doc.contains("sentences")) {
        const auto& sentences = doc["sentences"];
        if (!sentences.is_object()) throw ConfigError("\"sentences\" must be an object");
        for (auto it = sentences.begin(); it != sentences.end(); ++it) {
            catalog.set_sentence(parse_ordinal(it.key()), parse_handle(it.value(), "sentence " + it.key()));
        }
    }

    if (doc.contains("entities")) {
        const auto& entities = doc["entities"];
        if (!entities.is_object()) throw ConfigError("\"entities\" must be an object");
        for (auto it = entities.begin(); it != entities.end(); ++it) {
            const auto& list = it.value();
            if (list.is_array()) {
                for (const auto& h : list) catalog.add_entity(it.key(), parse_handle(h, "entity " + it.key()));
            } else {
                catalog.add_entity(it.key(), parse_handle(list, "entity " + it.key()));
            }
        }
    }

    return catalog;
}

EmbeddingCatalog EmbeddingCatalog::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("Cannot open embedding catalog: " + path.string());
    try {
        return from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse embedding catalog " + path.string() + ": " + e.what());
    }
}

void EmbeddingCatalog::set_sentence(uint32_t ordinal, EmbeddingHandle handle) {
    sentences_[ordinal] = std::move(handle);
}

void EmbeddingCatalog::add_entity(const std::string& label, EmbeddingHandle handle) {
    entities_[fold_case_utf8(label)].push_back(std::move(handle));
}

std::optional<EmbeddingHandle> EmbeddingCatalog::for_sentence(uint32_t ordinal) const {
    auto it = sentences_.find(ordinal);
    if (it == sentences_.end()) return std::nullopt;
    return it->second;
}

std::vector<EmbeddingHandle> EmbeddingCatalog::for_entity(const std::string& label) const {
    auto it = entities_.find(fold_case_utf8(label));
    if (it == entities_.end()) return {};
    return it->second;
}

} // namespace Lexigraph

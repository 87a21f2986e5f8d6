/**
 * @file embedding_catalog.hpp
 * @brief Externally supplied embedding handles for one document
 *
 * Sidecar format:
 *   {
 *     "sentences": { "<ordinal>": {"model": "...", "ref": "..."} },
 *     "entities":  { "<label>": [ {"model": "...", "ref": "..."} ] }
 *   }
 *
 * Entity labels are case-folded on load so they match registry keys.
 * Vectors never pass through here, only their handles.
 */

#pragma once

#include <graph/graph_model.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexigraph {

class EmbeddingCatalog {
public:
    EmbeddingCatalog() = default;

    /// @throws ConfigError on malformed input
    static EmbeddingCatalog from_json(const nlohmann::json& doc);

    /// @throws ConfigError if the file cannot be read or parsed
    static EmbeddingCatalog load_file(const std::filesystem::path& path);

    void set_sentence(uint32_t ordinal, EmbeddingHandle handle);
    void add_entity(const std::string& label, EmbeddingHandle handle);

    std::optional<EmbeddingHandle> for_sentence(uint32_t ordinal) const;

    /// Handles for a label in any case; empty if none.
    std::vector<EmbeddingHandle> for_entity(const std::string& label) const;

    bool empty() const { return sentences_.empty() && entities_.empty(); }

private:
    std::unordered_map<uint32_t, EmbeddingHandle> sentences_;
    std::unordered_map<std::string, std::vector<EmbeddingHandle>> entities_;
};

} // namespace Lexigraph

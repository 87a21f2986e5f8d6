/**
 * @file record_codec.hpp
 * @brief DocumentGraph <-> JSON document record
 *
 * The record is the durable artifact; a creation script can always be
 * re-emitted from it. Field order is fixed (ordered_json) so identical
 * graphs serialize to identical bytes.
 */

#pragma once

#include <graph/graph_model.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace Lexigraph {

inline constexpr const char* kRecordFormat = "lexigraph.record/1";

nlohmann::ordered_json concepts_to_json(const ConceptVector& weights);

/// @throws IntegrityError if a key is missing or a weight is not a number
ConceptVector concepts_from_json(const nlohmann::ordered_json& j);

nlohmann::ordered_json record_to_json(const DocumentGraph& graph);

/**
 * @brief Rebuild the graph from a record.
 * @throws IntegrityError on a missing field, wrong type or unknown format tag
 */
DocumentGraph record_from_json(const nlohmann::ordered_json& record);

/// @throws SourceReadError if the file cannot be opened, IntegrityError if it does not parse
DocumentGraph load_record(const std::filesystem::path& path);

} // namespace Lexigraph

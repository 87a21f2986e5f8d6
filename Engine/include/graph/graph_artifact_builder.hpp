/**
 * @file graph_artifact_builder.hpp
 * @brief Validated document record + Cypher creation script
 *
 * Script layout:
 *
 *   constraints
 *   :begin
 *   :param doc => {...}          MERGE (n:Document ...)
 *   :param tag_ndc_0 => {...}    MERGE (n:TagCatalog ...)
 *   :param seg_0000 => {...}     MERGE (n:Segment ...)
 *   :param sen_0000 => {...}     MERGE (n:Sentence ...)
 *   :param ent_0000 => {...}     MERGE (n:Entity ...)
 *   :param rel_00000 => {...}    MATCH ... MERGE relationship
 *   :commit
 *
 * All nodes precede all relationships, and parameter names depend only on
 * node kind and ordinal, so the same graph always yields the same bytes.
 */

#pragma once

#include <graph/graph_model.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace Lexigraph {

struct GraphArtifact {
    nlohmann::ordered_json record;
    std::string script;
    size_t node_statements = 0;
    size_t relationship_statements = 0;
};

/**
 * @brief Render a JSON value as a Cypher literal.
 *
 * Strings are single-quoted with backslash escapes; object keys that are
 * not plain identifiers are back-quoted.
 */
std::string cypher_literal(const nlohmann::ordered_json& value);

class GraphArtifactBuilder {
public:
    /**
     * @brief Validate, then produce the record and the script.
     * @throws IntegrityError if the graph violates a structural invariant
     */
    GraphArtifact build(const DocumentGraph& graph) const;

    /**
     * @brief Structural checks run before anything is emitted.
     *
     *  - IDs are unique across all nodes
     *  - segment and sentence ordinals run 0..n-1 in order
     *  - segment membership lists partition the sentences in order, and
     *    each sentence's parent matches the list that holds it
     *  - both taxonomy lists are non-empty
     *  - mentions reference known sentences and entities
     *
     * @throws IntegrityError naming the first violation
     */
    static void validate(const DocumentGraph& graph);

    /// Script only, no validation.
    static std::string emit_script(const DocumentGraph& graph,
                                   size_t* node_statements = nullptr,
                                   size_t* relationship_statements = nullptr);
};

} // namespace Lexigraph

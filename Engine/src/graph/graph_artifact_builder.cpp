/**
 * @file graph_artifact_builder.cpp
 * @brief Integrity validation and Cypher emission
 */

#include <graph/graph_artifact_builder.hpp>
#include <graph/record_codec.hpp>
#include <errors.hpp>
#include <cstdio>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace Lexigraph {

using ojson = nlohmann::ordered_json;

namespace {

const char* const kConstraints[] = {
    "CREATE CONSTRAINT lexigraph_document_id IF NOT EXISTS FOR (n:Document) REQUIRE n.id IS UNIQUE;",
    "CREATE CONSTRAINT lexigraph_segment_id IF NOT EXISTS FOR (n:Segment) REQUIRE n.id IS UNIQUE;",
    "CREATE CONSTRAINT lexigraph_sentence_id IF NOT EXISTS FOR (n:Sentence) REQUIRE n.id IS UNIQUE;",
    "CREATE CONSTRAINT lexigraph_entity_id IF NOT EXISTS FOR (n:Entity) REQUIRE n.id IS UNIQUE;",
    "CREATE CONSTRAINT lexigraph_tag_key IF NOT EXISTS FOR (n:TagCatalog) REQUIRE (n.scheme, n.code) IS UNIQUE;",
};

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
                  (i > 0 && c >= '0' && c <= '9');
        if (!ok) return false;
    }
    return true;
}

void append_string_literal(std::string& out, const std::string& s) {
    out += '\'';
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;   // UTF-8 passes through
                }
        }
    }
    out += '\'';
}

void append_literal(std::string& out, const ojson& v) {
    switch (v.type()) {
        case ojson::value_t::object: {
            out += '{';
            bool first = true;
            for (auto it = v.begin(); it != v.end(); ++it) {
                if (!first) out += ", ";
                first = false;
                if (is_identifier(it.key())) {
                    out += it.key();
                } else {
                    out += '`';
                    for (char c : it.key()) {
                        if (c == '`') out += "``";
                        else out += c;
                    }
                    out += '`';
                }
                out += ": ";
                append_literal(out, it.value());
            }
            out += '}';
            break;
        }
        case ojson::value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& item : v) {
                if (!first) out += ", ";
                first = false;
                append_literal(out, item);
            }
            out += ']';
            break;
        }
        case ojson::value_t::string:
            append_string_literal(out, v.get<std::string>());
            break;
        case ojson::value_t::boolean:
            out += v.get<bool>() ? "true" : "false";
            break;
        case ojson::value_t::null:
        case ojson::value_t::discarded:
            out += "null";
            break;
        default:
            out += v.dump();   // Numbers: shortest round-trip form
    }
}

ojson concept_list(const ConceptVector& weights) {
    ojson arr = ojson::array();
    for (size_t i = 0; i < kConceptCount; ++i) arr.push_back(weights[static_cast<Eigen::Index>(i)]);
    return arr;
}

std::string ordinal_name(const char* stem, size_t ordinal, int width) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s_%0*zu", stem, width, ordinal);
    return buf;
}

class ScriptWriter {
public:
    void line(const std::string& s) {
        out_ += s;
        out_ += '\n';
    }

    void node(const std::string& param, const ojson& props, const std::string& merge) {
        param_line(param, props);
        line(merge);
        nodes_++;
    }

    void relationship(const ojson& props, const std::string& statement_template) {
        const std::string param = ordinal_name("rel", rels_, 5);
        param_line(param, props);
        std::string stmt = statement_template;
        for (size_t pos = stmt.find("$r."); pos != std::string::npos; pos = stmt.find("$r.", pos)) {
            stmt.replace(pos, 2, "$" + param);
            pos += param.size() + 1;
        }
        line(stmt);
        rels_++;
    }

    std::string& text() { return out_; }
    size_t nodes() const { return nodes_; }
    size_t relationships() const { return rels_; }

private:
    void param_line(const std::string& name, const ojson& props) {
        std::string s = ":param " + name + " => ";
        append_literal(s, props);
        line(s);
    }

    std::string out_;
    size_t nodes_ = 0;
    size_t rels_ = 0;
};

void emit_tags(ScriptWriter& w, const char* scheme, const char* stem,
               const std::vector<RankedCategory>& cats) {
    for (size_t i = 0; i < cats.size(); ++i) {
        const std::string p = std::string("tag_") + stem + "_" + std::to_string(i);
        w.node(p, ojson{{"scheme", scheme}, {"code", cats[i].code}, {"name", cats[i].name}},
               "MERGE (n:TagCatalog {scheme: $" + p + ".scheme, code: $" + p + ".code}) SET n.name = $" + p + ".name;");
    }
}

void emit_classified(ScriptWriter& w, const std::string& doc_id, const char* scheme,
                     const std::vector<RankedCategory>& cats) {
    for (size_t i = 0; i < cats.size(); ++i) {
        w.relationship(
            ojson{{"from", doc_id}, {"scheme", scheme}, {"code", cats[i].code},
                  {"score", cats[i].score}, {"rank", i}},
            "MATCH (a:Document {id: $r.from}), (b:TagCatalog {scheme: $r.scheme, code: $r.code}) "
            "MERGE (a)-[e:CLASSIFIED_AS {scheme: $r.scheme}]->(b) SET e.score = $r.score, e.rank = $r.rank;");
    }
}

} // namespace

std::string cypher_literal(const ojson& value) {
    std::string out;
    append_literal(out, value);
    return out;
}

void GraphArtifactBuilder::validate(const DocumentGraph& graph) {
    const auto& doc = graph.document;

    std::unordered_set<std::string> ids;
    auto claim = [&](const std::string& id, const char* what) {
        if (id.empty()) throw IntegrityError(std::string(what) + " has an empty ID");
        if (!ids.insert(id).second) throw IntegrityError("ID emitted twice: " + id);
    };

    claim(doc.id, "Document");

    if (doc.ndc.empty()) throw IntegrityError("Document " + doc.id + " has no NDC classification");
    if (doc.kindle.empty()) throw IntegrityError("Document " + doc.id + " has no Kindle classification");
    for (const auto* cats : {&doc.ndc, &doc.kindle}) {
        std::unordered_set<std::string> codes;
        for (const auto& c : *cats) {
            if (!codes.insert(c.code).second) throw IntegrityError("Category listed twice: " + c.code);
        }
    }

    if (graph.sentences.empty()) throw IntegrityError("Document " + doc.id + " has no sentences");

    std::unordered_map<std::string, size_t> sentence_index;
    for (size_t i = 0; i < graph.sentences.size(); ++i) {
        const auto& s = graph.sentences[i];
        claim(s.id, "Sentence");
        if (s.ordinal != i) {
            throw IntegrityError("Sentence ordinal gap: expected " + std::to_string(i) +
                                 ", found " + std::to_string(s.ordinal) + " (" + s.id + ")");
        }
        sentence_index.emplace(s.id, i);
    }

    // Walking the segments in order must visit every sentence once, in order.
    size_t expected_sentence = 0;
    for (size_t k = 0; k < graph.segments.size(); ++k) {
        const auto& seg = graph.segments[k];
        claim(seg.id, "Segment");
        if (seg.ordinal != k) {
            throw IntegrityError("Segment ordinal gap: expected " + std::to_string(k) +
                                 ", found " + std::to_string(seg.ordinal) + " (" + seg.id + ")");
        }
        if (seg.sentence_ids.empty()) throw IntegrityError("Segment " + seg.id + " has no sentences");
        for (const auto& sid : seg.sentence_ids) {
            auto it = sentence_index.find(sid);
            if (it == sentence_index.end()) {
                throw IntegrityError("Segment " + seg.id + " lists unknown sentence " + sid);
            }
            if (it->second != expected_sentence) {
                throw IntegrityError("Sentence " + sid + " is out of order or listed twice in segment " + seg.id);
            }
            if (graph.sentences[it->second].segment_id != seg.id) {
                throw IntegrityError("Sentence " + sid + " claims parent " +
                                     graph.sentences[it->second].segment_id + " but is listed by " + seg.id);
            }
            expected_sentence++;
        }
    }
    if (expected_sentence != graph.sentences.size()) {
        throw IntegrityError("Segments cover " + std::to_string(expected_sentence) + " of " +
                             std::to_string(graph.sentences.size()) + " sentences");
    }

    std::unordered_set<std::string> entity_ids;
    std::unordered_set<std::string> labels;
    for (const auto& e : graph.entities) {
        claim(e.id, "Entity");
        entity_ids.insert(e.id);
        if (!labels.insert(e.label).second) throw IntegrityError("Entity label registered twice: " + e.label);
    }

    for (const auto& m : graph.mentions) {
        if (!sentence_index.count(m.sentence_id)) {
            throw IntegrityError("Mention references unknown sentence " + m.sentence_id);
        }
        if (!entity_ids.count(m.entity_id)) {
            throw IntegrityError("Mention references unknown entity " + m.entity_id);
        }
    }
}

std::string GraphArtifactBuilder::emit_script(const DocumentGraph& graph,
                                              size_t* node_statements,
                                              size_t* relationship_statements) {
    const auto& doc = graph.document;
    ScriptWriter w;

    w.line("// lexigraph creation script");
    w.line("// document " + doc.id);
    for (const char* c : kConstraints) w.line(c);
    w.line(":begin");

    // Nodes
    w.node("doc",
           ojson{{"id", doc.id},
                 {"title", doc.title},
                 {"source_path", doc.source_path},
                 {"fingerprint", doc.fingerprint},
                 {"ingested_at_ms", doc.ingested_at_ms},
                 {"token_count", doc.token_count},
                 {"language", doc.language},
                 {"concepts", concept_list(doc.concepts)},
                 {"dominant_concept", std::string(dominant_concept_key(doc.concepts))}},
           "MERGE (n:Document {id: $doc.id}) SET n += $doc;");

    emit_tags(w, "NDC", "ndc", doc.ndc);
    emit_tags(w, "Kindle", "kindle", doc.kindle);

    for (const auto& seg : graph.segments) {
        const std::string p = ordinal_name("seg", seg.ordinal, 4);
        w.node(p,
               ojson{{"id", seg.id},
                     {"ordinal", seg.ordinal},
                     {"key_terms", seg.key_terms},
                     {"length_hint", seg.sentence_ids.size()}},
               "MERGE (n:Segment {id: $" + p + ".id}) SET n += $" + p + ";");
    }

    for (const auto& sen : graph.sentences) {
        const std::string p = ordinal_name("sen", sen.ordinal, 4);
        ojson props{{"id", sen.id},
                    {"ordinal", sen.ordinal},
                    {"concepts", concept_list(sen.concepts)},
                    {"dominant_concept", std::string(dominant_concept_key(sen.concepts))}};
        if (sen.embedding) {
            props["embedding_model"] = sen.embedding->model;
            props["embedding_ref"] = sen.embedding->ref;
        }
        w.node(p, props, "MERGE (n:Sentence {id: $" + p + ".id}) SET n += $" + p + ";");
    }

    for (size_t i = 0; i < graph.entities.size(); ++i) {
        const auto& ent = graph.entities[i];
        const std::string p = ordinal_name("ent", i, 4);
        ojson models = ojson::array();
        ojson refs = ojson::array();
        for (const auto& h : ent.embeddings) {
            models.push_back(h.model);
            refs.push_back(h.ref);
        }
        w.node(p,
               ojson{{"id", ent.id},
                     {"label", ent.label},
                     {"type", ent.type},
                     {"concepts", concept_list(ent.concepts)},
                     {"dominant_concept", std::string(dominant_concept_key(ent.concepts))},
                     {"embedding_models", models},
                     {"embedding_refs", refs}},
               "MERGE (n:Entity {id: $" + p + ".id}) SET n += $" + p + ";");
    }

    // Relationships
    emit_classified(w, doc.id, "NDC", doc.ndc);
    emit_classified(w, doc.id, "Kindle", doc.kindle);

    for (const auto& seg : graph.segments) {
        w.relationship(ojson{{"from", doc.id}, {"to", seg.id}, {"order", seg.ordinal}},
                       "MATCH (a:Document {id: $r.from}), (b:Segment {id: $r.to}) "
                       "MERGE (a)-[e:HAS_SEGMENT]->(b) SET e.order = $r.order;");
    }

    for (const auto& seg : graph.segments) {
        for (size_t i = 0; i < seg.sentence_ids.size(); ++i) {
            w.relationship(ojson{{"from", seg.id}, {"to", seg.sentence_ids[i]}, {"order", i}},
                           "MATCH (a:Segment {id: $r.from}), (b:Sentence {id: $r.to}) "
                           "MERGE (a)-[e:HAS_SENTENCE]->(b) SET e.order = $r.order;");
        }
    }

    for (size_t i = 1; i < graph.sentences.size(); ++i) {
        w.relationship(ojson{{"from", graph.sentences[i - 1].id}, {"to", graph.sentences[i].id}},
                       "MATCH (a:Sentence {id: $r.from}), (b:Sentence {id: $r.to}) "
                       "MERGE (a)-[:NEXT]->(b);");
    }

    for (const auto& m : graph.mentions) {
        w.relationship(ojson{{"from", m.sentence_id},
                             {"to", m.entity_id},
                             {"surface", m.surface},
                             {"concept_key", m.concept_key},
                             {"weight", m.weight}},
                       "MATCH (a:Sentence {id: $r.from}), (b:Entity {id: $r.to}) "
                       "MERGE (a)-[e:MENTIONS]->(b) "
                       "SET e.surface = $r.surface, e.concept_key = $r.concept_key, e.weight = $r.weight;");
    }

    w.line(":commit");

    if (node_statements) *node_statements = w.nodes();
    if (relationship_statements) *relationship_statements = w.relationships();
    return std::move(w.text());
}

GraphArtifact GraphArtifactBuilder::build(const DocumentGraph& graph) const {
    validate(graph);

    GraphArtifact artifact;
    artifact.record = record_to_json(graph);
    artifact.script = emit_script(graph, &artifact.node_statements, &artifact.relationship_statements);
    return artifact;
}

} // namespace Lexigraph

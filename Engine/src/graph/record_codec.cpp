#include <graph/record_codec.hpp>
#include <errors.hpp>
#include <fstream>

namespace Lexigraph {

using ojson = nlohmann::ordered_json;

namespace {

const ojson& field(const ojson& obj, const char* name) {
    if (!obj.is_object() || !obj.contains(name)) {
        throw IntegrityError(std::string("Record is missing field \"") + name + "\"");
    }
    return obj[name];
}

template <typename T>
T get(const ojson& obj, const char* name) {
    try {
        return field(obj, name).get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw IntegrityError(std::string("Record field \"") + name + "\" has the wrong type: " + e.what());
    }
}

const ojson& array_field(const ojson& obj, const char* name) {
    const ojson& arr = field(obj, name);
    if (!arr.is_array()) throw IntegrityError(std::string("Record field \"") + name + "\" must be an array");
    return arr;
}

ojson categories_to_json(const std::vector<RankedCategory>& cats) {
    ojson arr = ojson::array();
    for (const auto& c : cats) {
        arr.push_back({{"code", c.code}, {"name", c.name}, {"score", c.score}, {"matches", c.matches}});
    }
    return arr;
}

std::vector<RankedCategory> categories_from_json(const ojson& arr) {
    std::vector<RankedCategory> out;
    for (const auto& c : arr) {
        out.push_back({get<std::string>(c, "code"), get<std::string>(c, "name"),
                       get<double>(c, "score"), get<uint32_t>(c, "matches")});
    }
    return out;
}

ojson handle_to_json(const EmbeddingHandle& h) {
    return {{"model", h.model}, {"ref", h.ref}};
}

EmbeddingHandle handle_from_json(const ojson& j) {
    return {get<std::string>(j, "model"), get<std::string>(j, "ref")};
}

} // namespace

ojson concepts_to_json(const ConceptVector& weights) {
    ojson obj = ojson::object();
    for (size_t i = 0; i < kConceptCount; ++i) {
        obj[std::string(kConceptKeys[i])] = weights[static_cast<Eigen::Index>(i)];
    }
    return obj;
}

ConceptVector concepts_from_json(const ojson& j) {
    ConceptVector v;
    for (size_t i = 0; i < kConceptCount; ++i) {
        const std::string key(kConceptKeys[i]);
        v[static_cast<Eigen::Index>(i)] = get<double>(j, key.c_str());
    }
    return v;
}

ojson record_to_json(const DocumentGraph& graph) {
    const auto& d = graph.document;

    ojson record;
    record["format"] = kRecordFormat;
    record["document"] = {
        {"id", d.id},
        {"title", d.title},
        {"source_path", d.source_path},
        {"fingerprint", d.fingerprint},
        {"ingested_at_ms", d.ingested_at_ms},
        {"token_count", d.token_count},
        {"language", d.language},
        {"ndc", categories_to_json(d.ndc)},
        {"kindle", categories_to_json(d.kindle)},
        {"concepts", concepts_to_json(d.concepts)},
    };

    ojson segments = ojson::array();
    for (const auto& s : graph.segments) {
        segments.push_back({
            {"id", s.id},
            {"ordinal", s.ordinal},
            {"key_terms", s.key_terms},
            {"sentence_ids", s.sentence_ids},
        });
    }
    record["segments"] = std::move(segments);

    ojson sentences = ojson::array();
    for (const auto& s : graph.sentences) {
        sentences.push_back({
            {"id", s.id},
            {"ordinal", s.ordinal},
            {"segment_id", s.segment_id},
            {"concepts", concepts_to_json(s.concepts)},
            {"embedding", s.embedding ? handle_to_json(*s.embedding) : ojson(nullptr)},
        });
    }
    record["sentences"] = std::move(sentences);

    ojson entities = ojson::array();
    for (const auto& e : graph.entities) {
        ojson handles = ojson::array();
        for (const auto& h : e.embeddings) handles.push_back(handle_to_json(h));
        entities.push_back({
            {"id", e.id},
            {"label", e.label},
            {"type", e.type},
            {"concepts", concepts_to_json(e.concepts)},
            {"embeddings", std::move(handles)},
        });
    }
    record["entities"] = std::move(entities);

    ojson mentions = ojson::array();
    for (const auto& m : graph.mentions) {
        mentions.push_back({
            {"sentence_id", m.sentence_id},
            {"entity_id", m.entity_id},
            {"surface", m.surface},
            {"concept_key", m.concept_key},
            {"weight", m.weight},
        });
    }
    record["mentions"] = std::move(mentions);

    return record;
}

DocumentGraph record_from_json(const ojson& record) {
    const std::string format = get<std::string>(record, "format");
    if (format != kRecordFormat) {
        throw IntegrityError("Unsupported record format '" + format + "'");
    }

    DocumentGraph graph;

    const ojson& d = field(record, "document");
    auto& doc = graph.document;
    doc.id = get<std::string>(d, "id");
    doc.title = get<std::string>(d, "title");
    doc.source_path = get<std::string>(d, "source_path");
    doc.fingerprint = get<std::string>(d, "fingerprint");
    doc.ingested_at_ms = get<uint64_t>(d, "ingested_at_ms");
    doc.token_count = get<uint64_t>(d, "token_count");
    doc.language = get<std::string>(d, "language");
    doc.ndc = categories_from_json(array_field(d, "ndc"));
    doc.kindle = categories_from_json(array_field(d, "kindle"));
    doc.concepts = concepts_from_json(field(d, "concepts"));

    for (const auto& s : array_field(record, "segments")) {
        SegmentNode seg;
        seg.id = get<std::string>(s, "id");
        seg.ordinal = get<uint32_t>(s, "ordinal");
        seg.key_terms = get<std::vector<std::string>>(s, "key_terms");
        seg.sentence_ids = get<std::vector<std::string>>(s, "sentence_ids");
        graph.segments.push_back(std::move(seg));
    }

    for (const auto& s : array_field(record, "sentences")) {
        SentenceNode sen;
        sen.id = get<std::string>(s, "id");
        sen.ordinal = get<uint32_t>(s, "ordinal");
        sen.segment_id = get<std::string>(s, "segment_id");
        sen.concepts = concepts_from_json(field(s, "concepts"));
        if (s.contains("embedding") && !s["embedding"].is_null()) {
            sen.embedding = handle_from_json(s["embedding"]);
        }
        graph.sentences.push_back(std::move(sen));
    }

    for (const auto& e : array_field(record, "entities")) {
        EntityNode ent;
        ent.id = get<std::string>(e, "id");
        ent.label = get<std::string>(e, "label");
        ent.type = get<std::string>(e, "type");
        ent.concepts = concepts_from_json(field(e, "concepts"));
        for (const auto& h : array_field(e, "embeddings")) ent.embeddings.push_back(handle_from_json(h));
        graph.entities.push_back(std::move(ent));
    }

    for (const auto& m : array_field(record, "mentions")) {
        Mention mention;
        mention.sentence_id = get<std::string>(m, "sentence_id");
        mention.entity_id = get<std::string>(m, "entity_id");
        mention.surface = get<std::string>(m, "surface");
        mention.concept_key = get<std::string>(m, "concept_key");
        mention.weight = get<double>(m, "weight");
        graph.mentions.push_back(std::move(mention));
    }

    return graph;
}

DocumentGraph load_record(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) throw SourceReadError("Cannot open record: " + path.string());
    try {
        return record_from_json(ojson::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw IntegrityError("Cannot parse record " + path.string() + ": " + e.what());
    }
}

} // namespace Lexigraph

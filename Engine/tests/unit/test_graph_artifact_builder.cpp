/**
 * @file test_graph_artifact_builder.cpp
 * @brief Integrity checks, script ordering, record codec
 */

#include <gtest/gtest.h>
#include <graph/graph_artifact_builder.hpp>
#include <graph/record_codec.hpp>
#include <errors.hpp>
#include <set>
#include <sstream>

using namespace Lexigraph;
using ojson = nlohmann::ordered_json;

// Two sentences in one segment, one entity mentioned by both.
static DocumentGraph sample_graph() {
    DocumentGraph g;
    g.document.id = "D0";
    g.document.title = "It's a cat";
    g.document.source_path = "/tmp/cat.txt";
    g.document.fingerprint = "abc123";
    g.document.ingested_at_ms = 1723862400000ULL;
    g.document.token_count = 6;
    g.document.language = "ja";
    g.document.ndc = {{"900", "文学", 1.0, 1}};
    g.document.kindle = {{"Literature & Fiction", "Literature & Fiction", 1.0, 1}};

    SegmentNode seg;
    seg.id = "S0";
    seg.ordinal = 0;
    seg.key_terms = {"猫"};
    seg.sentence_ids = {"T0", "T1"};
    g.segments.push_back(seg);

    for (uint32_t i = 0; i < 2; ++i) {
        SentenceNode s;
        s.id = "T" + std::to_string(i);
        s.ordinal = i;
        s.segment_id = "S0";
        g.sentences.push_back(s);
    }
    g.sentences[1].embedding = EmbeddingHandle{"m1", "vec/1"};

    EntityNode e;
    e.id = "E0";
    e.label = "猫";
    e.embeddings = {{"m1", "vec/cat"}};
    g.entities.push_back(e);

    g.mentions.push_back({"T0", "E0", "猫", "temporal", 1.0});
    g.mentions.push_back({"T1", "E0", "猫", "temporal", 1.0});
    return g;
}

static std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) out.push_back(line);
    return out;
}

// Value of `key: '...'` in a parameter line, or empty.
static std::string quoted_field(const std::string& line, const std::string& key) {
    const std::string marker = key + ": '";
    size_t pos = line.find(marker);
    if (pos == std::string::npos) return "";
    pos += marker.size();
    return line.substr(pos, line.find('\'', pos) - pos);
}

// ============================================================================
// Script
// ============================================================================

TEST(GraphArtifactBuilderTest, CountsAndFraming) {
    GraphArtifactBuilder builder;
    GraphArtifact a = builder.build(sample_graph());

    // doc + 2 tags + 1 segment + 2 sentences + 1 entity
    EXPECT_EQ(a.node_statements, 7u);
    // 2 classified + 1 has_segment + 2 has_sentence + 1 next + 2 mentions
    EXPECT_EQ(a.relationship_statements, 8u);

    auto lines = lines_of(a.script);
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "// lexigraph creation script");
    EXPECT_EQ(lines.back(), ":commit");
    EXPECT_NE(a.script.find(":param tag_kindle_0 => {scheme: 'Kindle', code: 'Literature & Fiction'"),
              std::string::npos);
    EXPECT_NE(a.script.find(":param sen_0001 => "), std::string::npos);
    EXPECT_NE(a.script.find("embedding_ref: 'vec/1'"), std::string::npos);
    EXPECT_NE(a.script.find("$rel_00007.weight"), std::string::npos);
}

TEST(GraphArtifactBuilderTest, ConstraintsPrecedeTransaction) {
    GraphArtifact a = GraphArtifactBuilder().build(sample_graph());
    const size_t begin = a.script.find(":begin");
    ASSERT_NE(begin, std::string::npos);
    EXPECT_LT(a.script.rfind("CREATE CONSTRAINT", begin), begin);
    EXPECT_EQ(a.script.find("CREATE CONSTRAINT", begin), std::string::npos);
}

TEST(GraphArtifactBuilderTest, NodesPrecedeRelationships) {
    GraphArtifact a = GraphArtifactBuilder().build(sample_graph());

    std::set<std::string> declared;
    size_t checked = 0;
    for (const auto& line : lines_of(a.script)) {
        if (line.rfind(":param ", 0) != 0) continue;
        if (line.rfind(":param rel_", 0) == 0) {
            std::string from = quoted_field(line, "from");
            ASSERT_TRUE(declared.count(from)) << line;
            std::string to = quoted_field(line, "{to");
            if (to.empty()) to = quoted_field(line, ", to");
            if (!to.empty()) {
                ASSERT_TRUE(declared.count(to)) << line;
            }
            checked++;
        } else {
            std::string id = quoted_field(line, "{id");
            if (!id.empty()) declared.insert(id);
        }
    }
    EXPECT_EQ(checked, 8u);
    EXPECT_EQ(declared.size(), 5u);
}

TEST(GraphArtifactBuilderTest, Deterministic) {
    GraphArtifactBuilder builder;
    EXPECT_EQ(builder.build(sample_graph()).script, builder.build(sample_graph()).script);
}

// ============================================================================
// Integrity
// ============================================================================

TEST(GraphArtifactBuilderTest, DuplicateIdRejected) {
    auto g = sample_graph();
    g.entities[0].id = "T1";
    g.mentions.clear();
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, OrdinalGapRejected) {
    auto g = sample_graph();
    g.sentences[1].ordinal = 2;
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, OrphanSentenceRejected) {
    auto g = sample_graph();
    g.segments[0].sentence_ids.pop_back();
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, ParentMismatchRejected) {
    auto g = sample_graph();
    g.sentences[0].segment_id = "S9";
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, OutOfOrderMembershipRejected) {
    auto g = sample_graph();
    std::swap(g.segments[0].sentence_ids[0], g.segments[0].sentence_ids[1]);
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, DanglingMentionRejected) {
    auto g = sample_graph();
    g.mentions.push_back({"T0", "E9", "x", "temporal", 1.0});
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, MissingClassificationRejected) {
    auto g = sample_graph();
    g.document.kindle.clear();
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, DuplicateLabelRejected) {
    auto g = sample_graph();
    EntityNode twin = g.entities[0];
    twin.id = "E1";
    g.entities.push_back(twin);
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

TEST(GraphArtifactBuilderTest, NoSentencesRejected) {
    auto g = sample_graph();
    g.sentences.clear();
    g.segments.clear();
    g.mentions.clear();
    EXPECT_THROW(GraphArtifactBuilder::validate(g), IntegrityError);
}

// ============================================================================
// Record codec
// ============================================================================

TEST(RecordCodecTest, RecordReemitsSameScript) {
    GraphArtifact a = GraphArtifactBuilder().build(sample_graph());
    EXPECT_EQ(a.record["format"].get<std::string>(), kRecordFormat);

    DocumentGraph back = record_from_json(a.record);
    EXPECT_EQ(GraphArtifactBuilder::emit_script(back), a.script);

    DocumentGraph reparsed = record_from_json(ojson::parse(a.record.dump(2)));
    EXPECT_EQ(GraphArtifactBuilder::emit_script(reparsed), a.script);
    ASSERT_TRUE(reparsed.sentences[1].embedding.has_value());
    EXPECT_EQ(reparsed.sentences[1].embedding->ref, "vec/1");
    EXPECT_FALSE(reparsed.sentences[0].embedding.has_value());
}

TEST(RecordCodecTest, ConceptsKeyedByName) {
    ConceptVector v = ConceptVector::Zero();
    v[*concept_index("food_culture")] = 1.0;
    ojson j = concepts_to_json(v);
    EXPECT_EQ(j.size(), kConceptCount);
    EXPECT_DOUBLE_EQ(j["food_culture"].get<double>(), 1.0);
    EXPECT_EQ(j.begin().key(), "temporal");
    EXPECT_TRUE(concepts_from_json(j).isApprox(v));
}

TEST(RecordCodecTest, RejectsMalformed) {
    ojson record = GraphArtifactBuilder().build(sample_graph()).record;

    ojson wrong_format = record;
    wrong_format["format"] = "other/2";
    EXPECT_THROW(record_from_json(wrong_format), IntegrityError);

    ojson missing = record;
    missing["document"].erase("fingerprint");
    EXPECT_THROW(record_from_json(missing), IntegrityError);

    ojson wrong_type = record;
    wrong_type["sentences"] = "none";
    EXPECT_THROW(record_from_json(wrong_type), IntegrityError);

    EXPECT_THROW(load_record("/nonexistent/record.json"), SourceReadError);
}

// ============================================================================
// Literals
// ============================================================================

TEST(CypherLiteralTest, StringsEscaped) {
    EXPECT_EQ(cypher_literal(ojson("it's")), "'it\\'s'");
    EXPECT_EQ(cypher_literal(ojson("a\\b")), "'a\\\\b'");
    EXPECT_EQ(cypher_literal(ojson("line\nbreak")), "'line\\nbreak'");
    EXPECT_EQ(cypher_literal(ojson("猫")), "'猫'");
}

TEST(CypherLiteralTest, Composites) {
    ojson obj = ojson::object();
    obj["plain"] = 1;
    obj["two words"] = "x";
    EXPECT_EQ(cypher_literal(obj), "{plain: 1, `two words`: 'x'}");

    ojson arr = ojson::array({1, "x", true, nullptr, 0.5});
    EXPECT_EQ(cypher_literal(arr), "[1, 'x', true, null, 0.5]");
}

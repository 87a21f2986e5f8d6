/**
 * @file test_end_to_end_pipeline.cpp
 * @brief Text in, record and creation script on disk
 */

#include <gtest/gtest.h>
#include <ingestion/batch_ingester.hpp>
#include <ingestion/document_ingester.hpp>
#include <graph/record_codec.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <storage/document_ledger.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <unistd.h>

using namespace Lexigraph;
namespace fs = std::filesystem;

static const char* kCats = "猫が座った。犬が走った。猫が笑った。";

static std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void spit(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static MillisecondClock frozen(uint64_t ms) {
    return [ms]() { return ms; };
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Off);
        root_ = fs::temp_directory_path() /
                ("lexigraph_e2e_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    PipelineConfig config_in(const std::string& name) const {
        PipelineConfig cfg;
        cfg.data_dir = (root_ / name / "data").string();
        cfg.script_dir = (root_ / name / "cypher").string();
        cfg.log_level = "off";
        return cfg;
    }

    fs::path root_;
};

// ============================================================================
// Single document
// ============================================================================

TEST_F(PipelineTest, CatsAndDog) {
    DocumentIngester ingester(config_in("run"), nullptr, frozen(1723862400123ULL));
    IngestionStats stats = ingester.ingest(kCats, "cats", "");

    EXPECT_EQ(stats.sentences, 3u);
    EXPECT_EQ(stats.segments, 1u);
    EXPECT_EQ(stats.entities, 5u);
    EXPECT_EQ(stats.mentions, 6u);
    ASSERT_TRUE(fs::exists(stats.paths.record));
    ASSERT_TRUE(fs::exists(stats.paths.script));

    DocumentGraph g = load_record(stats.paths.record);
    EXPECT_EQ(g.document.id, stats.document_id);
    EXPECT_EQ(g.document.ingested_at_ms, 1723862400123ULL);
    EXPECT_EQ(g.document.language, "ja");
    EXPECT_EQ(g.document.ndc.front().code, "900");
    EXPECT_EQ(g.document.kindle.front().code, "Literature & Fiction");

    std::map<std::string, std::string> label_of;
    for (const auto& e : g.entities) label_of[e.id] = e.label;
    std::map<std::string, int> mentions_by_label;
    for (const auto& m : g.mentions) mentions_by_label[label_of.at(m.entity_id)]++;

    EXPECT_EQ(mentions_by_label["猫"], 2);
    EXPECT_EQ(mentions_by_label["犬"], 1);
    EXPECT_EQ(std::count_if(g.entities.begin(), g.entities.end(),
                            [](const EntityNode& e) { return e.label == "猫"; }), 1);

    ASSERT_EQ(g.segments.size(), 1u);
    EXPECT_EQ(g.segments[0].sentence_ids.size(), 3u);
    EXPECT_EQ(g.segments[0].key_terms.front(), "猫");

    // Raw text is never persisted
    EXPECT_EQ(slurp(stats.paths.record).find("猫が座った"), std::string::npos);
    EXPECT_EQ(slurp(stats.paths.script).find("猫が座った"), std::string::npos);
}

TEST_F(PipelineTest, IdsCarryTheirParents) {
    DocumentIngester ingester(config_in("run"), nullptr, frozen(1723862400123ULL));
    IngestionStats stats = ingester.ingest(kCats, "cats", "/corpus/cats.txt");
    DocumentGraph g = load_record(stats.paths.record);

    std::set<std::string> ids{g.document.id};
    for (const auto& s : g.segments) {
        EXPECT_EQ(s.id.substr(0, 12), BLAKE3Pipeline::context_prefix(g.document.id));
        ids.insert(s.id);
    }
    for (const auto& s : g.sentences) {
        EXPECT_EQ(s.id.substr(0, 12), BLAKE3Pipeline::context_prefix(s.segment_id));
        ids.insert(s.id);
    }
    for (const auto& e : g.entities) {
        auto parsed = IdAllocator::parse(e.id);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(parsed->type_tag, "con");
        ids.insert(e.id);
    }
    EXPECT_EQ(ids.size(), g.node_count() - g.document.ndc.size() - g.document.kindle.size());
}

TEST_F(PipelineTest, NoBoundaryIsOneSentence) {
    DocumentIngester ingester(config_in("run"));
    IngestionStats stats = ingester.ingest("a single line with no terminal mark", "line", "");
    EXPECT_EQ(stats.sentences, 1u);
    EXPECT_EQ(stats.segments, 1u);
}

TEST_F(PipelineTest, NoOverlapFallsBackToUniform) {
    DocumentIngester ingester(config_in("run"));
    IngestionStats stats = ingester.ingest("xyzzy plugh quux", "nonsense", "");

    EXPECT_TRUE(stats.ndc_fallback);
    EXPECT_TRUE(stats.kindle_fallback);
    EXPECT_TRUE(stats.concept_fallback);

    DocumentGraph g = load_record(stats.paths.record);
    ASSERT_EQ(g.document.ndc.size(), 3u);
    for (const auto& c : g.document.ndc) EXPECT_DOUBLE_EQ(c.score, 0.1);
    for (const auto& c : g.document.kindle) EXPECT_DOUBLE_EQ(c.score, 0.125);
    EXPECT_TRUE(g.document.concepts.isApprox(uniform_concepts()));
}

TEST_F(PipelineTest, EmptyInputWritesNothing) {
    PipelineConfig cfg = config_in("run");
    DocumentIngester ingester(cfg);

    EXPECT_THROW(ingester.ingest("   \n ", "blank", ""), EmptyInputError);
    EXPECT_FALSE(fs::exists(cfg.data_dir));
    EXPECT_FALSE(fs::exists(cfg.script_dir));
}

TEST_F(PipelineTest, DeterministicModeReproducesBytes) {
    PipelineConfig a = config_in("a");
    PipelineConfig b = config_in("b");
    a.allocator.mode = AllocatorMode::DeterministicSeed;
    b.allocator.mode = AllocatorMode::DeterministicSeed;

    IngestionStats sa = DocumentIngester(a, nullptr, frozen(1)).ingest(kCats, "cats", "");
    IngestionStats sb = DocumentIngester(b, nullptr, frozen(2)).ingest(kCats, "cats", "");

    EXPECT_EQ(sa.document_id, sb.document_id);
    EXPECT_EQ(slurp(sa.paths.record), slurp(sb.paths.record));
    EXPECT_EQ(slurp(sa.paths.script), slurp(sb.paths.script));
}

TEST_F(PipelineTest, UnwritableScriptDirLeavesNoRecord) {
    spit(root_ / "blocker", "a regular file");
    PipelineConfig cfg = config_in("run");
    cfg.script_dir = (root_ / "blocker" / "cypher").string();
    DocumentIngester ingester(cfg);

    EXPECT_THROW(ingester.ingest(kCats, "cats", ""), ArtifactWriteError);

    size_t left = 0;
    if (fs::exists(cfg.data_dir)) {
        for (const auto& entry : fs::directory_iterator(cfg.data_dir)) {
            ADD_FAILURE() << "left behind: " << entry.path().string();
            ++left;
        }
    }
    EXPECT_EQ(left, 0u);
}

TEST_F(PipelineTest, InvalidUtf8LabelsAreCleaned) {
    InMemoryDocumentLedger ledger;
    DocumentIngester ingester(config_in("run"), &ledger);

    IngestionStats stats = ingester.ingest(kCats, "ca\xFFts", "/corpus/\xED\xA0\x80" "a.txt");

    DocumentGraph g = load_record(stats.paths.record);
    EXPECT_EQ(g.document.title, "cats");
    EXPECT_EQ(g.document.source_path, "/corpus/a.txt");
    ASSERT_TRUE(ledger.entry(stats.document_id).has_value());
    EXPECT_EQ(ledger.entry(stats.document_id)->title, "cats");
}

TEST_F(PipelineTest, WallClockIdsDifferAcrossRuns) {
    uint64_t now = 1723862400000ULL;
    DocumentIngester ingester(config_in("run"), nullptr, [&now]() { return now++; });

    IngestionStats first = ingester.ingest(kCats, "cats", "");
    IngestionStats second = ingester.ingest(kCats, "cats", "");
    EXPECT_NE(first.document_id, second.document_id);
    EXPECT_EQ(first.fingerprint, second.fingerprint);
}

TEST_F(PipelineTest, RecordReemitsStoredScript) {
    DocumentIngester ingester(config_in("run"));
    IngestionStats stats = ingester.ingest(kCats, "cats", "");

    DocumentGraph g = load_record(stats.paths.record);
    EXPECT_EQ(GraphArtifactBuilder::emit_script(g), slurp(stats.paths.script));
}

// ============================================================================
// Files, sidecars, ledger
// ============================================================================

TEST_F(PipelineTest, FileWithEmbeddingSidecar) {
    const fs::path input = root_ / "story.txt";
    spit(input, kCats);
    spit(root_ / "story.txt.embeddings.json", R"({
        "sentences": {"0": {"model": "m1", "ref": "vec/s0"}},
        "entities": {"猫": [{"model": "m1", "ref": "vec/cat"}]}
    })");

    DocumentIngester ingester(config_in("run"));
    IngestionStats stats = ingester.ingest_file(input.string());

    DocumentGraph g = load_record(stats.paths.record);
    EXPECT_EQ(g.document.title, "story");
    EXPECT_EQ(g.document.source_path, input.string());
    ASSERT_TRUE(g.sentences[0].embedding.has_value());
    EXPECT_EQ(g.sentences[0].embedding->ref, "vec/s0");
    EXPECT_FALSE(g.sentences[1].embedding.has_value());
    for (const auto& e : g.entities) {
        if (e.label == "猫") {
            ASSERT_EQ(e.embeddings.size(), 1u);
            EXPECT_EQ(e.embeddings[0].ref, "vec/cat");
        } else {
            EXPECT_TRUE(e.embeddings.empty());
        }
    }
}

TEST_F(PipelineTest, MissingFileIsSourceReadError) {
    DocumentIngester ingester(config_in("run"));
    EXPECT_THROW(ingester.ingest_file((root_ / "absent.txt").string()), SourceReadError);
}

TEST_F(PipelineTest, LedgerSkipsKnownFingerprints) {
    PipelineConfig cfg = config_in("run");
    cfg.ledger.skip_known = true;
    InMemoryDocumentLedger ledger;
    DocumentIngester ingester(cfg, &ledger);

    IngestionStats first = ingester.ingest(kCats, "cats", "");
    IngestionStats again = ingester.ingest(kCats, "cats, again", "");

    EXPECT_FALSE(first.skipped);
    EXPECT_TRUE(again.skipped);
    EXPECT_EQ(again.known_document_id, first.document_id);
    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_EQ(ledger.find(first.fingerprint).value_or(""), first.document_id);
}

TEST_F(PipelineTest, LedgerStoresWriteTimeNotIdEpoch) {
    PipelineConfig cfg = config_in("run");
    cfg.allocator.mode = AllocatorMode::DeterministicSeed;
    InMemoryDocumentLedger ledger;
    DocumentIngester ingester(cfg, &ledger, frozen(1723862400555ULL));

    IngestionStats stats = ingester.ingest(kCats, "cats", "");
    DocumentGraph g = load_record(stats.paths.record);

    // Unseeded deterministic IDs take their epoch from the fingerprint
    const uint64_t epoch = BLAKE3Pipeline::leading_u64(BLAKE3Pipeline::hash(std::string(kCats))) %
                           IdAllocator::kTimestampModulus;
    EXPECT_EQ(g.document.ingested_at_ms, epoch);

    auto entry = ledger.entry(stats.document_id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->ingested_at_ms, 1723862400555ULL);
}

// ============================================================================
// Batches
// ============================================================================

TEST_F(PipelineTest, BatchIsolatesExhaustedDocument) {
    PipelineConfig cfg = config_in("run");
    cfg.allocator.capacity = 8;
    cfg.allocator.scope = AllocatorScope::Document;
    DocumentIngester ingester(cfg, nullptr, frozen(1723862400000ULL));

    std::vector<BatchInput> inputs = {
        {"Short.", "a", "a.txt"},
        {"Apples ripen. Bananas ripen. Cherries ripen. Dates ripen. Figs ripen. Grapes ripen.", "b", "b.txt"},
        {"Brief.", "c", "c.txt"},
    };
    BatchReport report = BatchIngester(ingester, 2).run(inputs);

    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_TRUE(report.outcomes[0].ok);
    EXPECT_FALSE(report.outcomes[1].ok);
    EXPECT_EQ(report.outcomes[1].error_kind, "AllocatorExhaustedError");
    EXPECT_EQ(report.outcomes[1].source, "b.txt");
    EXPECT_TRUE(report.outcomes[2].ok);
    EXPECT_EQ(report.succeeded, 2u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_FALSE(report.all_succeeded());

    EXPECT_TRUE(fs::exists(report.outcomes[0].stats.paths.record));
    EXPECT_TRUE(fs::exists(report.outcomes[2].stats.paths.script));
    // Only the two successful documents left artifacts
    size_t records = 0;
    for (const auto& entry : fs::directory_iterator(cfg.data_dir)) records += entry.is_regular_file();
    EXPECT_EQ(records, 2u);
}

TEST_F(PipelineTest, SharedAllocatorKeepsIdsUnique) {
    PipelineConfig cfg = config_in("run");
    cfg.workers = 4;
    DocumentIngester ingester(cfg, nullptr, frozen(1723862400000ULL));

    std::vector<BatchInput> inputs;
    for (int i = 0; i < 8; ++i) {
        inputs.push_back({kCats, "cats", "doc" + std::to_string(i) + ".txt"});
    }
    BatchReport report = BatchIngester(ingester, cfg.workers).run(inputs);
    ASSERT_TRUE(report.all_succeeded());

    std::set<std::string> ids;
    size_t total = 0;
    for (const auto& o : report.outcomes) {
        DocumentGraph g = load_record(o.stats.paths.record);
        ids.insert(g.document.id);
        for (const auto& s : g.sentences) ids.insert(s.id);
        for (const auto& s : g.segments) ids.insert(s.id);
        for (const auto& e : g.entities) ids.insert(e.id);
        total += 1 + g.sentences.size() + g.segments.size() + g.entities.size();
    }
    EXPECT_EQ(ids.size(), total);
}

TEST_F(PipelineTest, SeededParallelBatchIsReproducible) {
    std::vector<BatchInput> inputs;
    for (int i = 0; i < 16; ++i) {
        const std::string n = std::to_string(i);
        inputs.push_back({"Document " + n + " tells a story. The story has " + n + " chapters. Readers enjoy it.",
                          "doc" + n, ""});
    }

    auto run = [&](const std::string& name, size_t workers) {
        PipelineConfig cfg = config_in(name);
        cfg.workers = workers;
        cfg.allocator.mode = AllocatorMode::DeterministicSeed;
        cfg.allocator.seed = 1723862400000ULL;
        DocumentIngester ingester(cfg);
        BatchReport report = BatchIngester(ingester, workers).run(inputs);
        EXPECT_TRUE(report.all_succeeded());

        std::vector<std::string> scripts;
        for (const auto& o : report.outcomes) scripts.push_back(o.stats.document_id + "\n" + slurp(o.stats.paths.script));
        return scripts;
    };

    const auto first = run("first", 4);
    const auto second = run("second", 4);
    const auto sequential = run("sequential", 1);

    ASSERT_EQ(first.size(), 16u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, sequential);

    std::set<std::string> ids;
    for (const auto& s : first) ids.insert(s.substr(0, s.find('\n')));
    EXPECT_EQ(ids.size(), 16u);
}

TEST_F(PipelineTest, CollectInputsByExtension) {
    fs::create_directories(root_ / "corpus" / "nested");
    spit(root_ / "corpus" / "b.txt", "B.");
    spit(root_ / "corpus" / "a.txt", "A.");
    spit(root_ / "corpus" / "notes.md", "skip");
    spit(root_ / "corpus" / "nested" / "c.txt", "C.");

    auto files = BatchIngester::collect_inputs((root_ / "corpus").string());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "a.txt");
    EXPECT_EQ(fs::path(files[1]).filename().string(), "b.txt");
    EXPECT_EQ(fs::path(files[2]).filename().string(), "c.txt");

    EXPECT_THROW(BatchIngester::collect_inputs((root_ / "missing").string()), SourceReadError);
}

TEST_F(PipelineTest, BatchFilesReportUnreadable) {
    spit(root_ / "one.txt", "The first file.");
    DocumentIngester ingester(config_in("run"));

    BatchReport report = BatchIngester(ingester, 2).run_files(
        {(root_ / "one.txt").string(), (root_ / "gone.txt").string()});
    EXPECT_TRUE(report.outcomes[0].ok);
    EXPECT_EQ(report.outcomes[1].error_kind, "SourceReadError");
}

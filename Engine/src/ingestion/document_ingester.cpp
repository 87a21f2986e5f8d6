/**
 * @file document_ingester.cpp
 * @brief Single-document ingestion pipeline
 */

#include <ingestion/document_ingester.hpp>
#include <ingestion/entity_registry.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Lexigraph {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw SourceReadError("Cannot open file: " + path);

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) throw SourceReadError("Read failed: " + path);
    return ss.str();
}

std::string describe_top(const std::vector<RankedCategory>& top) {
    return top.empty() ? std::string("-") : top.front().code;
}

} // namespace

ClassifierFusion make_fusion(const PipelineConfig& config) {
    Taxonomy primary = config.ndc_taxonomy_path.empty()
        ? Taxonomy::ndc() : Taxonomy::load_file(config.ndc_taxonomy_path);
    Taxonomy secondary = config.kindle_taxonomy_path.empty()
        ? Taxonomy::kindle() : Taxonomy::load_file(config.kindle_taxonomy_path);
    return ClassifierFusion(std::move(primary), std::move(secondary), config.fusion);
}

DocumentIngester::DocumentIngester(const PipelineConfig& config, DocumentLedger* ledger, MillisecondClock clock)
    : config_(config),
      ledger_(ledger),
      clock_(std::move(clock)),
      segmenter_(config.segmenter),
      extractor_(config.keywords),
      fusion_(make_fusion(config)),
      store_(config.data_dir, config.script_dir) {
    config_.validate();
}

std::unique_ptr<IdAllocator> DocumentIngester::make_allocator(const BLAKE3Pipeline::Digest& fingerprint) const {
    const auto& a = config_.allocator;
    if (a.mode == AllocatorMode::DeterministicSeed) {
        const uint64_t seed = a.seed ? *a.seed : BLAKE3Pipeline::leading_u64(fingerprint);
        return std::make_unique<IdAllocator>(AllocatorMode::DeterministicSeed, seed, clock_, a.capacity);
    }
    return std::make_unique<IdAllocator>(AllocatorMode::WallClock, 0, clock_, a.capacity);
}

std::unique_ptr<IdAllocator> DocumentIngester::make_shared_allocator() const {
    const auto& a = config_.allocator;
    if (a.effective_scope() == AllocatorScope::Document) return nullptr;
    return std::make_unique<IdAllocator>(a.mode, a.seed.value_or(0), clock_, a.capacity);
}

DocumentGraph DocumentIngester::build_graph(const std::string& text, const std::string& title,
                                            const std::string& source_path, IdAllocator& allocator,
                                            const EmbeddingCatalog* embeddings, IngestionStats& stats) const {
    const std::u32string utf32 = utf8_to_utf32(text);
    const SegmentedText segmented = segmenter_.segment(utf32);

    const std::vector<Token> doc_tokens = tokenize(utf32);
    const Classification doc_class = fusion_.classify(doc_tokens, utf32);
    stats.ndc_fallback = doc_class.primary.fallback;
    stats.kindle_fallback = doc_class.secondary.fallback;
    stats.concept_fallback = doc_class.concept_fallback;

    DocumentGraph graph;
    auto& doc = graph.document;
    doc.id = allocator.document_id(title, source_path, stats.fingerprint);
    doc.title = title;
    doc.source_path = source_path;
    doc.fingerprint = stats.fingerprint;
    // The document ID carries its creation time; reuse it so deterministic runs stay byte-identical.
    doc.ingested_at_ms = IdAllocator::parse(doc.id).value().timestamp_ms;
    doc.token_count = doc_tokens.size();
    doc.language = detect_language(utf32);
    doc.ndc = doc_class.primary.top;
    doc.kindle = doc_class.secondary.top;
    doc.concepts = doc_class.concepts;

    EntityRegistry registry(allocator, fusion_, doc.id, embeddings, config_.entity_type);

    for (size_t k = 0; k < segmented.segments.size(); ++k) {
        SegmentNode seg;
        seg.id = allocator.segment_id(doc.id, static_cast<uint32_t>(k));
        seg.ordinal = static_cast<uint32_t>(k);

        std::vector<Token> segment_tokens;

        for (size_t idx : segmented.segments[k]) {
            const std::u32string& sentence = segmented.sentences[idx];
            const uint32_t ordinal = static_cast<uint32_t>(idx);

            SentenceNode sen;
            sen.id = allocator.sentence_id(seg.id, ordinal);
            sen.ordinal = ordinal;
            sen.segment_id = seg.id;

            std::vector<Token> tokens = tokenize(sentence);
            const Classification sc = fusion_.classify(tokens, sentence);
            sen.concepts = sc.concepts;
            if (sc.concept_fallback) stats.sentence_concept_fallbacks++;
            if (embeddings) sen.embedding = embeddings->for_sentence(ordinal);

            for (const auto& kw : extractor_.extract(tokens, config_.terms_per_sentence)) {
                registry.register_term(sen.id, kw.surface);
            }

            seg.sentence_ids.push_back(sen.id);
            graph.sentences.push_back(std::move(sen));
            segment_tokens.insert(segment_tokens.end(),
                                  std::make_move_iterator(tokens.begin()),
                                  std::make_move_iterator(tokens.end()));
        }

        for (const auto& kw : extractor_.extract(segment_tokens, config_.key_terms_per_segment)) {
            seg.key_terms.push_back(utf32_to_utf8(kw.folded));
        }
        graph.segments.push_back(std::move(seg));
    }

    stats.entity_concept_fallbacks = registry.concept_fallbacks();
    graph.entities = registry.release_entities();
    graph.mentions = registry.release_mentions();

    stats.document_id = doc.id;
    stats.sentences = graph.sentences.size();
    stats.segments = graph.segments.size();
    stats.entities = graph.entities.size();
    stats.mentions = graph.mentions.size();
    return graph;
}

IngestionStats DocumentIngester::ingest(const std::string& text, const std::string& title,
                                        const std::string& source_path, IdAllocator* allocator,
                                        const EmbeddingCatalog* embeddings) const {
    Timer timer;
    IngestionStats stats;
    stats.original_bytes = text.size();

    const auto digest = BLAKE3Pipeline::hash(text);
    stats.fingerprint = BLAKE3Pipeline::to_hex(digest);

    if (ledger_ && config_.ledger.skip_known) {
        if (auto known = ledger_->find(stats.fingerprint)) {
            Logger::info("Already ingested as " + *known + ", skipping: " + source_path);
            stats.skipped = true;
            stats.known_document_id = *known;
            stats.elapsed_ms = timer.elapsed_ms();
            return stats;
        }
    }

    std::unique_ptr<IdAllocator> own_allocator;
    if (!allocator) {
        own_allocator = make_allocator(digest);
        allocator = own_allocator.get();
    }

    // Labels end up in JSON and SQL, which both require valid UTF-8.
    const std::string clean_title = valid_utf8(title);
    const std::string clean_source = valid_utf8(source_path);
    if (clean_title != title || clean_source != source_path) {
        Logger::warn("Dropped invalid UTF-8 from the title or source path of " + clean_source);
    }

    DocumentGraph graph = build_graph(text, clean_title, clean_source, *allocator, embeddings, stats);

    if (stats.ndc_fallback || stats.kindle_fallback) {
        Logger::warn("No taxonomy keyword matched in " + stats.document_id +
                     " (ndc=" + (stats.ndc_fallback ? "uniform" : describe_top(graph.document.ndc)) +
                     ", kindle=" + (stats.kindle_fallback ? "uniform" : describe_top(graph.document.kindle)) + ")");
    }
    if (stats.concept_fallback) {
        Logger::warn("Concept weights fell back to uniform for " + stats.document_id);
    }
    if (stats.sentence_concept_fallbacks || stats.entity_concept_fallbacks) {
        Logger::debug("Uniform concept weights: " + std::to_string(stats.sentence_concept_fallbacks) +
                      " sentences, " + std::to_string(stats.entity_concept_fallbacks) + " entities");
    }

    const GraphArtifact artifact = builder_.build(graph);
    stats.node_statements = artifact.node_statements;
    stats.relationship_statements = artifact.relationship_statements;
    stats.paths = store_.write(graph.document.id, artifact);

    if (ledger_) {
        LedgerEntry entry;
        entry.document_id = graph.document.id;
        entry.fingerprint = stats.fingerprint;
        entry.title = clean_title;
        entry.source_path = clean_source;
        entry.ingested_at_ms = clock_();
        entry.sentence_count = stats.sentences;
        entry.entity_count = stats.entities;
        entry.record_path = stats.paths.record.string();
        entry.script_path = stats.paths.script.string();
        ledger_->record(entry);
    }

    stats.elapsed_ms = timer.elapsed_ms();
    Logger::success(stats.document_id + ": " + std::to_string(stats.sentences) + " sentences, " +
                    std::to_string(stats.segments) + " segments, " +
                    std::to_string(stats.entities) + " entities, " +
                    std::to_string(stats.mentions) + " mentions in " +
                    std::to_string(static_cast<long long>(stats.elapsed_ms)) + " ms");
    return stats;
}

IngestionStats DocumentIngester::ingest_file(const std::string& path, IdAllocator* allocator,
                                             const EmbeddingCatalog* embeddings,
                                             const std::string& title) const {
    const std::string text = read_file(path);

    EmbeddingCatalog sidecar;
    if (!embeddings) {
        const std::string sidecar_path = path + ".embeddings.json";
        if (std::filesystem::exists(sidecar_path)) {
            sidecar = EmbeddingCatalog::load_file(sidecar_path);
            embeddings = &sidecar;
            Logger::debug("Using embedding handles from " + sidecar_path);
        }
    }

    const std::string doc_title = title.empty() ? std::filesystem::path(path).stem().string() : title;
    Logger::step("Ingesting " + path);
    return ingest(text, doc_title, path, allocator, embeddings);
}

} // namespace Lexigraph

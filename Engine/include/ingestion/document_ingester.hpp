/**
 * @file document_ingester.hpp
 * @brief One document in, one validated graph artifact out
 *
 * Pipeline:
 *   fingerprint → segment → classify document → allocate IDs
 *   → per sentence: classify, extract terms, register entities
 *   → validate + emit → write record and script → ledger
 *
 * Sentences are processed strictly in document order. Nothing is written
 * unless the whole document succeeds.
 */

#pragma once

#include <classification/classifier_fusion.hpp>
#include <config/pipeline_config.hpp>
#include <graph/graph_artifact_builder.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <ingestion/embedding_catalog.hpp>
#include <ingestion/id_allocator.hpp>
#include <ingestion/keyword_extractor.hpp>
#include <ingestion/segmenter.hpp>
#include <storage/artifact_store.hpp>
#include <storage/document_ledger.hpp>
#include <utils/time.hpp>
#include <memory>
#include <string>

namespace Lexigraph {

/**
 * @brief Ingestion statistics
 */
struct IngestionStats {
    std::string document_id;
    std::string fingerprint;
    size_t original_bytes = 0;
    size_t sentences = 0;
    size_t segments = 0;
    size_t entities = 0;
    size_t mentions = 0;
    size_t node_statements = 0;
    size_t relationship_statements = 0;

    // Quality signals, not errors
    bool ndc_fallback = false;
    bool kindle_fallback = false;
    bool concept_fallback = false;
    size_t sentence_concept_fallbacks = 0;
    size_t entity_concept_fallbacks = 0;

    bool skipped = false;             // Fingerprint already in the ledger
    std::string known_document_id;    // Set when skipped
    ArtifactPaths paths;
    double elapsed_ms = 0.0;
};

/**
 * @brief Build both classifiers from config (built-in tables or JSON overrides).
 * @throws ConfigError if an override file is malformed
 */
ClassifierFusion make_fusion(const PipelineConfig& config);

class DocumentIngester {
public:
    /**
     * @param config Pipeline configuration (copied)
     * @param ledger Optional; consulted for skip_known and written after each document
     * @param clock Millisecond source for wall-clock allocators
     *
     * @throws ConfigError on invalid configuration
     */
    explicit DocumentIngester(const PipelineConfig& config,
                              DocumentLedger* ledger = nullptr,
                              MillisecondClock clock = system_clock_ms());

    /**
     * @brief Ingest text and write its artifacts.
     *
     * @param allocator Shared allocator, or null for a per-document one
     * @param embeddings Optional embedding handles for this document
     *
     * @throws EmptyInputError, AllocatorExhaustedError, IntegrityError,
     *         ArtifactWriteError, LedgerError
     */
    IngestionStats ingest(const std::string& text, const std::string& title,
                          const std::string& source_path,
                          IdAllocator* allocator = nullptr,
                          const EmbeddingCatalog* embeddings = nullptr) const;

    /**
     * @brief Ingest a UTF-8 file. Title defaults to the file stem.
     *
     * Without an explicit catalog, <path>.embeddings.json is used when present.
     *
     * @throws SourceReadError if the file cannot be read, plus everything ingest() throws
     */
    IngestionStats ingest_file(const std::string& path,
                               IdAllocator* allocator = nullptr,
                               const EmbeddingCatalog* embeddings = nullptr,
                               const std::string& title = "") const;

    /**
     * @brief Segment, classify and allocate, without writing anything.
     *
     * stats receives counts and quality signals.
     */
    DocumentGraph build_graph(const std::string& text, const std::string& title,
                              const std::string& source_path, IdAllocator& allocator,
                              const EmbeddingCatalog* embeddings, IngestionStats& stats) const;

    /**
     * @brief Allocator for one document under the configured mode.
     *
     * Deterministic mode without a configured seed derives the seed from
     * the fingerprint, so the same bytes always get the same IDs.
     */
    std::unique_ptr<IdAllocator> make_allocator(const BLAKE3Pipeline::Digest& fingerprint) const;

    /// Batch-wide allocator, or null when the effective scope is per document.
    std::unique_ptr<IdAllocator> make_shared_allocator() const;

    const PipelineConfig& config() const { return config_; }
    const ClassifierFusion& fusion() const { return fusion_; }

private:
    PipelineConfig config_;
    DocumentLedger* ledger_;
    MillisecondClock clock_;

    Segmenter segmenter_;
    KeywordExtractor extractor_;
    ClassifierFusion fusion_;
    GraphArtifactBuilder builder_;
    ArtifactStore store_;
};

} // namespace Lexigraph

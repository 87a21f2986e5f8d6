/**
 * @file pipeline_config.hpp
 * @brief Pipeline configuration: defaults, JSON file, environment
 *
 * Precedence, lowest first: struct defaults, JSON file, environment
 * variables, command-line flags (applied by the tool).
 *
 * Example file:
 *   {
 *     "data_dir": "out/data",
 *     "script_dir": "out/cypher",
 *     "log_level": "info",
 *     "workers": 4,
 *     "segmenter":      {"boundaries": "。．.!?！？", "segment_size": 5},
 *     "keywords":       {"terms_per_sentence": 3, "key_terms_per_segment": 5,
 *                        "extra_stopwords": ["foo"]},
 *     "entity_type":    "concept",
 *     "allocator":      {"mode": "deterministic-seed", "seed": 1723862400000,
 *                        "capacity": 999999, "scope": "document"},
 *     "classification": {"top_k": 3, "feature_scale": 1.0,
 *                        "ndc_taxonomy": "ndc.json", "kindle_taxonomy": ""},
 *     "ledger":         {"enabled": true, "host": "localhost", "dbname": "lexigraph",
 *                        "skip_known": true}
 *   }
 */

#pragma once

#include <classification/classifier_fusion.hpp>
#include <ingestion/id_allocator.hpp>
#include <ingestion/keyword_extractor.hpp>
#include <ingestion/segmenter.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace Lexigraph {

enum class AllocatorScope : uint8_t {
    Batch,      // One allocator shared by every document of a run
    Document    // Fresh allocator per document
};

struct AllocatorSettings {
    AllocatorMode mode = AllocatorMode::WallClock;
    std::optional<uint64_t> seed;                 // Unset: derive from the content fingerprint
    uint32_t capacity = IdAllocator::kDefaultCapacity;
    AllocatorScope scope = AllocatorScope::Batch;

    /// Deterministic IDs must not depend on how documents interleave, so that
    /// mode always gets one allocator per document.
    AllocatorScope effective_scope() const {
        return mode == AllocatorMode::DeterministicSeed ? AllocatorScope::Document : scope;
    }
};

struct LedgerConfig {
    bool enabled = false;
    bool skip_known = false;      // Skip documents whose fingerprint is already recorded
    std::string conninfo;         // Used verbatim when set
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "lexigraph";
    std::string user = "postgres";
    std::string password;

    std::string connection_string() const;
};

struct PipelineConfig {
    std::string data_dir = "out/data";
    std::string script_dir = "out/cypher";
    std::string log_level = "info";
    size_t workers = 1;

    SegmenterConfig segmenter;
    KeywordConfig keywords;
    size_t terms_per_sentence = 3;
    size_t key_terms_per_segment = 5;
    std::string entity_type = "concept";

    AllocatorSettings allocator;

    FusionConfig fusion;
    std::string ndc_taxonomy_path;     // Empty: built-in table
    std::string kindle_taxonomy_path;

    LedgerConfig ledger;

    /**
     * @brief Overlay a JSON document on top of base.
     * @throws ConfigError on wrong types or invalid values
     */
    static PipelineConfig from_json(const nlohmann::json& doc, PipelineConfig base);
    static PipelineConfig from_json(const nlohmann::json& doc);

    /// @throws ConfigError if the file cannot be read or parsed
    static PipelineConfig load_file(const std::filesystem::path& path, PipelineConfig base);
    static PipelineConfig load_file(const std::filesystem::path& path);

    /**
     * @brief Apply LEXIGRAPH_* and PG* environment variables.
     *
     *   LEXIGRAPH_DATA_DIR, LEXIGRAPH_SCRIPT_DIR, LEXIGRAPH_LOG_LEVEL,
     *   LEXIGRAPH_WORKERS, LEXIGRAPH_ALLOCATOR_MODE, LEXIGRAPH_ALLOCATOR_SEED,
     *   LEXIGRAPH_ALLOCATOR_SCOPE, LEXIGRAPH_LEDGER (0/1),
     *   PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     *
     * @throws ConfigError on unparsable values
     */
    void apply_env();

    /// @throws ConfigError on out-of-range values
    void validate() const;
};

AllocatorScope parse_allocator_scope(const std::string& name);
std::string to_string(AllocatorScope scope);

} // namespace Lexigraph

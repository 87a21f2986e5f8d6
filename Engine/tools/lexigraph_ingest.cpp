#include <config/pipeline_config.hpp>
#include <graph/graph_artifact_builder.hpp>
#include <graph/record_codec.hpp>
#include <ingestion/batch_ingester.hpp>
#include <ingestion/document_ingester.hpp>
#include <storage/artifact_store.hpp>
#include <storage/document_ledger.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace Lexigraph;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  text \"<text>\"              Ingest text given on the command line\n"
              << "  file <path>                Ingest one UTF-8 file\n"
              << "  batch <path>...            Ingest files or directories (recursively, by extension)\n"
              << "  emit <record.json> [out]   Re-emit the creation script for a stored record\n"
              << "\nOptions:\n"
              << "  --config <file>            JSON configuration\n"
              << "  --data-dir <dir>           Record output directory\n"
              << "  --script-dir <dir>         Script output directory\n"
              << "  --workers <n>              Parallel documents in batch mode\n"
              << "  --mode <wall-clock|deterministic-seed>\n"
              << "  --seed <ms>                Frozen timestamp for deterministic-seed mode\n"
              << "  --scope <batch|document>   Allocator sharing\n"
              << "  --title <title>            Document title (text/file)\n"
              << "  --embeddings <file>        Embedding handle sidecar (text/file)\n"
              << "  --ext <.txt>               File extension collected in batch mode\n"
              << "  --ledger                   Record documents in PostgreSQL (PG* environment)\n"
              << "  --skip-known               With --ledger: skip fingerprints already recorded\n"
              << "  --log-level <level>        debug|info|warn|error|off\n"
              << "\nExamples:\n"
              << "  " << prog << " text \"猫が座った。犬が走った。\"\n"
              << "  " << prog << " --mode deterministic-seed file /path/to/document.txt\n"
              << "  " << prog << " --workers 8 batch corpus/\n";
}

struct Options {
    std::string config_path;
    std::optional<std::string> data_dir, script_dir, mode, scope, log_level;
    std::optional<uint64_t> seed;
    std::optional<size_t> workers;
    std::string title;
    std::string embeddings_path;
    std::string extension = ".txt";
    bool ledger = false;
    bool skip_known = false;
    std::string command;
    std::vector<std::string> args;
};

uint64_t parse_number(const std::string& flag, const std::string& value) {
    uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw ConfigError(flag + " expects a non-negative integer, got '" + value + "'");
    }
    return out;
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError(arg + " needs a value");
            return argv[++i];
        };

        if (!opt.command.empty()) {
            opt.args.push_back(arg);
        } else if (arg == "--config") {
            opt.config_path = value();
        } else if (arg == "--data-dir") {
            opt.data_dir = value();
        } else if (arg == "--script-dir") {
            opt.script_dir = value();
        } else if (arg == "--workers") {
            opt.workers = static_cast<size_t>(parse_number(arg, value()));
        } else if (arg == "--mode") {
            opt.mode = value();
        } else if (arg == "--seed") {
            opt.seed = parse_number(arg, value());
        } else if (arg == "--scope") {
            opt.scope = value();
        } else if (arg == "--title") {
            opt.title = value();
        } else if (arg == "--embeddings") {
            opt.embeddings_path = value();
        } else if (arg == "--ext") {
            opt.extension = value();
        } else if (arg == "--ledger") {
            opt.ledger = true;
        } else if (arg == "--skip-known") {
            opt.skip_known = true;
        } else if (arg == "--log-level") {
            opt.log_level = value();
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg.rfind("--", 0) == 0) {
            throw ConfigError("Unknown option " + arg);
        } else {
            opt.command = arg;
        }
    }
    if (opt.command.empty()) return std::nullopt;
    return opt;
}

PipelineConfig resolve_config(const Options& opt) {
    PipelineConfig config;
    if (!opt.config_path.empty()) config = PipelineConfig::load_file(opt.config_path);
    config.apply_env();

    if (opt.data_dir) config.data_dir = *opt.data_dir;
    if (opt.script_dir) config.script_dir = *opt.script_dir;
    if (opt.workers) config.workers = *opt.workers;
    if (opt.mode) config.allocator.mode = parse_allocator_mode(*opt.mode);
    if (opt.seed) config.allocator.seed = *opt.seed;
    if (opt.scope) config.allocator.scope = parse_allocator_scope(*opt.scope);
    if (opt.log_level) config.log_level = *opt.log_level;
    if (opt.ledger) config.ledger.enabled = true;
    if (opt.skip_known) config.ledger.skip_known = true;

    config.validate();
    return config;
}

void print_stats(const IngestionStats& stats) {
    if (stats.skipped) {
        std::cout << "Skipped: fingerprint already ingested as " << stats.known_document_id << "\n";
        return;
    }
    std::cout << "\n=== Ingestion Complete ===\n"
              << "Document:  " << stats.document_id << "\n"
              << "Input:     " << stats.original_bytes << " bytes\n"
              << "Sentences: " << stats.sentences << " in " << stats.segments << " segments\n"
              << "Entities:  " << stats.entities << " (" << stats.mentions << " mentions)\n"
              << "Script:    " << stats.node_statements << " node / "
              << stats.relationship_statements << " relationship statements\n"
              << "Record:    " << stats.paths.record.string() << "\n"
              << "Cypher:    " << stats.paths.script.string() << "\n";
}

int run_emit(const Options& opt, const PipelineConfig& config) {
    if (opt.args.empty()) throw ConfigError("emit needs a record path");

    DocumentGraph graph = load_record(opt.args[0]);
    GraphArtifactBuilder builder;
    GraphArtifact artifact = builder.build(graph);

    const std::string target = opt.args.size() > 1
        ? opt.args[1]
        : ArtifactStore(config.data_dir, config.script_dir).paths_for(graph.document.id).script.string();
    ArtifactStore::write_atomic(target, artifact.script);

    Logger::success("Script for " + graph.document.id + " written to " + target);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Logger::init_from_env();

    std::optional<Options> opt;
    try {
        opt = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }
    if (!opt) {
        usage(argv[0]);
        return 2;
    }

    try {
        PipelineConfig config = resolve_config(*opt);
        Logger::set_level(Logger::parse_level(config.log_level, Logger::level()));

        if (opt->command == "emit") return run_emit(*opt, config);

        std::unique_ptr<DocumentLedger> ledger;
        if (config.ledger.enabled) {
            ledger = std::make_unique<PostgresDocumentLedger>(config.ledger.connection_string());
        }

        DocumentIngester ingester(config, ledger.get());

        std::optional<EmbeddingCatalog> embeddings;
        if (!opt->embeddings_path.empty()) embeddings = EmbeddingCatalog::load_file(opt->embeddings_path);
        const EmbeddingCatalog* catalog = embeddings ? &*embeddings : nullptr;

        if (opt->command == "text") {
            if (opt->args.empty()) throw ConfigError("text needs an argument");
            const std::string title = opt->title.empty() ? "untitled" : opt->title;
            print_stats(ingester.ingest(opt->args[0], title, "", nullptr, catalog));
            return 0;
        }

        if (opt->command == "file") {
            if (opt->args.empty()) throw ConfigError("file needs a path");
            print_stats(ingester.ingest_file(opt->args[0], nullptr, catalog, opt->title));
            return 0;
        }

        if (opt->command == "batch") {
            if (opt->args.empty()) throw ConfigError("batch needs at least one path");
            std::vector<std::string> files;
            for (const auto& p : opt->args) {
                auto found = BatchIngester::collect_inputs(p, opt->extension);
                files.insert(files.end(), found.begin(), found.end());
            }

            BatchIngester batch(ingester, config.workers);
            BatchReport report = batch.run_files(files);

            for (const auto& o : report.outcomes) {
                if (o.ok) {
                    std::cout << "ok      " << o.source << " -> "
                              << (o.stats.skipped ? o.stats.known_document_id + " (skipped)" : o.stats.document_id) << "\n";
                } else {
                    std::cout << "FAILED  " << o.source << " [" << o.error_kind << "] " << o.message << "\n";
                }
            }
            std::cout << "\n" << report.succeeded << " succeeded, " << report.failed << " failed\n";
            return report.all_succeeded() ? 0 : 1;
        }

        std::cerr << "Unknown command: " << opt->command << "\n";
        usage(argv[0]);
        return 2;
    } catch (const IngestionError& e) {
        std::cerr << "Error [" << e.kind() << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

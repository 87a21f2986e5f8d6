#include <config/pipeline_config.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Lexigraph {

namespace {

template <typename T>
void read(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Config key \"") + key + "\" has the wrong type: " + e.what());
    }
}

const nlohmann::json* section(const nlohmann::json& doc, const char* key) {
    if (!doc.contains(key)) return nullptr;
    const auto& s = doc.at(key);
    if (!s.is_object()) throw ConfigError(std::string("Config section \"") + key + "\" must be an object");
    return &s;
}

uint64_t parse_u64(const std::string& value, const char* what) {
    uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw ConfigError(std::string(what) + " is not a non-negative integer: '" + value + "'");
    }
    return out;
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

AllocatorScope parse_allocator_scope(const std::string& name) {
    if (name == "batch") return AllocatorScope::Batch;
    if (name == "document") return AllocatorScope::Document;
    throw ConfigError("Unknown allocator scope '" + name + "' (expected batch or document)");
}

std::string to_string(AllocatorScope scope) {
    return scope == AllocatorScope::Batch ? "batch" : "document";
}

std::string LedgerConfig::connection_string() const {
    if (!conninfo.empty()) return conninfo;

    std::ostringstream out;
    out << "host=" << host << " ";
    out << "port=" << port << " ";
    out << "dbname=" << dbname << " ";
    out << "user=" << user;
    if (!password.empty()) out << " password=" << password;
    return out.str();
}

PipelineConfig PipelineConfig::from_json(const nlohmann::json& doc, PipelineConfig base) {
    if (!doc.is_object()) throw ConfigError("Config root must be a JSON object");

    PipelineConfig cfg = std::move(base);

    read(doc, "data_dir", cfg.data_dir);
    read(doc, "script_dir", cfg.script_dir);
    read(doc, "log_level", cfg.log_level);
    read(doc, "workers", cfg.workers);
    read(doc, "entity_type", cfg.entity_type);

    if (const auto* s = section(doc, "segmenter")) {
        std::string boundaries;
        read(*s, "boundaries", boundaries);
        if (!boundaries.empty()) cfg.segmenter.boundaries = utf8_to_utf32(boundaries);
        read(*s, "segment_size", cfg.segmenter.segment_size);
    }

    if (const auto* s = section(doc, "keywords")) {
        read(*s, "terms_per_sentence", cfg.terms_per_sentence);
        read(*s, "key_terms_per_segment", cfg.key_terms_per_segment);
        read(*s, "min_length_han", cfg.keywords.min_length_han);
        read(*s, "min_length_katakana", cfg.keywords.min_length_katakana);
        read(*s, "min_length_default", cfg.keywords.min_length_default);
        std::vector<std::string> extra;
        read(*s, "extra_stopwords", extra);
        for (const auto& w : extra) cfg.keywords.stopwords.insert(fold_case(utf8_to_utf32(w)));
    }

    if (const auto* s = section(doc, "allocator")) {
        std::string mode;
        read(*s, "mode", mode);
        if (!mode.empty()) cfg.allocator.mode = parse_allocator_mode(mode);
        if (s->contains("seed") && !s->at("seed").is_null()) {
            uint64_t seed = 0;
            read(*s, "seed", seed);
            cfg.allocator.seed = seed;
        }
        read(*s, "capacity", cfg.allocator.capacity);
        std::string scope;
        read(*s, "scope", scope);
        if (!scope.empty()) cfg.allocator.scope = parse_allocator_scope(scope);
    }

    if (const auto* s = section(doc, "classification")) {
        read(*s, "top_k", cfg.fusion.top_k);
        read(*s, "feature_scale", cfg.fusion.feature_scale);
        read(*s, "ndc_taxonomy", cfg.ndc_taxonomy_path);
        read(*s, "kindle_taxonomy", cfg.kindle_taxonomy_path);
    }

    if (const auto* s = section(doc, "ledger")) {
        read(*s, "enabled", cfg.ledger.enabled);
        read(*s, "skip_known", cfg.ledger.skip_known);
        read(*s, "conninfo", cfg.ledger.conninfo);
        read(*s, "host", cfg.ledger.host);
        read(*s, "port", cfg.ledger.port);
        read(*s, "dbname", cfg.ledger.dbname);
        read(*s, "user", cfg.ledger.user);
        read(*s, "password", cfg.ledger.password);
    }

    cfg.validate();
    return cfg;
}

PipelineConfig PipelineConfig::from_json(const nlohmann::json& doc) {
    return from_json(doc, PipelineConfig());
}

PipelineConfig PipelineConfig::load_file(const std::filesystem::path& path, PipelineConfig base) {
    std::ifstream file(path);
    if (!file) throw ConfigError("Cannot open config file: " + path.string());

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path.string() + ": " + e.what());
    }

    Logger::debug("Loaded config " + path.string());
    return from_json(doc, std::move(base));
}

PipelineConfig PipelineConfig::load_file(const std::filesystem::path& path) {
    return load_file(path, PipelineConfig());
}

void PipelineConfig::apply_env() {
    if (const char* v = env("LEXIGRAPH_DATA_DIR")) data_dir = v;
    if (const char* v = env("LEXIGRAPH_SCRIPT_DIR")) script_dir = v;
    if (const char* v = env("LEXIGRAPH_LOG_LEVEL")) log_level = v;
    if (const char* v = env("LEXIGRAPH_WORKERS")) workers = static_cast<size_t>(parse_u64(v, "LEXIGRAPH_WORKERS"));
    if (const char* v = env("LEXIGRAPH_ALLOCATOR_MODE")) allocator.mode = parse_allocator_mode(v);
    if (const char* v = env("LEXIGRAPH_ALLOCATOR_SEED")) allocator.seed = parse_u64(v, "LEXIGRAPH_ALLOCATOR_SEED");
    if (const char* v = env("LEXIGRAPH_ALLOCATOR_SCOPE")) allocator.scope = parse_allocator_scope(v);
    if (const char* v = env("LEXIGRAPH_LEDGER")) ledger.enabled = std::string(v) != "0";

    if (const char* v = env("PGHOST")) ledger.host = v;
    if (const char* v = env("PGPORT")) ledger.port = v;
    if (const char* v = env("PGDATABASE")) ledger.dbname = v;
    if (const char* v = env("PGUSER")) ledger.user = v;
    if (const char* v = env("PGPASSWORD")) ledger.password = v;

    validate();
}

void PipelineConfig::validate() const {
    if (data_dir.empty()) throw ConfigError("data_dir must not be empty");
    if (script_dir.empty()) throw ConfigError("script_dir must not be empty");
    if (workers == 0) throw ConfigError("workers must be at least 1");
    if (segmenter.segment_size == 0) throw ConfigError("segmenter.segment_size must be at least 1");
    if (segmenter.boundaries.empty()) throw ConfigError("segmenter.boundaries must not be empty");
    if (terms_per_sentence == 0) throw ConfigError("keywords.terms_per_sentence must be at least 1");
    if (key_terms_per_segment == 0) throw ConfigError("keywords.key_terms_per_segment must be at least 1");
    bool has_tag_char = false;
    for (char c : entity_type) has_tag_char |= std::isalnum(static_cast<unsigned char>(c)) != 0;
    if (!has_tag_char) throw ConfigError("entity_type needs at least one ASCII letter or digit");
    if (allocator.capacity == 0 || allocator.capacity > IdAllocator::kMaxCapacity) {
        throw ConfigError("allocator.capacity must be in [1, " + std::to_string(IdAllocator::kMaxCapacity) + "]");
    }
    if (fusion.top_k == 0) throw ConfigError("classification.top_k must be at least 1");
    if (fusion.feature_scale < 0.0) throw ConfigError("classification.feature_scale must be non-negative");

    const auto lvl = Logger::parse_level(log_level, Logger::Level::Off);
    if (lvl == Logger::Level::Off && log_level != "off") {
        throw ConfigError("Unknown log_level '" + log_level + "'");
    }
}

} // namespace Lexigraph

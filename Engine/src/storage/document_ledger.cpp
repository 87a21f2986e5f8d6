#include <storage/document_ledger.hpp>
#include <utils/logger.hpp>

namespace Lexigraph {

PostgresDocumentLedger::PostgresDocumentLedger(const std::string& conninfo) : db_(conninfo) {
    ensure_schema();
}

void PostgresDocumentLedger::ensure_schema() {
    PostgresConnection::Transaction txn(db_);
    db_.execute("CREATE SCHEMA IF NOT EXISTS lexigraph");
    db_.execute(
        "CREATE TABLE IF NOT EXISTS lexigraph.document ("
        "  document_id    TEXT PRIMARY KEY,"
        "  fingerprint    TEXT NOT NULL,"
        "  title          TEXT NOT NULL,"
        "  source_path    TEXT NOT NULL,"
        "  ingested_at    BIGINT NOT NULL,"
        "  sentence_count INTEGER NOT NULL,"
        "  entity_count   INTEGER NOT NULL,"
        "  record_path    TEXT NOT NULL,"
        "  script_path    TEXT NOT NULL"
        ")");
    db_.execute("CREATE INDEX IF NOT EXISTS document_fingerprint_idx ON lexigraph.document (fingerprint)");
    txn.commit();
    Logger::debug("Ledger schema ready");
}

std::optional<std::string> PostgresDocumentLedger::find(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.query_single(
        "SELECT document_id FROM lexigraph.document WHERE fingerprint = $1 "
        "ORDER BY ingested_at DESC, document_id DESC LIMIT 1",
        {fingerprint});
}

void PostgresDocumentLedger::record(const LedgerEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction txn(db_);
    db_.execute(
        "INSERT INTO lexigraph.document (document_id, fingerprint, title, source_path, ingested_at, "
        "sentence_count, entity_count, record_path, script_path) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) "
        "ON CONFLICT (document_id) DO UPDATE SET "
        "fingerprint = EXCLUDED.fingerprint, title = EXCLUDED.title, source_path = EXCLUDED.source_path, "
        "ingested_at = EXCLUDED.ingested_at, sentence_count = EXCLUDED.sentence_count, "
        "entity_count = EXCLUDED.entity_count, record_path = EXCLUDED.record_path, "
        "script_path = EXCLUDED.script_path",
        {
            entry.document_id,
            entry.fingerprint,
            entry.title,
            entry.source_path,
            std::to_string(entry.ingested_at_ms),
            std::to_string(entry.sentence_count),
            std::to_string(entry.entity_count),
            entry.record_path,
            entry.script_path
        });
    txn.commit();
}

std::optional<std::string> InMemoryDocumentLedger::find(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_by_fingerprint_.find(fingerprint);
    if (it == latest_by_fingerprint_.end()) return std::nullopt;
    return it->second;
}

void InMemoryDocumentLedger::record(const LedgerEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_id_[entry.document_id] = entry;
    latest_by_fingerprint_[entry.fingerprint] = entry.document_id;
}

size_t InMemoryDocumentLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_id_.size();
}

std::optional<LedgerEntry> InMemoryDocumentLedger::entry(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(document_id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

} // namespace Lexigraph

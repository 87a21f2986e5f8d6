/**
 * @file document_ledger.hpp
 * @brief Audit trail of ingested documents, keyed by content fingerprint
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Lexigraph {

struct LedgerEntry {
    std::string document_id;
    std::string fingerprint;
    std::string title;
    std::string source_path;
    uint64_t ingested_at_ms = 0;      // Wall-clock time of the write, in every allocator mode
    size_t sentence_count = 0;
    size_t entity_count = 0;
    std::string record_path;
    std::string script_path;
};

class DocumentLedger {
public:
    virtual ~DocumentLedger() = default;

    /// Most recent document ID ingested with this fingerprint.
    virtual std::optional<std::string> find(const std::string& fingerprint) = 0;

    /// Insert or replace the entry for entry.document_id.
    virtual void record(const LedgerEntry& entry) = 0;
};

/**
 * @brief Ledger in table lexigraph.document.
 *
 * Creates the schema on first use. Calls are serialized; one connection
 * is shared by all workers.
 */
class PostgresDocumentLedger : public DocumentLedger {
public:
    /// @throws LedgerError if the connection or schema setup fails
    explicit PostgresDocumentLedger(const std::string& conninfo);

    std::optional<std::string> find(const std::string& fingerprint) override;
    void record(const LedgerEntry& entry) override;

private:
    void ensure_schema();

    std::mutex mutex_;
    PostgresConnection db_;
};

/**
 * @brief Process-local ledger, for runs without a database.
 */
class InMemoryDocumentLedger : public DocumentLedger {
public:
    std::optional<std::string> find(const std::string& fingerprint) override;
    void record(const LedgerEntry& entry) override;

    size_t size() const;
    std::optional<LedgerEntry> entry(const std::string& document_id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LedgerEntry> by_id_;
    std::unordered_map<std::string, std::string> latest_by_fingerprint_;
};

} // namespace Lexigraph

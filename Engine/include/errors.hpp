/**
 * @file errors.hpp
 * @brief Exception taxonomy for the ingestion pipeline
 *
 * Every failure a document can hit derives from IngestionError so a batch
 * driver can isolate it per document. Classification fallbacks are not
 * errors and never appear here.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Lexigraph {

class IngestionError : public std::runtime_error {
public:
    explicit IngestionError(const std::string& msg) : std::runtime_error(msg) {}

    /// Short stable name used in batch reports and logs.
    virtual const char* kind() const noexcept { return "IngestionError"; }
};

/// Empty or whitespace-only input. Nothing is written.
class EmptyInputError : public IngestionError {
public:
    explicit EmptyInputError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "EmptyInputError"; }
};

/// Input file missing or unreadable.
class SourceReadError : public IngestionError {
public:
    explicit SourceReadError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "SourceReadError"; }
};

/// Counter overflow inside one allocation window. Fatal for the document.
class AllocatorExhaustedError : public IngestionError {
public:
    explicit AllocatorExhaustedError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "AllocatorExhaustedError"; }
};

/// Referential-integrity violation found before artifact emission.
class IntegrityError : public IngestionError {
public:
    explicit IntegrityError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "IntegrityError"; }
};

/// Artifact could not be written or moved into place.
class ArtifactWriteError : public IngestionError {
public:
    explicit ArtifactWriteError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "ArtifactWriteError"; }
};

/// Malformed configuration, taxonomy, embedding or record file.
class ConfigError : public IngestionError {
public:
    explicit ConfigError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "ConfigError"; }
};

/// Ledger database failure.
class LedgerError : public IngestionError {
public:
    explicit LedgerError(const std::string& msg) : IngestionError(msg) {}
    const char* kind() const noexcept override { return "LedgerError"; }
};

} // namespace Lexigraph

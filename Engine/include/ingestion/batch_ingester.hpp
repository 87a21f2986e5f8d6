/**
 * @file batch_ingester.hpp
 * @brief Many documents, bounded parallelism, per-document failure isolation
 */

#pragma once

#include <ingestion/document_ingester.hpp>
#include <string>
#include <vector>

namespace Lexigraph {

struct BatchInput {
    std::string text;
    std::string title;
    std::string source_path;
};

/**
 * @brief Result of one document in a batch
 */
struct DocumentOutcome {
    std::string source;           // Path or source label
    bool ok = false;
    IngestionStats stats;         // Valid when ok
    std::string error_kind;       // Exception class name when !ok
    std::string message;
};

struct BatchReport {
    std::vector<DocumentOutcome> outcomes;   // Input order
    size_t succeeded = 0;
    size_t skipped = 0;                      // Counted in succeeded as well
    size_t failed = 0;
    double elapsed_ms = 0.0;

    bool all_succeeded() const { return failed == 0; }
};

class BatchIngester {
public:
    /**
     * @param ingester Shared, used concurrently by all workers
     * @param workers Thread count for the document loop
     */
    BatchIngester(const DocumentIngester& ingester, size_t workers);

    /// Ingest files; an unreadable file fails alone.
    BatchReport run_files(const std::vector<std::string>& paths) const;

    /// Ingest in-memory documents.
    BatchReport run(const std::vector<BatchInput>& inputs) const;

    /**
     * @brief Files to ingest under a path: the path itself if it is a file,
     * otherwise every regular file with the extension below it, sorted.
     *
     * @throws SourceReadError if the path does not exist
     */
    static std::vector<std::string> collect_inputs(const std::string& path,
                                                   const std::string& extension = ".txt");

private:
    template <typename Input, typename Fn>
    BatchReport run_each(const std::vector<Input>& inputs, Fn&& ingest_one) const;

    const DocumentIngester& ingester_;
    size_t workers_;
};

} // namespace Lexigraph

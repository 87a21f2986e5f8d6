/**
 * @file batch_ingester.cpp
 * @brief OpenMP document loop
 */

#include <ingestion/batch_ingester.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <filesystem>

namespace Lexigraph {

namespace fs = std::filesystem;

namespace {

std::string label_of(const std::string& path) { return path; }
std::string label_of(const BatchInput& input) {
    return input.source_path.empty() ? input.title : input.source_path;
}

} // namespace

BatchIngester::BatchIngester(const DocumentIngester& ingester, size_t workers)
    : ingester_(ingester), workers_(std::max<size_t>(1, workers)) {}

template <typename Input, typename Fn>
BatchReport BatchIngester::run_each(const std::vector<Input>& inputs, Fn&& ingest_one) const {
    Timer timer;
    BatchReport report;
    report.outcomes.resize(inputs.size());

    // One allocator for the whole batch unless IDs are scoped per document.
    auto shared = ingester_.make_shared_allocator();
    IdAllocator* allocator = shared.get();

    const int threads = static_cast<int>(workers_);
    const long long n = static_cast<long long>(inputs.size());

    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long long i = 0; i < n; ++i) {
        DocumentOutcome& out = report.outcomes[static_cast<size_t>(i)];
        const Input& input = inputs[static_cast<size_t>(i)];
        out.source = label_of(input);
        try {
            out.stats = ingest_one(input, allocator);
            out.ok = true;
        } catch (const IngestionError& e) {
            out.error_kind = e.kind();
            out.message = e.what();
        } catch (const std::exception& e) {
            out.error_kind = "std::exception";
            out.message = e.what();
        }
        if (!out.ok) Logger::error(out.source + ": " + out.error_kind + ": " + out.message);
    }

    for (const auto& o : report.outcomes) {
        if (o.ok) {
            report.succeeded++;
            if (o.stats.skipped) report.skipped++;
        } else {
            report.failed++;
        }
    }
    report.elapsed_ms = timer.elapsed_ms();

    const std::string summary = std::to_string(report.succeeded) + " ingested (" +
                                std::to_string(report.skipped) + " skipped), " +
                                std::to_string(report.failed) + " failed in " +
                                std::to_string(static_cast<long long>(report.elapsed_ms)) + " ms";
    if (report.failed) Logger::warn("Batch: " + summary);
    else Logger::success("Batch: " + summary);
    return report;
}

BatchReport BatchIngester::run_files(const std::vector<std::string>& paths) const {
    Logger::step("Ingesting " + std::to_string(paths.size()) + " files with " +
                 std::to_string(workers_) + " workers");
    return run_each(paths, [this](const std::string& path, IdAllocator* allocator) {
        return ingester_.ingest_file(path, allocator);
    });
}

BatchReport BatchIngester::run(const std::vector<BatchInput>& inputs) const {
    return run_each(inputs, [this](const BatchInput& input, IdAllocator* allocator) {
        return ingester_.ingest(input.text, input.title, input.source_path, allocator);
    });
}

std::vector<std::string> BatchIngester::collect_inputs(const std::string& path, const std::string& extension) {
    std::error_code ec;
    if (!fs::exists(path, ec)) throw SourceReadError("No such file or directory: " + path);
    if (fs::is_regular_file(path, ec)) return {path};

    std::vector<std::string> files;
    for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == extension) {
            files.push_back(it->path().string());
        }
    }
    if (ec) throw SourceReadError("Cannot list " + path + ": " + ec.message());

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace Lexigraph

#include <storage/artifact_store.hpp>
#include <errors.hpp>
#include <atomic>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace Lexigraph {

namespace {

std::atomic<uint64_t> g_temp_sequence{0};

std::filesystem::path temp_sibling(const std::filesystem::path& target) {
    std::filesystem::path tmp = target;
    tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_temp_sequence.fetch_add(1));
    return tmp;
}

} // namespace

ArtifactStore::ArtifactStore(std::filesystem::path data_dir, std::filesystem::path script_dir)
    : data_dir_(std::move(data_dir)), script_dir_(std::move(script_dir)) {}

ArtifactPaths ArtifactStore::paths_for(const std::string& document_id) const {
    return {data_dir_ / (document_id + ".json"), script_dir_ / (document_id + ".cypher")};
}

namespace {

void discard(const std::filesystem::path& path) {
    std::error_code ignored;
    std::filesystem::remove(path, ignored);
}

// Writes content to a temporary sibling of target and returns its path.
std::filesystem::path stage(const std::filesystem::path& target, const std::string& content) {
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) throw ArtifactWriteError("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
    }

    const std::filesystem::path tmp = temp_sibling(target);
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw ArtifactWriteError("Cannot open " + tmp.string() + " for writing");
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        out.close();
        discard(tmp);
        throw ArtifactWriteError("Short write to " + tmp.string());
    }
    return tmp;
}

void commit(const std::filesystem::path& tmp, const std::filesystem::path& target) {
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        discard(tmp);
        throw ArtifactWriteError("Cannot move " + tmp.string() + " to " + target.string() + ": " + ec.message());
    }
}

} // namespace

void ArtifactStore::write_atomic(const std::filesystem::path& target, const std::string& content) {
    commit(stage(target, content), target);
}

ArtifactPaths ArtifactStore::write(const std::string& document_id, const GraphArtifact& artifact) const {
    ArtifactPaths paths = paths_for(document_id);

    // Both files are staged before either becomes visible.
    const std::filesystem::path record_tmp = stage(paths.record, artifact.record.dump(2) + "\n");
    std::filesystem::path script_tmp;
    try {
        script_tmp = stage(paths.script, artifact.script);
    } catch (const ArtifactWriteError&) {
        discard(record_tmp);
        throw;
    }

    try {
        commit(record_tmp, paths.record);
    } catch (const ArtifactWriteError&) {
        discard(script_tmp);
        throw;
    }

    try {
        commit(script_tmp, paths.script);
    } catch (const ArtifactWriteError&) {
        discard(paths.record);
        throw;
    }
    return paths;
}

} // namespace Lexigraph

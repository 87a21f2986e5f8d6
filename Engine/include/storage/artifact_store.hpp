#pragma once

#include <graph/graph_artifact_builder.hpp>
#include <filesystem>
#include <string>

namespace Lexigraph {

struct ArtifactPaths {
    std::filesystem::path record;
    std::filesystem::path script;
};

/**
 * @brief Writes <data_dir>/<id>.json and <script_dir>/<id>.cypher.
 *
 * Each file goes to a temporary sibling first and is renamed over the
 * target, so a reader sees the old file or the new one, never a mix.
 * write() stages both files before renaming either, and leaves neither
 * behind when it throws.
 */
class ArtifactStore {
public:
    ArtifactStore(std::filesystem::path data_dir, std::filesystem::path script_dir);

    /// @throws ArtifactWriteError
    ArtifactPaths write(const std::string& document_id, const GraphArtifact& artifact) const;

    ArtifactPaths paths_for(const std::string& document_id) const;

    /// @throws ArtifactWriteError
    static void write_atomic(const std::filesystem::path& target, const std::string& content);

    const std::filesystem::path& data_dir() const { return data_dir_; }
    const std::filesystem::path& script_dir() const { return script_dir_; }

private:
    std::filesystem::path data_dir_;
    std::filesystem::path script_dir_;
};

} // namespace Lexigraph

/**
 * @file taxonomy.hpp
 * @brief Static category schemes used for document classification
 *
 * Two schemes ship compiled in: NDC (Nippon Decimal Classification, ten
 * top-level classes) and Kindle store genres. Each category carries its
 * keyword list and a fixed sub-distribution over concept keys that the
 * fusion step scales by the category score.
 */

#pragma once

#include <classification/concept_weights.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace Lexigraph {

struct Category {
    std::string code;                   // Stable identifier ("900", "Romance")
    std::string name;                   // Display name
    std::vector<std::string> keywords;  // Case-folded, UTF-8
    ConceptVector concepts = ConceptVector::Zero();  // Raw, not normalized
};

/**
 * @brief An ordered, immutable list of categories.
 *
 * Declaration order is significant: it is the tie-break order for ranking.
 */
class Taxonomy {
public:
    /**
     * @throws ConfigError if categories is empty or codes repeat
     */
    Taxonomy(std::string scheme, std::vector<Category> categories);

    const std::string& scheme() const { return scheme_; }
    const std::vector<Category>& categories() const { return categories_; }
    size_t size() const { return categories_.size(); }

    /// NDC 10th edition top-level classes.
    static Taxonomy ndc();

    /// Kindle store genres.
    static Taxonomy kindle();

    /**
     * @brief Build from {"scheme", "categories": [{"code", "name", "keywords", "concepts"}]}.
     *
     * Unknown concept keys are rejected so typos do not silently drop weight.
     * The category name is added to its own keyword list.
     *
     * @throws ConfigError on malformed input
     */
    static Taxonomy from_json(const nlohmann::json& doc);

    /// @throws ConfigError if the file cannot be read or parsed
    static Taxonomy load_file(const std::filesystem::path& path);

private:
    std::string scheme_;
    std::vector<Category> categories_;
};

} // namespace Lexigraph

/**
 * @file taxonomy.cpp
 * @brief Built-in NDC and Kindle tables and the JSON loader
 */

#include <classification/taxonomy.hpp>
#include <errors.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace Lexigraph {

namespace {

using ConceptList = std::vector<std::pair<std::string_view, double>>;

Category make_category(std::string code, std::string name,
                       const std::vector<std::string>& keywords, const ConceptList& concepts) {
    Category cat;
    cat.code = std::move(code);
    cat.name = std::move(name);

    std::unordered_set<std::string> seen;
    auto add_keyword = [&](const std::string& kw) {
        std::string folded = fold_case_utf8(kw);
        if (!folded.empty() && seen.insert(folded).second) cat.keywords.push_back(std::move(folded));
    };
    for (const auto& kw : keywords) add_keyword(kw);
    add_keyword(cat.name);

    for (const auto& [key, weight] : concepts) {
        auto idx = concept_index(key);
        if (!idx) throw ConfigError("Unknown concept key '" + std::string(key) + "' in category " + cat.code);
        cat.concepts[static_cast<Eigen::Index>(*idx)] += weight;
    }
    return cat;
}

} // namespace

Taxonomy::Taxonomy(std::string scheme, std::vector<Category> categories)
    : scheme_(std::move(scheme)), categories_(std::move(categories)) {
    if (categories_.empty()) {
        throw ConfigError("Taxonomy '" + scheme_ + "' has no categories");
    }
    std::unordered_set<std::string> codes;
    for (const auto& c : categories_) {
        if (!codes.insert(c.code).second) {
            throw ConfigError("Taxonomy '" + scheme_ + "' repeats category code " + c.code);
        }
    }
}

Taxonomy Taxonomy::ndc() {
    return Taxonomy("NDC", {
        make_category("000", "総記", {"辞典", "百科事典", "一般", "参考書", "general", "reference", "encyclopedia"},
                      {{"natural", 0.1}, {"temporal", 0.1}, {"spatial", 0.1}}),
        make_category("100", "哲学", {"思想", "心理", "倫理", "宗教", "philosophy", "thought", "psychology", "ethics"},
                      {{"emotion", 0.3}, {"relationship", 0.2}, {"causality", 0.2}}),
        make_category("200", "歴史", {"過去", "伝記", "地理", "旅行", "history", "past", "biography", "geography"},
                      {{"temporal", 0.4}, {"spatial", 0.2}, {"relationship", 0.2}}),
        make_category("300", "社会科学", {"社会", "政治", "経済", "法律", "教育", "society", "politics", "economics", "law"},
                      {{"relationship", 0.4}, {"action", 0.3}, {"causality", 0.2}}),
        make_category("400", "自然科学", {"科学", "数学", "物理", "化学", "生物", "自然", "science", "mathematics", "physics"},
                      {{"natural", 0.4}, {"spatial", 0.2}, {"causality", 0.2}}),
        make_category("500", "技術", {"工学", "機械", "建築", "医学", "technology", "engineering", "medicine"},
                      {{"action", 0.4}, {"spatial", 0.3}, {"natural", 0.2}}),
        make_category("600", "産業", {"農業", "商業", "交通", "通信", "industry", "agriculture", "commerce"},
                      {{"action", 0.4}, {"relationship", 0.3}, {"natural", 0.2}}),
        make_category("700", "芸術", {"美術", "音楽", "演劇", "スポーツ", "art", "music", "theater", "sports"},
                      {{"emotion", 0.3}, {"sensation", 0.3}, {"indirect_emotion", 0.2}}),
        make_category("800", "言語", {"語学", "日本語", "英語", "文字", "language", "linguistics", "japanese"},
                      {{"discourse_structure", 0.4}, {"emotion", 0.3}, {"relationship", 0.2}}),
        make_category("900", "文学", {"小説", "詩", "物語", "作品", "猫", "literature", "fiction", "novel", "story"},
                      {{"narrative_structure", 0.4}, {"character_function", 0.3}, {"emotion", 0.2}}),
    });
}

Taxonomy Taxonomy::kindle() {
    return Taxonomy("Kindle", {
        make_category("Literature & Fiction", "Literature & Fiction",
                      {"文学", "小説", "物語", "作品", "猫", "fiction", "novel", "story", "literature"},
                      {{"narrative_structure", 0.4}, {"character_function", 0.3}, {"emotion", 0.2}}),
        make_category("Non-fiction", "Non-fiction",
                      {"ノンフィクション", "エッセイ", "伝記", "実話", "nonfiction", "essay", "biography"},
                      {{"action", 0.3}, {"relationship", 0.3}, {"natural", 0.2}}),
        make_category("Romance", "Romance",
                      {"恋愛", "ロマンス", "愛", "恋", "romance", "love", "relationship"},
                      {{"emotion", 0.4}, {"relationship", 0.4}, {"sensation", 0.1}}),
        make_category("Mystery", "Mystery",
                      {"ミステリー", "推理", "探偵", "犯罪", "mystery", "detective", "crime"},
                      {{"causality", 0.4}, {"action", 0.3}, {"emotion", 0.2}}),
        make_category("Science Fiction", "Science Fiction",
                      {"SF", "未来", "宇宙", "科学", "scifi", "future", "space", "science"},
                      {{"natural", 0.3}, {"spatial", 0.3}, {"temporal", 0.2}}),
        make_category("Fantasy", "Fantasy",
                      {"ファンタジー", "魔法", "幻想", "fantasy", "magic", "mythical"},
                      {{"indirect_emotion", 0.3}, {"natural", 0.3}, {"narrative_structure", 0.2}}),
        make_category("Business", "Business",
                      {"ビジネス", "経営", "金融", "仕事", "business", "management", "finance"},
                      {{"action", 0.4}, {"relationship", 0.3}, {"causality", 0.2}}),
        make_category("Self-Help", "Self-Help",
                      {"自己啓発", "改善", "ガイド", "成長", "selfhelp", "improvement", "guide"},
                      {{"action", 0.4}, {"emotion", 0.3}, {"relationship", 0.2}}),
    });
}

Taxonomy Taxonomy::from_json(const nlohmann::json& doc) {
    try {
        std::string scheme = doc.at("scheme").get<std::string>();
        const auto& cats = doc.at("categories");
        if (!cats.is_array()) throw ConfigError("Taxonomy '" + scheme + "': categories must be an array");

        std::vector<Category> categories;
        categories.reserve(cats.size());
        for (const auto& item : cats) {
            std::string code = item.at("code").get<std::string>();
            std::string name = item.value("name", code);
            std::vector<std::string> keywords = item.value("keywords", std::vector<std::string>{});

            // Kept as owned strings: the ConceptList views must outlive make_category.
            std::vector<std::pair<std::string, double>> owned;
            if (item.contains("concepts")) {
                for (const auto& [key, value] : item.at("concepts").items()) {
                    owned.emplace_back(key, value.get<double>());
                }
            }
            ConceptList concepts;
            for (const auto& [key, weight] : owned) concepts.emplace_back(key, weight);

            categories.push_back(make_category(std::move(code), std::move(name), keywords, concepts));
        }
        return Taxonomy(std::move(scheme), std::move(categories));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed taxonomy: ") + e.what());
    }
}

Taxonomy Taxonomy::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("Cannot open taxonomy file: " + path.string());
    try {
        return from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse taxonomy file " + path.string() + ": " + e.what());
    }
}

} // namespace Lexigraph

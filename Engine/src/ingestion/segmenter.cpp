#include <ingestion/segmenter.hpp>
#include <errors.hpp>
#include <algorithm>

namespace Lexigraph {

Segmenter::Segmenter(SegmenterConfig config) : config_(std::move(config)) {
    if (config_.segment_size == 0) throw ConfigError("segment_size must be at least 1");
    if (config_.boundaries.empty()) throw ConfigError("Sentence boundary class is empty");
}

bool Segmenter::is_boundary(char32_t cp) const {
    return config_.boundaries.find(cp) != std::u32string::npos;
}

SegmentedText Segmenter::segment(const std::u32string& text) const {
    SegmentedText out;

    std::u32string current;
    auto flush = [&]() {
        std::u32string s = trim(current);
        if (!s.empty()) out.sentences.push_back(std::move(s));
        current.clear();
    };

    for (char32_t cp : text) {
        if (cp == U'\r' || cp == U'\n') {
            current.push_back(U' ');
        } else if (is_boundary(cp)) {
            flush();
        } else {
            current.push_back(cp);
        }
    }
    flush();

    if (out.sentences.empty()) {
        throw EmptyInputError("Input contains no sentences (empty or whitespace-only text)");
    }

    const size_t n = out.sentences.size();
    for (size_t start = 0; start < n; start += config_.segment_size) {
        const size_t end = std::min(start + config_.segment_size, n);
        std::vector<size_t> group;
        group.reserve(end - start);
        for (size_t i = start; i < end; ++i) group.push_back(i);
        out.segments.push_back(std::move(group));
    }
    return out;
}

} // namespace Lexigraph

/**
 * @file segmenter.hpp
 * @brief Sentence splitting and fixed-size sentence grouping
 */

#pragma once

#include <utils/unicode.hpp>
#include <string>
#include <vector>

namespace Lexigraph {

struct SegmenterConfig {
    std::u32string boundaries = U"。．.!?！？";  // Sentence-final punctuation, Latin and CJK
    size_t segment_size = 5;                      // Sentences per segment
};

/**
 * @brief Output of segmentation
 *
 * segments[k] lists sentence indices; together they partition
 * [0, sentences.size()) in order.
 */
struct SegmentedText {
    std::vector<std::u32string> sentences;
    std::vector<std::vector<size_t>> segments;
};

class Segmenter {
public:
    /**
     * @throws ConfigError if segment_size is 0 or the boundary class is empty
     */
    explicit Segmenter(SegmenterConfig config = SegmenterConfig());

    /**
     * @brief Split text into sentences and group them.
     *
     * Line breaks become spaces. Runs of boundary characters count as one
     * boundary. Text without any boundary is a single sentence.
     *
     * @throws EmptyInputError when no non-blank sentence remains
     */
    SegmentedText segment(const std::u32string& text) const;

    SegmentedText segment(const std::string& utf8) const {
        return segment(utf8_to_utf32(utf8));
    }

    const SegmenterConfig& config() const { return config_; }

private:
    bool is_boundary(char32_t cp) const;

    SegmenterConfig config_;
};

} // namespace Lexigraph

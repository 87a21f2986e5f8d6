/**
 * @file test_segmenter.cpp
 * @brief Sentence splitting and fixed-size grouping
 */

#include <gtest/gtest.h>
#include <ingestion/segmenter.hpp>
#include <errors.hpp>

using namespace Lexigraph;

static size_t total_members(const SegmentedText& s) {
    size_t n = 0;
    for (const auto& seg : s.segments) n += seg.size();
    return n;
}

// ============================================================================
// Splitting
// ============================================================================

TEST(SegmenterTest, JapaneseSentences) {
    Segmenter seg;
    auto out = seg.segment(std::string("猫が座った。犬が走った。猫が笑った。"));

    ASSERT_EQ(out.sentences.size(), 3u);
    EXPECT_EQ(utf32_to_utf8(out.sentences[0]), "猫が座った");
    EXPECT_EQ(utf32_to_utf8(out.sentences[1]), "犬が走った");
    EXPECT_EQ(utf32_to_utf8(out.sentences[2]), "猫が笑った");
    ASSERT_EQ(out.segments.size(), 1u);
    EXPECT_EQ(out.segments[0], (std::vector<size_t>{0, 1, 2}));
}

TEST(SegmenterTest, NoBoundaryIsOneSentence) {
    Segmenter seg;
    auto out = seg.segment(std::string("a line without any terminal punctuation"));
    ASSERT_EQ(out.sentences.size(), 1u);
    EXPECT_EQ(utf32_to_utf8(out.sentences[0]), "a line without any terminal punctuation");
    EXPECT_EQ(out.segments.size(), 1u);
}

TEST(SegmenterTest, BoundaryRunsCollapse) {
    Segmenter seg;
    auto out = seg.segment(std::string("Wait!!! Really?! Yes..."));
    ASSERT_EQ(out.sentences.size(), 3u);
    EXPECT_EQ(utf32_to_utf8(out.sentences[0]), "Wait");
    EXPECT_EQ(utf32_to_utf8(out.sentences[1]), "Really");
    EXPECT_EQ(utf32_to_utf8(out.sentences[2]), "Yes");
}

TEST(SegmenterTest, LineBreaksBecomeSpaces) {
    Segmenter seg;
    auto out = seg.segment(std::string("line one\r\nline two."));
    ASSERT_EQ(out.sentences.size(), 1u);
    EXPECT_EQ(utf32_to_utf8(out.sentences[0]), "line one  line two");
}

TEST(SegmenterTest, IdeographicSpaceTrimmed) {
    Segmenter seg;
    auto out = seg.segment(std::string("　春が来た。　夏も来た！"));
    ASSERT_EQ(out.sentences.size(), 2u);
    EXPECT_EQ(utf32_to_utf8(out.sentences[0]), "春が来た");
    EXPECT_EQ(utf32_to_utf8(out.sentences[1]), "夏も来た");
}

// ============================================================================
// Grouping
// ============================================================================

TEST(SegmenterTest, FixedSizeWindows) {
    Segmenter seg;
    auto out = seg.segment(std::string("A1. B2. C3. D4. E5. F6. G7."));

    ASSERT_EQ(out.sentences.size(), 7u);
    ASSERT_EQ(out.segments.size(), 2u);
    EXPECT_EQ(out.segments[0].size(), 5u);
    EXPECT_EQ(out.segments[1].size(), 2u);
    EXPECT_EQ(out.segments[1], (std::vector<size_t>{5, 6}));
    EXPECT_EQ(total_members(out), out.sentences.size());
}

TEST(SegmenterTest, CustomSegmentSize) {
    SegmenterConfig cfg;
    cfg.segment_size = 2;
    Segmenter seg(cfg);
    auto out = seg.segment(std::string("a. b. c. d. e."));

    ASSERT_EQ(out.segments.size(), 3u);
    size_t expected = 0;
    for (const auto& group : out.segments) {
        for (size_t idx : group) EXPECT_EQ(idx, expected++);
    }
    EXPECT_EQ(expected, 5u);
}

TEST(SegmenterTest, CustomBoundaries) {
    SegmenterConfig cfg;
    cfg.boundaries = U";";
    Segmenter seg(cfg);
    auto out = seg.segment(std::string("first; second. still second"));
    ASSERT_EQ(out.sentences.size(), 2u);
    EXPECT_EQ(utf32_to_utf8(out.sentences[1]), "second. still second");
}

// ============================================================================
// Errors
// ============================================================================

TEST(SegmenterTest, EmptyInputThrows) {
    Segmenter seg;
    EXPECT_THROW(seg.segment(std::string("")), EmptyInputError);
    EXPECT_THROW(seg.segment(std::string("  \n\t 　")), EmptyInputError);
    EXPECT_THROW(seg.segment(std::string("。。。")), EmptyInputError);
}

TEST(SegmenterTest, InvalidConfigThrows) {
    SegmenterConfig zero;
    zero.segment_size = 0;
    EXPECT_THROW(Segmenter{zero}, ConfigError);

    SegmenterConfig none;
    none.boundaries.clear();
    EXPECT_THROW(Segmenter{none}, ConfigError);
}

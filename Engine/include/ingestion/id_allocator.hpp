/**
 * @file id_allocator.hpp
 * @brief Hierarchical, context-scoped node identifiers
 *
 * Format:  <prefix>_<timestamp>_<counter>_<kind><local>[_<type>]
 *
 *   prefix     12 chars, BLAKE3 of the parent context (same parent → same prefix)
 *   timestamp  13-digit milliseconds
 *   counter    6-digit sequence inside one timestamp window
 *   kind       doc | seg | sen | ent, followed by the local index (≥ 4 digits)
 *   type       entities only: first three letters of the type tag
 *
 * Example: 3aF9c1E04b7d_1723862400123_000042_ent0007_con
 *
 * The (timestamp, counter) pair never repeats within one allocator, and
 * orders identifiers by creation.
 */

#pragma once

#include <utils/time.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Lexigraph {

enum class NodeKind : uint8_t {
    Document,
    Segment,
    Sentence,
    Entity
};

std::string_view node_kind_tag(NodeKind kind);
std::optional<NodeKind> node_kind_from_tag(std::string_view tag);

/**
 * @brief How the timestamp field is produced
 *
 * WallClock: real milliseconds, counter resets each millisecond. Re-ingesting
 * the same document yields a fresh identifier set.
 *
 * DeterministicSeed: timestamp frozen at the seed, counter runs for the whole
 * allocator lifetime. Same seed + same call sequence = same identifiers.
 */
enum class AllocatorMode : uint8_t {
    WallClock,
    DeterministicSeed
};

std::string to_string(AllocatorMode mode);

/// @throws ConfigError for anything but "wall-clock" or "deterministic-seed"
AllocatorMode parse_allocator_mode(const std::string& name);

/**
 * @brief Fields recovered from an identifier string
 */
struct ParsedId {
    std::string prefix;
    uint64_t timestamp_ms = 0;
    uint32_t counter = 0;
    NodeKind kind = NodeKind::Document;
    uint32_t local_index = 0;
    std::string type_tag;          // Entities only

    /// Creation order: timestamp, then counter.
    bool created_before(const ParsedId& other) const {
        if (timestamp_ms != other.timestamp_ms) return timestamp_ms < other.timestamp_ms;
        return counter < other.counter;
    }
};

class IdAllocator {
public:
    static constexpr uint32_t kMaxCapacity = 1000000;   // Fits the 6-digit counter field
    static constexpr uint32_t kDefaultCapacity = 999999;
    static constexpr uint64_t kTimestampModulus = 10000000000000ULL; // 13 digits

    /**
     * @param mode Wall-clock or deterministic
     * @param seed_ms Frozen timestamp for DeterministicSeed, ignored otherwise
     * @param clock Millisecond source for WallClock
     * @param capacity Distinct counters per timestamp window (1..kMaxCapacity)
     * @param prefix_width Characters of context hash in each identifier
     *
     * @throws ConfigError on capacity or width out of range
     */
    IdAllocator(AllocatorMode mode, uint64_t seed_ms,
                MillisecondClock clock = system_clock_ms(),
                uint32_t capacity = kDefaultCapacity,
                size_t prefix_width = 12);

    IdAllocator(const IdAllocator&) = delete;
    IdAllocator& operator=(const IdAllocator&) = delete;

    static IdAllocator wall_clock(MillisecondClock clock = system_clock_ms(),
                                  uint32_t capacity = kDefaultCapacity) {
        return IdAllocator(AllocatorMode::WallClock, 0, std::move(clock), capacity);
    }

    static IdAllocator deterministic(uint64_t seed_ms, uint32_t capacity = kDefaultCapacity) {
        return IdAllocator(AllocatorMode::DeterministicSeed, seed_ms, system_clock_ms(), capacity);
    }

    /**
     * @brief Issue one identifier.
     *
     * @param kind Node kind, encoded in the identifier
     * @param parent_context String describing the logical parent
     * @param local_index Index within the parent (ordinal)
     * @param type_tag Entity type (required for entities, ignored otherwise)
     *
     * @throws AllocatorExhaustedError when the counter window is full
     * @throws std::invalid_argument for an entity without a usable type tag
     */
    std::string allocate(NodeKind kind, std::string_view parent_context,
                         uint32_t local_index, std::string_view type_tag = {});

    /// The fingerprint, when given, keeps same-titled documents apart under a frozen timestamp.
    std::string document_id(const std::string& title, const std::string& source_path,
                            const std::string& fingerprint = "") {
        std::string context = "document_" + title + "_" + source_path;
        if (!fingerprint.empty()) context += "_" + fingerprint;
        return allocate(NodeKind::Document, context, 0);
    }

    std::string segment_id(const std::string& document_id, uint32_t ordinal) {
        return allocate(NodeKind::Segment, document_id, ordinal);
    }

    /// Sentences are scoped to their segment; the ordinal is document-global.
    std::string sentence_id(const std::string& segment_id, uint32_t ordinal) {
        return allocate(NodeKind::Sentence, segment_id, ordinal);
    }

    std::string entity_id(const std::string& document_id, uint32_t index, std::string_view type_tag) {
        return allocate(NodeKind::Entity, document_id, index, type_tag);
    }

    /**
     * @brief Recover the fields of an identifier.
     * @return nullopt if the string is not a well-formed identifier
     */
    static std::optional<ParsedId> parse(std::string_view id);

    AllocatorMode mode() const { return mode_; }
    uint64_t issued() const;

private:
    struct Slot {
        uint64_t timestamp_ms;
        uint32_t counter;
    };

    Slot next_slot();

    const AllocatorMode mode_;
    const uint64_t seed_ms_;
    MillisecondClock clock_;
    const uint32_t capacity_;
    const size_t prefix_width_;

    mutable std::mutex mutex_;
    bool started_ = false;
    uint64_t window_ms_ = 0;
    uint32_t next_counter_ = 0;
    uint64_t issued_ = 0;
};

} // namespace Lexigraph

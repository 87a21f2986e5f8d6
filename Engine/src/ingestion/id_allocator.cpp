#include <ingestion/id_allocator.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <errors.hpp>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace Lexigraph {

namespace {

constexpr size_t kTimestampDigits = 13;
constexpr size_t kCounterDigits = 6;
constexpr size_t kTypeTagWidth = 3;

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool all_alnum(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

template <typename T>
bool parse_number(std::string_view s, T& out) {
    if (!all_digits(s)) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// Lower-case ASCII letters and digits of the tag, truncated to three.
std::string type_tag_field(std::string_view type_tag) {
    std::string out;
    for (char c : type_tag) {
        if (out.size() == kTypeTagWidth) break;
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

std::vector<std::string_view> split_underscore(std::string_view s) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find('_', start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

std::string_view node_kind_tag(NodeKind kind) {
    switch (kind) {
        case NodeKind::Document: return "doc";
        case NodeKind::Segment:  return "seg";
        case NodeKind::Sentence: return "sen";
        case NodeKind::Entity:   return "ent";
    }
    return "doc";
}

std::optional<NodeKind> node_kind_from_tag(std::string_view tag) {
    if (tag == "doc") return NodeKind::Document;
    if (tag == "seg") return NodeKind::Segment;
    if (tag == "sen") return NodeKind::Sentence;
    if (tag == "ent") return NodeKind::Entity;
    return std::nullopt;
}

std::string to_string(AllocatorMode mode) {
    return mode == AllocatorMode::WallClock ? "wall-clock" : "deterministic-seed";
}

AllocatorMode parse_allocator_mode(const std::string& name) {
    if (name == "wall-clock") return AllocatorMode::WallClock;
    if (name == "deterministic-seed") return AllocatorMode::DeterministicSeed;
    throw ConfigError("Unknown allocator mode '" + name +
                      "' (expected wall-clock or deterministic-seed)");
}

IdAllocator::IdAllocator(AllocatorMode mode, uint64_t seed_ms, MillisecondClock clock,
                         uint32_t capacity, size_t prefix_width)
    : mode_(mode),
      seed_ms_(seed_ms % kTimestampModulus),
      clock_(std::move(clock)),
      capacity_(capacity),
      prefix_width_(prefix_width) {
    if (capacity_ == 0 || capacity_ > kMaxCapacity) {
        throw ConfigError("Allocator capacity must be in [1, " + std::to_string(kMaxCapacity) + "]");
    }
    if (prefix_width_ == 0 || prefix_width_ > 64) {
        throw ConfigError("Allocator prefix width must be in [1, 64]");
    }
    if (mode_ == AllocatorMode::WallClock && !clock_) {
        throw ConfigError("Wall-clock allocator requires a clock");
    }
}

IdAllocator::Slot IdAllocator::next_slot() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (mode_ == AllocatorMode::DeterministicSeed) {
        if (!started_) {
            started_ = true;
            window_ms_ = seed_ms_;
            next_counter_ = 0;
        }
    } else {
        // Clamp to the last window so a clock stepping backwards cannot reorder IDs.
        uint64_t now = clock_() % kTimestampModulus;
        if (started_ && now < window_ms_) now = window_ms_;
        if (!started_ || now > window_ms_) {
            started_ = true;
            window_ms_ = now;
            next_counter_ = 0;
        }
    }

    if (next_counter_ >= capacity_) {
        throw AllocatorExhaustedError(
            "Identifier counter exhausted: " + std::to_string(capacity_) +
            " identifiers already issued in window " + std::to_string(window_ms_));
    }

    ++issued_;
    return {window_ms_, next_counter_++};
}

std::string IdAllocator::allocate(NodeKind kind, std::string_view parent_context,
                                  uint32_t local_index, std::string_view type_tag) {
    std::string type_field;
    if (kind == NodeKind::Entity) {
        type_field = type_tag_field(type_tag);
        if (type_field.empty()) {
            throw std::invalid_argument("Entity identifiers require an alphanumeric type tag");
        }
    }

    const Slot slot = next_slot();

    char numbers[64];
    std::snprintf(numbers, sizeof(numbers), "_%013llu_%06u_",
                  static_cast<unsigned long long>(slot.timestamp_ms), slot.counter);
    char local[16];
    std::snprintf(local, sizeof(local), "%04u", local_index);

    std::string id = BLAKE3Pipeline::context_prefix(parent_context, prefix_width_);
    id += numbers;
    id += node_kind_tag(kind);
    id += local;
    if (!type_field.empty()) {
        id += '_';
        id += type_field;
    }
    return id;
}

std::optional<ParsedId> IdAllocator::parse(std::string_view id) {
    auto parts = split_underscore(id);
    if (parts.size() != 4 && parts.size() != 5) return std::nullopt;

    ParsedId out;
    if (!all_alnum(parts[0])) return std::nullopt;
    out.prefix = std::string(parts[0]);

    if (parts[1].size() != kTimestampDigits || !parse_number(parts[1], out.timestamp_ms)) {
        return std::nullopt;
    }
    if (parts[2].size() != kCounterDigits || !parse_number(parts[2], out.counter)) {
        return std::nullopt;
    }

    std::string_view kind_field = parts[3];
    if (kind_field.size() < 4) return std::nullopt;
    auto kind = node_kind_from_tag(kind_field.substr(0, 3));
    if (!kind) return std::nullopt;
    out.kind = *kind;
    if (!parse_number(kind_field.substr(3), out.local_index)) return std::nullopt;

    const bool has_type = parts.size() == 5;
    if (has_type != (out.kind == NodeKind::Entity)) return std::nullopt;
    if (has_type) {
        if (!all_alnum(parts[4]) || parts[4].size() > kTypeTagWidth) return std::nullopt;
        out.type_tag = std::string(parts[4]);
    }
    return out;
}

uint64_t IdAllocator::issued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return issued_;
}

} // namespace Lexigraph

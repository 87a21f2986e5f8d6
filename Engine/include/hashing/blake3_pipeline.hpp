/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content fingerprints and identifier prefixes
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Lexigraph {

/**
 * @brief BLAKE3 hashing for document fingerprints and ID prefixes.
 *
 * SAME BYTES = SAME FINGERPRINT. The raw text is never kept, only this.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t DIGEST_SIZE = BLAKE3_OUT_LEN; // 256 bits
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    /**
     * @brief Hash a buffer
     * @param data Input bytes
     * @param len Length in bytes
     */
    static Digest hash(const void* data, size_t len);

    static Digest hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Lower-case hex of a full digest (64 chars)
     */
    static std::string to_hex(const Digest& digest);

    /**
     * @brief Fixed-width, visually traceable prefix for a parent context.
     *
     * Hex digits of the context digest with letters alternating upper/lower
     * case by position. Identical contexts give identical prefixes.
     *
     * @param width Output length, at most 64
     */
    static std::string context_prefix(std::string_view context, size_t width = 12);

    /**
     * @brief First 8 digest bytes as a big-endian integer.
     */
    static uint64_t leading_u64(const Digest& digest);
};

} // namespace Lexigraph

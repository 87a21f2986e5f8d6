/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Lexigraph {

BLAKE3Pipeline::Digest BLAKE3Pipeline::hash(const void* data, size_t len) {
    Digest result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), DIGEST_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Digest& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : digest) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string BLAKE3Pipeline::context_prefix(std::string_view context, size_t width) {
    if (width > DIGEST_SIZE * 2) {
        throw std::invalid_argument("Prefix width exceeds digest length");
    }

    std::string hex = to_hex(hash(context)).substr(0, width);
    for (size_t i = 0; i < hex.size(); ++i) {
        if (std::isalpha(static_cast<unsigned char>(hex[i])) && i % 2 == 0) {
            hex[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(hex[i])));
        }
    }
    return hex;
}

uint64_t BLAKE3Pipeline::leading_u64(const Digest& digest) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) v = (v << 8) | digest[i];
    return v;
}

} // namespace Lexigraph

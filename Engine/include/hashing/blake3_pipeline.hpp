/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content hashing for source-document deduplication
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace Repealer {

/**
 * @brief BLAKE3 hashing of raw document bytes.
 *
 * SAME BYTES = SAME HASH = INGESTED ONCE
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Incremental hasher for inputs that arrive in pieces (e.g. pages).
     */
    class Hasher {
    public:
        Hasher() { blake3_hasher_init(&state_); }

        Hasher& update(const void* data, size_t len) {
            blake3_hasher_update(&state_, data, len);
            return *this;
        }

        Hasher& update(std::string_view str) { return update(str.data(), str.size()); }

        /// Length-prefixed update so that ("ab","c") and ("a","bc") differ.
        Hasher& update_framed(std::string_view str);

        Hash finalize() const;

    private:
        blake3_hasher state_;
    };

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Hash an ordered list of texts, each framed by its length
     */
    static Hash hash_sequence(const std::vector<std::string>& parts);

    static std::string to_hex(const Hash& hash);

    /// @throws std::invalid_argument on malformed input
    static Hash from_hex(const std::string& hex);
};

} // namespace Repealer

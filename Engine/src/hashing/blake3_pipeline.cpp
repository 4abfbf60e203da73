/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <cctype>
#include <stdexcept>

namespace Repealer {

namespace {
constexpr char k_hex_lut[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}
}

BLAKE3Pipeline::Hasher& BLAKE3Pipeline::Hasher::update_framed(std::string_view str) {
    uint64_t len = str.size();
    uint8_t prefix[8];
    for (int i = 0; i < 8; ++i) prefix[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    update(prefix, sizeof(prefix));
    return update(str);
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::Hasher::finalize() const {
    Hash result;
    blake3_hasher_finalize(&state_, result.data(), HASH_SIZE);
    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hasher h;
    h.update(data, len);
    return h.finalize();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_sequence(const std::vector<std::string>& parts) {
    Hasher h;
    for (const auto& p : parts) h.update_framed(p);
    return h.finalize();
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(k_hex_lut[(byte >> 4) & 0xF]);
        out.push_back(k_hex_lut[byte & 0xF]);
    }
    return out;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) +
                                    ". Expected " + std::to_string(HASH_SIZE * 2) + ".");
    }
    Hash result{};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid hex digit in: " + hex);
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

} // namespace Repealer

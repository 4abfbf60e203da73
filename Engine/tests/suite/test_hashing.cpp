/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 content hashing
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <cctype>
#include <vector>
#include <string>

using namespace Repealer;

TEST(HashingTest, Determinism) {
    std::string data = "Document 015225 Rev. #4 Guy Markers";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, KnownVector) {
    // BLAKE3 of the empty input, truncated to 128 bits
    EXPECT_EQ(BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("")), "af1349b9f5f9a1a6a0404dea36dcc949");
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, HexConversion) {
    auto hash = BLAKE3Pipeline::hash("hex_test");
    std::string hex = BLAKE3Pipeline::to_hex(hash);
    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2

    EXPECT_EQ(BLAKE3Pipeline::from_hex(hex), hash);
    std::string upper = hex;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(BLAKE3Pipeline::from_hex(upper), hash);
}

TEST(HashingTest, MalformedHexRejected) {
    EXPECT_THROW(BLAKE3Pipeline::from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(BLAKE3Pipeline::from_hex(std::string(32, 'g')), std::invalid_argument);
}

TEST(HashingTest, IncrementalMatchesOneShot) {
    BLAKE3Pipeline::Hasher h;
    h.update("page one\f").update("page two");
    EXPECT_EQ(h.finalize(), BLAKE3Pipeline::hash("page one\fpage two"));
}

TEST(HashingTest, SequenceFramingSeparatesBoundaries) {
    auto a = BLAKE3Pipeline::hash_sequence({"ab", "c"});
    auto b = BLAKE3Pipeline::hash_sequence({"a", "bc"});
    auto c = BLAKE3Pipeline::hash_sequence({"abc"});
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a, BLAKE3Pipeline::hash_sequence({"ab", "c"}));
    EXPECT_NE(BLAKE3Pipeline::hash_sequence({}), BLAKE3Pipeline::hash_sequence({""}));
}

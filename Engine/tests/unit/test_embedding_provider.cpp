/**
 * @file test_embedding_provider.cpp
 * @brief Hashing model determinism and the BoundedEmbedder contract
 */

#include <gtest/gtest.h>
#include <ml/embedding_provider.hpp>
#include <core/errors.hpp>
#include "../support/test_support.hpp"
#include <cmath>
#include <numeric>

using namespace Repealer;

namespace {

double dot(const Embedding& a, const Embedding& b) {
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
}

/// Returns whatever it was told to, regardless of input.
class ScriptedProvider : public EmbeddingProvider {
public:
    ScriptedProvider(uint32_t dim, std::vector<Embedding> reply) : dim_(dim), reply_(std::move(reply)) {}
    std::vector<Embedding> encode(const std::vector<std::string>&) override { return reply_; }
    uint32_t dimension() const override { return dim_; }
    std::string model_id() const override { return "scripted"; }

private:
    uint32_t dim_;
    std::vector<Embedding> reply_;
};

} // namespace

TEST(HashingEmbeddingTest, DeterministicUnitVectors) {
    HashingEmbeddingProvider a(128), b(128);
    const std::string text = "Guy markers shall be installed on all down guys";
    auto va = a.encode_one(text);
    auto vb = b.encode_one(text);
    ASSERT_EQ(va.size(), 128u);
    EXPECT_EQ(va, vb);
    EXPECT_NEAR(dot(va, va), 1.0, 1e-5);
    EXPECT_EQ(a.model_id(), "hashing-ngram-v1/128");
}

TEST(HashingEmbeddingTest, RelatedTextIsCloser) {
    HashingEmbeddingProvider p(384);
    auto spec = p.encode_one("Anchor rods shall extend at least 6 inches above grade");
    auto close = p.encode_one("anchor rod does not extend 6 inches above grade");
    auto far = p.encode_one("Transformer nameplate faces the street side of the pole");
    EXPECT_GT(dot(spec, close), dot(spec, far));
    EXPECT_GT(dot(spec, close), 0.4);
}

TEST(HashingEmbeddingTest, CaseAndPunctuationInsensitive) {
    HashingEmbeddingProvider p(64);
    EXPECT_EQ(p.encode_one("Mud Sill, missing!"), p.encode_one("mud sill missing"));
}

TEST(HashingEmbeddingTest, FeaturelessTextIsZero) {
    HashingEmbeddingProvider p(32);
    auto v = p.encode_one("  -- ");
    EXPECT_EQ(v, Embedding(32, 0.0f));
}

TEST(HashingEmbeddingTest, BatchMatchesSingle) {
    HashingEmbeddingProvider p(64);
    std::vector<std::string> texts;
    for (int i = 0; i < 100; ++i) texts.push_back("crossarm brace " + std::to_string(i));
    auto batch = p.encode(texts);
    ASSERT_EQ(batch.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) EXPECT_EQ(batch[i], p.encode_one(texts[i]));
}

TEST(BoundedEmbedderTest, NormalizesProviderOutput) {
    auto provider = std::make_shared<ScriptedProvider>(2, std::vector<Embedding>{{3.0f, 4.0f}});
    BoundedEmbedder embedder(provider);
    auto out = embedder.encode({"x"}, Deadline::unbounded());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0][0], 0.6f, 1e-6);
    EXPECT_NEAR(out[0][1], 0.8f, 1e-6);
    EXPECT_TRUE(embedder.encode({}, Deadline::unbounded()).empty());
}

TEST(BoundedEmbedderTest, RejectsMalformedOutput) {
    BoundedEmbedder wrong_dim(std::make_shared<ScriptedProvider>(4, std::vector<Embedding>{{1.0f, 0.0f}}));
    EXPECT_THROW(wrong_dim.encode({"x"}, Deadline::unbounded()), EmbeddingProviderError);

    BoundedEmbedder wrong_count(std::make_shared<ScriptedProvider>(2, std::vector<Embedding>{}));
    EXPECT_THROW(wrong_count.encode({"x"}, Deadline::unbounded()), EmbeddingProviderError);
}

TEST(BoundedEmbedderTest, WrapsProviderFailure) {
    BoundedEmbedder embedder(std::make_shared<test::FailingEmbeddingProvider>(8, 0));
    try {
        embedder.encode({"x"}, Deadline::unbounded());
        FAIL() << "expected EmbeddingProviderError";
    } catch (const EmbeddingProviderError& e) {
        EXPECT_TRUE(e.retryable());
        EXPECT_NE(std::string(e.what()).find("model server unavailable"), std::string::npos);
    }
    EXPECT_THROW(embedder.encode({"x"}, Deadline(5000)), EmbeddingProviderError);
}

TEST(BoundedEmbedderTest, DeadlineExpires) {
    BoundedEmbedder embedder(std::make_shared<test::SlowEmbeddingProvider>(8, std::chrono::milliseconds(300)));
    EXPECT_THROW(embedder.encode({"x"}, Deadline(20)), EmbeddingTimeoutError);
    EXPECT_EQ(embedder.encode({"x"}, Deadline(5000)).size(), 1u);
}

TEST(BoundedEmbedderTest, RequiresProvider) {
    EXPECT_THROW(BoundedEmbedder(nullptr), std::invalid_argument);
}

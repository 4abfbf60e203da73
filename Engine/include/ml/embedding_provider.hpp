/**
 * @file embedding_provider.hpp
 * @brief Text → fixed-dimension vector
 *
 * The engine treats the embedding model as a black box behind EmbeddingProvider.
 * HashingEmbeddingProvider is a deterministic local model (signed feature hashing
 * of words, word bigrams and character trigrams) so corpora can be built without
 * a model server. Remote or neural providers implement the same interface.
 */

#pragma once

#include <export.hpp>
#include <utils/time.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Repealer {

using Embedding = std::vector<float>;

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Encode a batch of texts. Output order matches input order.
     *
     * Must be deterministic for a given model_id(). Implementations report
     * failures by throwing; the caller wraps them into EmbeddingProviderError.
     */
    virtual std::vector<Embedding> encode(const std::vector<std::string>& texts) = 0;

    virtual uint32_t dimension() const = 0;

    /// Identifier persisted with the corpus. A change forces re-embedding.
    virtual std::string model_id() const = 0;
};

class REPEALER_API HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(uint32_t dimension = 384);

    std::vector<Embedding> encode(const std::vector<std::string>& texts) override;
    uint32_t dimension() const override { return dim_; }
    std::string model_id() const override;

    /// Single-text encoding, unit length (or all zeros for featureless text).
    Embedding encode_one(const std::string& text) const;

private:
    void add_feature(Embedding& v, const std::string& feature, float weight) const;

    uint32_t dim_;
};

/**
 * @brief Calls an EmbeddingProvider under a deadline and enforces the canonical contract.
 *
 * Every returned vector has the provider's dimension and unit length. Provider
 * failures surface as EmbeddingProviderError; an expired deadline as
 * EmbeddingTimeoutError. Either way the caller has received nothing.
 */
class REPEALER_API BoundedEmbedder {
public:
    explicit BoundedEmbedder(std::shared_ptr<EmbeddingProvider> provider);

    std::vector<Embedding> encode(const std::vector<std::string>& texts, const Deadline& deadline) const;

    const EmbeddingProvider& provider() const { return *provider_; }
    uint32_t dimension() const { return provider_->dimension(); }
    std::string model_id() const { return provider_->model_id(); }

    /// Scale v to unit length in place. Zero vectors are left untouched.
    static void normalize(Embedding& v);

private:
    std::vector<Embedding> call_provider(const std::vector<std::string>& texts) const;
    void check_and_normalize(std::vector<Embedding>& out, size_t expected) const;

    std::shared_ptr<EmbeddingProvider> provider_;
};

} // namespace Repealer

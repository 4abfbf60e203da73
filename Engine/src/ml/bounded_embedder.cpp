/**
 * @file bounded_embedder.cpp
 * @brief Deadline enforcement and output validation around an EmbeddingProvider
 */

#include <ml/embedding_provider.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <Eigen/Core>
#include <future>
#include <thread>

namespace Repealer {

BoundedEmbedder::BoundedEmbedder(std::shared_ptr<EmbeddingProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) throw std::invalid_argument("BoundedEmbedder requires a provider");
}

void BoundedEmbedder::normalize(Embedding& v) {
    Eigen::Map<Eigen::VectorXf> mv(v.data(), static_cast<Eigen::Index>(v.size()));
    float n = mv.norm();
    if (n > 0.0f) mv /= n;
}

std::vector<Embedding> BoundedEmbedder::call_provider(const std::vector<std::string>& texts) const {
    try {
        return provider_->encode(texts);
    } catch (const EmbeddingProviderError&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingProviderError(std::string("Embedding provider failed: ") + e.what());
    }
}

void BoundedEmbedder::check_and_normalize(std::vector<Embedding>& out, size_t expected) const {
    if (out.size() != expected) {
        throw EmbeddingProviderError("Embedding provider returned " + std::to_string(out.size()) +
                                     " vectors for " + std::to_string(expected) + " texts");
    }
    const size_t dim = provider_->dimension();
    for (auto& v : out) {
        if (v.size() != dim) {
            throw EmbeddingProviderError("Embedding provider returned dimension " + std::to_string(v.size()) +
                                         ", expected " + std::to_string(dim));
        }
        normalize(v);
    }
}

std::vector<Embedding> BoundedEmbedder::encode(const std::vector<std::string>& texts,
                                               const Deadline& deadline) const {
    if (texts.empty()) return {};

    if (!deadline.bounded()) {
        auto out = call_provider(texts);
        check_and_normalize(out, texts.size());
        return out;
    }
    if (deadline.expired()) {
        throw EmbeddingTimeoutError("Embedding deadline expired before the call was made");
    }

    // The worker owns everything it touches, so it can outlive this call when
    // the deadline fires first.
    auto promise = std::make_shared<std::promise<std::vector<Embedding>>>();
    auto future = promise->get_future();
    auto provider = provider_;
    std::thread worker([promise, provider, texts]() {
        try {
            promise->set_value(provider->encode(texts));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (future.wait_until(deadline.expires_at()) != std::future_status::ready) {
        worker.detach();
        Logger::warn("Embedding call for " + std::to_string(texts.size()) + " texts exceeded its deadline");
        throw EmbeddingTimeoutError("Embedding provider did not answer before the deadline");
    }
    worker.join();

    std::vector<Embedding> out;
    try {
        out = future.get();
    } catch (const EmbeddingProviderError&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingProviderError(std::string("Embedding provider failed: ") + e.what());
    }
    check_and_normalize(out, texts.size());
    return out;
}

} // namespace Repealer

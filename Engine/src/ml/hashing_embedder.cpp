/**
 * @file hashing_embedder.cpp
 * @brief Deterministic feature-hashing embedding model
 */

#include <ml/embedding_provider.hpp>
#include <utils/text.hpp>
#include <Eigen/Core>
#include <cctype>

namespace Repealer {

namespace {

constexpr float k_word_weight = 1.0f;
constexpr float k_bigram_weight = 0.7f;
constexpr float k_trigram_weight = 0.35f;

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

// Lower-cased alphanumeric tokens; '.' stays inside numbers so "4.5" survives.
std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string cur;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        bool keep = std::isalnum(c) || c >= 0x80 ||
                    (c == '.' && !cur.empty() && std::isdigit(static_cast<unsigned char>(cur.back())) &&
                     i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1])));
        if (keep) {
            cur.push_back(static_cast<char>(std::tolower(c)));
        } else if (!cur.empty()) {
            tokens.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(uint32_t dimension) : dim_(dimension) {}

std::string HashingEmbeddingProvider::model_id() const {
    return "hashing-ngram-v1/" + std::to_string(dim_);
}

void HashingEmbeddingProvider::add_feature(Embedding& v, const std::string& feature, float weight) const {
    uint64_t h = fnv1a(feature);
    size_t bucket = static_cast<size_t>(h % dim_);
    float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
    v[bucket] += sign * weight;
}

Embedding HashingEmbeddingProvider::encode_one(const std::string& text) const {
    Embedding v(dim_, 0.0f);
    auto tokens = tokenize(text);

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        add_feature(v, "w:" + tok, k_word_weight);
        if (i + 1 < tokens.size()) add_feature(v, "b:" + tok + " " + tokens[i + 1], k_bigram_weight);

        auto cps = utf8_to_utf32(tok);
        if (cps.size() < 4) continue;
        std::string padded = "<" + tok + ">";
        for (size_t k = 0; k + 3 <= padded.size(); ++k) {
            add_feature(v, "c:" + padded.substr(k, 3), k_trigram_weight);
        }
    }

    Eigen::Map<Eigen::VectorXf> mv(v.data(), static_cast<Eigen::Index>(v.size()));
    float n = mv.norm();
    if (n > 0.0f) mv /= n;
    return v;
}

std::vector<Embedding> HashingEmbeddingProvider::encode(const std::vector<std::string>& texts) {
    std::vector<Embedding> out(texts.size());
    const long n = static_cast<long>(texts.size());

    #pragma omp parallel for schedule(dynamic, 16) if (n > 64)
    for (long i = 0; i < n; ++i) {
        out[static_cast<size_t>(i)] = encode_one(texts[static_cast<size_t>(i)]);
    }
    return out;
}

} // namespace Repealer

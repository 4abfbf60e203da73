/**
 * @file vector_index.hpp
 * @brief Nearest-neighbour index over unit-length embeddings
 *
 * Indexes report distances in their native metric. to_similarity() is the one
 * place where a native distance becomes the canonical cosine similarity in
 * [-1, 1] that matching and calibration consume:
 *
 *   InnerProductDistance   d = 1 - <a,b>        →  s = 1 - d
 *   SquaredL2              d = |a-b|² = 2 - 2<a,b>  →  s = 1 - d/2
 *
 * Both mappings are monotonically decreasing in d, so neighbour order is kept.
 */

#pragma once

#include <export.hpp>
#include <ml/embedding_provider.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Repealer {

enum class DistanceMetric {
    InnerProductDistance,
    SquaredL2
};

REPEALER_API const char* to_string(DistanceMetric m);

/// Native distance → cosine similarity, clamped to [-1, 1].
REPEALER_API double to_similarity(DistanceMetric metric, double distance);

struct Neighbor {
    size_t id = 0;
    float distance = 0.0f;
};

class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    /// Append vectors; ids continue from total_count().
    virtual void add(const std::vector<Embedding>& vectors) = 0;

    /// Up to k neighbours, nearest first, ties broken by ascending id.
    virtual std::vector<Neighbor> search(const Embedding& query, size_t k) const = 0;

    virtual size_t total_count() const = 0;
    virtual uint32_t dimension() const = 0;
    virtual DistanceMetric metric() const = 0;

    virtual void persist(const std::string& path) const = 0;

    /// Replace contents with the snapshot at path. @throws std::runtime_error
    virtual void load(const std::string& path) = 0;
};

using VectorIndexFactory = std::function<std::unique_ptr<VectorIndex>(uint32_t dimension)>;

/**
 * @brief hnswlib HierarchicalNSW over inner-product or L2 space
 */
class REPEALER_API HnswVectorIndex : public VectorIndex {
public:
    struct Params {
        size_t m = 16;
        size_t ef_construction = 200;
        size_t ef_search = 64;
        size_t initial_capacity = 1024;
    };

    HnswVectorIndex(uint32_t dimension, DistanceMetric metric, const Params& params);
    ~HnswVectorIndex() override;

    void add(const std::vector<Embedding>& vectors) override;
    std::vector<Neighbor> search(const Embedding& query, size_t k) const override;
    size_t total_count() const override;
    uint32_t dimension() const override { return dim_; }
    DistanceMetric metric() const override { return metric_; }
    void persist(const std::string& path) const override;
    void load(const std::string& path) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    uint32_t dim_;
    DistanceMetric metric_;
    Params params_;
};

/**
 * @brief Exact brute-force index. Deterministic; suited to small corpora and tests.
 */
class REPEALER_API FlatVectorIndex : public VectorIndex {
public:
    FlatVectorIndex(uint32_t dimension, DistanceMetric metric);

    void add(const std::vector<Embedding>& vectors) override;
    std::vector<Neighbor> search(const Embedding& query, size_t k) const override;
    size_t total_count() const override { return count_; }
    uint32_t dimension() const override { return dim_; }
    DistanceMetric metric() const override { return metric_; }
    void persist(const std::string& path) const override;
    void load(const std::string& path) override;

private:
    uint32_t dim_;
    DistanceMetric metric_;
    size_t count_ = 0;
    std::vector<float> data_; // packed rows: count_ * dim_
};

} // namespace Repealer

/**
 * @file hnsw_index.cpp
 * @brief hnswlib-backed VectorIndex
 */

#include <ml/vector_index.hpp>
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <stdexcept>

namespace Repealer {

struct HnswVectorIndex::Impl {
    std::unique_ptr<hnswlib::SpaceInterface<float>> space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index;

    Impl(uint32_t dim, DistanceMetric metric) {
        if (metric == DistanceMetric::InnerProductDistance) {
            space = std::make_unique<hnswlib::InnerProductSpace>(dim);
        } else {
            space = std::make_unique<hnswlib::L2Space>(dim);
        }
    }
};

HnswVectorIndex::HnswVectorIndex(uint32_t dimension, DistanceMetric metric, const Params& params)
    : impl_(std::make_unique<Impl>(dimension, metric)), dim_(dimension), metric_(metric), params_(params) {
    if (dim_ == 0) throw std::invalid_argument("HnswVectorIndex dimension must be positive");
    impl_->index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        impl_->space.get(), std::max<size_t>(params_.initial_capacity, 1), params_.m, params_.ef_construction);
    impl_->index->setEf(params_.ef_search);
}

HnswVectorIndex::~HnswVectorIndex() = default;

size_t HnswVectorIndex::total_count() const {
    return impl_->index->getCurrentElementCount();
}

void HnswVectorIndex::add(const std::vector<Embedding>& vectors) {
    if (vectors.empty()) return;
    for (const auto& v : vectors) {
        if (v.size() != dim_) throw std::invalid_argument("Vector dimension mismatch in HnswVectorIndex::add");
    }

    auto& index = *impl_->index;
    const size_t base = index.getCurrentElementCount();
    const size_t needed = base + vectors.size();
    if (needed > index.getMaxElements()) {
        index.resizeIndex(std::max(needed, index.getMaxElements() * 2));
    }

    const long n = static_cast<long>(vectors.size());
    #pragma omp parallel for schedule(dynamic, 64) if (n > 256)
    for (long i = 0; i < n; ++i) {
        index.addPoint(vectors[static_cast<size_t>(i)].data(), static_cast<hnswlib::labeltype>(base + static_cast<size_t>(i)));
    }
}

std::vector<Neighbor> HnswVectorIndex::search(const Embedding& query, size_t k) const {
    if (query.size() != dim_) throw std::invalid_argument("Query dimension mismatch in HnswVectorIndex::search");
    const size_t count = total_count();
    if (count == 0 || k == 0) return {};

    auto result_pq = impl_->index->searchKnn(query.data(), std::min(k, count));
    std::vector<Neighbor> results;
    results.reserve(result_pq.size());
    while (!result_pq.empty()) {
        const auto& top = result_pq.top();
        results.push_back({static_cast<size_t>(top.second), top.first});
        result_pq.pop();
    }

    // searchKnn pops furthest first
    std::sort(results.begin(), results.end(), [](const Neighbor& a, const Neighbor& b) {
        return a.distance < b.distance || (a.distance == b.distance && a.id < b.id);
    });
    return results;
}

void HnswVectorIndex::persist(const std::string& path) const {
    impl_->index->saveIndex(path);
}

void HnswVectorIndex::load(const std::string& path) {
    auto loaded = std::make_unique<hnswlib::HierarchicalNSW<float>>(impl_->space.get(), path, false, 0);
    loaded->setEf(params_.ef_search);
    impl_->index = std::move(loaded);
}

} // namespace Repealer

/**
 * @file vector_index.cpp
 * @brief Distance → similarity adaptation and the exact flat index
 */

#include <ml/vector_index.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace Repealer {

namespace {
constexpr char k_flat_magic[8] = {'R', 'P', 'F', 'L', 'A', 'T', '0', '1'};
}

const char* to_string(DistanceMetric m) {
    return m == DistanceMetric::SquaredL2 ? "squared_l2" : "inner_product";
}

double to_similarity(DistanceMetric metric, double distance) {
    double s = 0.0;
    switch (metric) {
        case DistanceMetric::InnerProductDistance: s = 1.0 - distance; break;
        case DistanceMetric::SquaredL2:            s = 1.0 - distance / 2.0; break;
    }
    return std::clamp(s, -1.0, 1.0);
}

FlatVectorIndex::FlatVectorIndex(uint32_t dimension, DistanceMetric metric)
    : dim_(dimension), metric_(metric) {
    if (dim_ == 0) throw std::invalid_argument("FlatVectorIndex dimension must be positive");
}

void FlatVectorIndex::add(const std::vector<Embedding>& vectors) {
    for (const auto& v : vectors) {
        if (v.size() != dim_) throw std::invalid_argument("Vector dimension mismatch in FlatVectorIndex::add");
    }
    data_.reserve(data_.size() + vectors.size() * dim_);
    for (const auto& v : vectors) data_.insert(data_.end(), v.begin(), v.end());
    count_ += vectors.size();
}

std::vector<Neighbor> FlatVectorIndex::search(const Embedding& query, size_t k) const {
    if (query.size() != dim_) throw std::invalid_argument("Query dimension mismatch in FlatVectorIndex::search");
    if (count_ == 0 || k == 0) return {};

    using RowMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    Eigen::Map<const RowMatrix> rows(data_.data(), static_cast<Eigen::Index>(count_), static_cast<Eigen::Index>(dim_));
    Eigen::Map<const Eigen::VectorXf> q(query.data(), static_cast<Eigen::Index>(dim_));

    std::vector<Neighbor> all(count_);
    if (metric_ == DistanceMetric::InnerProductDistance) {
        Eigen::VectorXf ip = rows * q;
        for (size_t i = 0; i < count_; ++i) all[i] = {i, 1.0f - ip[static_cast<Eigen::Index>(i)]};
    } else {
        for (size_t i = 0; i < count_; ++i) {
            all[i] = {i, (rows.row(static_cast<Eigen::Index>(i)).transpose() - q).squaredNorm()};
        }
    }

    size_t take = std::min(k, count_);
    auto by_distance = [](const Neighbor& a, const Neighbor& b) {
        return a.distance < b.distance || (a.distance == b.distance && a.id < b.id);
    };
    std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(take), all.end(), by_distance);
    all.resize(take);
    return all;
}

void FlatVectorIndex::persist(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open index file for writing: " + path);
    uint32_t metric = static_cast<uint32_t>(metric_);
    uint64_t count = count_;
    out.write(k_flat_magic, sizeof(k_flat_magic));
    out.write(reinterpret_cast<const char*>(&dim_), sizeof(dim_));
    out.write(reinterpret_cast<const char*>(&metric), sizeof(metric));
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));
    out.write(reinterpret_cast<const char*>(data_.data()), static_cast<std::streamsize>(data_.size() * sizeof(float)));
    if (!out) throw std::runtime_error("Failed writing index file: " + path);
}

void FlatVectorIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open index file: " + path);

    char magic[sizeof(k_flat_magic)];
    uint32_t dim = 0, metric = 0;
    uint64_t count = 0;
    in.read(magic, sizeof(magic));
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    in.read(reinterpret_cast<char*>(&metric), sizeof(metric));
    in.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!in || std::memcmp(magic, k_flat_magic, sizeof(magic)) != 0) {
        throw std::runtime_error("Not a flat index file: " + path);
    }
    if (dim != dim_ || metric != static_cast<uint32_t>(metric_)) {
        throw std::runtime_error("Flat index file has a different dimension or metric: " + path);
    }

    std::vector<float> data(static_cast<size_t>(count) * dim);
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size() * sizeof(float)));
    if (!in) throw std::runtime_error("Truncated flat index file: " + path);

    data_ = std::move(data);
    count_ = static_cast<size_t>(count);
}

} // namespace Repealer

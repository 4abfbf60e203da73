/**
 * @file vector_store.hpp
 * @brief vectors.bin: packed float32 embedding rows
 *
 * Layout (little-endian):
 *   char[8]  "RPVEC001"
 *   uint32   dimension
 *   uint64   row count
 *   uint64   generation (matches the manifest that committed it)
 *   uint32   model id length, then that many bytes
 *   float32  rows, count * dimension
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Repealer {

struct VectorFile {
    uint32_t dimension = 0;
    uint64_t count = 0;
    uint64_t generation = 0;
    std::string model_id;
    std::vector<float> data;
};

class REPEALER_API VectorStore {
public:
    static void save(const std::filesystem::path& path, const VectorFile& file);

    /// @throws std::runtime_error on a missing, foreign or truncated file
    static VectorFile load(const std::filesystem::path& path);
};

} // namespace Repealer

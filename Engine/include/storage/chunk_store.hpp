/**
 * @file chunk_store.hpp
 * @brief chunks.json: corpus manifest plus every chunk record
 *
 * The manifest is the commit point of a corpus: it is written last, after the
 * vector store and the index. Its generation counter is mirrored in
 * vectors.bin so a torn write between the two is detected on load.
 */

#pragma once

#include <export.hpp>
#include <core/types.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace Repealer {

/**
 * @brief One ingested source document.
 *
 * complete is false while a cancelled ingestion has committed only the first
 * chunk_count of planned_chunks chunks.
 */
struct SourceRecord {
    std::string name;
    std::string content_hash;
    size_t chunk_count = 0;
    size_t planned_chunks = 0;
    bool complete = false;
    std::string ingested_at;     ///< ISO-8601 UTC
};

struct ChunkManifest {
    static constexpr uint32_t FORMAT_VERSION = 1;

    uint32_t format_version = FORMAT_VERSION;
    std::string model_id;
    uint32_t embedding_dim = 0;
    uint64_t generation = 0;
    bool dirty = false;          ///< set after a failed integrity check; forces a rebuild
    std::vector<SourceRecord> sources;
    std::vector<ChunkPtr> chunks;
};

REPEALER_API void to_json(nlohmann::json& j, const SourceRecord& s);
REPEALER_API void from_json(const nlohmann::json& j, SourceRecord& s);

class REPEALER_API ChunkStore {
public:
    static void save(const std::filesystem::path& path, const ChunkManifest& manifest);

    /// @throws IntegrityError (not recoverable) if the file is unreadable or malformed
    static ChunkManifest load(const std::filesystem::path& path);
};

} // namespace Repealer

/**
 * @file corpus_index.hpp
 * @brief The spec corpus: chunk store + vector store + nearest-neighbour index
 *
 * A CorpusIndex owns one corpus directory. Readers work against an immutable
 * CorpusSnapshot; writers (ingest, remove_source, rebuild_from_chunks, reindex,
 * reset) build a
 * complete new snapshot off to the side, persist it, then swap it in. A reader
 * therefore never sees chunks, vectors and index disagree in length.
 *
 * Writers are serialized by a writer mutex. With nonblocking_ingest the second
 * writer gets IngestionBusyError instead of waiting.
 *
 * On-disk layout of the corpus directory:
 *   chunks.json   manifest + chunk records (commit point, written last)
 *   vectors.bin   float32 rows, see vector_store.hpp
 *   index.bin     VectorIndex snapshot
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ml/embedding_provider.hpp>
#include <ml/vector_index.hpp>
#include <storage/chunk_store.hpp>
#include <utils/cancellation.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Repealer {

/**
 * @brief Immutable view of the corpus. chunks.size() == vector rows == index count.
 */
struct REPEALER_API CorpusSnapshot {
    std::vector<ChunkPtr> chunks;
    std::vector<float> vectors;                 ///< packed, chunks.size() * dimension
    std::shared_ptr<const VectorIndex> index;
    std::vector<SourceRecord> sources;
    uint32_t dimension = 0;
    std::string model_id;
    uint64_t generation = 0;

    size_t size() const { return chunks.size(); }
    bool empty() const { return chunks.empty(); }

    /// @throws IntegrityError if the three lengths disagree
    void check_consistent() const;
};

struct SearchHit {
    size_t chunk_index = 0;
    float raw_score = 0.0f;   ///< native index distance; see to_similarity()
};

struct CorpusStats {
    size_t chunk_count = 0;
    uint32_t dimension = 0;
    std::string model_id;
    DistanceMetric metric = DistanceMetric::InnerProductDistance;
    uint64_t generation = 0;
    std::vector<SourceRecord> sources;
    std::map<SectionType, size_t> section_counts;
};

REPEALER_API void to_json(nlohmann::json& j, const CorpusStats& s);

class REPEALER_API CorpusIndex {
public:
    struct Options {
        std::filesystem::path directory;   ///< empty = in-memory corpus, nothing persisted
        uint32_t batch_size = 32;
        uint32_t embedding_timeout_ms = 0;
        bool dedup_enabled = true;
        bool nonblocking_ingest = false;

        static Options from_config(const EngineConfig& config, const std::filesystem::path& directory);
    };

    static constexpr const char* CHUNKS_FILE = "chunks.json";
    static constexpr const char* VECTORS_FILE = "vectors.bin";
    static constexpr const char* INDEX_FILE = "index.bin";

    CorpusIndex(Options options, std::shared_ptr<EmbeddingProvider> provider, VectorIndexFactory index_factory);

    /// hnsw or flat according to config.index_type, inner-product metric.
    static VectorIndexFactory make_index_factory(const EngineConfig& config);

    CorpusIndex(const CorpusIndex&) = delete;
    CorpusIndex& operator=(const CorpusIndex&) = delete;

    /**
     * @brief Open the corpus directory, repairing what can be repaired.
     *
     * No chunks.json: the corpus starts empty. Unreadable chunks.json:
     * IntegrityError (not recoverable). Vector store missing, stale or produced
     * by another model: rebuild_from_chunks(). Index missing or stale: reindex().
     */
    void load();

    /// Write the current snapshot to the corpus directory.
    void persist();

    /**
     * @brief Embed, append, index and persist chunks of one source, batch by batch.
     *
     * A source whose content_hash is already complete in the corpus is a
     * no-op (duplicate=true). A source left incomplete by a cancelled ingestion
     * resumes after its committed chunks. An empty content_hash is derived from
     * the chunk texts.
     *
     * @throws EmptyDocumentError if chunks is empty
     * @throws EmbeddingProviderError / EmbeddingTimeoutError; batches already committed by
     *         this call are rolled back, so the corpus is left as it was before the call
     * @throws IngestionBusyError in non-blocking mode while another writer runs
     */
    IngestResult ingest(const std::vector<SpecChunk>& chunks, const std::string& source_name,
                        std::string content_hash, const CancellationToken* cancel = nullptr);

    /// @throws IndexNotReadyError when the corpus is empty
    std::vector<SearchHit> search(const Embedding& query, size_t k) const;

    /// Re-embed every chunk and rebuild the index.
    void rebuild_from_chunks();

    /// Rebuild only the nearest-neighbour index from the stored vectors.
    void reindex();

    /**
     * @brief Remove one source: its record, chunks and vectors. The index is rebuilt.
     *
     * @return number of chunks removed; 0 when no source has this content hash
     */
    size_t remove_source(const std::string& content_hash);

    /// Drop all state, in memory and on disk.
    void reset();

    std::shared_ptr<const CorpusSnapshot> snapshot() const;
    CorpusStats stats() const;

    bool empty() const { return snapshot()->empty(); }
    size_t size() const { return snapshot()->size(); }
    DistanceMetric metric() const;

    const BoundedEmbedder& embedder() const { return embedder_; }
    const std::filesystem::path& directory() const { return options_.directory; }

private:
    std::unique_lock<std::mutex> acquire_writer();

    std::shared_ptr<CorpusSnapshot> empty_snapshot() const;
    std::shared_ptr<const VectorIndex> build_index(const std::vector<float>& vectors, size_t count) const;
    std::vector<float> embed_all(const std::vector<ChunkPtr>& chunks) const;
    std::shared_ptr<CorpusSnapshot> rebuild_snapshot(std::vector<ChunkPtr> chunks,
                                                     std::vector<SourceRecord> sources,
                                                     uint64_t generation) const;

    void commit(const std::shared_ptr<CorpusSnapshot>& next);
    void rollback(const CorpusSnapshot& before);
    void write_snapshot(const CorpusSnapshot& snap, bool dirty) const;
    void mark_dirty(const CorpusSnapshot& snap) const;
    void publish(std::shared_ptr<const CorpusSnapshot> next);

    bool persistent() const { return !options_.directory.empty(); }
    std::filesystem::path file(const char* name) const { return options_.directory / name; }

    Options options_;
    BoundedEmbedder embedder_;
    VectorIndexFactory index_factory_;

    std::mutex writer_mutex_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const CorpusSnapshot> current_;
};

} // namespace Repealer

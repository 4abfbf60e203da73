/**
 * @file corpus_index.cpp
 * @brief Snapshot-published corpus with batch commits and load-time repair
 */

#include <storage/corpus_index.hpp>
#include <storage/atomic_file.hpp>
#include <storage/vector_store.hpp>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Repealer {

namespace {

std::string now_iso8601() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

ChunkManifest manifest_for(const CorpusSnapshot& snap, bool dirty) {
    ChunkManifest m;
    m.model_id = snap.model_id;
    m.embedding_dim = snap.dimension;
    m.generation = snap.generation;
    m.dirty = dirty;
    m.sources = snap.sources;
    m.chunks = snap.chunks;
    return m;
}

std::string format_ms(double ms) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << ms << " ms";
    return os.str();
}

} // namespace

// ============================================================================
// CorpusSnapshot
// ============================================================================

void CorpusSnapshot::check_consistent() const {
    const size_t rows = dimension ? vectors.size() / dimension : 0;
    const size_t indexed = index ? index->total_count() : 0;
    if (rows * dimension != vectors.size() || rows != chunks.size() || indexed != chunks.size()) {
        throw IntegrityError("Corpus out of step: " + std::to_string(chunks.size()) + " chunks, " +
                             std::to_string(rows) + " vectors, " + std::to_string(indexed) + " indexed",
                             true);
    }
}

void to_json(nlohmann::json& j, const CorpusStats& s) {
    nlohmann::json sections = nlohmann::json::object();
    for (const auto& [type, count] : s.section_counts) sections[to_string(type)] = count;
    j = nlohmann::json{
        {"chunk_count", s.chunk_count},
        {"dimension", s.dimension},
        {"model_id", s.model_id},
        {"metric", to_string(s.metric)},
        {"generation", s.generation},
        {"sources", s.sources},
        {"sections", std::move(sections)}
    };
}

// ============================================================================
// CorpusIndex
// ============================================================================

CorpusIndex::Options CorpusIndex::Options::from_config(const EngineConfig& config,
                                                       const std::filesystem::path& directory) {
    Options o;
    o.directory = directory;
    o.batch_size = config.embedding_batch_size;
    o.embedding_timeout_ms = config.embedding_timeout_ms;
    o.dedup_enabled = config.dedup_enabled;
    o.nonblocking_ingest = config.nonblocking_ingest;
    return o;
}

VectorIndexFactory CorpusIndex::make_index_factory(const EngineConfig& config) {
    if (config.index_type == IndexType::Flat) {
        return [](uint32_t dim) -> std::unique_ptr<VectorIndex> {
            return std::make_unique<FlatVectorIndex>(dim, DistanceMetric::InnerProductDistance);
        };
    }
    HnswVectorIndex::Params params;
    params.m = config.hnsw_m;
    params.ef_construction = config.hnsw_ef_construction;
    params.ef_search = config.hnsw_ef_search;
    return [params](uint32_t dim) -> std::unique_ptr<VectorIndex> {
        return std::make_unique<HnswVectorIndex>(dim, DistanceMetric::InnerProductDistance, params);
    };
}

CorpusIndex::CorpusIndex(Options options, std::shared_ptr<EmbeddingProvider> provider,
                         VectorIndexFactory index_factory)
    : options_(std::move(options)), embedder_(std::move(provider)), index_factory_(std::move(index_factory)) {
    if (!index_factory_) throw std::invalid_argument("CorpusIndex requires an index factory");
    if (options_.batch_size == 0) options_.batch_size = 1;
    if (persistent()) std::filesystem::create_directories(options_.directory);
    current_ = empty_snapshot();
}

std::unique_lock<std::mutex> CorpusIndex::acquire_writer() {
    if (options_.nonblocking_ingest) {
        std::unique_lock<std::mutex> lock(writer_mutex_, std::try_to_lock);
        if (!lock.owns_lock()) throw IngestionBusyError();
        return lock;
    }
    return std::unique_lock<std::mutex>(writer_mutex_);
}

std::shared_ptr<const CorpusSnapshot> CorpusIndex::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

void CorpusIndex::publish(std::shared_ptr<const CorpusSnapshot> next) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current_ = std::move(next);
}

DistanceMetric CorpusIndex::metric() const {
    return snapshot()->index->metric();
}

std::shared_ptr<CorpusSnapshot> CorpusIndex::empty_snapshot() const {
    auto snap = std::make_shared<CorpusSnapshot>();
    snap->dimension = embedder_.dimension();
    snap->model_id = embedder_.model_id();
    snap->index = build_index({}, 0);
    return snap;
}

std::shared_ptr<const VectorIndex> CorpusIndex::build_index(const std::vector<float>& vectors, size_t count) const {
    const uint32_t dim = embedder_.dimension();
    std::unique_ptr<VectorIndex> index = index_factory_(dim);
    if (count > 0) {
        std::vector<Embedding> rows(count);
        for (size_t i = 0; i < count; ++i) {
            rows[i].assign(vectors.begin() + static_cast<std::ptrdiff_t>(i * dim),
                           vectors.begin() + static_cast<std::ptrdiff_t>((i + 1) * dim));
        }
        index->add(rows);
    }
    return std::shared_ptr<const VectorIndex>(std::move(index));
}

std::vector<float> CorpusIndex::embed_all(const std::vector<ChunkPtr>& chunks) const {
    std::vector<float> packed;
    packed.reserve(chunks.size() * embedder_.dimension());
    for (size_t begin = 0; begin < chunks.size(); begin += options_.batch_size) {
        size_t end = std::min(begin + options_.batch_size, chunks.size());
        std::vector<std::string> texts;
        texts.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) texts.push_back(chunks[i]->text);

        for (const auto& v : embedder_.encode(texts, Deadline(options_.embedding_timeout_ms))) {
            packed.insert(packed.end(), v.begin(), v.end());
        }
    }
    return packed;
}

std::shared_ptr<CorpusSnapshot> CorpusIndex::rebuild_snapshot(std::vector<ChunkPtr> chunks,
                                                              std::vector<SourceRecord> sources,
                                                              uint64_t generation) const {
    auto next = std::make_shared<CorpusSnapshot>();
    next->dimension = embedder_.dimension();
    next->model_id = embedder_.model_id();
    next->vectors = embed_all(chunks);
    next->chunks = std::move(chunks);
    next->sources = std::move(sources);
    next->generation = generation;
    next->index = build_index(next->vectors, next->chunks.size());
    return next;
}

void CorpusIndex::write_snapshot(const CorpusSnapshot& snap, bool dirty) const {
    std::filesystem::create_directories(options_.directory);

    VectorFile vf;
    vf.dimension = snap.dimension;
    vf.count = snap.chunks.size();
    vf.generation = snap.generation;
    vf.model_id = snap.model_id;
    vf.data = snap.vectors;
    VectorStore::save(file(VECTORS_FILE), vf);

    write_path_atomic(file(INDEX_FILE), [&](const std::filesystem::path& tmp) {
        snap.index->persist(tmp.string());
    });

    ChunkStore::save(file(CHUNKS_FILE), manifest_for(snap, dirty));
}

void CorpusIndex::mark_dirty(const CorpusSnapshot& snap) const {
    if (!persistent()) return;
    try {
        ChunkStore::save(file(CHUNKS_FILE), manifest_for(snap, true));
    } catch (const std::exception& e) {
        Logger::error(std::string("Could not mark corpus dirty: ") + e.what());
    }
}

void CorpusIndex::commit(const std::shared_ptr<CorpusSnapshot>& next) {
    try {
        next->check_consistent();
    } catch (const IntegrityError&) {
        mark_dirty(*snapshot());
        throw;
    }
    if (persistent()) write_snapshot(*next, false);
    publish(next);
}

void CorpusIndex::rollback(const CorpusSnapshot& before) {
    auto restored = std::make_shared<CorpusSnapshot>(before);
    restored->generation = snapshot()->generation + 1;
    commit(restored);
}

void CorpusIndex::persist() {
    auto lock = acquire_writer();
    if (!persistent()) return;
    write_snapshot(*snapshot(), false);
}

void CorpusIndex::load() {
    auto lock = acquire_writer();
    if (!persistent()) return;

    Timer timer;
    const auto chunks_path = file(CHUNKS_FILE);
    if (!std::filesystem::exists(chunks_path)) {
        if (std::filesystem::exists(file(VECTORS_FILE)) || std::filesystem::exists(file(INDEX_FILE))) {
            Logger::warn("Ignoring vector/index files without a chunk store in " + options_.directory.string());
        }
        publish(empty_snapshot());
        return;
    }

    ChunkManifest m = ChunkStore::load(chunks_path);
    const uint32_t dim = embedder_.dimension();
    const std::string model = embedder_.model_id();

    std::string rebuild_reason;
    VectorFile vf;
    if (m.dirty) {
        rebuild_reason = "corpus was marked dirty";
    } else if (m.model_id != model || m.embedding_dim != dim) {
        rebuild_reason = "embedding model changed from " + m.model_id + " to " + model;
    } else {
        try {
            vf = VectorStore::load(file(VECTORS_FILE));
            if (vf.dimension != dim || vf.model_id != model) {
                rebuild_reason = "vector store was produced by another model";
            } else if (vf.count != m.chunks.size()) {
                rebuild_reason = "vector store holds " + std::to_string(vf.count) + " rows for " +
                                 std::to_string(m.chunks.size()) + " chunks";
            } else if (vf.generation != m.generation) {
                rebuild_reason = "vector store generation does not match the chunk store";
            }
        } catch (const std::exception& e) {
            rebuild_reason = e.what();
        }
    }

    if (!rebuild_reason.empty()) {
        Logger::warn("Re-embedding " + std::to_string(m.chunks.size()) + " chunks: " + rebuild_reason);
        commit(rebuild_snapshot(std::move(m.chunks), std::move(m.sources), m.generation + 1));
        Logger::success("Corpus rebuilt in " + format_ms(timer.elapsed_ms()));
        return;
    }

    auto next = std::make_shared<CorpusSnapshot>();
    next->dimension = dim;
    next->model_id = model;
    next->generation = m.generation;
    next->chunks = std::move(m.chunks);
    next->sources = std::move(m.sources);
    next->vectors = std::move(vf.data);

    const auto index_path = file(INDEX_FILE);
    if (std::filesystem::exists(index_path)) {
        try {
            std::unique_ptr<VectorIndex> index = index_factory_(dim);
            index->load(index_path.string());
            if (index->total_count() == next->chunks.size()) {
                next->index = std::shared_ptr<const VectorIndex>(std::move(index));
            } else {
                Logger::warn("Index holds " + std::to_string(index->total_count()) + " entries for " +
                             std::to_string(next->chunks.size()) + " chunks");
            }
        } catch (const std::exception& e) {
            Logger::warn(std::string("Index snapshot unusable: ") + e.what());
        }
    }

    if (!next->index) {
        Logger::step("Reindexing " + std::to_string(next->chunks.size()) + " stored vectors");
        next->index = build_index(next->vectors, next->chunks.size());
        next->check_consistent();
        write_path_atomic(index_path, [&](const std::filesystem::path& tmp) {
            next->index->persist(tmp.string());
        });
    }

    next->check_consistent();
    publish(next);
    Logger::info("Loaded corpus with " + std::to_string(next->size()) + " chunks from " +
                 options_.directory.string() + " in " + format_ms(timer.elapsed_ms()));
}

IngestResult CorpusIndex::ingest(const std::vector<SpecChunk>& chunks, const std::string& source_name,
                                 std::string content_hash, const CancellationToken* cancel) {
    auto lock = acquire_writer();
    if (chunks.empty()) throw EmptyDocumentError("No chunks to ingest for '" + source_name + "'");

    if (content_hash.empty()) {
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& c : chunks) texts.push_back(c.text);
        content_hash = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash_sequence(texts));
    }

    std::shared_ptr<const CorpusSnapshot> current = snapshot();
    IngestResult result;
    result.content_hash = content_hash;
    result.total_chunks = current->size();

    std::vector<SourceRecord> sources = current->sources;
    size_t record = sources.size();
    size_t start = 0;
    if (options_.dedup_enabled) {
        for (size_t i = 0; i < sources.size(); ++i) {
            if (sources[i].content_hash != content_hash) continue;
            if (sources[i].complete) {
                Logger::info("'" + source_name + "' is already in the corpus as '" + sources[i].name + "'");
                result.duplicate = true;
                return result;
            }
            record = i;
            start = std::min(sources[i].chunk_count, chunks.size());
            Logger::step("Resuming '" + source_name + "' after " + std::to_string(start) + " committed chunks");
            break;
        }
    }
    if (record == sources.size()) {
        SourceRecord rec;
        rec.name = source_name;
        rec.content_hash = content_hash;
        rec.planned_chunks = chunks.size();
        rec.ingested_at = now_iso8601();
        sources.push_back(std::move(rec));
    }
    sources[record].planned_chunks = chunks.size();

    Timer timer;
    if (start >= chunks.size()) {
        auto next = std::make_shared<CorpusSnapshot>(*current);
        sources[record].complete = true;
        next->sources = sources;
        next->generation = current->generation + 1;
        commit(next);
        result.total_chunks = next->size();
        return result;
    }

    const auto pre_ingest = current;
    const uint32_t dim = embedder_.dimension();
    for (size_t begin = start; begin < chunks.size(); begin += options_.batch_size) {
        if (cancel && cancel->cancelled()) {
            result.cancelled = true;
            Logger::warn("Ingestion of '" + source_name + "' cancelled after " +
                         std::to_string(result.chunks_added) + " chunks");
            break;
        }

        const size_t end = std::min(begin + options_.batch_size, chunks.size());
        std::vector<std::string> texts;
        texts.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) texts.push_back(chunks[i].text);

        std::vector<Embedding> embedded;
        try {
            embedded = embedder_.encode(texts, Deadline(options_.embedding_timeout_ms));
        } catch (const EmbeddingProviderError& e) {
            if (result.chunks_added > 0) rollback(*pre_ingest);
            Logger::error("Ingestion of '" + source_name + "' failed, corpus left as before: " + e.what());
            throw;
        }

        auto next = std::make_shared<CorpusSnapshot>(*current);
        next->chunks.reserve(next->chunks.size() + (end - begin));
        next->vectors.reserve(next->vectors.size() + (end - begin) * dim);
        for (size_t i = begin; i < end; ++i) {
            auto chunk = std::make_shared<SpecChunk>(chunks[i]);
            chunk->content_hash = content_hash;
            next->chunks.push_back(std::move(chunk));
        }
        for (const auto& v : embedded) next->vectors.insert(next->vectors.end(), v.begin(), v.end());
        next->index = build_index(next->vectors, next->chunks.size());

        sources[record].chunk_count = end;
        sources[record].complete = (end == chunks.size());
        next->sources = sources;
        next->generation = current->generation + 1;

        commit(next);
        current = next;
        result.chunks_added += end - begin;
        Logger::debug("Committed batch " + std::to_string(begin) + ".." + std::to_string(end) + " of '" +
                      source_name + "'");
    }

    result.total_chunks = current->size();
    if (!result.cancelled) {
        Logger::success("Ingested " + std::to_string(result.chunks_added) + " chunks from '" + source_name +
                        "' in " + format_ms(timer.elapsed_ms()));
    }
    return result;
}

std::vector<SearchHit> CorpusIndex::search(const Embedding& query, size_t k) const {
    auto snap = snapshot();
    if (snap->empty()) throw IndexNotReadyError();
    if (query.size() != snap->dimension) {
        throw std::invalid_argument("Query has dimension " + std::to_string(query.size()) + ", corpus has " +
                                    std::to_string(snap->dimension));
    }

    std::vector<SearchHit> hits;
    for (const auto& n : snap->index->search(query, std::min(k, snap->size()))) {
        if (n.id < snap->size()) hits.push_back({n.id, n.distance});
    }
    return hits;
}

void CorpusIndex::rebuild_from_chunks() {
    auto lock = acquire_writer();
    auto current = snapshot();
    Timer timer;
    Logger::step("Re-embedding " + std::to_string(current->size()) + " chunks");
    commit(rebuild_snapshot(current->chunks, current->sources, current->generation + 1));
    Logger::success("Rebuilt corpus in " + format_ms(timer.elapsed_ms()));
}

void CorpusIndex::reindex() {
    auto lock = acquire_writer();
    auto current = snapshot();
    Timer timer;
    auto next = std::make_shared<CorpusSnapshot>(*current);
    next->index = build_index(current->vectors, current->size());
    next->generation = current->generation + 1;
    commit(next);
    Logger::success("Reindexed " + std::to_string(next->size()) + " vectors in " + format_ms(timer.elapsed_ms()));
}

size_t CorpusIndex::remove_source(const std::string& content_hash) {
    auto lock = acquire_writer();
    auto current = snapshot();

    auto record = std::find_if(current->sources.begin(), current->sources.end(),
                               [&](const SourceRecord& s) { return s.content_hash == content_hash; });
    if (record == current->sources.end()) {
        Logger::warn("No source with content hash " + content_hash);
        return 0;
    }

    Timer timer;
    const std::string name = record->name;
    const uint32_t dim = current->dimension;
    auto next = std::make_shared<CorpusSnapshot>();
    next->dimension = dim;
    next->model_id = current->model_id;
    next->generation = current->generation + 1;
    for (const auto& s : current->sources) {
        if (s.content_hash != content_hash) next->sources.push_back(s);
    }
    for (size_t i = 0; i < current->size(); ++i) {
        if (current->chunks[i]->content_hash == content_hash) continue;
        next->chunks.push_back(current->chunks[i]);
        next->vectors.insert(next->vectors.end(),
                             current->vectors.begin() + static_cast<std::ptrdiff_t>(i * dim),
                             current->vectors.begin() + static_cast<std::ptrdiff_t>((i + 1) * dim));
    }
    next->index = build_index(next->vectors, next->chunks.size());

    const size_t removed = current->size() - next->size();
    commit(next);
    Logger::success("Removed '" + name + "' (" + std::to_string(removed) + " chunks) in " +
                    format_ms(timer.elapsed_ms()));
    return removed;
}

void CorpusIndex::reset() {
    auto lock = acquire_writer();
    if (persistent()) {
        for (const char* name : {CHUNKS_FILE, VECTORS_FILE, INDEX_FILE}) {
            for (auto path : {file(name), std::filesystem::path(file(name)) += ".tmp"}) {
                std::error_code ec;
                std::filesystem::remove(path, ec);
                if (ec) throw std::runtime_error("Cannot remove " + path.string() + ": " + ec.message());
            }
        }
    }
    publish(empty_snapshot());
    Logger::info("Corpus reset");
}

CorpusStats CorpusIndex::stats() const {
    auto snap = snapshot();
    CorpusStats s;
    s.chunk_count = snap->size();
    s.dimension = snap->dimension;
    s.model_id = snap->model_id;
    s.metric = snap->index->metric();
    s.generation = snap->generation;
    s.sources = snap->sources;
    for (const auto& c : snap->chunks) ++s.section_counts[c->section_type];
    return s;
}

} // namespace Repealer

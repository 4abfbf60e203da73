/**
 * @file repeal_engine.hpp
 * @brief Top-level API: ingest spec documents, analyze audits
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ingestion/document_ingestor.hpp>
#include <ml/embedding_provider.hpp>
#include <storage/corpus_index.hpp>
#include <utils/cancellation.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Repealer {

/**
 * @brief Owns one corpus and runs the extraction → matching → calibration pipeline.
 *
 * Construction validates the configuration, applies its log level and loads
 * the corpus directory (an empty directory path keeps the corpus in memory).
 * Without an explicit provider the deterministic HashingEmbeddingProvider of
 * config.embedding_dim is used; without a factory, config.index_type decides.
 */
class REPEALER_API RepealEngine {
public:
    RepealEngine(EngineConfig config, const std::filesystem::path& corpus_dir,
                 std::shared_ptr<EmbeddingProvider> provider = nullptr,
                 VectorIndexFactory index_factory = nullptr);

    /**
     * @brief Chunk and index one spec document.
     *
     * raw_bytes, when given, is the original file content and keys
     * deduplication; otherwise the page texts do.
     *
     * @throws EmptyDocumentError if the pages yield no chunk
     */
    IngestResult ingest_document(const std::vector<PageText>& pages, const std::string& source_name,
                                 std::string_view raw_bytes = {}, const CancellationToken* cancel = nullptr);

    /// analyze_infractions() with the engine's own configuration.
    std::vector<RepealVerdict> analyze_infractions(const std::string& audit_text) const;

    /**
     * @brief One verdict per extracted infraction, in audit order.
     *
     * Extraction, matching and decision settings come from config; the corpus
     * is the engine's.
     *
     * @throws IndexNotReadyError if nothing was ingested (checked before extraction)
     * @throws EmptyDocumentError for empty audit text
     */
    std::vector<RepealVerdict> analyze_infractions(const std::string& audit_text, const EngineConfig& config) const;

    /**
     * @brief Analyze several audits against one corpus, given as (name, text) pairs.
     *
     * A user-facing or retryable failure of one audit is recorded in its report
     * and the batch carries on. Reports keep the input order.
     *
     * @throws IndexNotReadyError if nothing was ingested
     */
    std::vector<AuditReport> analyze_batch(const std::vector<std::pair<std::string, std::string>>& audits) const;

    /// Counts per status; high-confidence means at least the configured high threshold.
    AnalysisSummary summarize(const std::vector<RepealVerdict>& verdicts) const;

    CorpusIndex& corpus() { return corpus_; }
    const CorpusIndex& corpus() const { return corpus_; }
    const EngineConfig& config() const { return config_; }

    static void apply_log_level(const EngineConfig& config);

private:
    static std::shared_ptr<EmbeddingProvider> default_provider(const EngineConfig& config,
                                                               std::shared_ptr<EmbeddingProvider> provider);

    EngineConfig config_;
    DocumentIngestor ingestor_;
    CorpusIndex corpus_;
};

} // namespace Repealer

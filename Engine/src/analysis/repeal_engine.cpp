/**
 * @file repeal_engine.cpp
 * @brief Engine facade wiring the ingestion and analysis pipelines
 */

#include <analysis/repeal_engine.hpp>
#include <analysis/confidence_calibrator.hpp>
#include <analysis/infraction_extractor.hpp>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <query/similarity_matcher.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Repealer {

void RepealEngine::apply_log_level(const EngineConfig& config) {
    Logger::Level level;
    if (!Logger::parse_level(config.log_level, level)) throw ConfigError("Unknown log_level: " + config.log_level);
    Logger::set_level(level);
}

std::shared_ptr<EmbeddingProvider> RepealEngine::default_provider(const EngineConfig& config,
                                                                  std::shared_ptr<EmbeddingProvider> provider) {
    config.validate();
    if (provider) return provider;
    return std::make_shared<HashingEmbeddingProvider>(config.embedding_dim);
}

RepealEngine::RepealEngine(EngineConfig config, const std::filesystem::path& corpus_dir,
                           std::shared_ptr<EmbeddingProvider> provider, VectorIndexFactory index_factory)
    : config_(std::move(config)),
      ingestor_(ChunkingParams::from_config(config_)),
      corpus_(CorpusIndex::Options::from_config(config_, corpus_dir),
              default_provider(config_, std::move(provider)),
              index_factory ? std::move(index_factory) : CorpusIndex::make_index_factory(config_)) {
    apply_log_level(config_);
    corpus_.load();
}

IngestResult RepealEngine::ingest_document(const std::vector<PageText>& pages, const std::string& source_name,
                                           std::string_view raw_bytes, const CancellationToken* cancel) {
    Timer timer;
    Logger::step("Ingesting '" + source_name + "' (" + std::to_string(pages.size()) + " pages)");

    std::vector<SpecChunk> chunks = ingestor_.chunk(pages, source_name);

    BLAKE3Pipeline::Hash hash;
    if (!raw_bytes.empty()) {
        hash = BLAKE3Pipeline::hash(raw_bytes);
    } else {
        std::vector<std::string> texts;
        texts.reserve(pages.size());
        for (const auto& p : pages) texts.push_back(p.text);
        hash = BLAKE3Pipeline::hash_sequence(texts);
    }

    IngestResult result = corpus_.ingest(chunks, source_name, BLAKE3Pipeline::to_hex(hash), cancel);
    Logger::info("'" + source_name + "': " + std::to_string(result.chunks_added) + " chunks added, " +
                 std::to_string(result.total_chunks) + " in corpus (" + std::to_string(timer.elapsed_ms()) + " ms)");
    return result;
}

std::vector<RepealVerdict> RepealEngine::analyze_infractions(const std::string& audit_text) const {
    return analyze_infractions(audit_text, config_);
}

std::vector<RepealVerdict> RepealEngine::analyze_infractions(const std::string& audit_text,
                                                             const EngineConfig& config) const {
    if (corpus_.empty()) throw IndexNotReadyError();
    config.validate();

    Timer timer;
    const InfractionExtractor extractor(ExtractionParams::from_config(config));
    const std::vector<Infraction> infractions = extractor.extract(audit_text);
    if (infractions.empty()) {
        Logger::info("No infractions found in audit");
        return {};
    }

    const SimilarityMatcher matcher(corpus_);
    const auto matches = matcher.match(infractions, MatchParams::from_config(config));

    const ConfidenceCalibrator calibrator(DecisionPolicy::from_config(config));
    std::vector<RepealVerdict> verdicts;
    verdicts.reserve(infractions.size());
    for (size_t i = 0; i < infractions.size(); ++i) {
        verdicts.push_back(calibrator.calibrate(infractions[i], matches[i]));
    }

    const AnalysisSummary s = Repealer::summarize(verdicts, config.high_threshold);
    Logger::success("Analyzed " + std::to_string(s.total) + " infractions in " +
                    std::to_string(timer.elapsed_ms()) + " ms: " + std::to_string(s.repealable) + " repealable, " +
                    std::to_string(s.review) + " to review, " + std::to_string(s.valid) + " valid");
    return verdicts;
}

std::vector<AuditReport> RepealEngine::analyze_batch(
    const std::vector<std::pair<std::string, std::string>>& audits) const {
    if (corpus_.empty()) throw IndexNotReadyError();

    Timer timer;
    std::vector<AuditReport> reports;
    reports.reserve(audits.size());
    size_t failed = 0;
    for (const auto& [name, text] : audits) {
        AuditReport report;
        report.name = name;
        try {
            report.verdicts = analyze_infractions(text, config_);
            report.summary = summarize(report.verdicts);
        } catch (const RepealerError& e) {
            Logger::warn("Audit '" + name + "' not analyzed: " + e.what());
            report.error = e.what();
            ++failed;
        }
        reports.push_back(std::move(report));
    }

    Logger::info("Batch of " + std::to_string(audits.size()) + " audits done in " +
                 std::to_string(timer.elapsed_ms()) + " ms, " + std::to_string(failed) + " failed");
    return reports;
}

AnalysisSummary RepealEngine::summarize(const std::vector<RepealVerdict>& verdicts) const {
    return Repealer::summarize(verdicts, config_.high_threshold);
}

} // namespace Repealer

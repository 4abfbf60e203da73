/**
 * @file types.hpp
 * @brief Data model shared by ingestion, indexing, matching and calibration
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Repealer {

enum class SectionType {
    Purpose,
    Notes,
    Table,
    Figure,
    General
};

enum class Severity {
    High,
    Medium,
    Low
};

enum class VerdictStatus {
    Repealable,
    ReviewRecommended,
    ValidInfraction
};

REPEALER_API const char* to_string(SectionType t);
REPEALER_API const char* to_string(Severity s);
REPEALER_API const char* to_string(VerdictStatus s);

/// @throws std::invalid_argument for unknown names
REPEALER_API SectionType section_type_from_string(const std::string& name);

/**
 * @brief One page of upstream-extracted text.
 */
struct PageText {
    std::string text;
    uint32_t page_number = 1;
};

/**
 * @brief A bounded span of spec text with structural metadata. Immutable once built.
 */
struct SpecChunk {
    std::string text;
    std::string source;
    uint32_t page = 1;
    SectionType section_type = SectionType::General;
    std::optional<std::string> document_number;
    std::optional<std::string> revision;
    std::string content_hash;      ///< hash of the owning source, set when the chunk is ingested

    /// "Document 022178 Rev. #13 p.4" or "<source> p.4" when no number was seen.
    std::string reference() const;
};

using ChunkPtr = std::shared_ptr<const SpecChunk>;

/**
 * @brief Candidate non-compliance statement extracted from an audit.
 */
struct Infraction {
    std::string raw_text;
    std::string normalized_text;   ///< lower-cased, whitespace-collapsed dedup key
    Severity severity = Severity::Medium;
    std::optional<std::string> category;
    bool category_flagged = false;
    std::optional<std::string> document_ref;
    size_t position = 0;           ///< offset of first occurrence in the audit text
};

struct MatchResult {
    const Infraction* infraction = nullptr;
    ChunkPtr chunk;
    size_t chunk_index = 0;
    double score = 0.0;            ///< cosine similarity in [-1, 1]
};

struct StageTrace {
    std::string stage;
    double confidence = 0.0;
};

struct RepealVerdict {
    Infraction infraction;
    VerdictStatus status = VerdictStatus::ValidInfraction;
    double confidence = 0.0;       ///< clamped to [0, 100]
    size_t match_count = 0;
    std::vector<std::string> reasons;
    std::vector<std::string> spec_references;
    std::vector<StageTrace> trace;
};

struct IngestResult {
    size_t chunks_added = 0;
    size_t total_chunks = 0;
    bool duplicate = false;
    bool cancelled = false;
    std::string content_hash;
};

struct AnalysisSummary {
    size_t total = 0;
    size_t repealable = 0;
    size_t review = 0;
    size_t valid = 0;
    size_t high_confidence = 0;
    double average_confidence = 0.0;
};

/**
 * @brief Outcome for one audit of a batch. error is set, and verdicts empty,
 * when that audit could not be analyzed.
 */
struct AuditReport {
    std::string name;
    std::vector<RepealVerdict> verdicts;
    AnalysisSummary summary;
    std::optional<std::string> error;
};

REPEALER_API AnalysisSummary summarize(const std::vector<RepealVerdict>& verdicts,
                                       double high_confidence_cutoff);

// JSON encodings used by the chunk store and the tools
REPEALER_API void to_json(nlohmann::json& j, const SpecChunk& c);
REPEALER_API void from_json(const nlohmann::json& j, SpecChunk& c);
REPEALER_API void to_json(nlohmann::json& j, const Infraction& inf);
REPEALER_API void to_json(nlohmann::json& j, const RepealVerdict& v);
REPEALER_API void to_json(nlohmann::json& j, const IngestResult& r);
REPEALER_API void to_json(nlohmann::json& j, const AnalysisSummary& s);
REPEALER_API void to_json(nlohmann::json& j, const AuditReport& r);

} // namespace Repealer

/**
 * @file config.hpp
 * @brief Engine configuration: defaults, JSON file, REPEALER_* environment
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Repealer {

/**
 * @brief How the decision policy maps confidence to a status.
 *
 * ThreeTier keeps REVIEW_RECOMMENDED. The binary modes collapse it into one of
 * its neighbours: BinaryStrict into VALID_INFRACTION, BinaryLenient into REPEALABLE.
 */
enum class DecisionMode {
    ThreeTier,
    BinaryStrict,
    BinaryLenient
};

enum class IndexType {
    Hnsw,
    Flat
};

struct REPEALER_API EngineConfig {
    // Chunking
    uint32_t chunk_size = 300;          // words per prose chunk
    uint32_t chunk_overlap = 50;        // words shared by consecutive windows
    uint32_t table_chunk_size = 600;    // words per table/figure chunk
    uint32_t min_chunk_chars = 50;

    // Embedding
    uint32_t embedding_dim = 384;
    uint32_t embedding_batch_size = 32;
    uint32_t embedding_timeout_ms = 0;  // 0 = unbounded

    // Index
    IndexType index_type = IndexType::Hnsw;
    uint32_t hnsw_m = 16;
    uint32_t hnsw_ef_construction = 200;
    uint32_t hnsw_ef_search = 64;

    // Matching
    double min_similarity_threshold = 0.40;
    uint32_t top_k = 5;
    uint32_t category_top_k = 8;

    // Decision policy
    double high_threshold = 85.0;
    double medium_threshold = 60.0;
    uint32_t min_matches = 2;
    DecisionMode decision_mode = DecisionMode::ThreeTier;

    // Extraction
    uint32_t max_infractions = 100;
    uint32_t min_infraction_chars = 20;
    uint32_t max_infraction_chars = 1000;
    std::vector<std::string> infraction_keywords = default_infraction_keywords();
    std::vector<std::string> category_keywords = default_category_keywords();

    // Corpus
    bool dedup_enabled = true;
    bool nonblocking_ingest = false;

    std::string log_level = "info";

    static std::vector<std::string> default_infraction_keywords();
    static std::vector<std::string> default_category_keywords();

    /// Defaults overlaid with every key present in j. @throws ConfigError
    static EngineConfig from_json(const nlohmann::json& j);

    /// @throws ConfigError if the file cannot be read or parsed
    static EngineConfig load_file(const std::string& path);

    /// Override fields from REPEALER_* environment variables, e.g. REPEALER_TOP_K.
    void apply_env();

    /// @throws ConfigError on inconsistent values
    void validate() const;

    nlohmann::json to_json() const;
};

REPEALER_API const char* to_string(DecisionMode m);
REPEALER_API const char* to_string(IndexType t);

} // namespace Repealer

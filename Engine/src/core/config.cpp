/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include <core/config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <cstdlib>
#include <fstream>

namespace Repealer {

namespace {

DecisionMode decision_mode_from_string(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "three_tier")     return DecisionMode::ThreeTier;
    if (n == "binary_strict")  return DecisionMode::BinaryStrict;
    if (n == "binary_lenient") return DecisionMode::BinaryLenient;
    throw ConfigError("Unknown decision_mode: " + name);
}

IndexType index_type_from_string(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "hnsw") return IndexType::Hnsw;
    if (n == "flat") return IndexType::Flat;
    throw ConfigError("Unknown index_type: " + name);
}

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

bool parse_bool(const std::string& v) {
    std::string n = to_lower(v);
    return n == "1" || n == "true" || n == "yes" || n == "on";
}

uint32_t parse_u32(const char* name, const std::string& v) {
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not an unsigned integer: " + v);
    }
}

double parse_double(const char* name, const std::string& v) {
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not a number: " + v);
    }
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

const char* to_string(DecisionMode m) {
    switch (m) {
        case DecisionMode::ThreeTier:     return "three_tier";
        case DecisionMode::BinaryStrict:  return "binary_strict";
        case DecisionMode::BinaryLenient: return "binary_lenient";
    }
    return "three_tier";
}

const char* to_string(IndexType t) {
    return t == IndexType::Flat ? "flat" : "hnsw";
}

std::vector<std::string> EngineConfig::default_infraction_keywords() {
    return {
        "go-back", "go back", "goback",
        "infraction", "violation", "issue",
        "non-compliance", "non-compliant", "noncompliant",
        "non-conforming", "nonconforming",
        "deficiency", "discrepancy", "defect",
        "correction required", "does not meet", "fails to meet",
        "not per spec", "not in compliance",
        "missing", "improper", "incorrect", "inadequate", "insufficient"
    };
}

std::vector<std::string> EngineConfig::default_category_keywords() {
    return {
        "fusesaver", "tripsaver", "recloser", "scada",
        "anchor", "guy wire", "guy marker",
        "mud sill", "bearing plate", "pole reinforcement",
        "crossarm", "transformer", "conduit", "capacitor"
    };
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("Configuration must be a JSON object");

    EngineConfig c;
    read_field(j, "chunk_size", c.chunk_size);
    read_field(j, "chunk_overlap", c.chunk_overlap);
    read_field(j, "table_chunk_size", c.table_chunk_size);
    read_field(j, "min_chunk_chars", c.min_chunk_chars);
    read_field(j, "embedding_dim", c.embedding_dim);
    read_field(j, "embedding_batch_size", c.embedding_batch_size);
    read_field(j, "embedding_timeout_ms", c.embedding_timeout_ms);
    read_field(j, "hnsw_m", c.hnsw_m);
    read_field(j, "hnsw_ef_construction", c.hnsw_ef_construction);
    read_field(j, "hnsw_ef_search", c.hnsw_ef_search);
    read_field(j, "min_similarity_threshold", c.min_similarity_threshold);
    read_field(j, "top_k", c.top_k);
    read_field(j, "category_top_k", c.category_top_k);
    read_field(j, "high_threshold", c.high_threshold);
    read_field(j, "medium_threshold", c.medium_threshold);
    read_field(j, "min_matches", c.min_matches);
    read_field(j, "max_infractions", c.max_infractions);
    read_field(j, "min_infraction_chars", c.min_infraction_chars);
    read_field(j, "max_infraction_chars", c.max_infraction_chars);
    read_field(j, "infraction_keywords", c.infraction_keywords);
    read_field(j, "category_keywords", c.category_keywords);
    read_field(j, "dedup_enabled", c.dedup_enabled);
    read_field(j, "nonblocking_ingest", c.nonblocking_ingest);
    read_field(j, "log_level", c.log_level);

    std::string name;
    read_field(j, "decision_mode", name);
    if (!name.empty()) c.decision_mode = decision_mode_from_string(name);
    name.clear();
    read_field(j, "index_type", name);
    if (!name.empty()) c.index_type = index_type_from_string(name);

    c.validate();
    return c;
}

EngineConfig EngineConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("Cannot open config file: " + path);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }
    return from_json(j);
}

void EngineConfig::apply_env() {
    if (auto v = env("REPEALER_CHUNK_SIZE"))               chunk_size = parse_u32("REPEALER_CHUNK_SIZE", v);
    if (auto v = env("REPEALER_CHUNK_OVERLAP"))            chunk_overlap = parse_u32("REPEALER_CHUNK_OVERLAP", v);
    if (auto v = env("REPEALER_EMBEDDING_BATCH_SIZE"))     embedding_batch_size = parse_u32("REPEALER_EMBEDDING_BATCH_SIZE", v);
    if (auto v = env("REPEALER_EMBEDDING_TIMEOUT_MS"))     embedding_timeout_ms = parse_u32("REPEALER_EMBEDDING_TIMEOUT_MS", v);
    if (auto v = env("REPEALER_MIN_SIMILARITY_THRESHOLD")) min_similarity_threshold = parse_double("REPEALER_MIN_SIMILARITY_THRESHOLD", v);
    if (auto v = env("REPEALER_TOP_K"))                    top_k = parse_u32("REPEALER_TOP_K", v);
    if (auto v = env("REPEALER_HIGH_THRESHOLD"))           high_threshold = parse_double("REPEALER_HIGH_THRESHOLD", v);
    if (auto v = env("REPEALER_MEDIUM_THRESHOLD"))         medium_threshold = parse_double("REPEALER_MEDIUM_THRESHOLD", v);
    if (auto v = env("REPEALER_MAX_INFRACTIONS"))          max_infractions = parse_u32("REPEALER_MAX_INFRACTIONS", v);
    if (auto v = env("REPEALER_DEDUP_ENABLED"))            dedup_enabled = parse_bool(v);
    if (auto v = env("REPEALER_DECISION_MODE"))            decision_mode = decision_mode_from_string(v);
    if (auto v = env("REPEALER_INDEX_TYPE"))               index_type = index_type_from_string(v);
    if (auto v = env("REPEALER_LOG_LEVEL"))                log_level = v;
    validate();
}

void EngineConfig::validate() const {
    if (chunk_size == 0) throw ConfigError("chunk_size must be positive");
    if (chunk_overlap >= chunk_size) throw ConfigError("chunk_overlap must be smaller than chunk_size");
    if (table_chunk_size < chunk_size) throw ConfigError("table_chunk_size must be at least chunk_size");
    if (embedding_dim == 0) throw ConfigError("embedding_dim must be positive");
    if (embedding_batch_size == 0) throw ConfigError("embedding_batch_size must be positive");
    if (top_k == 0 || category_top_k == 0) throw ConfigError("top_k and category_top_k must be positive");
    if (min_similarity_threshold < -1.0 || min_similarity_threshold > 1.0) {
        throw ConfigError("min_similarity_threshold must lie in [-1, 1]");
    }
    if (high_threshold < 0.0 || high_threshold > 100.0 || medium_threshold < 0.0 || medium_threshold > 100.0) {
        throw ConfigError("thresholds must lie in [0, 100]");
    }
    if (medium_threshold > high_threshold) throw ConfigError("medium_threshold must not exceed high_threshold");
    if (min_infraction_chars > max_infraction_chars) {
        throw ConfigError("min_infraction_chars must not exceed max_infraction_chars");
    }
    if (max_infractions == 0) throw ConfigError("max_infractions must be positive");
    if (hnsw_m < 2) throw ConfigError("hnsw_m must be at least 2");
    Logger::Level level;
    if (!Logger::parse_level(log_level, level)) throw ConfigError("Unknown log_level: " + log_level);
}

nlohmann::json EngineConfig::to_json() const {
    return nlohmann::json{
        {"chunk_size", chunk_size},
        {"chunk_overlap", chunk_overlap},
        {"table_chunk_size", table_chunk_size},
        {"min_chunk_chars", min_chunk_chars},
        {"embedding_dim", embedding_dim},
        {"embedding_batch_size", embedding_batch_size},
        {"embedding_timeout_ms", embedding_timeout_ms},
        {"index_type", to_string(index_type)},
        {"hnsw_m", hnsw_m},
        {"hnsw_ef_construction", hnsw_ef_construction},
        {"hnsw_ef_search", hnsw_ef_search},
        {"min_similarity_threshold", min_similarity_threshold},
        {"top_k", top_k},
        {"category_top_k", category_top_k},
        {"high_threshold", high_threshold},
        {"medium_threshold", medium_threshold},
        {"min_matches", min_matches},
        {"decision_mode", to_string(decision_mode)},
        {"max_infractions", max_infractions},
        {"min_infraction_chars", min_infraction_chars},
        {"max_infraction_chars", max_infraction_chars},
        {"infraction_keywords", infraction_keywords},
        {"category_keywords", category_keywords},
        {"dedup_enabled", dedup_enabled},
        {"nonblocking_ingest", nonblocking_ingest},
        {"log_level", log_level}
    };
}

} // namespace Repealer

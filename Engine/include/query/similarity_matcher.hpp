/**
 * @file similarity_matcher.hpp
 * @brief Infractions → ranked spec chunk matches
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <storage/corpus_index.hpp>
#include <vector>

namespace Repealer {

struct MatchParams {
    size_t top_k = 5;
    size_t category_top_k = 8;      ///< used for category-flagged infractions
    double min_score = 0.40;        ///< cosine similarity floor
    uint32_t embedding_timeout_ms = 0;

    static MatchParams from_config(const EngineConfig& config);
};

/**
 * @brief Embeds infractions in one batch and searches one corpus snapshot.
 *
 * Scores are cosine similarities, converted from the index's native distance
 * by to_similarity(). Each result list is ordered by score descending, then
 * chunk index ascending. MatchResult::infraction points into the input vector.
 */
class REPEALER_API SimilarityMatcher {
public:
    explicit SimilarityMatcher(const CorpusIndex& corpus);

    /// @throws IndexNotReadyError when the corpus is empty
    std::vector<std::vector<MatchResult>> match(const std::vector<Infraction>& infractions,
                                                const MatchParams& params) const;

private:
    const CorpusIndex& corpus_;
};

} // namespace Repealer

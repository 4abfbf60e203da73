#include <query/similarity_matcher.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>

namespace Repealer {

MatchParams MatchParams::from_config(const EngineConfig& config) {
    MatchParams p;
    p.top_k = config.top_k;
    p.category_top_k = config.category_top_k;
    p.min_score = config.min_similarity_threshold;
    p.embedding_timeout_ms = config.embedding_timeout_ms;
    return p;
}

SimilarityMatcher::SimilarityMatcher(const CorpusIndex& corpus) : corpus_(corpus) {}

std::vector<std::vector<MatchResult>> SimilarityMatcher::match(const std::vector<Infraction>& infractions,
                                                               const MatchParams& params) const {
    auto snap = corpus_.snapshot();
    if (snap->empty()) throw IndexNotReadyError();

    std::vector<std::vector<MatchResult>> results(infractions.size());
    if (infractions.empty()) return results;

    Timer timer;
    std::vector<std::string> texts;
    texts.reserve(infractions.size());
    for (const auto& inf : infractions) texts.push_back(inf.raw_text);
    const auto queries = corpus_.embedder().encode(texts, Deadline(params.embedding_timeout_ms));

    const DistanceMetric metric = snap->index->metric();
    for (size_t i = 0; i < infractions.size(); ++i) {
        const size_t k = std::min(infractions[i].category_flagged ? params.category_top_k : params.top_k,
                                  snap->size());
        auto& out = results[i];
        for (const auto& n : snap->index->search(queries[i], k)) {
            if (n.id >= snap->size()) continue;
            double score = to_similarity(metric, n.distance);
            if (score < params.min_score) continue;
            out.push_back({&infractions[i], snap->chunks[n.id], n.id, score});
        }
        std::sort(out.begin(), out.end(), [](const MatchResult& a, const MatchResult& b) {
            return a.score > b.score || (a.score == b.score && a.chunk_index < b.chunk_index);
        });
    }

    Logger::debug("Matched " + std::to_string(infractions.size()) + " infractions against " +
                  std::to_string(snap->size()) + " chunks in " + std::to_string(timer.elapsed_ms()) + " ms");
    return results;
}

} // namespace Repealer

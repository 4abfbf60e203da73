/**
 * @file confidence_calibrator.cpp
 * @brief Scoring stages, decision policy and reason rendering
 */

#include <analysis/confidence_calibrator.hpp>
#include <analysis/entities.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cmath>
#include <set>

namespace Repealer {

namespace {

double clamp_confidence(double c) {
    return std::clamp(c, 0.0, 100.0);
}

std::set<std::pair<EntityType, std::string>> entity_keys(const std::string& text) {
    std::set<std::pair<EntityType, std::string>> keys;
    for (auto& e : extract_entities(text)) keys.emplace(e.type, std::move(e.canonical));
    return keys;
}

} // namespace

// ============================================================================
// Stages
// ============================================================================

double BaseScoreStage::band(double similarity) {
    if (similarity >= 0.85) return 95.0;
    if (similarity >= 0.75) return 85.0;
    if (similarity >= 0.60) return 70.0;
    if (similarity >= 0.45) return 55.0;
    if (similarity >= 0.30) return 40.0;
    return 20.0;
}

double BaseScoreStage::apply(double, const CalibrationContext& ctx) const {
    if (ctx.matches.empty()) return 0.0;
    return band(ctx.matches.front().score);
}

double MatchCountBoostStage::apply(double confidence, const CalibrationContext& ctx) const {
    if (ctx.matches.size() >= 3) return confidence * 1.2;
    if (ctx.matches.size() >= 2) return confidence * 1.1;
    return confidence;
}

double DocumentReferenceBonusStage::apply(double confidence, const CalibrationContext& ctx) const {
    const auto& ref = ctx.infraction.document_ref;
    if (!ref) return confidence;
    for (const auto& m : ctx.matches) {
        if ((m.chunk->document_number && *m.chunk->document_number == *ref) ||
            m.chunk->text.find(*ref) != std::string::npos) {
            return confidence * 1.15;
        }
    }
    return confidence;
}

double EntityOverlapBonusStage::apply(double confidence, const CalibrationContext& ctx) const {
    if (ctx.matches.empty()) return confidence;
    const auto wanted = entity_keys(ctx.infraction.raw_text);
    if (wanted.empty()) return confidence;

    std::set<EntityType> shared;
    for (const auto& m : ctx.matches) {
        for (const auto& key : entity_keys(m.chunk->text)) {
            if (wanted.count(key)) shared.insert(key.first);
        }
    }
    return confidence + std::min(CAP, PER_TYPE * static_cast<double>(shared.size()));
}

double CategoryBoostStage::apply(double confidence, const CalibrationContext& ctx) const {
    if (!ctx.infraction.category_flagged || !ctx.infraction.category) return confidence;
    const std::string category = to_lower(*ctx.infraction.category);
    for (const auto& m : ctx.matches) {
        if (contains_ci(to_lower(m.chunk->text), category)) return confidence * 1.1;
    }
    return confidence;
}

double MeasurementConflictPenaltyStage::apply(double confidence, const CalibrationContext& ctx) const {
    if (ctx.matches.empty()) return confidence;
    const auto field = extract_measurements(ctx.infraction.raw_text);
    const auto spec = extract_measurements(ctx.matches.front().chunk->text);

    bool shared_unit = false;
    for (const auto& f : field) {
        for (const auto& s : spec) {
            if (f.unit != s.unit) continue;
            shared_unit = true;
            if (std::fabs(f.value - s.value) < 1e-9) return confidence;
        }
    }
    return shared_unit ? confidence * 0.8 : confidence;
}

// ============================================================================
// DecisionPolicy
// ============================================================================

DecisionPolicy DecisionPolicy::from_config(const EngineConfig& config) {
    DecisionPolicy p;
    p.high_threshold = config.high_threshold;
    p.medium_threshold = config.medium_threshold;
    p.min_matches = config.min_matches;
    p.mode = config.decision_mode;
    return p;
}

VerdictStatus DecisionPolicy::decide(double confidence, size_t match_count) const {
    VerdictStatus status = VerdictStatus::ValidInfraction;
    if (confidence >= high_threshold && match_count >= min_matches) {
        status = VerdictStatus::Repealable;
    } else if (confidence >= medium_threshold) {
        status = VerdictStatus::ReviewRecommended;
    }

    if (status == VerdictStatus::ReviewRecommended) {
        if (mode == DecisionMode::BinaryStrict)  return VerdictStatus::ValidInfraction;
        if (mode == DecisionMode::BinaryLenient) return VerdictStatus::Repealable;
    }
    return status;
}

// ============================================================================
// ConfidenceCalibrator
// ============================================================================

ConfidenceCalibrator::ConfidenceCalibrator(DecisionPolicy policy)
    : ConfidenceCalibrator(policy, default_stages()) {}

ConfidenceCalibrator::ConfidenceCalibrator(DecisionPolicy policy,
                                           std::vector<std::unique_ptr<CalibrationStage>> stages)
    : policy_(policy), stages_(std::move(stages)) {}

std::vector<std::unique_ptr<CalibrationStage>> ConfidenceCalibrator::default_stages() {
    std::vector<std::unique_ptr<CalibrationStage>> stages;
    stages.push_back(std::make_unique<BaseScoreStage>());
    stages.push_back(std::make_unique<MatchCountBoostStage>());
    stages.push_back(std::make_unique<DocumentReferenceBonusStage>());
    stages.push_back(std::make_unique<EntityOverlapBonusStage>());
    stages.push_back(std::make_unique<CategoryBoostStage>());
    stages.push_back(std::make_unique<MeasurementConflictPenaltyStage>());
    return stages;
}

std::string ConfidenceCalibrator::format_reason(const MatchResult& match) {
    const long pct = std::lround(match.score * 100.0);
    std::string snippet = collapse_whitespace(match.chunk->text);
    if (snippet.size() > SNIPPET_BYTES) snippet = utf8_truncate(snippet, SNIPPET_BYTES) + "...";
    return match.chunk->reference() + " (" + std::to_string(pct) + "% similarity): " + snippet;
}

RepealVerdict ConfidenceCalibrator::calibrate(const Infraction& infraction,
                                              const std::vector<MatchResult>& matches) const {
    RepealVerdict v;
    v.infraction = infraction;
    v.match_count = matches.size();

    const CalibrationContext ctx{infraction, matches};
    double confidence = 0.0;
    for (const auto& stage : stages_) {
        confidence = clamp_confidence(stage->apply(confidence, ctx));
        v.trace.push_back({stage->name(), confidence});
    }
    v.confidence = confidence;
    v.status = policy_.decide(confidence, matches.size());

    if (matches.empty()) {
        v.reasons.push_back(NO_MATCH_REASON);
        return v;
    }
    for (size_t i = 0; i < matches.size() && i < MAX_REASONS; ++i) {
        v.reasons.push_back(format_reason(matches[i]));
    }
    for (const auto& m : matches) {
        std::string ref = m.chunk->reference();
        if (std::find(v.spec_references.begin(), v.spec_references.end(), ref) == v.spec_references.end()) {
            v.spec_references.push_back(std::move(ref));
        }
    }
    return v;
}

} // namespace Repealer

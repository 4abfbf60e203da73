/**
 * @file confidence_calibrator.hpp
 * @brief Matches → calibrated confidence → explainable RepealVerdict
 *
 * Confidence is produced by an ordered list of named stages. Each stage takes
 * the confidence left by the previous one and the infraction's matches, and
 * its output is clamped to [0, 100] and recorded in the verdict trace.
 *
 * Default pipeline:
 *   base_score                    band table over the best similarity
 *   match_count_boost             >=3 matches x1.2, >=2 x1.1
 *   document_reference_bonus      cited document matched x1.15
 *   entity_overlap_bonus          +5 per shared entity type, at most +15
 *   category_boost                category keyword found in a match x1.1
 *   measurement_conflict_penalty  same unit, different value x0.8
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Repealer {

struct CalibrationContext {
    const Infraction& infraction;
    const std::vector<MatchResult>& matches;   ///< best first
};

class CalibrationStage {
public:
    virtual ~CalibrationStage() = default;
    virtual const char* name() const = 0;
    virtual double apply(double confidence, const CalibrationContext& ctx) const = 0;
};

/**
 * @brief Similarity bands, the one place that maps similarity to a base confidence.
 *
 *   >= 0.85 → 95    >= 0.75 → 85    >= 0.60 → 70
 *   >= 0.45 → 55    >= 0.30 → 40    otherwise 20
 */
class REPEALER_API BaseScoreStage : public CalibrationStage {
public:
    const char* name() const override { return "base_score"; }
    double apply(double confidence, const CalibrationContext& ctx) const override;

    static double band(double similarity);
};

class REPEALER_API MatchCountBoostStage : public CalibrationStage {
public:
    const char* name() const override { return "match_count_boost"; }
    double apply(double confidence, const CalibrationContext& ctx) const override;
};

class REPEALER_API DocumentReferenceBonusStage : public CalibrationStage {
public:
    const char* name() const override { return "document_reference_bonus"; }
    double apply(double confidence, const CalibrationContext& ctx) const override;
};

class REPEALER_API EntityOverlapBonusStage : public CalibrationStage {
public:
    static constexpr double PER_TYPE = 5.0;
    static constexpr double CAP = 15.0;

    const char* name() const override { return "entity_overlap_bonus"; }
    double apply(double confidence, const CalibrationContext& ctx) const override;
};

class REPEALER_API CategoryBoostStage : public CalibrationStage {
public:
    const char* name() const override { return "category_boost"; }
    double apply(double confidence, const CalibrationContext& ctx) const override;
};

/// The best match quotes the same unit as the infraction but never the same value.
class REPEALER_API MeasurementConflictPenaltyStage : public CalibrationStage {
public:
    const char* name() const override { return "measurement_conflict_penalty"; }
    double apply(double confidence, const CalibrationContext& ctx) const override;
};

struct REPEALER_API DecisionPolicy {
    double high_threshold = 85.0;
    double medium_threshold = 60.0;
    size_t min_matches = 2;
    DecisionMode mode = DecisionMode::ThreeTier;

    static DecisionPolicy from_config(const EngineConfig& config);

    VerdictStatus decide(double confidence, size_t match_count) const;
};

class REPEALER_API ConfidenceCalibrator {
public:
    static constexpr size_t MAX_REASONS = 3;
    static constexpr size_t SNIPPET_BYTES = 150;
    static constexpr const char* NO_MATCH_REASON = "No strong spec matches found — infraction appears valid.";

    explicit ConfidenceCalibrator(DecisionPolicy policy = DecisionPolicy());
    ConfidenceCalibrator(DecisionPolicy policy, std::vector<std::unique_ptr<CalibrationStage>> stages);

    static std::vector<std::unique_ptr<CalibrationStage>> default_stages();

    /// matches must be ordered best first, as SimilarityMatcher returns them.
    RepealVerdict calibrate(const Infraction& infraction, const std::vector<MatchResult>& matches) const;

    /// "{reference} ({score}% similarity): {snippet}"
    static std::string format_reason(const MatchResult& match);

    const DecisionPolicy& policy() const { return policy_; }

private:
    DecisionPolicy policy_;
    std::vector<std::unique_ptr<CalibrationStage>> stages_;
};

} // namespace Repealer

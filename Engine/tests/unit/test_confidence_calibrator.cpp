/**
 * @file test_confidence_calibrator.cpp
 * @brief Stage arithmetic, decision modes, reasons and monotonicity
 */

#include <gtest/gtest.h>
#include <analysis/confidence_calibrator.hpp>
#include <memory>
#include <string>

using namespace Repealer;

namespace {

ChunkPtr make_chunk(const std::string& text, std::optional<std::string> doc = std::nullopt,
                    uint32_t page = 1) {
    auto c = std::make_shared<SpecChunk>();
    c->text = text;
    c->source = "spec.txt";
    c->page = page;
    c->document_number = std::move(doc);
    return c;
}

Infraction make_infraction(const std::string& text) {
    Infraction inf;
    inf.raw_text = text;
    inf.normalized_text = text;
    return inf;
}

std::vector<MatchResult> make_matches(const Infraction& inf, const std::vector<std::pair<ChunkPtr, double>>& specs) {
    std::vector<MatchResult> out;
    for (size_t i = 0; i < specs.size(); ++i) out.push_back({&inf, specs[i].first, i, specs[i].second});
    return out;
}

double stage_value(const RepealVerdict& v, const std::string& stage) {
    for (const auto& t : v.trace) {
        if (t.stage == stage) return t.confidence;
    }
    ADD_FAILURE() << "no stage " << stage;
    return -1.0;
}

} // namespace

TEST(ConfidenceCalibratorTest, BandTable) {
    EXPECT_EQ(BaseScoreStage::band(1.0), 95.0);
    EXPECT_EQ(BaseScoreStage::band(0.85), 95.0);
    EXPECT_EQ(BaseScoreStage::band(0.8499), 85.0);
    EXPECT_EQ(BaseScoreStage::band(0.75), 85.0);
    EXPECT_EQ(BaseScoreStage::band(0.60), 70.0);
    EXPECT_EQ(BaseScoreStage::band(0.45), 55.0);
    EXPECT_EQ(BaseScoreStage::band(0.30), 40.0);
    EXPECT_EQ(BaseScoreStage::band(0.29), 20.0);
    EXPECT_EQ(BaseScoreStage::band(-1.0), 20.0);
}

TEST(ConfidenceCalibratorTest, NoMatchesIsValidWithFixedReason) {
    auto inf = make_infraction("Go-back: guy marker not installed on anchor guy");
    auto v = ConfidenceCalibrator().calibrate(inf, {});

    EXPECT_EQ(v.status, VerdictStatus::ValidInfraction);
    EXPECT_EQ(v.confidence, 0.0);
    EXPECT_EQ(v.match_count, 0u);
    ASSERT_EQ(v.reasons.size(), 1u);
    EXPECT_EQ(v.reasons[0], "No strong spec matches found — infraction appears valid.");
    EXPECT_TRUE(v.spec_references.empty());
}

TEST(ConfidenceCalibratorTest, TraceListsEveryStageInOrder) {
    auto inf = make_infraction("Go-back: guy marker not installed on anchor guy");
    auto v = ConfidenceCalibrator().calibrate(inf, {});
    ASSERT_EQ(v.trace.size(), 6u);
    EXPECT_EQ(v.trace[0].stage, "base_score");
    EXPECT_EQ(v.trace[1].stage, "match_count_boost");
    EXPECT_EQ(v.trace[2].stage, "document_reference_bonus");
    EXPECT_EQ(v.trace[3].stage, "entity_overlap_bonus");
    EXPECT_EQ(v.trace[4].stage, "category_boost");
    EXPECT_EQ(v.trace[5].stage, "measurement_conflict_penalty");
}

TEST(ConfidenceCalibratorTest, StrongRepeatedMatchIsRepealable) {
    auto inf = make_infraction("Go-back: guy marker not installed on anchor guy");
    auto matches = make_matches(inf, {
        {make_chunk("Guy markers are not required on anchor guys in rural areas."), 0.90},
        {make_chunk("Anchor guys away from traffic do not need a guy marker."), 0.80}
    });

    auto v = ConfidenceCalibrator().calibrate(inf, matches);
    EXPECT_DOUBLE_EQ(stage_value(v, "base_score"), 95.0);
    EXPECT_DOUBLE_EQ(stage_value(v, "match_count_boost"), 100.0);   // 104.5 clamped
    EXPECT_EQ(v.status, VerdictStatus::Repealable);
    EXPECT_EQ(v.match_count, 2u);
}

TEST(ConfidenceCalibratorTest, SingleMatchNeedsReviewAndModesCollapseIt) {
    auto inf = make_infraction("Go-back: guy marker not installed on anchor guy");
    auto matches = make_matches(inf, {{make_chunk("Guy markers are not required on anchor guys in rural areas."), 0.90}});

    EXPECT_EQ(ConfidenceCalibrator().calibrate(inf, matches).status, VerdictStatus::ReviewRecommended);

    DecisionPolicy strict;
    strict.mode = DecisionMode::BinaryStrict;
    EXPECT_EQ(ConfidenceCalibrator(strict).calibrate(inf, matches).status, VerdictStatus::ValidInfraction);

    DecisionPolicy lenient;
    lenient.mode = DecisionMode::BinaryLenient;
    EXPECT_EQ(ConfidenceCalibrator(lenient).calibrate(inf, matches).status, VerdictStatus::Repealable);
}

TEST(ConfidenceCalibratorTest, DecisionPolicyThresholds) {
    DecisionPolicy p;
    EXPECT_EQ(p.decide(85.0, 2), VerdictStatus::Repealable);
    EXPECT_EQ(p.decide(84.9, 5), VerdictStatus::ReviewRecommended);
    EXPECT_EQ(p.decide(95.0, 1), VerdictStatus::ReviewRecommended);
    EXPECT_EQ(p.decide(60.0, 0), VerdictStatus::ReviewRecommended);
    EXPECT_EQ(p.decide(59.9, 3), VerdictStatus::ValidInfraction);

    p.high_threshold = 70.0;
    p.min_matches = 1;
    EXPECT_EQ(p.decide(72.0, 1), VerdictStatus::Repealable);
}

TEST(ConfidenceCalibratorTest, DocumentReferenceBonus) {
    auto inf = make_infraction("Issue: riser not strapped per 022178");
    inf.document_ref = "022178";
    auto matches = make_matches(inf, {{make_chunk("Risers shall be strapped at intervals.", std::string("022178")), 0.50}});

    auto v = ConfidenceCalibrator().calibrate(inf, matches);
    EXPECT_DOUBLE_EQ(stage_value(v, "base_score"), 55.0);
    EXPECT_NEAR(stage_value(v, "document_reference_bonus"), 63.25, 1e-9);
    EXPECT_EQ(v.status, VerdictStatus::ReviewRecommended);

    auto other = make_matches(inf, {{make_chunk("Risers shall be strapped at intervals.", std::string("045786")), 0.50}});
    EXPECT_DOUBLE_EQ(ConfidenceCalibrator().calibrate(inf, other).confidence, 55.0);
}

TEST(ConfidenceCalibratorTest, EntityOverlapBonusCapped) {
    auto inf = make_infraction("Go-back: Class H1 pole per ASTM A123 set with 18 feet clearance");
    auto matches = make_matches(inf, {
        {make_chunk("Poles shall be Class H1, galvanized per ASTM A123, with 18 feet clearance over roads."), 0.50}
    });

    auto v = ConfidenceCalibrator().calibrate(inf, matches);
    EXPECT_DOUBLE_EQ(stage_value(v, "entity_overlap_bonus"), 70.0);
    EXPECT_DOUBLE_EQ(v.confidence, 70.0);
}

TEST(ConfidenceCalibratorTest, CategoryBoostNeedsKeywordInMatch) {
    auto inf = make_infraction("Go-back: recloser bypass switch left open");
    inf.category = "recloser";
    inf.category_flagged = true;

    auto hit = make_matches(inf, {{make_chunk("Recloser bypass switches are operated by the control center."), 0.50}});
    EXPECT_NEAR(ConfidenceCalibrator().calibrate(inf, hit).confidence, 60.5, 1e-9);

    auto miss = make_matches(inf, {{make_chunk("Switches are operated by the control center only."), 0.50}});
    EXPECT_DOUBLE_EQ(ConfidenceCalibrator().calibrate(inf, miss).confidence, 55.0);
}

TEST(ConfidenceCalibratorTest, ContradictingMeasurementIsPenalized) {
    auto inf = make_infraction("Go-back: pole clearance only 10 feet");
    auto matches = make_matches(inf, {
        {make_chunk("Table 1: Clearance requirements for overhead conductors require a minimum 18 feet."), 0.65}
    });

    auto v = ConfidenceCalibrator().calibrate(inf, matches);
    EXPECT_DOUBLE_EQ(stage_value(v, "base_score"), 70.0);
    EXPECT_NEAR(v.confidence, 56.0, 1e-9);
    EXPECT_EQ(v.status, VerdictStatus::ValidInfraction);
}

TEST(ConfidenceCalibratorTest, AgreeingMeasurementIsNotPenalized) {
    auto inf = make_infraction("Go-back: pole clearance is 18 feet");
    auto matches = make_matches(inf, {
        {make_chunk("Table 1: Clearance requirements for overhead conductors require a minimum 18 feet."), 0.65}
    });
    // 70 base, +5 for the shared measurement, no penalty
    EXPECT_DOUBLE_EQ(ConfidenceCalibrator().calibrate(inf, matches).confidence, 75.0);
}

TEST(ConfidenceCalibratorTest, ConfidenceIsMonotonicInSimilarity) {
    auto inf = make_infraction("Go-back: guy marker not installed on anchor guy");
    auto chunk = make_chunk("Guy markers are not required on anchor guys in rural areas.");
    ConfidenceCalibrator calibrator;

    double previous = -1.0;
    for (int i = 0; i <= 100; ++i) {
        double score = i / 100.0;
        auto v = calibrator.calibrate(inf, make_matches(inf, {{chunk, score}, {chunk, score}}));
        EXPECT_GE(v.confidence, previous) << "at similarity " << score;
        previous = v.confidence;
    }
}

TEST(ConfidenceCalibratorTest, ReasonsAndReferences) {
    auto inf = make_infraction("Go-back: guy marker not installed on anchor guy");
    std::string long_text(400, 'x');
    auto matches = make_matches(inf, {
        {make_chunk("Guy markers are not required on anchor guys in rural areas.", std::string("022178"), 4), 0.874},
        {make_chunk(long_text), 0.70},
        {make_chunk("Anchor guys away from traffic do not need a guy marker.", std::string("022178"), 4), 0.60},
        {make_chunk("Fourth match never shown.", std::string("013109"), 2), 0.50}
    });

    auto v = ConfidenceCalibrator().calibrate(inf, matches);
    ASSERT_EQ(v.reasons.size(), 3u);
    EXPECT_EQ(v.reasons[0],
              "Document 022178 p.4 (87% similarity): Guy markers are not required on anchor guys in rural areas.");
    EXPECT_EQ(v.reasons[1], "spec.txt p.1 (70% similarity): " + std::string(150, 'x') + "...");

    ASSERT_EQ(v.spec_references.size(), 3u);
    EXPECT_EQ(v.spec_references[0], "Document 022178 p.4");
    EXPECT_EQ(v.spec_references[1], "spec.txt p.1");
    EXPECT_EQ(v.spec_references[2], "Document 013109 p.2");
}

TEST(ConfidenceCalibratorTest, CustomPipeline) {
    std::vector<std::unique_ptr<CalibrationStage>> stages;
    stages.push_back(std::make_unique<BaseScoreStage>());
    ConfidenceCalibrator calibrator(DecisionPolicy(), std::move(stages));

    auto inf = make_infraction("Go-back: pole clearance only 10 feet");
    auto matches = make_matches(inf, {{make_chunk("minimum 18 feet over roads and highways."), 0.65}});
    auto v = calibrator.calibrate(inf, matches);
    ASSERT_EQ(v.trace.size(), 1u);
    EXPECT_DOUBLE_EQ(v.confidence, 70.0);
}

TEST(ConfidenceCalibratorTest, OverlongNumberInChunkDoesNotBreakEntityStages) {
    auto inf = make_infraction("Go-back: pole clearance only 10 feet over the road");
    auto matches = make_matches(inf, {
        {make_chunk("Clearance table row " + std::string(1, '1') + std::string(400, '0') + " feet minimum."), 0.65}
    });

    RepealVerdict v;
    ASSERT_NO_THROW(v = ConfidenceCalibrator().calibrate(inf, matches));
    EXPECT_DOUBLE_EQ(stage_value(v, "measurement_conflict_penalty"), 70.0);
    EXPECT_EQ(v.status, VerdictStatus::ReviewRecommended);
}

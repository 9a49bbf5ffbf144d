#include "ztredact/errors.h"
#include "ztredact/processing_record.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace ztredact;
using S = ProcessingState;

namespace {
void advance_to_scored(ProcessingRecord &rec) {
    for (S s : {S::VISUAL_SANITIZED, S::EXTRACTED, S::DETECTED, S::CONSOLIDATED, S::SCORED}) rec.transition(s);
}
} // namespace

TEST(ProcessingRecord, HappyPath) {
    ProcessingRecord rec("abc", "letter.pdf");
    advance_to_scored(rec);
    rec.transition(S::RELEASED);
    rec.set_sanitized_text("Herr [PERSON_1]");
    rec.seal();

    EXPECT_TRUE(rec.sealed());
    EXPECT_EQ(rec.state(), S::SEALED);
    EXPECT_EQ(rec.outcome(), S::RELEASED);
    std::vector<S> expected = {S::RECEIVED, S::VISUAL_SANITIZED, S::EXTRACTED, S::DETECTED, S::CONSOLIDATED,
                               S::SCORED, S::RELEASED, S::SEALED};
    EXPECT_EQ(rec.history(), expected);
}

TEST(ProcessingRecord, IllegalTransitionsThrow) {
    ProcessingRecord rec("abc", "letter.pdf");
    EXPECT_THROW(rec.transition(S::DETECTED), std::logic_error);
    EXPECT_THROW(rec.transition(S::RELEASED), std::logic_error);
    EXPECT_THROW(rec.transition(S::REVIEW_REJECTED), std::logic_error);
    EXPECT_EQ(rec.state(), S::RECEIVED);
}

TEST(ProcessingRecord, TransitionTable) {
    EXPECT_TRUE(valid_transition(S::EXTRACTED, S::REJECTED));
    EXPECT_TRUE(valid_transition(S::DETECTED, S::CANCELLED));
    EXPECT_TRUE(valid_transition(S::SCORED, S::HELD_FOR_REVIEW));
    EXPECT_TRUE(valid_transition(S::HELD_FOR_REVIEW, S::RELEASED));
    EXPECT_TRUE(valid_transition(S::HELD_FOR_REVIEW, S::REVIEW_REJECTED));
    EXPECT_FALSE(valid_transition(S::HELD_FOR_REVIEW, S::CANCELLED));
    EXPECT_FALSE(valid_transition(S::RELEASED, S::HELD_FOR_REVIEW));
    EXPECT_FALSE(valid_transition(S::REJECTED, S::RELEASED));
    EXPECT_FALSE(valid_transition(S::SEALED, S::RELEASED));
}

TEST(ProcessingRecord, SealedRecordIsImmutable) {
    ProcessingRecord rec("abc", "letter.pdf");
    rec.transition(S::REJECTED);
    rec.seal();
    EXPECT_THROW(rec.add_timing("ocr", 1.0), std::logic_error);
    EXPECT_THROW(rec.set_error("late"), std::logic_error);
    EXPECT_THROW(rec.set_plan(RedactionPlan()), std::logic_error);
    EXPECT_THROW(rec.add_detector_failure("contextual"), std::logic_error);
    EXPECT_THROW(rec.seal(), std::logic_error);
    EXPECT_EQ(rec.outcome(), S::REJECTED);
}

TEST(ProcessingRecord, SanitizedTextOnlyWhenReleased) {
    ProcessingRecord rec("abc", "letter.pdf");
    advance_to_scored(rec);
    EXPECT_THROW(rec.set_sanitized_text("x"), std::logic_error);
    rec.transition(S::HELD_FOR_REVIEW);
    EXPECT_THROW(rec.set_sanitized_text("x"), std::logic_error);
    EXPECT_FALSE(rec.sanitized_text().has_value());
}

TEST(ProcessingRecord, JsonCarriesNoText) {
    ProcessingRecord rec("abc", "letter.pdf");
    advance_to_scored(rec);
    rec.add_timing("detection", 12.5);
    rec.transition(S::RELEASED);
    rec.set_sanitized_text("Herr [PERSON_1], geboren am [DATE_1]");
    rec.seal();

    auto j = rec.to_json();
    EXPECT_EQ(j["processing_id"], "abc");
    EXPECT_EQ(j["outcome"], "RELEASED");
    EXPECT_EQ(j["state"], "SEALED");
    EXPECT_EQ(j["released"], true);
    EXPECT_DOUBLE_EQ(j["timings_ms"]["detection"].get<double>(), 12.5);
    EXPECT_EQ(j.dump().find("[PERSON_1]"), std::string::npos);
}

TEST(ProcessingRecord, RestoresHeldRecordFromAuditView) {
    ProcessingRecord rec("00ab", "letter.pdf");
    advance_to_scored(rec);
    rec.add_timing("detection", 12.5);
    rec.add_detector_failure("statistical-ner");
    RedactionPlan plan;
    plan.entries.push_back({{5, 19}, EntityKind::PERSON, "[PERSON_1]", 0.85, DetectorKind::CONTEXTUAL});
    plan.regions.push_back({{0, 10, 20, 30, 40}, EntityKind::STAMP, 0.7});
    rec.set_plan(plan);
    RiskAssessment risk;
    risk.score = 60;
    risk.decision = TriageDecision::HUMAN_REVIEW_REQUIRED;
    risk.factors.push_back({"pii_density", 60, "3 findings"});
    rec.set_risk(risk);
    rec.transition(S::HELD_FOR_REVIEW);

    ProcessingRecord back = ProcessingRecord::restore_held(rec.to_json());
    EXPECT_EQ(back.id(), "00ab");
    EXPECT_EQ(back.state(), S::HELD_FOR_REVIEW);
    EXPECT_FALSE(back.sealed());
    EXPECT_EQ(back.history(), rec.history());
    EXPECT_TRUE(*back.plan() == plan);
    EXPECT_EQ(back.risk()->score, 60);
    EXPECT_EQ(back.risk()->decision, TriageDecision::HUMAN_REVIEW_REQUIRED);
    EXPECT_EQ(back.detector_failures(), std::vector<std::string>{"statistical-ner"});

    back.transition(S::RELEASED);
    back.set_sanitized_text("Herr [PERSON_1]");
    back.seal();
    EXPECT_EQ(back.outcome(), S::RELEASED);
}

TEST(ProcessingRecord, RestoreRefusesRecordsThatAreNotHeld) {
    ProcessingRecord rec("00ab", "letter.pdf");
    advance_to_scored(rec);
    rec.transition(S::RELEASED);
    EXPECT_THROW(ProcessingRecord::restore_held(rec.to_json()), Error);

    nlohmann::json forged = {{"processing_id", "00ab"}, {"source", "x"},
                             {"history", nlohmann::json::array({"RECEIVED", "HELD_FOR_REVIEW"})}};
    EXPECT_THROW(ProcessingRecord::restore_held(forged), Error);
    EXPECT_THROW(ProcessingRecord::restore_held(nlohmann::json::object()), Error);
}

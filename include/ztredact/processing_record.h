#pragma once

#include "ztredact/consolidator.h"
#include "ztredact/risk_scorer.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ztredact {

enum class ProcessingState {
    RECEIVED, VISUAL_SANITIZED, EXTRACTED, DETECTED, CONSOLIDATED, SCORED,
    RELEASED, HELD_FOR_REVIEW, SEALED,
    REJECTED, CANCELLED, REVIEW_REJECTED
};

const char* processing_state_str(ProcessingState s);
bool parse_processing_state(const std::string &s, ProcessingState &out);

// True when `to` is a legal successor of `from`.
bool valid_transition(ProcessingState from, ProcessingState to);

// Audit record of one document. Only the pipeline mutates it; once sealed,
// every mutator throws std::logic_error.
class ProcessingRecord {
public:
    ProcessingRecord(std::string id, std::string source);

    const std::string& id() const { return id_; }
    const std::string& source() const { return source_; }
    ProcessingState state() const { return state_; }
    // State the record was sealed in; equals state() while unsealed.
    ProcessingState outcome() const { return outcome_; }
    bool sealed() const { return state_ == ProcessingState::SEALED; }

    const std::vector<ProcessingState>& history() const { return history_; }
    const std::vector<std::pair<std::string, double>>& timings_ms() const { return timings_ms_; }
    const std::optional<RedactionPlan>& plan() const { return plan_; }
    const std::optional<RiskAssessment>& risk() const { return risk_; }
    const std::vector<std::string>& detector_failures() const { return detector_failures_; }
    const std::optional<std::string>& sanitized_text() const { return sanitized_text_; }
    const std::string& error() const { return error_; }
    const nlohmann::json& analysis() const { return analysis_; }
    const std::string& analysis_error() const { return analysis_error_; }
    int page_count() const { return page_count_; }

    void transition(ProcessingState next);
    void seal();

    void add_timing(const std::string &stage, double ms);
    void set_plan(RedactionPlan plan);
    void set_risk(RiskAssessment risk);
    void add_detector_failure(const std::string &detector);
    // Only in RELEASED: held and rejected records never carry text.
    void set_sanitized_text(std::string text);
    void set_error(const std::string &message);
    void set_analysis(nlohmann::json analysis);
    void set_analysis_error(const std::string &message);
    void set_page_count(int pages);

    // Audit view. Contains no sanitized text and no raw values.
    nlohmann::json to_json() const;

    // Rebuilds an unsealed HELD_FOR_REVIEW record from its audit view by
    // replaying the recorded history. Throws Error for anything else.
    static ProcessingRecord restore_held(const nlohmann::json &audit);

private:
    void check_mutable(const char *what) const;

    std::string id_;
    std::string source_;
    ProcessingState state_ = ProcessingState::RECEIVED;
    ProcessingState outcome_ = ProcessingState::RECEIVED;
    std::vector<ProcessingState> history_{ProcessingState::RECEIVED};
    std::vector<std::pair<std::string, double>> timings_ms_;
    std::optional<RedactionPlan> plan_;
    std::optional<RiskAssessment> risk_;
    std::vector<std::string> detector_failures_;
    std::optional<std::string> sanitized_text_;
    std::string error_;
    nlohmann::json analysis_;
    std::string analysis_error_;
    int page_count_ = 0;
};

} // namespace ztredact

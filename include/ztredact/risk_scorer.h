#pragma once

#include "ztredact/config.h"
#include "ztredact/consolidator.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ztredact {

enum class TriageDecision { AUTO_RELEASE, ENHANCED_LOGGING, HUMAN_REVIEW_REQUIRED };

const char* triage_str(TriageDecision d);

struct RiskFactor {
    std::string name;      // "pii_density", "person_location", "visual_regions"
    int points = 0;
    std::string detail;
};

struct RiskAssessment {
    int score = 0;
    std::vector<RiskFactor> factors;
    TriageDecision decision = TriageDecision::AUTO_RELEASE;

    nlohmann::json to_json() const;
    // Throws std::invalid_argument on an unknown decision.
    static RiskAssessment from_json(const nlohmann::json &j);
};

// Additive re-identification risk of a finished plan over a text of
// text_length bytes.
RiskAssessment score_risk(const RedactionPlan &plan, size_t text_length, const RiskPolicy &policy);

TriageDecision triage(int score, const RiskPolicy &policy);

} // namespace ztredact

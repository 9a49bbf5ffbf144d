// risk_scorer.cpp
// Additive re-identification risk: PII density, risky kind combinations, visual regions.

#include "ztredact/risk_scorer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <stdexcept>

using json = nlohmann::json;

namespace ztredact {

const char* triage_str(TriageDecision d) {
    switch (d) {
        case TriageDecision::AUTO_RELEASE: return "AUTO_RELEASE";
        case TriageDecision::ENHANCED_LOGGING: return "ENHANCED_LOGGING";
        case TriageDecision::HUMAN_REVIEW_REQUIRED: return "HUMAN_REVIEW_REQUIRED";
    }
    return "HUMAN_REVIEW_REQUIRED";
}

json RiskAssessment::to_json() const {
    json j;
    j["score"] = score;
    j["decision"] = triage_str(decision);
    j["factors"] = json::array();
    for (auto &f : factors) j["factors"].push_back({{"name", f.name}, {"points", f.points}, {"detail", f.detail}});
    return j;
}

RiskAssessment RiskAssessment::from_json(const json &j) {
    RiskAssessment r;
    r.score = j.at("score").get<int>();
    std::string d = j.at("decision").get<std::string>();
    bool known = false;
    for (auto t : {TriageDecision::AUTO_RELEASE, TriageDecision::ENHANCED_LOGGING,
                   TriageDecision::HUMAN_REVIEW_REQUIRED}) {
        if (d == triage_str(t)) { r.decision = t; known = true; }
    }
    if (!known) throw std::invalid_argument("unknown triage decision " + d);
    for (auto &f : j.at("factors")) {
        r.factors.push_back({f.at("name").get<std::string>(), f.at("points").get<int>(),
                             f.value("detail", std::string())});
    }
    return r;
}

TriageDecision triage(int score, const RiskPolicy &policy) {
    if (score <= policy.auto_release_max) return TriageDecision::AUTO_RELEASE;
    if (score <= policy.enhanced_logging_max) return TriageDecision::ENHANCED_LOGGING;
    return TriageDecision::HUMAN_REVIEW_REQUIRED;
}

static bool contains(const std::vector<EntityKind> &kinds, EntityKind k) {
    return std::find(kinds.begin(), kinds.end(), k) != kinds.end();
}

// bytes between two non-overlapping spans
static size_t gap(const TextSpan &a, const TextSpan &b) {
    if (a.end <= b.start) return b.start - a.end;
    if (b.end <= a.start) return a.start - b.end;
    return 0;
}

RiskAssessment score_risk(const RedactionPlan &plan, size_t text_length, const RiskPolicy &policy) {
    RiskAssessment ra;

    // ---------------- Density ----------------
    size_t basis = std::max(text_length, policy.density_min_chars);
    double density = basis ? (double)plan.entries.size() * 1000.0 / (double)basis : 0.0;
    char detail[96];
    std::snprintf(detail, sizeof(detail), "%zu findings, %.2f per 1000 bytes", plan.entries.size(), density);
    if (density > policy.density_threshold) {
        ra.factors.push_back({"pii_density", policy.density_exceeded_points, detail});
    } else {
        int pts = (int)std::lround(density * policy.density_weight);
        if (pts > 0) ra.factors.push_back({"pii_density", pts, detail});
    }

    // ---------------- High-risk combinations ----------------
    for (auto &combo : policy.combinations) {
        int pairs = 0;
        for (size_t i = 0; i < plan.entries.size(); ++i) {
            if (!contains(combo.first, plan.entries[i].kind)) continue;
            for (size_t k = 0; k < plan.entries.size(); ++k) {
                if (k == i || !contains(combo.second, plan.entries[k].kind)) continue;
                if (gap(plan.entries[i].span, plan.entries[k].span) <= combo.window) ++pairs;
            }
        }
        if (pairs > 0) {
            ra.factors.push_back({combo.name, pairs * combo.points,
                                  std::to_string(pairs) + (pairs == 1 ? " pair" : " pairs") + " within " +
                                  std::to_string(combo.window) + " bytes"});
        }
    }

    // ---------------- Visual ----------------
    if (!plan.regions.empty()) {
        ra.factors.push_back({"visual_regions", (int)plan.regions.size() * policy.visual_points,
                              std::to_string(plan.regions.size()) + " image regions"});
    }

    for (auto &f : ra.factors) ra.score += f.points;
    ra.decision = triage(ra.score, policy);
    return ra;
}

} // namespace ztredact

#pragma once

#include "ztredact/types.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ztredact {

struct PlanEntry {
    TextSpan span;
    EntityKind kind = EntityKind::OTHER;
    std::string placeholder;       // "[PERSON_1]"
    double confidence = 0.0;
    DetectorKind source = DetectorKind::PATTERN;
};

struct PlanRegion {
    BoundingBox box;
    EntityKind kind = EntityKind::IMAGE_REGION;
    double confidence = 0.0;
};

// Ordered, pairwise non-overlapping spans plus merged image regions.
// Carries no raw values.
struct RedactionPlan {
    std::vector<PlanEntry> entries;
    std::vector<PlanRegion> regions;

    bool empty() const { return entries.empty() && regions.empty(); }
    nlohmann::json to_json() const;
    // Inverse of to_json. Throws std::invalid_argument on unknown kinds.
    static RedactionPlan from_json(const nlohmann::json &j);
};

bool operator==(const PlanEntry &a, const PlanEntry &b);
bool operator==(const PlanRegion &a, const PlanRegion &b);
bool operator==(const RedactionPlan &a, const RedactionPlan &b);

// Raw value -> placeholder, for registration with the log scrubber only.
using ScrubValues = std::vector<std::pair<std::string, std::string>>;

// Resolves overlaps (higher confidence wins, then detector priority, then the
// span accepted first) and numbers placeholders per kind in order of first
// appearance. When scrub_values is given it receives the raw value of every
// text finding, winners and losers alike.
RedactionPlan consolidate(const Findings &findings, ScrubValues *scrub_values = nullptr);

// Writes the sanitized text into a fresh buffer. Throws std::invalid_argument
// when a span does not fit the text.
std::string apply(const std::string &text, const RedactionPlan &plan);

// "PERSON" -> 2, "FACE" -> 1, ...
std::map<std::string, int> kind_counts(const RedactionPlan &plan);

} // namespace ztredact

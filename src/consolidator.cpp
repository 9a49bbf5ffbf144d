// consolidator.cpp
// All findings -> one non-overlapping redaction plan with stable placeholders.

#include "ztredact/consolidator.h"

#include "ztredact/text_util.h"

#include <algorithm>
#include <stdexcept>
#include <tuple>

using json = nlohmann::json;

namespace ztredact {

bool operator==(const PlanEntry &a, const PlanEntry &b) {
    return a.span.start == b.span.start && a.span.end == b.span.end && a.kind == b.kind &&
           a.placeholder == b.placeholder && a.confidence == b.confidence && a.source == b.source;
}

bool operator==(const PlanRegion &a, const PlanRegion &b) {
    return a.box.page == b.box.page && a.box.x == b.box.x && a.box.y == b.box.y &&
           a.box.width == b.box.width && a.box.height == b.box.height && a.kind == b.kind &&
           a.confidence == b.confidence;
}

bool operator==(const RedactionPlan &a, const RedactionPlan &b) {
    return a.entries == b.entries && a.regions == b.regions;
}

json RedactionPlan::to_json() const {
    json j;
    j["spans"] = json::array();
    for (auto &e : entries) {
        j["spans"].push_back({
            {"start", e.span.start}, {"end", e.span.end}, {"kind", entity_kind_str(e.kind)},
            {"placeholder", e.placeholder}, {"confidence", e.confidence}, {"source", detector_kind_str(e.source)}
        });
    }
    j["regions"] = json::array();
    for (auto &r : regions) {
        j["regions"].push_back({
            {"page", r.box.page}, {"x", r.box.x}, {"y", r.box.y}, {"width", r.box.width},
            {"height", r.box.height}, {"kind", entity_kind_str(r.kind)}, {"confidence", r.confidence}
        });
    }
    return j;
}

RedactionPlan RedactionPlan::from_json(const json &j) {
    auto kind_of = [](const json &v){
        EntityKind k;
        if (!parse_entity_kind(v.get<std::string>(), k)) throw std::invalid_argument("unknown entity kind in plan");
        return k;
    };
    RedactionPlan plan;
    for (auto &s : j.at("spans")) {
        PlanEntry e;
        e.span = {s.at("start").get<size_t>(), s.at("end").get<size_t>()};
        e.kind = kind_of(s.at("kind"));
        e.placeholder = s.at("placeholder").get<std::string>();
        e.confidence = s.at("confidence").get<double>();
        if (!parse_detector_kind(s.at("source").get<std::string>(), e.source)) {
            throw std::invalid_argument("unknown detector in plan");
        }
        plan.entries.push_back(e);
    }
    for (auto &r : j.at("regions")) {
        PlanRegion pr;
        pr.box = {r.at("page").get<int>(), r.at("x").get<int>(), r.at("y").get<int>(), r.at("width").get<int>(),
                  r.at("height").get<int>()};
        pr.kind = kind_of(r.at("kind"));
        pr.confidence = r.at("confidence").get<double>();
        plan.regions.push_back(pr);
    }
    return plan;
}

// ---------------- Text spans ----------------
static bool sort_before(const Finding &a, const Finding &b) {
    if (a.span().start != b.span().start) return a.span().start < b.span().start;
    if (a.span().length() != b.span().length()) return a.span().length() > b.span().length();
    if (a.confidence() != b.confidence()) return a.confidence() > b.confidence();
    int pa = detector_priority(a.source()), pb = detector_priority(b.source());
    if (pa != pb) return pa > pb;
    if (a.kind() != b.kind()) return a.kind() < b.kind();
    return a.raw_value() < b.raw_value();
}

// true when the challenger displaces the accepted finding
static bool wins_over(const Finding &challenger, const Finding &accepted) {
    if (challenger.confidence() != accepted.confidence()) return challenger.confidence() > accepted.confidence();
    return detector_priority(challenger.source()) > detector_priority(accepted.source());
}

static std::vector<const Finding*> resolve_overlaps(const Findings &findings) {
    std::vector<const Finding*> sorted;
    for (auto &f : findings) {
        if (f.is_text() && f.span().length() > 0) sorted.push_back(&f);
    }
    std::sort(sorted.begin(), sorted.end(), [](const Finding *a, const Finding *b){ return sort_before(*a, *b); });

    std::vector<const Finding*> accepted;
    for (auto *f : sorted) {
        if (!accepted.empty() && accepted.back()->span().overlaps(f->span())) {
            if (wins_over(*f, *accepted.back())) accepted.back() = f;
            continue;
        }
        accepted.push_back(f);
    }
    return accepted;
}

// ---------------- Image regions ----------------
static std::vector<PlanRegion> merge_regions(const Findings &findings) {
    std::vector<PlanRegion> regions;
    for (auto &f : findings) {
        if (f.is_text()) continue;
        regions.push_back({f.box(), f.kind(), f.confidence()});
    }
    // union overlapping boxes until nothing changes
    bool merged = true;
    while (merged) {
        merged = false;
        for (size_t i = 0; i < regions.size() && !merged; ++i) {
            for (size_t j = i + 1; j < regions.size(); ++j) {
                if (!regions[i].box.overlaps(regions[j].box)) continue;
                PlanRegion &a = regions[i];
                const PlanRegion &b = regions[j];
                a.box = a.box.united(b.box);
                if (b.kind == EntityKind::IMAGE_REGION || (a.kind != EntityKind::IMAGE_REGION && b.confidence > a.confidence)) {
                    a.kind = b.kind;
                }
                a.confidence = std::max(a.confidence, b.confidence);
                regions.erase(regions.begin() + j);
                merged = true;
                break;
            }
        }
    }
    std::sort(regions.begin(), regions.end(), [](const PlanRegion &a, const PlanRegion &b){
        return std::tie(a.box.page, a.box.y, a.box.x, a.box.width, a.box.height) <
               std::tie(b.box.page, b.box.y, b.box.x, b.box.width, b.box.height);
    });
    return regions;
}

// ---------------- Plan ----------------
RedactionPlan consolidate(const Findings &findings, ScrubValues *scrub_values) {
    RedactionPlan plan;
    std::vector<const Finding*> accepted = resolve_overlaps(findings);

    std::map<EntityKind, int> next_number;
    std::map<std::pair<EntityKind, std::string>, std::string> numbered;
    for (auto *f : accepted) {
        auto key = std::make_pair(f->kind(), collapse_spaces(f->raw_value()));
        auto it = numbered.find(key);
        if (it == numbered.end()) {
            int n = ++next_number[f->kind()];
            std::string ph = std::string("[") + entity_kind_str(f->kind()) + "_" + std::to_string(n) + "]";
            it = numbered.emplace(key, ph).first;
        }
        plan.entries.push_back({f->span(), f->kind(), it->second, f->confidence(), f->source()});
    }
    plan.regions = merge_regions(findings);

    if (scrub_values) {
        scrub_values->clear();
        for (auto &kv : numbered) {
            if (!kv.first.second.empty()) scrub_values->emplace_back(kv.first.second, kv.second);
        }
        // overruled findings still name something sensitive
        for (auto &f : findings) {
            if (!f.is_text()) continue;
            std::string raw = collapse_spaces(f.raw_value());
            if (raw.empty() || numbered.count({f.kind(), raw})) continue;
            scrub_values->emplace_back(raw, std::string("[") + entity_kind_str(f.kind()) + "]");
        }
    }
    return plan;
}

std::string apply(const std::string &text, const RedactionPlan &plan) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (auto &e : plan.entries) {
        if (e.span.start < pos || e.span.end > text.size() || e.span.end < e.span.start) {
            throw std::invalid_argument("redaction plan does not fit the text");
        }
        out.append(text, pos, e.span.start - pos);
        out += e.placeholder;
        pos = e.span.end;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::map<std::string, int> kind_counts(const RedactionPlan &plan) {
    std::map<std::string, int> counts;
    for (auto &e : plan.entries) counts[entity_kind_str(e.kind)]++;
    for (auto &r : plan.regions) counts[entity_kind_str(r.kind)]++;
    return counts;
}

} // namespace ztredact

#include "ztredact/detectors.h"

#include <algorithm>

namespace ztredact {

PatternDetector::PatternDetector(const PatternConfig &cfg) : window_(cfg.context_window) {
    for (auto &rule : default_pattern_rules()) {
        auto &off = cfg.disabled_rules;
        if (std::find(off.begin(), off.end(), rule.name) != off.end()) continue;
        rules_.push_back(rule);
    }
}

Findings PatternDetector::detect(const std::string &text) const {
    Findings out;
    for (auto &m : scan_patterns(text, rules_, true, window_)) {
        out.push_back(Finding::text(m.span, m.rule->kind, m.rule->confidence, DetectorKind::PATTERN,
                                    text.substr(m.span.start, m.span.length())));
    }
    return out;
}

} // namespace ztredact

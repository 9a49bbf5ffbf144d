// fuzzy_detector.cpp
// Near matches of case gazetteer entries, for OCR noise and spelling variants.

#include "ztredact/detectors.h"

#include "ztredact/text_util.h"

#include <algorithm>
#include <cmath>

namespace ztredact {

namespace {
struct Candidate {
    TextSpan span;
    double score;
    EntityKind kind;
};
} // namespace

Findings FuzzyDetector::detect(const std::string &text) const {
    if (!gazetteer_ || gazetteer_->empty()) return {};

    std::vector<Token> words;
    std::vector<bool> breaks_before;   // punctuation between this word and the previous one
    bool pending_break = false;
    for (auto &t : tokenize(text)) {
        if (t.is_punct()) { pending_break = true; continue; }
        words.push_back(t);
        breaks_before.push_back(pending_break);
        pending_break = false;
    }

    std::vector<Candidate> candidates;
    for (auto &entry : gazetteer_->entries()) {
        size_t entry_len = utf8_length(entry.value);
        if (entry_len < 3) continue;
        size_t entry_words = 0;
        for (auto &t : tokenize(entry.value)) if (!t.is_punct()) ++entry_words;
        if (entry_words == 0) continue;

        size_t min_w = std::max<size_t>(1, entry_words - 1);
        size_t max_w = std::min(entry_words + 1, std::max<size_t>(1, cfg_.max_window_tokens));
        // an edit budget larger than this cannot reach the threshold
        double max_len_gap = (1.0 - cfg_.threshold) * (double)entry_len + 1.0;

        for (size_t w = min_w; w <= max_w; ++w) {
            for (size_t i = 0; i + w <= words.size(); ++i) {
                bool broken = false;
                for (size_t k = i + 1; k < i + w && !broken; ++k) broken = breaks_before[k];
                if (broken) continue;
                TextSpan span{words[i].start, words[i + w - 1].end};
                std::string window = collapse_spaces(text.substr(span.start, span.length()));
                double gap = std::fabs((double)utf8_length(window) - (double)entry_len);
                if (gap > max_len_gap) continue;
                double score = similarity(window, entry.value);
                if (score >= cfg_.threshold) candidates.push_back({span, score, entry.kind});
            }
        }
    }

    // best first, then greedily keep non-overlapping windows
    std::sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b){
        if (a.score != b.score) return a.score > b.score;
        if (a.span.length() != b.span.length()) return a.span.length() > b.span.length();
        return a.span.start < b.span.start;
    });
    std::vector<Candidate> kept;
    for (auto &c : candidates) {
        bool clash = std::any_of(kept.begin(), kept.end(), [&](const Candidate &k){ return k.span.overlaps(c.span); });
        if (!clash) kept.push_back(c);
    }
    std::sort(kept.begin(), kept.end(), [](const Candidate &a, const Candidate &b){ return a.span.start < b.span.start; });

    Findings out;
    for (auto &c : kept) {
        out.push_back(Finding::text(c.span, c.kind, c.score, DetectorKind::FUZZY,
                                    text.substr(c.span.start, c.span.length())));
    }
    return out;
}

} // namespace ztredact

// ner_detector.cpp
// Statistical NER through a model server; code point spans -> byte spans.

#include "ztredact/detectors.h"

#include "ztredact/errors.h"
#include "ztredact/http.h"
#include "ztredact/text_util.h"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace ztredact {

// ---------------- Model server client ----------------
std::vector<EntitySpan> HttpEntityRecognizer::recognize(const std::string &text,
                                                        const CancellationToken &cancel) const {
    long http_code = 0;
    json resp = http_post_json(endpoint_, "", json{{"text", text}}, http_code, timeout_sec_, &cancel);
    if (http_code >= 400) throw Error("NER server returned HTTP " + std::to_string(http_code));

    std::vector<EntitySpan> spans;
    if (!resp.contains("entities") || !resp["entities"].is_array()) return spans;
    for (auto &e : resp["entities"]) {
        if (!e.contains("start") || !e.contains("end") || !e.contains("label")) continue;
        EntitySpan s;
        s.start = e["start"].get<size_t>();
        s.end = e["end"].get<size_t>();
        s.label = e["label"].get<std::string>();
        s.score = e.value("score", 1.0);
        spans.push_back(s);
    }
    return spans;
}

// ---------------- Detector ----------------
EntityKind NerDetector::map_label(const std::string &label) {
    std::string up = label;
    std::transform(up.begin(), up.end(), up.begin(), ::toupper);
    if (up == "PER" || up == "PERSON") return EntityKind::PERSON;
    if (up == "LOC" || up == "GPE" || up == "LOCATION") return EntityKind::LOCATION;
    if (up == "ORG" || up == "ORGANIZATION") return EntityKind::ORG;
    if (up == "DATE") return EntityKind::DATE;
    // MISC and anything unrecognised stay sensitive
    return EntityKind::OTHER;
}

Findings NerDetector::detect(const std::string &text) const {
    if (!recognizer_) return {};
    std::vector<EntitySpan> spans;
    try {
        spans = recognizer_->recognize(text, cancel_);
    } catch (const PipelineCancelled &) {
        throw;
    } catch (const std::exception &e) {
        throw DetectorFailure(name(), e.what());
    }

    std::vector<size_t> offs = utf8_codepoint_offsets(text);
    size_t cp_count = offs.size() - 1;
    Findings out;
    for (auto &s : spans) {
        // malformed spans are dropped, the rest still count
        if (s.start >= s.end || s.end > cp_count) continue;
        TextSpan span{offs[s.start], offs[s.end]};
        out.push_back(Finding::text(span, map_label(s.label), s.score, DetectorKind::NER,
                                    text.substr(span.start, span.length())));
    }
    return out;
}

} // namespace ztredact

// pipeline.cpp
// Orchestration: visual redaction -> extraction -> four detectors in parallel ->
// consolidation -> risk triage -> release or review queue.

#include "ztredact/pipeline.h"

#include "ztredact/consolidator.h"
#include "ztredact/detectors.h"
#include "ztredact/errors.h"
#include "ztredact/risk_scorer.h"
#include "ztredact/text_util.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

namespace ztredact {

namespace {
using Clock = std::chrono::steady_clock;

double ms_since(Clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

std::string describe_counts(const RedactionPlan &plan) {
    std::string s;
    for (auto &kv : kind_counts(plan)) {
        if (!s.empty()) s += ", ";
        s += kv.first + "=" + std::to_string(kv.second);
    }
    return s.empty() ? "none" : s;
}

std::string describe_factors(const RiskAssessment &risk) {
    std::string s;
    for (auto &f : risk.factors) {
        if (!s.empty()) s += ", ";
        s += f.name + "=" + std::to_string(f.points);
    }
    return s.empty() ? "none" : s;
}
} // namespace

Pipeline::Pipeline(const PipelineConfig &cfg, SecureLogger &logger, PipelineServices services)
    : cfg_(cfg), log_(logger), services_(std::move(services)),
      epoch_((uint64_t)std::chrono::system_clock::now().time_since_epoch().count()) {
    if (services_.gazetteer) log_.set_gazetteer(services_.gazetteer);
    if (!cfg_.review.store_dir.empty()) store_ = std::make_unique<ReviewStore>(cfg_.review.store_dir);
}

std::string Pipeline::next_id(const Document &doc) {
    uint64_t n = ++seq_;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  (unsigned long long)fnv1a_64(doc.id + "#" + std::to_string(epoch_) + "#" + std::to_string(n)));
    return buf;
}

void Pipeline::check(const CancellationToken &cancel) const {
    if (cancel.cancelled()) throw PipelineCancelled();
}

// ---------------- Stages ----------------
std::vector<cv::Mat> Pipeline::sanitize_pages(const Document &doc, ProcessingRecord &rec, Findings &visual) {
    const size_t n = doc.pages.size();
    std::vector<VisualResult> results(n);
    if (n > 0) {
        VisualRedactor redactor(cfg_.visual, services_.image_analyzer);
        std::atomic<size_t> idx{0};
        auto worker = [&](){
            while (true) {
                size_t i = idx.fetch_add(1);
                if (i >= n) break;
                results[i] = redactor.redact(doc.pages[i], (int)i);
            }
        };
        int thread_count = std::max(1, std::min<int>(cfg_.threads, (int)n));
        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        for (int t = 0; t < thread_count; ++t) workers.emplace_back(worker);
        for (auto &th : workers) th.join();
    }

    std::vector<cv::Mat> pages;
    pages.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (results[i].failed_closed) {
            log_.warn("visual", rec.id() + " page " + std::to_string(i + 1) + " blanked: " + results[i].error);
        }
        visual.insert(visual.end(), results[i].findings.begin(), results[i].findings.end());
        pages.push_back(std::move(results[i].image));
    }
    rec.set_page_count((int)n);
    return pages;
}

std::string layer_text_outside(const std::vector<LayerWord> &words, const Findings &regions) {
    std::string out;
    const LayerWord *prev = nullptr;
    bool skipped = false;
    for (auto &w : words) {
        bool covered = std::any_of(regions.begin(), regions.end(), [&](const Finding &f){
            return !f.is_text() && f.box().overlaps(w.box);
        });
        if (covered) { skipped = true; continue; }
        if (prev) {
            if (w.box.page != prev->box.page) out += "\n";
            else if (w.box.y > prev->box.y + prev->box.height / 2) out += "\n";
            else if (prev->space_after || skipped) out += " ";
        }
        out += w.text;
        prev = &w;
        skipped = false;
    }
    if (!out.empty()) out += "\n";
    return out;
}

std::string Pipeline::extract_text(const Document &doc, const std::vector<cv::Mat> &pages, const Findings &visual) {
    if (!doc.text_layer.empty()) {
        std::string text = layer_text_outside(doc.text_layer, visual);
        if (!trim_copy(text).empty()) return text;
    } else if (doc.text && !trim_copy(*doc.text).empty()) {
        // without word positions only OCR of the redacted pages keeps region text out
        if (visual.empty() || pages.empty()) return *doc.text;
        log_.debug("extraction", "text without positions on a page with regions, using OCR");
    }
    if (pages.empty()) throw ExtractionFailure("document has neither text nor page images");
    if (!services_.extractor) throw ExtractionFailure("no text extractor configured");

    std::string text;
    for (auto &page : pages) {
        if (page.empty()) continue;
        try {
            text += services_.extractor->extract(page);
        } catch (const ExtractionFailure &) {
            throw;
        } catch (const std::exception &e) {
            throw ExtractionFailure(e.what());
        }
        text += "\n";
    }
    if (trim_copy(text).empty()) throw ExtractionFailure("OCR produced no text");
    return text;
}

Findings Pipeline::run_detectors(const std::string &text, const Document &doc, ProcessingRecord &rec,
                                 const CancellationToken &cancel) {
    std::vector<std::unique_ptr<Detector>> detectors;
    if (cfg_.ner.enabled && services_.recognizer) {
        // the model call is the slow one; it watches the token itself
        detectors.push_back(std::make_unique<NerDetector>(services_.recognizer, cancel));
    }
    if (cfg_.pattern.enabled) detectors.push_back(std::make_unique<PatternDetector>(cfg_.pattern));
    if (cfg_.contextual.enabled) detectors.push_back(std::make_unique<ContextualDetector>(cfg_.contextual));
    if (cfg_.fuzzy.enabled) {
        auto gazetteer = std::make_shared<Gazetteer>();
        if (services_.gazetteer) gazetteer->merge(*services_.gazetteer);
        if (doc.gazetteer) gazetteer->merge(*doc.gazetteer);
        if (!gazetteer->empty()) detectors.push_back(std::make_unique<FuzzyDetector>(cfg_.fuzzy, gazetteer));
    }

    // one thread and one result slot per detector, joined before anything is merged
    std::vector<Findings> slots(detectors.size());
    std::vector<std::string> failures(detectors.size());
    std::vector<std::thread> threads;
    threads.reserve(detectors.size());
    for (size_t i = 0; i < detectors.size(); ++i) {
        threads.emplace_back([&, i](){
            try {
                slots[i] = detectors[i]->detect(text);
            } catch (const PipelineCancelled &) {
                failures[i] = "PipelineCancelled";
            } catch (const DetectorFailure &) {
                failures[i] = "DetectorFailure";
            } catch (const std::exception &) {
                failures[i] = "unexpected exception";
            }
        });
    }
    for (auto &t : threads) t.join();
    check(cancel);

    Findings all;
    for (size_t i = 0; i < detectors.size(); ++i) {
        const char *name = detectors[i]->name();
        if (!failures[i].empty()) {
            // type and detector only; the message may quote the document
            log_.warn("detector", failures[i] + " in " + name + ", counted as zero findings");
            rec.add_detector_failure(name);
            continue;
        }
        log_.debug("detector", std::string(name) + ": " + std::to_string(slots[i].size()) + " findings");
        all.insert(all.end(), slots[i].begin(), slots[i].end());
    }
    return all;
}

void Pipeline::release(ProcessingRecord &rec, std::string sanitized) {
    rec.transition(ProcessingState::RELEASED);
    rec.set_sanitized_text(std::move(sanitized));
    if (!services_.analysis) return;

    auto t0 = Clock::now();
    try {
        rec.set_analysis(services_.analysis->analyze(*rec.sanitized_text()));
    } catch (const std::exception &e) {
        // all or nothing: a failed analysis leaves no partial result
        rec.set_analysis_error(log_.scrub(e.what()));
        log_.warn("analysis", rec.id() + " analysis failed: " + e.what());
    }
    rec.add_timing("analysis", ms_since(t0));
}

// ---------------- Orchestration ----------------
ProcessingRecord Pipeline::process(const Document &doc, const CancellationToken &cancel) {
    ProcessingRecord rec(next_id(doc), doc.id);
    log_.info("pipeline", rec.id() + " received, " + std::to_string(doc.pages.size()) + " page(s)" +
                          (doc.text || !doc.text_layer.empty() ? ", text layer present" : ""));

    SecureLogger::ScrubScope scrub_scope;
    try {
        check(cancel);
        auto t0 = Clock::now();
        Findings visual;
        std::vector<cv::Mat> pages = sanitize_pages(doc, rec, visual);
        rec.add_timing("visual", ms_since(t0));
        rec.transition(ProcessingState::VISUAL_SANITIZED);
        check(cancel);

        t0 = Clock::now();
        std::string text = extract_text(doc, pages, visual);
        pages.clear();
        rec.add_timing("extraction", ms_since(t0));
        rec.transition(ProcessingState::EXTRACTED);
        check(cancel);

        t0 = Clock::now();
        Findings findings = run_detectors(text, doc, rec, cancel);
        rec.add_timing("detection", ms_since(t0));
        check(cancel);
        rec.transition(ProcessingState::DETECTED);

        t0 = Clock::now();
        findings.insert(findings.end(), visual.begin(), visual.end());
        ScrubValues scrub_values;
        RedactionPlan plan = consolidate(findings, &scrub_values);
        scrub_scope = log_.register_values(scrub_values);
        findings.clear();
        visual.clear();
        std::string sanitized = ztredact::apply(text, plan);
        rec.add_timing("consolidation", ms_since(t0));
        rec.transition(ProcessingState::CONSOLIDATED);
        check(cancel);

        RiskAssessment risk = score_risk(plan, text.size(), cfg_.risk);
        check(cancel);
        log_.info("pipeline", rec.id() + " score " + std::to_string(risk.score) + " -> " + triage_str(risk.decision));
        rec.set_plan(std::move(plan));
        rec.set_risk(risk);
        rec.transition(ProcessingState::SCORED);

        if (risk.decision == TriageDecision::HUMAN_REVIEW_REQUIRED) {
            rec.transition(ProcessingState::HELD_FOR_REVIEW);
            ProcessingRecord snapshot = rec;
            if (store_) {
                try {
                    store_->save(rec, sanitized);
                } catch (const Error &e) {
                    // still held in memory for this run
                    log_.error("review", rec.id() + " not persisted: " + e.what());
                }
            }
            {
                std::lock_guard<std::mutex> lk(review_mu_);
                review_queue_.emplace(rec.id(), HeldEntry{std::move(rec), std::move(sanitized)});
            }
            log_.warn("pipeline", snapshot.id() + " held for review (" + describe_factors(risk) + ")");
            snapshot.seal();
            return snapshot;
        }
        if (risk.decision == TriageDecision::ENHANCED_LOGGING) {
            log_.info("pipeline", rec.id() + " enhanced logging: kinds " + describe_counts(*rec.plan()) +
                                  "; factors " + describe_factors(risk));
        }
        release(rec, std::move(sanitized));
        log_.info("pipeline", rec.id() + " released");
    } catch (const PipelineCancelled &) {
        rec.transition(ProcessingState::CANCELLED);
        log_.warn("pipeline", rec.id() + " cancelled in state " + processing_state_str(rec.state()));
    } catch (const ExtractionFailure &e) {
        rec.set_error(log_.scrub(e.what()));
        rec.transition(ProcessingState::REJECTED);
        log_.error("pipeline", rec.id() + " rejected: ExtractionFailure: " + e.what());
    }
    rec.seal();
    return rec;
}

ProcessingRecord Pipeline::review_decision(const std::string &processing_id, ReviewDecision decision) {
    HeldEntry held = [&]{
        std::lock_guard<std::mutex> lk(review_mu_);
        auto it = review_queue_.find(processing_id);
        if (it != review_queue_.end()) {
            HeldEntry h = std::move(it->second);
            review_queue_.erase(it);
            return h;
        }
        std::optional<HeldEntry> stored = store_ ? store_->load(processing_id) : std::nullopt;
        if (!stored) throw UnknownProcessingId(processing_id);
        return std::move(*stored);
    }();
    if (store_) store_->remove(processing_id);

    ProcessingRecord &rec = held.record;
    if (decision == ReviewDecision::APPROVE) {
        release(rec, std::move(held.sanitized_text));
        log_.info("review", rec.id() + " approved and released");
    } else {
        rec.transition(ProcessingState::REVIEW_REJECTED);
        log_.info("review", rec.id() + " rejected, sanitized text discarded");
    }
    rec.seal();
    return std::move(rec);
}

std::vector<std::string> Pipeline::pending_reviews() const {
    std::lock_guard<std::mutex> lk(review_mu_);
    std::vector<std::string> ids;
    for (auto &kv : review_queue_) ids.push_back(kv.first);
    if (store_) {
        for (auto &id : store_->ids()) {
            if (!review_queue_.count(id)) ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());
    }
    return ids;
}

} // namespace ztredact

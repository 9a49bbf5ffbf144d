// processing_record.cpp
// Per-document state machine and audit record.

#include "ztredact/processing_record.h"

#include "ztredact/errors.h"

#include <stdexcept>

using json = nlohmann::json;

namespace ztredact {

const char* processing_state_str(ProcessingState s) {
    switch (s) {
        case ProcessingState::RECEIVED: return "RECEIVED";
        case ProcessingState::VISUAL_SANITIZED: return "VISUAL_SANITIZED";
        case ProcessingState::EXTRACTED: return "EXTRACTED";
        case ProcessingState::DETECTED: return "DETECTED";
        case ProcessingState::CONSOLIDATED: return "CONSOLIDATED";
        case ProcessingState::SCORED: return "SCORED";
        case ProcessingState::RELEASED: return "RELEASED";
        case ProcessingState::HELD_FOR_REVIEW: return "HELD_FOR_REVIEW";
        case ProcessingState::SEALED: return "SEALED";
        case ProcessingState::REJECTED: return "REJECTED";
        case ProcessingState::CANCELLED: return "CANCELLED";
        case ProcessingState::REVIEW_REJECTED: return "REVIEW_REJECTED";
    }
    return "UNKNOWN";
}

bool parse_processing_state(const std::string &s, ProcessingState &out) {
    for (int i = (int)ProcessingState::RECEIVED; i <= (int)ProcessingState::REVIEW_REJECTED; ++i) {
        auto st = (ProcessingState)i;
        if (s == processing_state_str(st)) { out = st; return true; }
    }
    return false;
}

static bool in_flight(ProcessingState s) {
    switch (s) {
        case ProcessingState::RECEIVED:
        case ProcessingState::VISUAL_SANITIZED:
        case ProcessingState::EXTRACTED:
        case ProcessingState::DETECTED:
        case ProcessingState::CONSOLIDATED:
        case ProcessingState::SCORED:
            return true;
        default:
            return false;
    }
}

bool valid_transition(ProcessingState from, ProcessingState to) {
    using S = ProcessingState;
    if (in_flight(from) && (to == S::REJECTED || to == S::CANCELLED)) return true;
    switch (from) {
        case S::RECEIVED: return to == S::VISUAL_SANITIZED;
        case S::VISUAL_SANITIZED: return to == S::EXTRACTED;
        case S::EXTRACTED: return to == S::DETECTED;
        case S::DETECTED: return to == S::CONSOLIDATED;
        case S::CONSOLIDATED: return to == S::SCORED;
        case S::SCORED: return to == S::RELEASED || to == S::HELD_FOR_REVIEW;
        // a held record leaves only through a reviewer decision
        case S::HELD_FOR_REVIEW: return to == S::RELEASED || to == S::REVIEW_REJECTED || to == S::SEALED;
        case S::RELEASED:
        case S::REJECTED:
        case S::CANCELLED:
        case S::REVIEW_REJECTED:
            return to == S::SEALED;
        case S::SEALED: return false;
    }
    return false;
}

ProcessingRecord::ProcessingRecord(std::string id, std::string source)
    : id_(std::move(id)), source_(std::move(source)) {}

void ProcessingRecord::check_mutable(const char *what) const {
    if (sealed()) throw std::logic_error(std::string("processing record ") + id_ + " is sealed: " + what);
}

void ProcessingRecord::transition(ProcessingState next) {
    check_mutable("transition");
    if (!valid_transition(state_, next)) {
        throw std::logic_error(std::string("illegal transition ") + processing_state_str(state_) + " -> " +
                               processing_state_str(next));
    }
    if (next != ProcessingState::SEALED) outcome_ = next;
    state_ = next;
    history_.push_back(next);
}

void ProcessingRecord::seal() { transition(ProcessingState::SEALED); }

void ProcessingRecord::add_timing(const std::string &stage, double ms) {
    check_mutable("add_timing");
    timings_ms_.emplace_back(stage, ms);
}

void ProcessingRecord::set_plan(RedactionPlan plan) {
    check_mutable("set_plan");
    plan_ = std::move(plan);
}

void ProcessingRecord::set_risk(RiskAssessment risk) {
    check_mutable("set_risk");
    risk_ = std::move(risk);
}

void ProcessingRecord::add_detector_failure(const std::string &detector) {
    check_mutable("add_detector_failure");
    detector_failures_.push_back(detector);
}

void ProcessingRecord::set_sanitized_text(std::string text) {
    check_mutable("set_sanitized_text");
    if (state_ != ProcessingState::RELEASED) {
        throw std::logic_error(std::string("sanitized text outside RELEASED (state ") + processing_state_str(state_) + ")");
    }
    sanitized_text_ = std::move(text);
}

void ProcessingRecord::set_error(const std::string &message) {
    check_mutable("set_error");
    error_ = message;
}

void ProcessingRecord::set_analysis(json analysis) {
    check_mutable("set_analysis");
    analysis_ = std::move(analysis);
}

void ProcessingRecord::set_analysis_error(const std::string &message) {
    check_mutable("set_analysis_error");
    analysis_error_ = message;
}

void ProcessingRecord::set_page_count(int pages) {
    check_mutable("set_page_count");
    page_count_ = pages;
}

json ProcessingRecord::to_json() const {
    json j;
    j["processing_id"] = id_;
    j["source"] = source_;
    j["state"] = processing_state_str(state_);
    j["outcome"] = processing_state_str(outcome_);
    j["page_count"] = page_count_;
    j["history"] = json::array();
    for (auto s : history_) j["history"].push_back(processing_state_str(s));
    j["timings_ms"] = json::object();
    for (auto &t : timings_ms_) j["timings_ms"][t.first] = t.second;
    if (plan_) {
        j["redactions"] = plan_->to_json();
        j["kind_counts"] = kind_counts(*plan_);
    }
    if (risk_) j["risk"] = risk_->to_json();
    if (!detector_failures_.empty()) j["detector_failures"] = detector_failures_;
    j["released"] = sanitized_text_.has_value();
    if (sanitized_text_) j["sanitized_chars"] = sanitized_text_->size();
    if (!error_.empty()) j["error"] = error_;
    if (!analysis_.is_null()) j["analysis"] = analysis_;
    if (!analysis_error_.empty()) j["analysis_error"] = analysis_error_;
    return j;
}

ProcessingRecord ProcessingRecord::restore_held(const json &audit) {
    try {
        ProcessingRecord rec(audit.at("processing_id").get<std::string>(), audit.at("source").get<std::string>());
        const json &history = audit.at("history");
        for (size_t i = 1; i < history.size(); ++i) {
            ProcessingState st;
            if (!parse_processing_state(history[i].get<std::string>(), st)) {
                throw Error("unknown state " + history[i].get<std::string>());
            }
            rec.transition(st);
        }
        if (rec.state() != ProcessingState::HELD_FOR_REVIEW) {
            throw Error(std::string("record is ") + processing_state_str(rec.state()) + ", not held");
        }
        rec.page_count_ = audit.value("page_count", 0);
        json timings = audit.value("timings_ms", json::object());
        for (auto &kv : timings.items()) rec.timings_ms_.emplace_back(kv.key(), kv.value().get<double>());
        if (audit.contains("redactions")) rec.plan_ = RedactionPlan::from_json(audit.at("redactions"));
        if (audit.contains("risk")) rec.risk_ = RiskAssessment::from_json(audit.at("risk"));
        rec.detector_failures_ = audit.value("detector_failures", std::vector<std::string>());
        return rec;
    } catch (const json::exception &e) {
        throw Error(std::string("malformed held record: ") + e.what());
    } catch (const std::logic_error &e) {
        // illegal replayed transition or unknown kind
        throw Error(std::string("malformed held record: ") + e.what());
    }
}

} // namespace ztredact

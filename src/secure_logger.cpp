// secure_logger.cpp
// spdlog behind a scrubber; nothing reaches a sink unscrubbed.

#include "ztredact/secure_logger.h"

#include "ztredact/detectors.h"
#include "ztredact/gazetteer.h"
#include "ztredact/pattern_rules.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ztredact {

// ---------------- ScrubScope ----------------
SecureLogger::ScrubScope::ScrubScope(ScrubScope &&other) noexcept
    : owner_(other.owner_), raw_values_(std::move(other.raw_values_)) {
    other.owner_ = nullptr;
    other.raw_values_.clear();
}

SecureLogger::ScrubScope& SecureLogger::ScrubScope::operator=(ScrubScope &&other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        raw_values_ = std::move(other.raw_values_);
        other.owner_ = nullptr;
        other.raw_values_.clear();
    }
    return *this;
}

SecureLogger::ScrubScope::~ScrubScope() { release(); }

void SecureLogger::ScrubScope::release() {
    if (owner_) owner_->unregister(raw_values_);
    owner_ = nullptr;
    raw_values_.clear();
}

// ---------------- SecureLogger ----------------
// "[PERSON_1]", "[IBAN]": output of an earlier replacement
static std::vector<TextSpan> placeholder_spans(const std::string &s) {
    static const std::regex re(R"(\[[A-Z][A-Z0-9_]*\])");
    std::vector<TextSpan> spans;
    for (auto it = std::sregex_iterator(s.begin(), s.end(), re); it != std::sregex_iterator(); ++it) {
        size_t pos = (size_t)it->position(0);
        spans.push_back({pos, pos + (size_t)it->length(0)});
    }
    return spans;
}

static spdlog::level::level_enum to_spdlog(SecureLogger::Level l) {
    switch (l) {
        case SecureLogger::Level::DEBUG: return spdlog::level::debug;
        case SecureLogger::Level::INFO: return spdlog::level::info;
        case SecureLogger::Level::WARN: return spdlog::level::warn;
        case SecureLogger::Level::ERROR: return spdlog::level::err;
    }
    return spdlog::level::info;
}

SecureLogger::Level SecureLogger::parse_level(const std::string &s) {
    if (s == "debug") return Level::DEBUG;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error") return Level::ERROR;
    return Level::INFO;
}

SecureLogger::SecureLogger(const LogConfig &cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    if (!cfg.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file_path, false));
    }
    if (cfg.console) sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (sinks.empty()) sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());

    // not registered with spdlog's global registry
    sink_ = std::make_shared<spdlog::logger>("ztredact", sinks.begin(), sinks.end());
    sink_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sink_->set_level(to_spdlog(parse_level(cfg.level)));
    sink_->flush_on(spdlog::level::warn);
}

SecureLogger::~SecureLogger() {
    if (sink_) sink_->flush();
}

void SecureLogger::log(Level level, const std::string &component, const std::string &message) {
    if (!sink_->should_log(to_spdlog(level))) return;
    std::string line = scrub("[" + component + "] " + message);
    sink_->log(to_spdlog(level), "{}", line);
}

void SecureLogger::flush() { sink_->flush(); }

SecureLogger::ScrubScope SecureLogger::register_values(
    const std::vector<std::pair<std::string, std::string>> &raw_to_placeholder) {
    std::vector<std::string> raws;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : raw_to_placeholder) {
        if (kv.first.empty()) continue;
        auto &entry = values_[kv.first];
        entry.placeholder = kv.second;
        entry.refs++;
        raws.push_back(kv.first);
    }
    return ScrubScope(this, std::move(raws));
}

void SecureLogger::set_gazetteer(std::shared_ptr<const Gazetteer> gazetteer) {
    std::lock_guard<std::mutex> lk(mu_);
    gazetteer_ = std::move(gazetteer);
}

void SecureLogger::unregister(const std::vector<std::string> &raw_values) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &raw : raw_values) {
        auto it = values_.find(raw);
        if (it == values_.end()) continue;
        if (--it->second.refs <= 0) values_.erase(it);
    }
}

std::string SecureLogger::scrub(const std::string &message) const {
    std::string out = message;

    std::vector<std::pair<std::string, std::string>> known;
    {
        std::lock_guard<std::mutex> lk(mu_);
        known.reserve(values_.size());
        for (auto &kv : values_) known.emplace_back(kv.first, kv.second.placeholder);
    }
    // longest first, so "Max Mustermann" is replaced before "Max"
    std::sort(known.begin(), known.end(), [](const auto &a, const auto &b){
        if (a.first.size() != b.first.size()) return a.first.size() > b.first.size();
        return a.first < b.first;
    });
    for (auto &kv : known) {
        size_t pos = out.find(kv.first);
        while (pos != std::string::npos) {
            out.replace(pos, kv.first.size(), kv.second);
            pos = out.find(kv.first, pos + kv.second.size());
        }
    }

    // Ad hoc pass over what is left: the pattern rules without context, the
    // contextual triggers and the shared gazetteer.
    struct Hit { TextSpan span; EntityKind kind; size_t longest; };
    std::vector<Hit> found;
    for (auto &m : scan_patterns(out, default_pattern_rules(), false, 0)) {
        found.push_back({m.span, m.rule->kind, m.span.length()});
    }
    for (auto &f : ContextualDetector(ContextualConfig()).detect(out)) {
        found.push_back({f.span(), f.kind(), f.span().length()});
    }
    std::shared_ptr<const Gazetteer> gazetteer;
    {
        std::lock_guard<std::mutex> lk(mu_);
        gazetteer = gazetteer_;
    }
    if (gazetteer) {
        for (auto &f : FuzzyDetector(FuzzyConfig(), gazetteer).detect(out)) {
            found.push_back({f.span(), f.kind(), f.span().length()});
        }
    }

    // placeholders written above are never rewritten; hits are clipped around them
    std::vector<TextSpan> keep = placeholder_spans(out);
    std::vector<Hit> pieces;
    for (auto &h : found) {
        size_t from = h.span.start;
        auto emit = [&](size_t a, size_t b) {
            while (a < b && std::isspace((unsigned char)out[a])) ++a;
            while (b > a && std::isspace((unsigned char)out[b - 1])) --b;
            if (b > a) pieces.push_back({TextSpan{a, b}, h.kind, h.longest});
        };
        for (auto &k : keep) {
            if (k.end <= from || k.start >= h.span.end) continue;
            emit(from, std::max(from, k.start));
            from = std::max(from, k.end);
        }
        emit(from, std::max(from, h.span.end));
    }

    std::sort(pieces.begin(), pieces.end(), [](const Hit &a, const Hit &b){
        if (a.span.start != b.span.start) return a.span.start < b.span.start;
        return a.span.length() > b.span.length();
    });
    // overlapping hits collapse into their union, labelled by the longest one
    std::vector<Hit> hits;
    for (auto &p : pieces) {
        if (!hits.empty() && p.span.start < hits.back().span.end) {
            Hit &h = hits.back();
            h.span.end = std::max(h.span.end, p.span.end);
            if (p.longest > h.longest) { h.kind = p.kind; h.longest = p.longest; }
            continue;
        }
        hits.push_back(p);
    }
    for (auto it = hits.rbegin(); it != hits.rend(); ++it) {
        out.replace(it->span.start, it->span.length(), std::string("[") + entity_kind_str(it->kind) + "]");
    }
    return out;
}

} // namespace ztredact

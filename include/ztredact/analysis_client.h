#pragma once

#include "ztredact/config.h"

#include <chrono>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace ztredact {

// ---------------- Doc type classification ----------------
enum class LegalDocType {
    MAHNUNG, CONTRACT, LEGAL_LETTER, DAMAGES_CLAIM, TERMINATION, NDA, POWER_OF_ATTORNEY,
    RENTAL_LAW, EMPLOYMENT_LAW, GENERAL
};

LegalDocType classify_doc(const std::string &text);
const char* doc_type_str(LegalDocType d);

// At most max_bytes of the text, cut on a code point boundary and never
// inside a [KIND_n] placeholder.
std::string analysis_snippet(const std::string &sanitized_text, size_t max_bytes);

// ---------------- Rate limit ----------------
class RateLimiter {
public:
    explicit RateLimiter(int qps) : qps_(qps) {}
    void wait();

private:
    std::mutex mu_;
    std::chrono::steady_clock::time_point next_ok_ = std::chrono::steady_clock::now();
    int qps_;
};

// Downstream analysis of released, sanitized text only. Throws AnalysisFailure.
class AnalysisClient {
public:
    virtual ~AnalysisClient() = default;
    virtual nlohmann::json analyze(const std::string &sanitized_text) const = 0;
};

// OpenAI-compatible /chat/completions with client-side rate limit, bounded
// exponential backoff on 429 and 5xx, and an optional on-disk cache.
class HttpAnalysisClient : public AnalysisClient {
public:
    // Reads the API key from the environment variable named in cfg.
    // Throws ConfigError when it is unset.
    explicit HttpAnalysisClient(const AnalysisConfig &cfg);
    nlohmann::json analyze(const std::string &sanitized_text) const override;

private:
    nlohmann::json call_model(LegalDocType dt, const std::string &snippet) const;
    bool cache_load(const std::string &key, nlohmann::json &out) const;
    void cache_store(const std::string &key, const nlohmann::json &val) const;

    AnalysisConfig cfg_;
    std::string api_key_;
    mutable RateLimiter limiter_;
};

} // namespace ztredact

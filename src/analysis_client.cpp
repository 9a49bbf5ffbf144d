// analysis_client.cpp
// Downstream analysis of released text: doc type classification, compact prompt,
// OpenAI-compatible chat call with rate limit, retries with backoff and a snippet cache.

#include "ztredact/analysis_client.h"

#include "ztredact/errors.h"
#include "ztredact/http.h"
#include "ztredact/text_util.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ztredact {

// ---------------- Doc type classification ----------------
LegalDocType classify_doc(const std::string &text) {
    std::string t = to_lower(text);
    struct Bucket { LegalDocType type; std::vector<const char*> keys; };
    static const std::vector<Bucket> buckets = {
        {LegalDocType::MAHNUNG, {"mahnung", "zahlungserinnerung", "zahlungsfrist", "offene forderung", "inkasso", "mahnbescheid"}},
        {LegalDocType::CONTRACT, {"vertrag", "vertragsparteien", "vereinbaren", "vertragslaufzeit", "§ 1 gegenstand", "unterzeichnung"}},
        {LegalDocType::LEGAL_LETTER, {"sehr geehrte", "mit freundlichen grüßen", "rechtsanwalt", "in sachen", "unser zeichen", "ihr schreiben"}},
        {LegalDocType::DAMAGES_CLAIM, {"schadensersatz", "schmerzensgeld", "schaden", "haftung", "unfall", "gutachten"}},
        {LegalDocType::TERMINATION, {"kündigung", "kündige", "fristlos", "ordentliche kündigung", "kündigungsfrist", "beendigung"}},
        {LegalDocType::NDA, {"geheimhaltung", "vertraulich", "verschwiegenheit", "non-disclosure", "vertragsstrafe", "vertrauliche informationen"}},
        {LegalDocType::POWER_OF_ATTORNEY, {"vollmacht", "bevollmächtige", "bevollmächtigt", "vertretung", "untervollmacht"}},
        {LegalDocType::RENTAL_LAW, {"mietvertrag", "vermieter", "mieter", "nebenkosten", "mietminderung", "kaution", "wohnung"}},
        {LegalDocType::EMPLOYMENT_LAW, {"arbeitsvertrag", "arbeitgeber", "arbeitnehmer", "abmahnung", "kündigungsschutz", "arbeitszeugnis", "gehalt"}},
    };

    LegalDocType best_type = LegalDocType::GENERAL;
    int best = 0;
    for (auto &b : buckets) {
        int hits = 0;
        for (auto *k : b.keys) if (t.find(k) != std::string::npos) hits++;
        // first bucket wins ties
        if (hits > best) { best = hits; best_type = b.type; }
    }
    return best_type;
}

const char* doc_type_str(LegalDocType d) {
    switch (d) {
        case LegalDocType::MAHNUNG: return "mahnung";
        case LegalDocType::CONTRACT: return "contract";
        case LegalDocType::LEGAL_LETTER: return "legal_letter";
        case LegalDocType::DAMAGES_CLAIM: return "damages_claim";
        case LegalDocType::TERMINATION: return "termination";
        case LegalDocType::NDA: return "nda";
        case LegalDocType::POWER_OF_ATTORNEY: return "power_of_attorney";
        case LegalDocType::RENTAL_LAW: return "rental_law";
        case LegalDocType::EMPLOYMENT_LAW: return "employment_law";
        case LegalDocType::GENERAL: return "general";
    }
    return "general";
}

// Fields the model is asked to fill, per document type.
static std::vector<const char*> fields_for(LegalDocType dt) {
    switch (dt) {
        case LegalDocType::MAHNUNG: return {"creditor", "debtor", "amount_due", "due_date", "claim_basis", "deadline"};
        case LegalDocType::CONTRACT: return {"parties", "subject", "term", "termination_terms", "obligations", "governing_law"};
        case LegalDocType::LEGAL_LETTER: return {"sender", "recipient", "matter", "requests", "deadline"};
        case LegalDocType::DAMAGES_CLAIM: return {"claimant", "respondent", "incident_date", "damage_items", "amount_claimed", "legal_basis"};
        case LegalDocType::TERMINATION: return {"terminating_party", "contract", "effective_date", "notice_period", "grounds"};
        case LegalDocType::NDA: return {"parties", "confidential_information", "duration", "penalty", "exceptions"};
        case LegalDocType::POWER_OF_ATTORNEY: return {"principal", "agent", "scope", "validity", "substitution_allowed"};
        case LegalDocType::RENTAL_LAW: return {"landlord", "tenant", "property", "rent", "issue", "deadline"};
        case LegalDocType::EMPLOYMENT_LAW: return {"employer", "employee", "issue", "dates", "claims"};
        case LegalDocType::GENERAL: return {"summary", "parties", "dates", "requests"};
    }
    return {"summary"};
}

// ---------------- Rate limit ----------------
void RateLimiter::wait() {
    std::unique_lock<std::mutex> lk(mu_);
    auto now = std::chrono::steady_clock::now();
    if (now < next_ok_) std::this_thread::sleep_until(next_ok_);
    next_ok_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(1000 / std::max(1, qps_));
}

// ---------------- Client ----------------
HttpAnalysisClient::HttpAnalysisClient(const AnalysisConfig &cfg) : cfg_(cfg), limiter_(cfg.qps) {
    const char *key = std::getenv(cfg_.api_key_env.c_str());
    if (!key || !*key) throw ConfigError("environment variable " + cfg_.api_key_env + " is not set");
    api_key_ = key;
}

bool HttpAnalysisClient::cache_load(const std::string &key, json &out) const {
    if (cfg_.cache_dir.empty()) return false;
    std::ifstream f(fs::path(cfg_.cache_dir) / (key + ".json"));
    if (!f) return false;
    try {
        out = json::parse(std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>()));
        return true;
    } catch (const json::parse_error &) {
        // corrupt entry, fetch again
        return false;
    }
}

void HttpAnalysisClient::cache_store(const std::string &key, const json &val) const {
    if (cfg_.cache_dir.empty()) return;
    std::error_code ec;
    fs::create_directories(cfg_.cache_dir, ec);
    if (ec) return;
    std::ofstream f(fs::path(cfg_.cache_dir) / (key + ".json"));
    if (f) f << val.dump();
}

json HttpAnalysisClient::call_model(LegalDocType dt, const std::string &snippet) const {
    json fields = json::array();
    for (auto *f : fields_for(dt)) fields.push_back(f);

    json req;
    req["model"] = cfg_.model;
    req["temperature"] = 0.0;
    req["messages"] = json::array({
        {{"role", "system"},
         {"content", "Du analysierst anonymisierte deutsche Rechtsdokumente. Platzhalter wie [PERSON_1] "
                     "bleiben unverändert. Antworte nur mit kompaktem JSON mit den Feldern " + fields.dump() +
                     " sowie \"confidence\" (0..1), ohne weiteren Text."}},
        {{"role", "user"},
         {"content", std::string("Dokumenttyp: ") + doc_type_str(dt) + "\n---\n" + snippet}}
    });

    long http_code = 0;
    json resp;
    int attempts = 0;
    int backoff_ms = 400;
    while (true) {
        limiter_.wait();
        resp = http_post_json(cfg_.endpoint, api_key_, req, http_code, cfg_.timeout);
        bool retry = http_code == 429 || http_code >= 500;
        if (!retry || ++attempts >= cfg_.max_attempts) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        backoff_ms = std::min(5000, backoff_ms * 2);
    }
    if (http_code >= 400) throw AnalysisFailure("analysis endpoint returned HTTP " + std::to_string(http_code));

    std::string payload;
    try {
        auto &msg = resp.at("choices").at(0).at("message");
        payload = msg.at("content").get<std::string>();
    } catch (const json::exception &) {
        throw AnalysisFailure("analysis response has no message content");
    }
    try {
        return json::parse(payload);
    } catch (const json::parse_error &) {
        // models sometimes wrap the object in prose or code fences
        auto start = payload.find('{');
        auto end = payload.rfind('}');
        if (start != std::string::npos && end != std::string::npos && end > start) {
            json repaired = json::parse(payload.substr(start, end - start + 1), nullptr, false);
            if (!repaired.is_discarded()) return repaired;
        }
        throw AnalysisFailure("analysis output is not JSON");
    }
}

std::string analysis_snippet(const std::string &sanitized_text, size_t max_bytes) {
    std::string snippet = utf8_prefix(sanitized_text, max_bytes);
    if (snippet.size() == sanitized_text.size()) return snippet;
    // a placeholder cut in half would read as "[PERS"
    size_t open = snippet.rfind('[');
    if (open != std::string::npos && snippet.find(']', open) == std::string::npos &&
        sanitized_text.find(']', open) != std::string::npos) {
        snippet.resize(open);
    }
    return snippet;
}

json HttpAnalysisClient::analyze(const std::string &sanitized_text) const {
    LegalDocType dt = classify_doc(sanitized_text);
    std::string snippet = analysis_snippet(sanitized_text, cfg_.max_chars);

    std::string key = std::to_string(fnv1a_64(std::string(doc_type_str(dt)) + "\n" + snippet));
    json model;
    if (!cache_load(key, model)) {
        try {
            model = call_model(dt, snippet);
        } catch (const AnalysisFailure &) {
            throw;
        } catch (const std::exception &e) {
            throw AnalysisFailure(e.what());
        }
        cache_store(key, model);
    }

    json out;
    out["doc_type"] = doc_type_str(dt);
    out["model"] = cfg_.model;
    out["result"] = model;
    return out;
}

} // namespace ztredact

// config.cpp
// Policy file -> PipelineConfig. Every key is optional; bad types are ConfigError.

#include "ztredact/config.h"

#include "ztredact/errors.h"

#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace ztredact {

std::vector<RiskCombination> RiskPolicy::default_combinations() {
    return {
        {"person_location", {EntityKind::PERSON},
         {EntityKind::LOCATION, EntityKind::STREET_ADDRESS, EntityKind::POSTAL_CODE}, 100, 20},
        {"identifier_date",
         {EntityKind::ID_NUMBER, EntityKind::TAX_ID, EntityKind::CASE_NUMBER, EntityKind::IBAN, EntityKind::AMOUNT},
         {EntityKind::DATE}, 100, 15},
    };
}

static std::vector<EntityKind> kinds_from_json(const json &arr) {
    std::vector<EntityKind> kinds;
    for (auto &v : arr) {
        EntityKind k;
        if (!parse_entity_kind(v.get<std::string>(), k)) {
            throw ConfigError("unknown entity kind: " + v.get<std::string>());
        }
        kinds.push_back(k);
    }
    return kinds;
}

static void read_risk(const json &j, RiskPolicy &r) {
    r.density_threshold = j.value("density_threshold", r.density_threshold);
    r.density_weight = j.value("density_weight", r.density_weight);
    r.density_min_chars = j.value("density_min_chars", r.density_min_chars);
    r.density_exceeded_points = j.value("density_exceeded_points", r.density_exceeded_points);
    r.visual_points = j.value("visual_points", r.visual_points);
    r.auto_release_max = j.value("auto_release_max", r.auto_release_max);
    r.enhanced_logging_max = j.value("enhanced_logging_max", r.enhanced_logging_max);
    if (r.enhanced_logging_max < r.auto_release_max) {
        throw ConfigError("risk.enhanced_logging_max must not be below risk.auto_release_max");
    }
    if (j.contains("combinations")) {
        r.combinations.clear();
        for (auto &c : j.at("combinations")) {
            RiskCombination rc;
            rc.name = c.value("name", std::string("combination"));
            rc.first = kinds_from_json(c.at("first"));
            rc.second = kinds_from_json(c.at("second"));
            rc.window = c.value("window", rc.window);
            rc.points = c.value("points", rc.points);
            r.combinations.push_back(rc);
        }
    }
}

PipelineConfig config_from_json(const json &j) {
    PipelineConfig c;
    try {
        if (j.contains("risk")) read_risk(j.at("risk"), c.risk);
        if (j.contains("pattern")) {
            auto &p = j.at("pattern");
            c.pattern.enabled = p.value("enabled", c.pattern.enabled);
            c.pattern.context_window = p.value("context_window", c.pattern.context_window);
            c.pattern.disabled_rules = p.value("disabled_rules", c.pattern.disabled_rules);
        }
        if (j.contains("contextual")) {
            auto &p = j.at("contextual");
            c.contextual.enabled = p.value("enabled", c.contextual.enabled);
            c.contextual.max_phrase_tokens = p.value("max_phrase_tokens", c.contextual.max_phrase_tokens);
            c.contextual.confidence = p.value("confidence", c.contextual.confidence);
        }
        if (j.contains("fuzzy")) {
            auto &p = j.at("fuzzy");
            c.fuzzy.enabled = p.value("enabled", c.fuzzy.enabled);
            c.fuzzy.threshold = p.value("threshold", c.fuzzy.threshold);
            c.fuzzy.max_window_tokens = p.value("max_window_tokens", c.fuzzy.max_window_tokens);
            c.fuzzy.gazetteer_path = p.value("gazetteer_path", c.fuzzy.gazetteer_path);
        }
        if (j.contains("ner")) {
            auto &p = j.at("ner");
            c.ner.enabled = p.value("enabled", c.ner.enabled);
            c.ner.endpoint = p.value("endpoint", c.ner.endpoint);
            c.ner.timeout = p.value("timeout", c.ner.timeout);
        }
        if (j.contains("visual")) {
            auto &p = j.at("visual");
            c.visual.face_cascade_path = p.value("face_cascade_path", c.visual.face_cascade_path);
            c.visual.detect_signatures = p.value("detect_signatures", c.visual.detect_signatures);
            c.visual.detect_stamps = p.value("detect_stamps", c.visual.detect_stamps);
            c.visual.padding = p.value("padding", c.visual.padding);
            c.visual.signature_max_solidity = p.value("signature_max_solidity", c.visual.signature_max_solidity);
            c.visual.signature_min_width = p.value("signature_min_width", c.visual.signature_min_width);
            c.visual.stamp_min_radius_ratio = p.value("stamp_min_radius_ratio", c.visual.stamp_min_radius_ratio);
            c.visual.stamp_max_radius_ratio = p.value("stamp_max_radius_ratio", c.visual.stamp_max_radius_ratio);
        }
        if (j.contains("ocr")) {
            auto &p = j.at("ocr");
            c.ocr.lang = p.value("lang", c.ocr.lang);
            c.ocr.deskew = p.value("deskew", c.ocr.deskew);
            c.ocr.denoise_h = p.value("denoise_h", c.ocr.denoise_h);
        }
        if (j.contains("analysis")) {
            auto &p = j.at("analysis");
            c.analysis.enabled = p.value("enabled", c.analysis.enabled);
            c.analysis.endpoint = p.value("endpoint", c.analysis.endpoint);
            c.analysis.model = p.value("model", c.analysis.model);
            c.analysis.api_key_env = p.value("api_key_env", c.analysis.api_key_env);
            c.analysis.cache_dir = p.value("cache_dir", c.analysis.cache_dir);
            c.analysis.timeout = std::max(30, p.value("timeout", c.analysis.timeout));
            c.analysis.max_attempts = std::max(1, p.value("max_attempts", c.analysis.max_attempts));
            c.analysis.qps = std::max(1, p.value("qps", c.analysis.qps));
            c.analysis.max_chars = p.value("max_chars", c.analysis.max_chars);
        }
        if (j.contains("review")) {
            c.review.store_dir = j.at("review").value("store_dir", c.review.store_dir);
        }
        if (j.contains("log")) {
            auto &p = j.at("log");
            c.log.file_path = p.value("file", c.log.file_path);
            c.log.console = p.value("console", c.log.console);
            c.log.level = p.value("level", c.log.level);
        }
        c.threads = std::max(1, j.value("threads", c.threads));
    } catch (const json::exception &e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return c;
}

PipelineConfig load_config(const std::string &path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file: " + path);
    json j;
    try {
        j = json::parse(std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>()));
    } catch (const json::parse_error &e) {
        throw ConfigError("config file is not valid JSON: " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError("config root must be an object: " + path);
    return config_from_json(j);
}

} // namespace ztredact

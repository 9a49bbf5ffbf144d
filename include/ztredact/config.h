#pragma once

#include "ztredact/types.h"

#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace ztredact {

// ---------------- Policy and component settings ----------------
struct RiskCombination {
    std::string name;
    std::vector<EntityKind> first;
    std::vector<EntityKind> second;
    size_t window = 100;   // max byte gap between the two spans
    int points = 20;
};

// Weights are compliance policy, not mechanism. Defaults only.
struct RiskPolicy {
    double density_threshold = 20.0;    // text findings per 1000 bytes
    double density_weight = 1.0;        // points per unit of density below the threshold
    size_t density_min_chars = 200;     // short documents are scored as if this long
    int density_exceeded_points = 51;
    int visual_points = 5;
    int auto_release_max = 30;
    int enhanced_logging_max = 50;
    std::vector<RiskCombination> combinations = default_combinations();

    static std::vector<RiskCombination> default_combinations();
};

struct PatternConfig {
    bool enabled = true;
    size_t context_window = 48;
    std::vector<std::string> disabled_rules;
};

struct ContextualConfig {
    bool enabled = true;
    size_t max_phrase_tokens = 6;
    double confidence = 0.85;
};

struct FuzzyConfig {
    bool enabled = true;
    double threshold = 0.8;
    size_t max_window_tokens = 5;
    std::string gazetteer_path;
};

struct NerConfig {
    bool enabled = true;
    std::string endpoint;          // empty disables the statistical detector
    int timeout = 30;              // seconds
};

struct VisualConfig {
    std::string face_cascade_path; // empty disables face detection
    bool detect_signatures = true;
    bool detect_stamps = true;
    int padding = 6;
    double signature_max_solidity = 0.35;
    int signature_min_width = 80;
    double stamp_min_radius_ratio = 0.02;
    double stamp_max_radius_ratio = 0.15;
};

struct OcrConfig {
    std::string lang = "deu";
    bool deskew = true;
    double denoise_h = 30.0;
};

struct AnalysisConfig {
    bool enabled = false;
    std::string endpoint = "https://api.together.xyz/v1/chat/completions";
    std::string model = "meta-llama/Llama-3.3-70B-Instruct-Turbo";
    std::string api_key_env = "TOGETHER_API_KEY";
    std::string cache_dir;         // empty disables cache
    int timeout = 120;             // seconds
    int max_attempts = 4;
    int qps = 3;
    size_t max_chars = 6000;
};

struct ReviewConfig {
    std::string store_dir;         // empty keeps held documents in memory only
};

struct LogConfig {
    std::string file_path;         // empty logs to console only
    bool console = true;
    std::string level = "info";
};

struct PipelineConfig {
    RiskPolicy risk;
    PatternConfig pattern;
    ContextualConfig contextual;
    FuzzyConfig fuzzy;
    NerConfig ner;
    VisualConfig visual;
    OcrConfig ocr;
    AnalysisConfig analysis;
    ReviewConfig review;
    LogConfig log;
    int threads = std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4;
};

// Missing keys keep their defaults. Throws ConfigError on unreadable files,
// malformed JSON and wrongly typed values.
PipelineConfig load_config(const std::string &path);
PipelineConfig config_from_json(const nlohmann::json &j);

} // namespace ztredact

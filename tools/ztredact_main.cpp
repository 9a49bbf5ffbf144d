// ztredact: batch front end for the sanitization pipeline.
// Input file or folder (PDF, images, .txt) -> visual redaction -> OCR -> four
// detectors -> consolidation -> risk triage -> audit JSON.
//
// Usage:
// ./ztredact INPUT_PATH OUTPUT_JSON [--config=policy.json] [--threads=N] [--lang=deu]
//    [--gazetteer=file] [--ner-url=URL] [--analysis-url=URL] [--model=NAME] [--log=path]
//    [--jsonl=path.jsonl] [--sanitized-dir=dir] [--cascade=haarcascade.xml] [--no-analysis]
//    [--review-dir=dir]
// ./ztredact --review=ID:approve|reject OUTPUT_JSON --review-dir=dir [--sanitized-dir=dir] [--config=...]
//
// A "<stem>.gazetteer.json" next to an input is loaded as that document's
// case gazetteer. With a review dir, held documents are kept there until a
// later --review run releases or rejects them.

#include "ztredact/config.h"
#include "ztredact/document_loader.h"
#include "ztredact/errors.h"
#include "ztredact/http.h"
#include "ztredact/pipeline.h"
#include "ztredact/secure_logger.h"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace ztredact;

// ---------------- Helpers ----------------
[[noreturn]] static void die(const std::string &m) { std::cerr << "Error: " << m << std::endl; std::exit(1); }

struct CliOptions {
    std::string input_path;
    std::string output_json;
    std::string jsonl_path;       // empty disables jsonl
    std::string sanitized_dir;    // empty disables per-document text output
    std::string gazetteer_path;
    std::string review;           // "ID:approve" or "ID:reject"; empty for batch runs
    PipelineConfig cfg;
};

// ---------------- CLI ----------------
static CliOptions parse_cli(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " INPUT_PATH OUTPUT_JSON [--config=policy.json] [--threads=N] "
                  << "[--lang=deu] [--gazetteer=file] [--ner-url=URL] [--analysis-url=URL] [--model=NAME] "
                  << "[--log=path] [--jsonl=path.jsonl] [--sanitized-dir=dir] [--cascade=path] [--no-analysis] "
                  << "[--review-dir=dir]\n"
                  << "       " << argv[0] << " --review=ID:approve|reject OUTPUT_JSON --review-dir=dir "
                  << "[--sanitized-dir=dir] [--config=policy.json]\n";
        std::exit(1);
    }
    CliOptions o;
    std::string first = argv[1];
    if (first.rfind("--review=", 0) == 0) o.review = first.substr(9);
    else o.input_path = first;
    o.output_json = argv[2];

    // the config file first, so flags override it
    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--config=", 0) == 0) o.cfg = load_config(a.substr(9));
    }
    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--config=", 0) == 0) continue;
        else if (a.rfind("--threads=", 0) == 0) o.cfg.threads = std::max(1, std::stoi(a.substr(10)));
        else if (a.rfind("--lang=", 0) == 0) o.cfg.ocr.lang = a.substr(7);
        else if (a.rfind("--gazetteer=", 0) == 0) o.gazetteer_path = a.substr(12);
        else if (a.rfind("--ner-url=", 0) == 0) o.cfg.ner.endpoint = a.substr(10);
        else if (a.rfind("--analysis-url=", 0) == 0) { o.cfg.analysis.endpoint = a.substr(15); o.cfg.analysis.enabled = true; }
        else if (a.rfind("--model=", 0) == 0) o.cfg.analysis.model = a.substr(8);
        else if (a.rfind("--log=", 0) == 0) o.cfg.log.file_path = a.substr(6);
        else if (a.rfind("--jsonl=", 0) == 0) o.jsonl_path = a.substr(8);
        else if (a.rfind("--sanitized-dir=", 0) == 0) o.sanitized_dir = a.substr(16);
        else if (a.rfind("--cascade=", 0) == 0) o.cfg.visual.face_cascade_path = a.substr(10);
        else if (a == "--no-analysis") o.cfg.analysis.enabled = false;
        else if (a.rfind("--review-dir=", 0) == 0) o.cfg.review.store_dir = a.substr(13);
        else throw ConfigError("unknown option: " + a);
    }
    if (o.gazetteer_path.empty()) o.gazetteer_path = o.cfg.fuzzy.gazetteer_path;
    return o;
}

// ---------------- Document processing ----------------
struct DocResult {
    std::string input_path;
    bool ok = false;              // reached the pipeline
    std::string error;
    json record;
    ProcessingState outcome = ProcessingState::RECEIVED;
    std::optional<std::string> sanitized_text;
};

static DocResult process_single_document(const fs::path &path, Pipeline &pipeline) {
    DocResult r;
    r.input_path = path.string();
    Document doc;
    try {
        doc = load_document(path);
        fs::path sidecar = path.parent_path() / (path.stem().string() + ".gazetteer.json");
        if (fs::exists(sidecar)) doc.gazetteer = std::make_shared<Gazetteer>(Gazetteer::load(sidecar.string()));
    } catch (const std::exception &e) {
        // unreadable input or sidecar gazetteer; reported per document
        r.error = e.what();
        return r;
    }

    ProcessingRecord rec = pipeline.process(doc);
    r.ok = true;
    r.outcome = rec.outcome();
    r.record = rec.to_json();
    r.sanitized_text = rec.sanitized_text();
    return r;
}

// ---------------- Review ----------------
static int run_review(const CliOptions &opt, SecureLogger &logger, const PipelineServices &services) {
    size_t colon = opt.review.rfind(':');
    if (colon == std::string::npos) die("--review expects ID:approve or ID:reject");
    std::string id = opt.review.substr(0, colon);
    std::string verdict = opt.review.substr(colon + 1);
    ReviewDecision decision = ReviewDecision::REJECT;
    if (verdict == "approve") decision = ReviewDecision::APPROVE;
    else if (verdict != "reject") die("--review expects ID:approve or ID:reject");
    if (opt.cfg.review.store_dir.empty()) die("--review needs --review-dir or review.store_dir");

    std::unique_ptr<Pipeline> pipeline;
    std::optional<ProcessingRecord> rec;
    try {
        pipeline.reset(new Pipeline(opt.cfg, logger, services));
        rec = pipeline->review_decision(id, decision);
    } catch (const Error &e) {
        die(logger.scrub(e.what()));
    }

    if (rec->sanitized_text() && !opt.sanitized_dir.empty()) {
        std::error_code ec;
        fs::create_directories(opt.sanitized_dir, ec);
        if (ec) die("Cannot create sanitized dir: " + ec.message());
        std::ofstream t(fs::path(opt.sanitized_dir) / (id + ".sanitized.txt"), std::ios::binary);
        if (!t) die("Cannot write sanitized text for " + id);
        t << *rec->sanitized_text();
    }

    json out;
    out["generated_at"] = (long long)std::time(nullptr);
    out["review"] = rec->to_json();
    out["pending_reviews"] = pipeline->pending_reviews();
    std::ofstream f(opt.output_json);
    if (!f) die("Failed to open output file");
    f << out.dump(2);
    f.close();

    std::cout << id << " -> " << processing_state_str(rec->outcome()) << "\n";
    logger.flush();
    return 0;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
    CliOptions opt;
    try {
        opt = parse_cli(argc, argv);
    } catch (const ConfigError &e) {
        die(e.what());
    } catch (const std::logic_error &e) {
        die(std::string("bad option value: ") + e.what());
    }

    CurlGlobal curl_global;
    SecureLogger logger(opt.cfg.log);

    PipelineServices services;
    if (!opt.review.empty()) {
        try {
            if (opt.cfg.analysis.enabled) services.analysis = std::make_shared<HttpAnalysisClient>(opt.cfg.analysis);
        } catch (const ConfigError &e) {
            die(e.what());
        }
        return run_review(opt, logger, services);
    }

    services.extractor = std::make_shared<TesseractExtractor>(opt.cfg.ocr);
    services.image_analyzer = std::make_shared<OpenCvImageAnalyzer>(opt.cfg.visual);
    if (opt.cfg.ner.enabled && !opt.cfg.ner.endpoint.empty()) {
        services.recognizer = std::make_shared<HttpEntityRecognizer>(opt.cfg.ner.endpoint, opt.cfg.ner.timeout);
    } else {
        logger.warn("main", "no NER endpoint configured, statistical detector disabled");
    }
    try {
        if (opt.cfg.analysis.enabled) services.analysis = std::make_shared<HttpAnalysisClient>(opt.cfg.analysis);
        if (!opt.gazetteer_path.empty()) {
            services.gazetteer = std::make_shared<Gazetteer>(Gazetteer::load(opt.gazetteer_path));
        }
    } catch (const ConfigError &e) {
        die(e.what());
    }

    std::vector<fs::path> inputs = collect_inputs(opt.input_path);
    if (inputs.empty()) die("No PDFs, images or text files found in " + opt.input_path);

    std::unique_ptr<Pipeline> pipeline_owner;
    try {
        pipeline_owner.reset(new Pipeline(opt.cfg, logger, services));
    } catch (const ConfigError &e) {
        die(e.what());
    }
    Pipeline &pipeline = *pipeline_owner;

    std::mutex io_mu;
    std::vector<DocResult> results(inputs.size());
    std::atomic<size_t> idx{0};

    int thread_count = std::max(1, std::min<int>(opt.cfg.threads, (int)inputs.size()));
    std::vector<std::thread> workers;
    workers.reserve(thread_count);

    // optional JSONL
    std::unique_ptr<std::ofstream> jsonl_stream;
    if (!opt.jsonl_path.empty()) {
        jsonl_stream.reset(new std::ofstream(opt.jsonl_path, std::ios::out));
        if (!*jsonl_stream) die("Cannot open jsonl path");
    }
    if (!opt.sanitized_dir.empty()) {
        std::error_code ec;
        fs::create_directories(opt.sanitized_dir, ec);
        if (ec) die("Cannot create sanitized dir: " + ec.message());
    }

    auto write_sanitized = [&](const DocResult &r){
        if (opt.sanitized_dir.empty() || !r.sanitized_text) return;
        fs::path outp = fs::path(opt.sanitized_dir) / (fs::path(r.input_path).stem().string() + ".sanitized.txt");
        std::ofstream f(outp, std::ios::binary);
        if (!f) {
            logger.error("main", "cannot write " + outp.string());
            return;
        }
        f << *r.sanitized_text;
    };

    auto write_jsonl = [&](const DocResult &r){
        if (!jsonl_stream || !*jsonl_stream) return;
        json one;
        one["ok"] = r.ok;
        one["source"] = r.input_path;
        if (r.ok) one["record"] = r.record;
        else one["error"] = logger.scrub(r.error);
        (*jsonl_stream) << one.dump() << "\n";
        jsonl_stream->flush();
    };

    auto worker = [&](){
        while (true) {
            size_t i = idx.fetch_add(1);
            if (i >= inputs.size()) break;
            DocResult r = process_single_document(inputs[i], pipeline);
            {
                std::lock_guard<std::mutex> lk(io_mu);
                results[i] = std::move(r);
                write_sanitized(results[i]);
                write_jsonl(results[i]);
                std::cout << "[" << i + 1 << "/" << inputs.size() << "] "
                          << fs::path(results[i].input_path).filename().string() << " -> "
                          << (results[i].ok ? processing_state_str(results[i].outcome) : "ERR") << "\n";
            }
        }
    };

    for (int t = 0; t < thread_count; ++t) workers.emplace_back(worker);
    for (auto &th : workers) th.join();

    // Combined JSON
    json out;
    out["generated_at"] = (long long)std::time(nullptr);
    out["documents"] = json::array();
    out["errors"] = json::array();
    out["pending_reviews"] = pipeline.pending_reviews();

    size_t released = 0, held = 0, rejected = 0, cancelled = 0;
    long long score_sum = 0;
    size_t scored = 0;
    for (auto &r : results) {
        if (!r.ok) {
            out["errors"].push_back({{"source", r.input_path}, {"error", logger.scrub(r.error)}});
            continue;
        }
        out["documents"].push_back(r.record);
        switch (r.outcome) {
            case ProcessingState::RELEASED: released++; break;
            case ProcessingState::HELD_FOR_REVIEW: held++; break;
            case ProcessingState::REJECTED: rejected++; break;
            case ProcessingState::CANCELLED: cancelled++; break;
            default: break;
        }
        if (r.record.contains("risk")) {
            score_sum += r.record["risk"].value("score", 0);
            scored++;
        }
    }
    out["stats"] = {
        {"processed", results.size()},
        {"released", released},
        {"held_for_review", held},
        {"rejected", rejected},
        {"cancelled", cancelled},
        {"errors", out["errors"].size()},
        {"avg_risk_score", scored ? (double)score_sum / (double)scored : 0.0}
    };

    std::ofstream f(opt.output_json);
    if (!f) die("Failed to open output file");
    f << out.dump(2);
    f.close();

    if (jsonl_stream && *jsonl_stream) {
        std::cout << "JSONL written: " << opt.jsonl_path << "\n";
    }
    std::cout << "Combined JSON written: " << opt.output_json << "\n";
    if (held && !opt.cfg.review.store_dir.empty()) {
        std::cout << held << " document(s) held for review in " << opt.cfg.review.store_dir << "\n";
    }
    logger.flush();
    return 0;
}

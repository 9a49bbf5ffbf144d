#pragma once

#include "ztredact/analysis_client.h"
#include "ztredact/entity_recognizer.h"
#include "ztredact/errors.h"
#include "ztredact/text_extractor.h"
#include "ztredact/visual_redactor.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace ztredact {
namespace test_support {

// ---------------- Fakes for the external capabilities ----------------
class FakeRecognizer : public EntityRecognizer {
public:
    explicit FakeRecognizer(std::vector<EntitySpan> spans) : spans_(std::move(spans)) {}
    std::vector<EntitySpan> recognize(const std::string &, const CancellationToken &cancel) const override {
        calls++;
        if (hook) hook();
        // a slow model server: waits for the token or the deadline
        auto deadline = std::chrono::steady_clock::now() + block_for;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel.cancelled()) throw PipelineCancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (fail) throw std::runtime_error("model server unavailable");
        return spans_;
    }

    bool fail = false;
    std::chrono::milliseconds block_for{0};
    std::function<void()> hook;
    mutable std::atomic<int> calls{0};

private:
    std::vector<EntitySpan> spans_;
};

class FakeImageAnalyzer : public ImageAnalyzer {
public:
    explicit FakeImageAnalyzer(std::vector<DetectedRegion> regions) : regions_(std::move(regions)) {}
    std::vector<DetectedRegion> analyze(const cv::Mat &) const override {
        if (fail) throw VisualAnalysisFailure("detector crashed");
        return regions_;
    }

    bool fail = false;

private:
    std::vector<DetectedRegion> regions_;
};

class FakeExtractor : public TextExtractor {
public:
    explicit FakeExtractor(std::string text) : text_(std::move(text)) {}
    std::string extract(const cv::Mat &) const override {
        if (fail) throw ExtractionFailure("tesseract init failed");
        return text_;
    }

    bool fail = false;

private:
    std::string text_;
};

class FakeAnalysisClient : public AnalysisClient {
public:
    nlohmann::json analyze(const std::string &sanitized_text) const override {
        {
            std::lock_guard<std::mutex> lk(mu);
            seen.push_back(sanitized_text);
        }
        if (!fail_message.empty()) throw AnalysisFailure(fail_message);
        return {{"doc_type", doc_type_str(classify_doc(sanitized_text))}, {"result", {{"summary", "ok"}}}};
    }

    std::string fail_message;
    mutable std::mutex mu;
    mutable std::vector<std::string> seen;
};

// ---------------- Files ----------------
// A fresh path under the system temp directory, removed on destruction.
class TempFile {
public:
    explicit TempFile(const std::string &name)
        : path_(std::filesystem::temp_directory_path() / ("ztredact_test_" + name)) {
        std::filesystem::remove(path_);
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

    void write(const std::string &content) const {
        std::ofstream f(path_, std::ios::binary);
        f << content;
    }

    std::string read() const {
        std::ifstream f(path_, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path path_;
};

} // namespace test_support
} // namespace ztredact

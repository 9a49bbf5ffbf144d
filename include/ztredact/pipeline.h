#pragma once

#include "ztredact/analysis_client.h"
#include "ztredact/cancellation.h"
#include "ztredact/config.h"
#include "ztredact/entity_recognizer.h"
#include "ztredact/gazetteer.h"
#include "ztredact/processing_record.h"
#include "ztredact/review_store.h"
#include "ztredact/secure_logger.h"
#include "ztredact/text_extractor.h"
#include "ztredact/visual_redactor.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ztredact {

// One word of a PDF text layer; box in rendered page pixels.
struct LayerWord {
    std::string text;
    BoundingBox box;
    bool space_after = true;
};

struct Document {
    std::string id;                          // source name, used in the audit record
    std::vector<cv::Mat> pages;              // scanned page images, may be empty
    std::optional<std::string> text;         // born-digital text without positions
    std::vector<LayerWord> text_layer;       // positioned words, preferred over text
    std::shared_ptr<const Gazetteer> gazetteer;   // per-case entries, may be null
};

// The text layer in reading order, without the words that fall inside a
// visual region.
std::string layer_text_outside(const std::vector<LayerWord> &words, const Findings &regions);

enum class ReviewDecision { APPROVE, REJECT };

// Everything outside the core, injected. Null members disable the
// corresponding step; a null image analyzer fails every page closed.
struct PipelineServices {
    std::shared_ptr<const TextExtractor> extractor;
    std::shared_ptr<const EntityRecognizer> recognizer;
    std::shared_ptr<const ImageAnalyzer> image_analyzer;
    std::shared_ptr<const AnalysisClient> analysis;
    std::shared_ptr<const Gazetteer> gazetteer;   // shared across all documents
};

class Pipeline {
public:
    Pipeline(const PipelineConfig &cfg, SecureLogger &logger, PipelineServices services);

    // Synchronous for the caller. Returns a sealed record: RELEASED with
    // sanitized text, HELD_FOR_REVIEW without it, or REJECTED / CANCELLED.
    ProcessingRecord process(const Document &doc, const CancellationToken &cancel = CancellationToken());

    // Resolves a held document, from this run or, with a review store, from
    // an earlier one. Throws UnknownProcessingId for ids held in neither.
    ProcessingRecord review_decision(const std::string &processing_id, ReviewDecision decision);

    std::vector<std::string> pending_reviews() const;

private:
    std::string next_id(const Document &doc);
    std::vector<cv::Mat> sanitize_pages(const Document &doc, ProcessingRecord &rec, Findings &visual);
    std::string extract_text(const Document &doc, const std::vector<cv::Mat> &pages, const Findings &visual);
    Findings run_detectors(const std::string &text, const Document &doc, ProcessingRecord &rec,
                           const CancellationToken &cancel);
    void release(ProcessingRecord &rec, std::string sanitized);
    void check(const CancellationToken &cancel) const;

    PipelineConfig cfg_;
    SecureLogger &log_;
    PipelineServices services_;

    uint64_t epoch_;                // keeps ids of separate runs apart in the review store
    std::atomic<uint64_t> seq_{0};
    mutable std::mutex review_mu_;
    std::map<std::string, HeldEntry> review_queue_;
    std::unique_ptr<ReviewStore> store_;
};

} // namespace ztredact

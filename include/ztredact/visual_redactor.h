#pragma once

#include "ztredact/config.h"
#include "ztredact/types.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

namespace ztredact {

struct DetectedRegion {
    cv::Rect rect;
    EntityKind kind = EntityKind::IMAGE_REGION;
    double confidence = 1.0;
};

// Face, signature and stamp detection on one page image. May throw.
class ImageAnalyzer {
public:
    virtual ~ImageAnalyzer() = default;
    virtual std::vector<DetectedRegion> analyze(const cv::Mat &page) const = 0;
};

// Haar cascade for faces, contour solidity for signatures, Hough circles for
// stamps. A configured cascade that fails to load makes every analyze() throw.
class OpenCvImageAnalyzer : public ImageAnalyzer {
public:
    explicit OpenCvImageAnalyzer(const VisualConfig &cfg);
    std::vector<DetectedRegion> analyze(const cv::Mat &page) const override;

private:
    std::vector<DetectedRegion> detect_faces(const cv::Mat &gray) const;
    std::vector<DetectedRegion> detect_signatures(const cv::Mat &gray) const;
    std::vector<DetectedRegion> detect_stamps(const cv::Mat &gray) const;

    VisualConfig cfg_;
    bool cascade_failed_ = false;
    mutable std::mutex cascade_mu_;   // detectMultiScale is not const
    mutable cv::CascadeClassifier faces_;
};

struct VisualResult {
    cv::Mat image;          // redacted copy; the input is never modified
    Findings findings;
    bool failed_closed = false;
    std::string error;      // analyzer message when failed_closed
};

class VisualRedactor {
public:
    VisualRedactor(const VisualConfig &cfg, std::shared_ptr<const ImageAnalyzer> analyzer)
        : cfg_(cfg), analyzer_(std::move(analyzer)) {}

    // Fills every detected region, padded. If analysis fails the whole page
    // is blanked and reported as one IMAGE_REGION.
    VisualResult redact(const cv::Mat &page, int page_index) const;

private:
    VisualConfig cfg_;
    std::shared_ptr<const ImageAnalyzer> analyzer_;
};

} // namespace ztredact

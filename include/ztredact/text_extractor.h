#pragma once

#include "ztredact/config.h"

#include <string>

#include <opencv2/core.hpp>

namespace ztredact {

// image -> UTF-8 text. Throws ExtractionFailure when the engine cannot run.
class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    virtual std::string extract(const cv::Mat &page) const = 0;
};

// Tesseract LSTM over a deskewed, denoised, adaptively thresholded page.
class TesseractExtractor : public TextExtractor {
public:
    explicit TesseractExtractor(const OcrConfig &cfg) : cfg_(cfg) {}
    std::string extract(const cv::Mat &page) const override;

private:
    OcrConfig cfg_;
};

// Rotates the page by the dominant text baseline angle.
cv::Mat deskew(const cv::Mat &gray);

} // namespace ztredact

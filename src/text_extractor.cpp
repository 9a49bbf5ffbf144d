// text_extractor.cpp
// Tesseract OCR of sanitized pages, with deskew and denoise first.

#include "ztredact/text_extractor.h"

#include "ztredact/errors.h"

#include <algorithm>
#include <memory>
#include <vector>

#include <leptonica/allheaders.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <tesseract/baseapi.h>

namespace ztredact {

// ---------------- Deskew ----------------
cv::Mat deskew(const cv::Mat &gray) {
    // dominant angle of Hough lines near the text baselines
    cv::Mat bw;
    cv::adaptiveThreshold(gray, bw, 255, cv::ADAPTIVE_THRESH_MEAN_C, cv::THRESH_BINARY_INV, 31, 15);
    std::vector<cv::Vec2f> lines;
    cv::HoughLines(bw, lines, 1, CV_PI / 180, 180);
    double angle_deg = 0.0;
    int count = 0;
    for (auto &l : lines) {
        double deg = l[1] * 180.0 / CV_PI;
        if (deg > 80 && deg < 100) continue;
        if (deg > 0 && deg < 45) { angle_deg += deg; count++; }
        else if (deg > 135 && deg < 180) { angle_deg += deg - 180; count++; }
    }
    if (count == 0) return gray;
    angle_deg /= count;
    cv::Point2f center(gray.cols / 2.0f, gray.rows / 2.0f);
    cv::Mat rot = cv::getRotationMatrix2D(center, angle_deg, 1.0);
    cv::Mat dst;
    cv::warpAffine(gray, dst, rot, gray.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    return dst;
}

// ---------------- Tesseract ----------------
namespace {
struct PixDeleter {
    void operator()(Pix *p) const { pixDestroy(&p); }
};
struct TessDeleter {
    void operator()(tesseract::TessBaseAPI *t) const { t->End(); delete t; }
};
} // namespace

std::string TesseractExtractor::extract(const cv::Mat &page) const {
    if (page.empty()) throw ExtractionFailure("empty page image");

    cv::Mat gray;
    if (page.channels() == 3) cv::cvtColor(page, gray, cv::COLOR_BGR2GRAY);
    else if (page.channels() == 4) cv::cvtColor(page, gray, cv::COLOR_BGRA2GRAY);
    else gray = page;

    cv::Mat straight = cfg_.deskew ? deskew(gray) : gray;
    cv::Mat den;
    cv::fastNlMeansDenoising(straight, den, (float)cfg_.denoise_h);
    cv::Mat th;
    cv::adaptiveThreshold(den, th, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 31, 15);

    // in-memory PNG, so no page image is ever written to disk
    std::vector<unsigned char> png;
    if (!cv::imencode(".png", th, png)) throw ExtractionFailure("could not encode page for OCR");
    std::unique_ptr<Pix, PixDeleter> px(pixReadMem(png.data(), png.size()));
    if (!px) throw ExtractionFailure("leptonica could not read the page image");

    std::unique_ptr<tesseract::TessBaseAPI, TessDeleter> tess(new tesseract::TessBaseAPI());
    if (tess->Init(nullptr, cfg_.lang.c_str(), tesseract::OEM_LSTM_ONLY)) {
        throw ExtractionFailure("tesseract init failed for language " + cfg_.lang);
    }
    tess->SetVariable("preserve_interword_spaces", "1");
    tess->SetImage(px.get());
    std::unique_ptr<char[]> out(tess->GetUTF8Text());
    return out ? std::string(out.get()) : std::string();
}

} // namespace ztredact

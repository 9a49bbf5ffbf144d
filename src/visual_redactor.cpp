// visual_redactor.cpp
// Faces, signatures and stamps on page images, filled black on a copy.

#include "ztredact/visual_redactor.h"

#include "ztredact/errors.h"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace ztredact {

// ---------------- OpenCV analyzer ----------------
OpenCvImageAnalyzer::OpenCvImageAnalyzer(const VisualConfig &cfg) : cfg_(cfg) {
    if (!cfg_.face_cascade_path.empty()) {
        cascade_failed_ = !faces_.load(cfg_.face_cascade_path);
    }
}

std::vector<DetectedRegion> OpenCvImageAnalyzer::analyze(const cv::Mat &page) const {
    if (page.empty()) throw VisualAnalysisFailure("empty page image");
    if (cascade_failed_) throw VisualAnalysisFailure("face cascade could not be loaded");

    cv::Mat gray;
    if (page.channels() == 3) cv::cvtColor(page, gray, cv::COLOR_BGR2GRAY);
    else if (page.channels() == 4) cv::cvtColor(page, gray, cv::COLOR_BGRA2GRAY);
    else gray = page.clone();

    std::vector<DetectedRegion> out;
    if (!cfg_.face_cascade_path.empty()) {
        auto f = detect_faces(gray);
        out.insert(out.end(), f.begin(), f.end());
    }
    if (cfg_.detect_signatures) {
        auto s = detect_signatures(gray);
        out.insert(out.end(), s.begin(), s.end());
    }
    if (cfg_.detect_stamps) {
        auto s = detect_stamps(gray);
        out.insert(out.end(), s.begin(), s.end());
    }
    return out;
}

std::vector<DetectedRegion> OpenCvImageAnalyzer::detect_faces(const cv::Mat &gray) const {
    cv::Mat eq;
    cv::equalizeHist(gray, eq);
    std::vector<cv::Rect> rects;
    {
        std::lock_guard<std::mutex> lk(cascade_mu_);
        faces_.detectMultiScale(eq, rects, 1.1, 5, 0, cv::Size(30, 30));
    }
    std::vector<DetectedRegion> out;
    for (auto &r : rects) out.push_back({r, EntityKind::FACE, 0.9});
    return out;
}

// Handwriting leaves sparse, wide contours; printed text dilates into solid
// blocks and stays under the minimum width per word.
std::vector<DetectedRegion> OpenCvImageAnalyzer::detect_signatures(const cv::Mat &gray) const {
    cv::Mat bw;
    cv::threshold(gray, bw, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
    cv::morphologyEx(bw, bw, cv::MORPH_CLOSE, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bw, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<DetectedRegion> out;
    for (auto &c : contours) {
        cv::Rect r = cv::boundingRect(c);
        if (r.width < cfg_.signature_min_width || r.height < 20) continue;
        double aspect = (double)r.width / (double)r.height;
        if (aspect < 1.5 || aspect > 8.0) continue;
        std::vector<cv::Point> hull;
        cv::convexHull(c, hull);
        double hull_area = cv::contourArea(hull);
        if (hull_area <= 0.0) continue;
        double solidity = cv::contourArea(c) / hull_area;
        if (solidity < cfg_.signature_max_solidity) out.push_back({r, EntityKind::SIGNATURE, 0.6});
    }
    return out;
}

std::vector<DetectedRegion> OpenCvImageAnalyzer::detect_stamps(const cv::Mat &gray) const {
    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(9, 9), 2.0);
    int min_dim = std::min(gray.rows, gray.cols);
    int min_r = std::max(4, (int)(min_dim * cfg_.stamp_min_radius_ratio));
    int max_r = std::max(min_r + 1, (int)(min_dim * cfg_.stamp_max_radius_ratio));

    std::vector<cv::Vec3f> circles;
    cv::HoughCircles(blurred, circles, cv::HOUGH_GRADIENT, 1, std::max(1, min_dim / 8), 100, 40, min_r, max_r);

    std::vector<DetectedRegion> out;
    for (auto &c : circles) {
        int r = cvRound(c[2]);
        cv::Rect box(cvRound(c[0]) - r, cvRound(c[1]) - r, 2 * r, 2 * r);
        out.push_back({box, EntityKind::STAMP, 0.7});
    }
    return out;
}

// ---------------- Redactor ----------------
static VisualResult fail_closed(const cv::Mat &page, int page_index, const std::string &why) {
    VisualResult r;
    r.image = page.empty() ? cv::Mat() : cv::Mat::zeros(page.size(), page.type());
    r.findings.push_back(Finding::region({page_index, 0, 0, page.cols, page.rows}, EntityKind::IMAGE_REGION, 1.0));
    r.failed_closed = true;
    r.error = why;
    return r;
}

VisualResult VisualRedactor::redact(const cv::Mat &page, int page_index) const {
    try {
        if (!analyzer_) throw VisualAnalysisFailure("no image analyzer configured");
        std::vector<DetectedRegion> regions = analyzer_->analyze(page);

        VisualResult r;
        r.image = page.clone();
        const cv::Rect bounds(0, 0, page.cols, page.rows);
        const int pad = std::max(0, cfg_.padding);
        for (auto &d : regions) {
            cv::Rect box(d.rect.x - pad, d.rect.y - pad, d.rect.width + 2 * pad, d.rect.height + 2 * pad);
            box &= bounds;
            if (box.area() <= 0) continue;
            cv::rectangle(r.image, box, cv::Scalar::all(0), cv::FILLED);
            r.findings.push_back(Finding::region({page_index, box.x, box.y, box.width, box.height}, d.kind,
                                                 d.confidence));
        }
        return r;
    } catch (const std::exception &e) {
        return fail_closed(page, page_index, e.what());
    }
}

} // namespace ztredact

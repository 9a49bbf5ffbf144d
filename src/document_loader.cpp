// document_loader.cpp
// Input files -> Document: PDF rasterization and text layer via poppler, images, plain text.

#include "ztredact/document_loader.h"

#include "ztredact/errors.h"
#include "ztredact/text_util.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page.h>
#include <poppler-page-renderer.h>

namespace fs = std::filesystem;

namespace ztredact {

static bool has_ext(const fs::path &p, std::initializer_list<std::string> exts) {
    if (!p.has_extension()) return false;
    auto e = to_lower(p.extension().string());
    for (auto &x : exts) if (e == x) return true;
    return false;
}
bool is_pdf(const fs::path &p)   { return has_ext(p, {".pdf"}); }
bool is_image(const fs::path &p) { return has_ext(p, {".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp", ".webp"}); }
bool is_text(const fs::path &p)  { return has_ext(p, {".txt"}); }
bool is_supported(const fs::path &p) { return is_pdf(p) || is_image(p) || is_text(p); }

// ---------------- PDF ----------------
static cv::Mat to_mat(const poppler::image &img) {
    int type = 0;
    int convert = -1;
    switch (img.format()) {
        case poppler::image::format_argb32: type = CV_8UC4; convert = cv::COLOR_BGRA2BGR; break;
        case poppler::image::format_rgb24: type = CV_8UC4; convert = cv::COLOR_BGRA2BGR; break;
        case poppler::image::format_bgr24: type = CV_8UC3; break;
        case poppler::image::format_gray8: type = CV_8UC1; break;
        default: throw ExtractionFailure("unsupported poppler image format");
    }
    // poppler owns the buffer; wrap, then copy out
    cv::Mat view(img.height(), img.width(), type, const_cast<char*>(img.const_data()), img.bytes_per_row());
    cv::Mat out;
    if (convert >= 0) cv::cvtColor(view, out, convert);
    else out = view.clone();
    return out;
}

// Words with their boxes, scaled from PDF points to the rendered pixels.
static void append_text_layer(const poppler::page &page, int page_index, double dpi, std::vector<LayerWord> &out) {
    const double scale = dpi / 72.0;
    for (auto &box : page.text_list()) {
        poppler::byte_array utf8 = box.text().to_utf8();
        std::string word(utf8.begin(), utf8.end());
        if (trim_copy(word).empty()) continue;
        poppler::rectf r = box.bbox();
        LayerWord w;
        w.text = word;
        w.box = {page_index, (int)(r.x() * scale), (int)(r.y() * scale),
                 std::max(1, (int)(r.width() * scale + 0.5)), std::max(1, (int)(r.height() * scale + 0.5))};
        w.space_after = box.has_space_after();
        out.push_back(std::move(w));
    }
}

static Document load_pdf(const fs::path &path, double dpi) {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path.string()));
    if (!doc) throw ExtractionFailure("cannot open PDF: " + path.filename().string());
    if (doc->is_locked()) throw ExtractionFailure("PDF is encrypted: " + path.filename().string());
    if (!poppler::page_renderer::can_render()) throw ExtractionFailure("poppler was built without a renderer");

    Document d;
    d.id = path.filename().string();
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);

    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) throw ExtractionFailure("cannot read PDF page " + std::to_string(i + 1));
        poppler::image img = renderer.render_page(page.get(), dpi, dpi);
        if (!img.is_valid()) throw ExtractionFailure("cannot render PDF page " + std::to_string(i + 1));
        d.pages.push_back(to_mat(img));

        append_text_layer(*page, i, dpi, d.text_layer);
    }
    if (d.pages.empty()) throw ExtractionFailure("PDF has no pages: " + path.filename().string());
    return d;
}

// ---------------- Entry points ----------------
Document load_document(const fs::path &path, double dpi) {
    if (is_pdf(path)) return load_pdf(path, dpi);

    Document d;
    d.id = path.filename().string();
    if (is_image(path)) {
        cv::Mat img = cv::imread(path.string(), cv::IMREAD_COLOR);
        if (img.empty()) throw ExtractionFailure("cannot read image: " + d.id);
        d.pages.push_back(img);
        return d;
    }
    if (is_text(path)) {
        std::ifstream f(path, std::ios::binary);
        if (!f) throw ExtractionFailure("cannot read text file: " + d.id);
        d.text = std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return d;
    }
    throw ExtractionFailure("unsupported file type: " + d.id);
}

std::vector<fs::path> collect_inputs(const fs::path &input) {
    std::vector<fs::path> inputs;
    if (fs::is_directory(input)) {
        for (auto &entry : fs::directory_iterator(input)) {
            if (entry.is_regular_file() && is_supported(entry.path())) inputs.push_back(entry.path());
        }
        std::sort(inputs.begin(), inputs.end());
    } else {
        inputs.push_back(input);
    }
    return inputs;
}

} // namespace ztredact

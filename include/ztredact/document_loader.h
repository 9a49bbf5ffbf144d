#pragma once

#include "ztredact/pipeline.h"

#include <filesystem>
#include <string>
#include <vector>

namespace ztredact {

bool is_pdf(const std::filesystem::path &p);
bool is_image(const std::filesystem::path &p);
bool is_text(const std::filesystem::path &p);
bool is_supported(const std::filesystem::path &p);

// PDF pages are rendered with poppler at `dpi`; a PDF text layer, when
// present, becomes the positioned text layer. Images are loaded as one page and
// .txt files as text only. Throws ExtractionFailure for unreadable input.
Document load_document(const std::filesystem::path &path, double dpi = 300.0);

// A single supported file, or every supported file directly inside a
// directory, sorted.
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path &input);

} // namespace ztredact

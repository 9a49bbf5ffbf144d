#pragma once

#include <stdexcept>
#include <string>

namespace ztredact {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A single detection strategy failed; the pipeline treats it as zero findings.
struct DetectorFailure : Error {
    DetectorFailure(const std::string &detector, const std::string &what)
        : Error(detector + ": " + what), detector_name(detector) {}
    std::string detector_name;
};

struct VisualAnalysisFailure : Error { using Error::Error; };

// No text means no safe redaction; fatal for the document.
struct ExtractionFailure : Error { using Error::Error; };

struct ConfigError : Error { using Error::Error; };

struct AnalysisFailure : Error { using Error::Error; };

struct UnknownProcessingId : Error {
    explicit UnknownProcessingId(const std::string &id) : Error("unknown processing id: " + id) {}
};

struct PipelineCancelled : Error {
    PipelineCancelled() : Error("processing cancelled") {}
};

} // namespace ztredact

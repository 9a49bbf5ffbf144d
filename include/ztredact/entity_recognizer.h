#pragma once

#include "ztredact/cancellation.h"

#include <string>
#include <utility>
#include <vector>

namespace ztredact {

// One span reported by a pretrained NER model. Offsets are Unicode code
// points, the convention of the model servers this talks to.
struct EntitySpan {
    size_t start = 0;
    size_t end = 0;
    std::string label;
    double score = 0.0;
};

// A cancelled token abandons the call; implementations throw PipelineCancelled.
class EntityRecognizer {
public:
    virtual ~EntityRecognizer() = default;
    virtual std::vector<EntitySpan> recognize(const std::string &text, const CancellationToken &cancel) const = 0;
};

// Talks to a model server: POST {"text": ...} and expects
// {"entities": [{"start", "end", "label", "score"}]}.
class HttpEntityRecognizer : public EntityRecognizer {
public:
    HttpEntityRecognizer(std::string endpoint, int timeout_sec)
        : endpoint_(std::move(endpoint)), timeout_sec_(timeout_sec) {}
    std::vector<EntitySpan> recognize(const std::string &text, const CancellationToken &cancel) const override;

private:
    std::string endpoint_;
    int timeout_sec_;
};

} // namespace ztredact

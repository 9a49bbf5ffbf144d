#include "ztredact/types.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace ztredact {

namespace {
struct KindName { EntityKind kind; const char* name; };

const KindName kKindNames[] = {
    {EntityKind::PERSON, "PERSON"},
    {EntityKind::LOCATION, "LOCATION"},
    {EntityKind::ORG, "ORG"},
    {EntityKind::ID_NUMBER, "ID_NUMBER"},
    {EntityKind::TAX_ID, "TAX_ID"},
    {EntityKind::IBAN, "IBAN"},
    {EntityKind::PHONE, "PHONE"},
    {EntityKind::EMAIL, "EMAIL"},
    {EntityKind::CASE_NUMBER, "CASE_NUMBER"},
    {EntityKind::POSTAL_CODE, "POSTAL_CODE"},
    {EntityKind::STREET_ADDRESS, "STREET_ADDRESS"},
    {EntityKind::AMOUNT, "AMOUNT"},
    {EntityKind::DATE, "DATE"},
    {EntityKind::FACE, "FACE"},
    {EntityKind::SIGNATURE, "SIGNATURE"},
    {EntityKind::STAMP, "STAMP"},
    {EntityKind::IMAGE_REGION, "IMAGE_REGION"},
    {EntityKind::OTHER, "OTHER"},
};
} // namespace

const char* entity_kind_str(EntityKind k) {
    for (auto &kn : kKindNames) if (kn.kind == k) return kn.name;
    return "OTHER";
}

bool parse_entity_kind(const std::string &s, EntityKind &out) {
    std::string up = s;
    std::transform(up.begin(), up.end(), up.begin(), ::toupper);
    for (auto &kn : kKindNames) {
        if (up == kn.name) { out = kn.kind; return true; }
    }
    return false;
}

const char* detector_kind_str(DetectorKind d) {
    switch (d) {
        case DetectorKind::PATTERN: return "pattern";
        case DetectorKind::CONTEXTUAL: return "contextual";
        case DetectorKind::NER: return "ner";
        case DetectorKind::FUZZY: return "fuzzy";
        case DetectorKind::VISUAL: return "visual";
    }
    return "unknown";
}

bool parse_detector_kind(const std::string &s, DetectorKind &out) {
    for (auto d : {DetectorKind::PATTERN, DetectorKind::CONTEXTUAL, DetectorKind::NER, DetectorKind::FUZZY,
                   DetectorKind::VISUAL}) {
        if (s == detector_kind_str(d)) { out = d; return true; }
    }
    return false;
}

int detector_priority(DetectorKind d) {
    switch (d) {
        case DetectorKind::PATTERN: return 4;
        case DetectorKind::CONTEXTUAL: return 3;
        case DetectorKind::NER: return 2;
        case DetectorKind::FUZZY: return 1;
        case DetectorKind::VISUAL: return 0;
    }
    return 0;
}

bool is_identifier_kind(EntityKind k) {
    return k == EntityKind::ID_NUMBER || k == EntityKind::TAX_ID || k == EntityKind::CASE_NUMBER;
}

bool is_financial_kind(EntityKind k) {
    return k == EntityKind::IBAN || k == EntityKind::AMOUNT;
}

bool is_visual_kind(EntityKind k) {
    return k == EntityKind::FACE || k == EntityKind::SIGNATURE || k == EntityKind::STAMP ||
           k == EntityKind::IMAGE_REGION;
}

BoundingBox BoundingBox::united(const BoundingBox &o) const {
    BoundingBox b;
    b.page = page;
    b.x = std::min(x, o.x);
    b.y = std::min(y, o.y);
    b.width = std::max(x + width, o.x + o.width) - b.x;
    b.height = std::max(y + height, o.y + o.height) - b.y;
    return b;
}

Finding Finding::text(TextSpan span, EntityKind kind, double confidence, DetectorKind source,
                      std::string raw_value) {
    Finding f;
    f.is_text_ = true;
    f.span_ = span;
    f.kind_ = kind;
    f.confidence_ = std::clamp(confidence, 0.0, 1.0);
    f.source_ = source;
    f.raw_value_ = std::move(raw_value);
    return f;
}

Finding Finding::region(BoundingBox box, EntityKind kind, double confidence) {
    Finding f;
    f.is_text_ = false;
    f.box_ = box;
    f.kind_ = kind;
    f.confidence_ = std::clamp(confidence, 0.0, 1.0);
    f.source_ = DetectorKind::VISUAL;
    return f;
}

} // namespace ztredact

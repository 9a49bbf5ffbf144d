#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ztredact {

// ---------------- Entity and detector kinds ----------------
enum class EntityKind {
    PERSON, LOCATION, ORG, ID_NUMBER, TAX_ID, IBAN, PHONE, EMAIL, CASE_NUMBER,
    POSTAL_CODE, STREET_ADDRESS, AMOUNT, DATE, FACE, SIGNATURE, STAMP, IMAGE_REGION, OTHER
};

enum class DetectorKind { PATTERN, CONTEXTUAL, NER, FUZZY, VISUAL };

const char* entity_kind_str(EntityKind k);
bool parse_entity_kind(const std::string &s, EntityKind &out);
const char* detector_kind_str(DetectorKind d);
bool parse_detector_kind(const std::string &s, DetectorKind &out);

// Higher wins an overlap tie: PATTERN > CONTEXTUAL > NER > FUZZY.
int detector_priority(DetectorKind d);

bool is_identifier_kind(EntityKind k);
bool is_financial_kind(EntityKind k);
bool is_visual_kind(EntityKind k);

struct TextSpan {
    size_t start = 0;
    size_t end = 0;   // exclusive, byte offset into the canonical UTF-8 text
    size_t length() const { return end - start; }
    bool overlaps(const TextSpan &o) const { return start < o.end && o.start < end; }
};

struct BoundingBox {
    int page = 0;
    int x = 0, y = 0, width = 0, height = 0;
    bool overlaps(const BoundingBox &o) const {
        return page == o.page && x < o.x + o.width && o.x < x + width &&
               y < o.y + o.height && o.y < y + height;
    }
    BoundingBox united(const BoundingBox &o) const;
};

// One detector's claim that a text span or image region is sensitive.
// Immutable after construction. The raw value is transient: it is dropped when
// findings are consolidated and never reaches a plan, record or log.
class Finding {
public:
    static Finding text(TextSpan span, EntityKind kind, double confidence, DetectorKind source,
                        std::string raw_value);
    static Finding region(BoundingBox box, EntityKind kind, double confidence);

    bool is_text() const { return is_text_; }
    const TextSpan& span() const { return span_; }
    const BoundingBox& box() const { return box_; }
    EntityKind kind() const { return kind_; }
    double confidence() const { return confidence_; }
    DetectorKind source() const { return source_; }
    const std::string& raw_value() const { return raw_value_; }

private:
    Finding() = default;

    bool is_text_ = true;
    TextSpan span_;
    BoundingBox box_;
    EntityKind kind_ = EntityKind::OTHER;
    double confidence_ = 0.0;
    DetectorKind source_ = DetectorKind::PATTERN;
    std::string raw_value_;
};

using Findings = std::vector<Finding>;

} // namespace ztredact

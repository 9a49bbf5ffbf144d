#pragma once

#include "ztredact/types.h"

#include <string>
#include <vector>

namespace ztredact {

struct GazetteerEntry {
    std::string value;
    EntityKind kind = EntityKind::PERSON;
};

// Entities already known for a case (parties, counsel, addresses).
class Gazetteer {
public:
    void add(const std::string &value, EntityKind kind = EntityKind::PERSON);
    void merge(const Gazetteer &other);
    const std::vector<GazetteerEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    // JSON: [{"value": "...", "kind": "PERSON"}, ...] or ["...", ...].
    // Text: one entry per line, optionally "KIND<TAB>value"; '#' starts a comment.
    static Gazetteer load(const std::string &path);

private:
    std::vector<GazetteerEntry> entries_;
};

} // namespace ztredact

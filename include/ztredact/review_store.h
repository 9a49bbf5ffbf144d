#pragma once

#include "ztredact/processing_record.h"

#include <optional>
#include <string>
#include <vector>

namespace ztredact {

struct HeldEntry {
    ProcessingRecord record;       // unsealed, HELD_FOR_REVIEW
    std::string sanitized_text;    // withheld until approved
};

// Held documents on disk, one "<id>.json" per document with the audit record
// and the sanitized text, so a reviewer can decide in a later run. Raw values
// are never written.
class ReviewStore {
public:
    // Creates the directory. Throws ConfigError when that fails.
    explicit ReviewStore(std::string dir);

    // Throws Error when the entry cannot be written.
    void save(const ProcessingRecord &record, const std::string &sanitized_text) const;

    // nullopt for ids with no entry. Throws Error for a corrupt entry.
    std::optional<HeldEntry> load(const std::string &id) const;

    void remove(const std::string &id) const;
    std::vector<std::string> ids() const;

    const std::string& dir() const { return dir_; }

private:
    std::string path_for(const std::string &id) const;

    std::string dir_;
};

} // namespace ztredact

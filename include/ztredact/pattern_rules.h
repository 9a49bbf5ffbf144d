#pragma once

#include "ztredact/types.h"

#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace ztredact {

// ---------------- Validators ----------------
// Each takes the matched text as it appears in the document.
bool valid_iban(const std::string &s);       // ISO 13616 mod 97
bool valid_tax_id(const std::string &s);     // German Steuer-IdNr, ISO 7064 MOD 11,10
bool valid_id_card(const std::string &s);    // German Personalausweis, 7-3-1 check digit
bool valid_phone(const std::string &s);
bool valid_email(const std::string &s);
bool valid_case_number(const std::string &s);
bool valid_date(const std::string &s);
bool valid_postal_code(const std::string &s);
bool valid_street_address(const std::string &s);
bool valid_amount(const std::string &s);

struct PatternRule {
    std::string name;
    EntityKind kind = EntityKind::OTHER;
    std::regex re;
    std::function<bool(const std::string&)> validate;
    std::vector<std::string> keywords;   // lower case
    double confidence = 0.95;
};

// German legal-intake rule table. Built once, shared read-only across threads.
const std::vector<PatternRule>& default_pattern_rules();

struct PatternMatch {
    TextSpan span;
    const PatternRule* rule = nullptr;
};

// Keyword search is whole-word for short keywords and prefix-bounded otherwise,
// on the lower-cased window around (but excluding) the match.
bool has_context_keyword(const std::string &text, TextSpan span, size_t window,
                         const std::vector<std::string> &keywords);

// All validated matches of all rules, in rule order then text order. With
// require_context, a match also needs a keyword within `window` bytes.
std::vector<PatternMatch> scan_patterns(const std::string &text, const std::vector<PatternRule> &rules,
                                        bool require_context, size_t window);

} // namespace ztredact

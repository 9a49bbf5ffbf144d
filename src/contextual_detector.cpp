// contextual_detector.cpp
// Trigger phrases ("geboren am", "wohnhaft in", "Herr") and the phrase they govern.

#include "ztredact/detectors.h"

#include "ztredact/text_util.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace ztredact {

// A trigger phrase governs the phrase that follows it up to the next clause
// boundary. The governed phrase is emitted only if it has the shape the
// trigger expects, so "geboren am" needs something date-like after it.

const std::vector<ContextualDetector::Trigger>& ContextualDetector::default_triggers() {
    using S = Shape;
    static const std::vector<Trigger> triggers = [] {
        std::vector<Trigger> t = {
            // residence and origin
            {{"wohnhaft", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"wohnhaft", "zu"}, EntityKind::LOCATION, S::PLACE},
            {{"wohnhaft"}, EntityKind::LOCATION, S::PLACE},
            {{"wohnt", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"ansässig", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"mit", "sitz", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"geboren", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"anschrift"}, EntityKind::STREET_ADDRESS, S::PLACE},
            {{"residing", "at"}, EntityKind::LOCATION, S::PLACE},
            {{"residing", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"lives", "in"}, EntityKind::LOCATION, S::PLACE},
            {{"living", "at"}, EntityKind::LOCATION, S::PLACE},
            {{"born", "in"}, EntityKind::LOCATION, S::PLACE},
            // birth and other personal dates
            {{"geboren", "am"}, EntityKind::DATE, S::DATE},
            {{"geb.", "am"}, EntityKind::DATE, S::DATE},
            {{"geb."}, EntityKind::DATE, S::DATE},
            {{"geburtsdatum"}, EntityKind::DATE, S::DATE},
            {{"born", "on"}, EntityKind::DATE, S::DATE},
            {{"date", "of", "birth"}, EntityKind::DATE, S::DATE},
            {{"verstorben", "am"}, EntityKind::DATE, S::DATE},
            // people
            {{"herr"}, EntityKind::PERSON, S::NAME},
            {{"herrn"}, EntityKind::PERSON, S::NAME},
            {{"frau"}, EntityKind::PERSON, S::NAME},
            {{"vertreten", "durch"}, EntityKind::PERSON, S::NAME},
            {{"represented", "by"}, EntityKind::PERSON, S::NAME},
            {{"mandant"}, EntityKind::PERSON, S::NAME},
            {{"mandantin"}, EntityKind::PERSON, S::NAME},
            {{"kläger"}, EntityKind::PERSON, S::NAME},
            {{"klägerin"}, EntityKind::PERSON, S::NAME},
            {{"beklagte"}, EntityKind::PERSON, S::NAME},
            {{"beklagter"}, EntityKind::PERSON, S::NAME},
            {{"zeuge"}, EntityKind::PERSON, S::NAME},
            {{"zeugin"}, EntityKind::PERSON, S::NAME},
            {{"unterzeichnet", "von"}, EntityKind::PERSON, S::NAME},
            {{"signed", "by"}, EntityKind::PERSON, S::NAME},
            {{"mr."}, EntityKind::PERSON, S::NAME},
            {{"mrs."}, EntityKind::PERSON, S::NAME},
            {{"ms."}, EntityKind::PERSON, S::NAME},
            // organisations
            {{"arbeitgeber"}, EntityKind::ORG, S::NAME},
            {{"firma"}, EntityKind::ORG, S::NAME},
            {{"employer"}, EntityKind::ORG, S::NAME},
            // identifiers phrased loosely
            {{"konto"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"kontonummer"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"kundennummer"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"versicherungsnummer"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"mitgliedsnummer"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"ausweisnummer"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"policennummer"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"account", "number"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"policy", "number"}, EntityKind::ID_NUMBER, S::IDENTIFIER},
            {{"aktenzeichen"}, EntityKind::CASE_NUMBER, S::IDENTIFIER},
            {{"az."}, EntityKind::CASE_NUMBER, S::IDENTIFIER},
            {{"az"}, EntityKind::CASE_NUMBER, S::IDENTIFIER},
        };
        // longest trigger first so "geb. am" is tried before "geb."
        std::stable_sort(t.begin(), t.end(), [](const Trigger &a, const Trigger &b){
            return a.words.size() > b.words.size();
        });
        return t;
    }();
    return triggers;
}

namespace {

const std::unordered_set<std::string> kDeterminers = {
    "der", "die", "das", "dem", "den", "des", "the", "a", "an"
};
const std::unordered_set<std::string> kPlaceConnectors = {"in", "bei", "an", "am", "im", "der", "-"};
const std::unordered_set<std::string> kNameParticles = {"von", "van", "de", "zu", "vom", "der", "den"};
const std::unordered_set<std::string> kTitles = {"dr.", "prof.", "dipl.", "ing.", "rechtsanwalt", "rechtsanwältin", "ra"};
const std::unordered_set<std::string> kClauseWords = {"und", "oder", "sowie", "and", "or", "aber", "but"};
const std::unordered_set<std::string> kIdPrefixes = {"nr.", "nr", "no.", "no", "number", "nummer", "#"};
const std::unordered_set<std::string> kMonths = {
    "januar", "februar", "märz", "april", "mai", "juni", "juli", "august", "september", "oktober",
    "november", "dezember", "january", "february", "march", "may", "june", "july", "october", "december"
};

bool has_digit(const std::string &s) {
    return std::any_of(s.begin(), s.end(), [](char c){ return std::isdigit((unsigned char)c); });
}

bool is_boundary(const Token &t) {
    if (t.is_punct()) return t.text != "-";
    return kClauseWords.count(to_lower(t.text)) > 0;
}

// [first, last) token range of the governed phrase, or first == last when the
// phrase does not have the expected shape.
std::pair<size_t, size_t> governed_phrase(const std::vector<Token> &toks, size_t i,
                                          ContextualDetector::Shape shape, size_t max_tokens) {
    using S = ContextualDetector::Shape;
    while (i < toks.size() && (toks[i].text == ":" || toks[i].text == "-")) ++i;

    size_t first = i, last = i;
    if (shape == S::DATE) {
        while (last < toks.size() && last - first < max_tokens) {
            std::string low = to_lower(toks[last].text);
            if (has_digit(low) || kMonths.count(low)) { ++last; continue; }
            break;
        }
        bool any_digit = false;
        for (size_t k = first; k < last; ++k) any_digit = any_digit || has_digit(toks[k].text);
        if (!any_digit) return {first, first};
        return {first, last};
    }

    if (shape == S::NAME) {
        while (first < toks.size() && kTitles.count(to_lower(toks[first].text))) ++first;
        last = first;
        size_t name_tokens = std::min<size_t>(max_tokens, 4);
        while (last < toks.size() && last - first < name_tokens && !is_boundary(toks[last])) {
            const std::string &t = toks[last].text;
            if (starts_upper(t) && !has_digit(t)) { ++last; continue; }
            // particles only between capitalised parts: "Ludwig van Beethoven"
            if (last > first && kNameParticles.count(to_lower(t)) && last + 1 < toks.size() &&
                starts_upper(toks[last + 1].text)) { ++last; continue; }
            break;
        }
        return {first, last};
    }

    if (shape == S::PLACE) {
        while (first < toks.size() && kDeterminers.count(to_lower(toks[first].text))) ++first;
        last = first;
        while (last < toks.size() && last - first < max_tokens) {
            const Token &t = toks[last];
            std::string low = to_lower(t.text);
            if (starts_upper(t.text) || has_digit(t.text)) { ++last; continue; }
            bool next_ok = last + 1 < toks.size() &&
                           (starts_upper(toks[last + 1].text) || has_digit(toks[last + 1].text));
            if (last > first && kPlaceConnectors.count(low) && next_ok) { ++last; continue; }
            // "Hauptstraße 5, 10115 Berlin": a comma may introduce a postcode
            if (last > first && t.text == "," && last + 1 < toks.size() && toks[last + 1].text.size() == 5 &&
                digits_only(toks[last + 1].text).size() == 5) { ++last; continue; }
            break;
        }
        return {first, last};
    }

    // IDENTIFIER
    while (first < toks.size() && kIdPrefixes.count(to_lower(toks[first].text))) ++first;
    while (first < toks.size() && toks[first].text == ":") ++first;
    last = first;
    while (last < toks.size() && last - first < 4 && !is_boundary(toks[last])) {
        const std::string &t = toks[last].text;
        if (has_digit(t)) { ++last; continue; }
        // register letters inside a file number: "12 O 345/23"
        bool short_alpha = t.size() <= 4 && std::all_of(t.begin(), t.end(), [](char c){
            return std::isalpha((unsigned char)c);
        });
        if (last > first && short_alpha && last + 1 < toks.size() && has_digit(toks[last + 1].text)) {
            ++last;
            continue;
        }
        break;
    }
    return {first, last};
}

} // namespace

ContextualDetector::ContextualDetector(const ContextualConfig &cfg) : cfg_(cfg) {}

Findings ContextualDetector::detect(const std::string &text) const {
    std::vector<Token> toks = tokenize(text);
    std::vector<std::string> lower(toks.size());
    for (size_t k = 0; k < toks.size(); ++k) lower[k] = to_lower(toks[k].text);

    Findings out;
    size_t i = 0;
    while (i < toks.size()) {
        const Trigger *hit = nullptr;
        for (auto &trig : default_triggers()) {
            if (i + trig.words.size() > toks.size()) continue;
            bool match = true;
            for (size_t w = 0; w < trig.words.size() && match; ++w) match = lower[i + w] == trig.words[w];
            if (match) { hit = &trig; break; }
        }
        if (!hit) { ++i; continue; }

        size_t after = i + hit->words.size();
        auto range = governed_phrase(toks, after, hit->shape, cfg_.max_phrase_tokens);
        if (range.second > range.first) {
            TextSpan span{toks[range.first].start, toks[range.second - 1].end};
            out.push_back(Finding::text(span, hit->kind, cfg_.confidence, DetectorKind::CONTEXTUAL,
                                        text.substr(span.start, span.length())));
            i = range.second;
        } else {
            i = after;
        }
    }
    return out;
}

} // namespace ztredact

#include "ztredact/text_util.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace ztredact {

std::string to_lower(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = s[i];
        // UTF-8 for Ä Ö Ü is C3 84 / C3 96 / C3 9C, lower case is +0x20
        if (c == 0xC3 && i + 1 < s.size()) {
            unsigned char n = s[i + 1];
            out += (char)c;
            if (n == 0x84 || n == 0x96 || n == 0x9C) out += (char)(n + 0x20);
            else out += (char)n;
            ++i;
            continue;
        }
        out += (char)::tolower(c);
    }
    return out;
}

std::string trim_copy(const std::string &s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::string collapse_spaces(const std::string &s) {
    std::string out;
    bool in_space = false;
    for (char c : s) {
        if (std::isspace((unsigned char)c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

std::string digits_only(const std::string &s) {
    std::string out;
    for (char c : s) if (std::isdigit((unsigned char)c)) out += c;
    return out;
}

uint64_t fnv1a_64(const std::string &s) {
    const uint64_t FNV_OFFSET = 1469598103934665603ULL;
    const uint64_t FNV_PRIME = 1099511628211ULL;
    uint64_t h = FNV_OFFSET;
    for (unsigned char c : s) { h ^= c; h *= FNV_PRIME; }
    return h;
}

std::u32string utf8_decode(const std::string &s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = s[i];
        char32_t cp = 0;
        size_t n = 1;
        if (c < 0x80) cp = c;
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; n = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; n = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; n = 4; }
        else { out.push_back(0xFFFD); ++i; continue; }
        if (i + n > s.size()) { out.push_back(0xFFFD); break; }
        for (size_t k = 1; k < n; ++k) cp = (cp << 6) | (s[i + k] & 0x3F);
        out.push_back(cp);
        i += n;
    }
    return out;
}

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

size_t utf8_length(const std::string &s) {
    size_t n = 0;
    for (unsigned char c : s) if (!is_continuation(c)) ++n;
    return n;
}

std::vector<size_t> utf8_codepoint_offsets(const std::string &s) {
    std::vector<size_t> offs;
    offs.reserve(s.size() + 1);
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation((unsigned char)s[i])) offs.push_back(i);
    }
    offs.push_back(s.size());
    return offs;
}

std::string utf8_prefix(const std::string &s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && is_continuation((unsigned char)s[cut])) --cut;
    return s.substr(0, cut);
}

bool starts_upper(const std::string &token) {
    if (token.empty()) return false;
    unsigned char c = token[0];
    if (c >= 'A' && c <= 'Z') return true;
    if (c == 0xC3 && token.size() > 1) {
        unsigned char n = token[1];
        return n == 0x84 || n == 0x96 || n == 0x9C;
    }
    return false;
}

size_t levenshtein(const std::u32string &a, const std::u32string &b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double similarity(const std::string &a, const std::string &b) {
    std::u32string ua = utf8_decode(to_lower(a));
    std::u32string ub = utf8_decode(to_lower(b));
    size_t longest = std::max(ua.size(), ub.size());
    if (longest == 0) return 1.0;
    return 1.0 - (double)levenshtein(ua, ub) / (double)longest;
}

bool Token::is_punct() const {
    return text.size() == 1 && std::ispunct((unsigned char)text[0]) && text[0] != '&';
}

static bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80 || c == '-' || c == '.' || c == '/' || c == '@' ||
           c == '+' || c == '\'' || c == '&';
}

static const std::unordered_set<std::string> &abbreviations() {
    static const std::unordered_set<std::string> abbr = {
        "dr", "prof", "str", "nr", "hr", "fr", "st", "geb", "ca", "bzw", "vgl", "abs",
        "az", "tel", "dipl", "ing", "mr", "mrs", "ms", "no", "inc", "ltd", "co", "jr", "sr", "ggf", "usw"
    };
    return abbr;
}

std::vector<Token> tokenize(const std::string &text) {
    std::vector<Token> out;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = text[i];
        if (std::isspace(c)) { ++i; continue; }
        if (!is_word_byte(c)) {
            out.push_back({i, i + 1, std::string(1, (char)c)});
            ++i;
            continue;
        }
        size_t j = i;
        while (j < text.size() && is_word_byte((unsigned char)text[j])) ++j;
        // trailing punctuation-like word bytes become separate tokens
        size_t end = j;
        while (end > i + 1 && (text[end - 1] == '-' || text[end - 1] == '/' || text[end - 1] == '\'')) --end;
        bool split_dot = false;
        if (end > i + 1 && text[end - 1] == '.') {
            std::string stem = to_lower(text.substr(i, end - 1 - i));
            bool numeric_stem = !stem.empty() && std::all_of(stem.begin(), stem.end(), [](char ch){
                return std::isdigit((unsigned char)ch) || ch == '.';
            });
            // "1." in "1. Januar" is an ordinal, keep the period
            bool ordinal = numeric_stem && stem.size() <= 2 && stem.find('.') == std::string::npos;
            if (!abbreviations().count(stem) && !ordinal) split_dot = true;
        }
        if (split_dot) {
            out.push_back({i, end - 1, text.substr(i, end - 1 - i)});
            out.push_back({end - 1, end, "."});
        } else {
            out.push_back({i, end, text.substr(i, end - i)});
        }
        for (size_t k = end; k < j; ++k) out.push_back({k, k + 1, std::string(1, text[k])});
        i = j;
    }
    return out;
}

} // namespace ztredact

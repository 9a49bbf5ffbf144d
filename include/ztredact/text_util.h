#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ztredact {

// ASCII and German umlaut lower-casing; other bytes pass through unchanged.
std::string to_lower(const std::string &s);
std::string trim_copy(const std::string &s);
std::string collapse_spaces(const std::string &s);
std::string digits_only(const std::string &s);

// FNV-1a 64 bit, used for cache keys and processing ids
uint64_t fnv1a_64(const std::string &s);

std::u32string utf8_decode(const std::string &s);
size_t utf8_length(const std::string &s);

// Byte offset of every code point boundary, size utf8_length(s) + 1.
std::vector<size_t> utf8_codepoint_offsets(const std::string &s);

// Longest prefix of at most max_bytes that ends on a code point boundary.
std::string utf8_prefix(const std::string &s, size_t max_bytes);

// True when the token starts with an upper-case Latin letter, including Ä Ö Ü.
bool starts_upper(const std::string &token);

size_t levenshtein(const std::u32string &a, const std::u32string &b);

// 1 - distance / max(len), on case-folded code points. 1.0 for identical strings.
double similarity(const std::string &a, const std::string &b);

struct Token {
    size_t start = 0;
    size_t end = 0;
    std::string text;
    bool is_punct() const;
};

// Word tokens (letters, digits, UTF-8 multibyte, and - . / @ + ' &) and single
// punctuation tokens. A trailing period is split off unless the word is a
// common German or English abbreviation.
std::vector<Token> tokenize(const std::string &text);

} // namespace ztredact

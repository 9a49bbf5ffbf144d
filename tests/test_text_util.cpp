#include "ztredact/text_util.h"

#include <gtest/gtest.h>

using namespace ztredact;

namespace {
std::vector<std::string> texts(const std::vector<Token> &toks) {
    std::vector<std::string> out;
    for (auto &t : toks) out.push_back(t.text);
    return out;
}
} // namespace

TEST(TextUtil, LowerCasesUmlauts) {
    EXPECT_EQ(to_lower("ÄRGER Über ÖL"), "ärger über öl");
    EXPECT_EQ(to_lower("Straße"), "straße");
}

TEST(TextUtil, CollapsesWhitespace) {
    EXPECT_EQ(collapse_spaces("  Max \n\t Mustermann  "), "Max Mustermann");
    EXPECT_EQ(collapse_spaces(""), "");
}

TEST(TextUtil, Utf8OffsetsCountCodePoints) {
    std::string s = "Jörg";
    EXPECT_EQ(utf8_length(s), 4u);
    std::vector<size_t> offs = utf8_codepoint_offsets(s);
    ASSERT_EQ(offs.size(), 5u);
    EXPECT_EQ(offs[0], 0u);
    EXPECT_EQ(offs[1], 1u);
    EXPECT_EQ(offs[2], 3u);   // ö is two bytes
    EXPECT_EQ(offs[4], s.size());
}

TEST(TextUtil, Utf8PrefixEndsOnCodePoint) {
    std::string s = "Grüße";                  // G r [ü ü] [ß ß] e
    EXPECT_EQ(utf8_prefix(s, 3), "Gr");       // byte 3 is inside ü
    EXPECT_EQ(utf8_prefix(s, 4), "Grü");
    EXPECT_EQ(utf8_prefix(s, 5), "Grü");
    EXPECT_EQ(utf8_prefix(s, 100), s);
    EXPECT_EQ(utf8_prefix(s, 0), "");
}

TEST(TextUtil, StartsUpperKnowsUmlauts) {
    EXPECT_TRUE(starts_upper("Müller"));
    EXPECT_TRUE(starts_upper("Übach"));
    EXPECT_FALSE(starts_upper("über"));
    EXPECT_FALSE(starts_upper("12"));
    EXPECT_FALSE(starts_upper(""));
}

TEST(TextUtil, SimilarityIsCaseInsensitive) {
    EXPECT_DOUBLE_EQ(similarity("Max Mustermann", "max mustermann"), 1.0);
    EXPECT_NEAR(similarity("Max Musterman", "Max Mustermann"), 1.0 - 1.0 / 14.0, 1e-9);
    EXPECT_LT(similarity("Berlin", "Hamburg"), 0.5);
    EXPECT_DOUBLE_EQ(similarity("", ""), 1.0);
}

TEST(TextUtil, LevenshteinOnCodePoints) {
    EXPECT_EQ(levenshtein(utf8_decode("Müller"), utf8_decode("Muller")), 1u);
    EXPECT_EQ(levenshtein(utf8_decode("abc"), utf8_decode("")), 3u);
}

TEST(TextUtil, TokenizeKeepsAbbreviations) {
    auto toks = texts(tokenize("Dr. Weber, geb. 1980. Ende."));
    std::vector<std::string> expected = {"Dr.", "Weber", ",", "geb.", "1980", ".", "Ende", "."};
    EXPECT_EQ(toks, expected);
}

TEST(TextUtil, TokenizeKeepsDatesAndOrdinals) {
    auto toks = texts(tokenize("am 01.01.1980, am 1. Januar"));
    std::vector<std::string> expected = {"am", "01.01.1980", ",", "am", "1.", "Januar"};
    EXPECT_EQ(toks, expected);
}

TEST(TextUtil, TokenOffsetsPointIntoText) {
    std::string text = "Herr Jörg Müller: wohnhaft";
    for (auto &t : tokenize(text)) EXPECT_EQ(text.substr(t.start, t.end - t.start), t.text);
}

TEST(TextUtil, FnvIsStable) {
    EXPECT_EQ(fnv1a_64(""), 1469598103934665603ULL);
    EXPECT_EQ(fnv1a_64("abc"), fnv1a_64("abc"));
    EXPECT_NE(fnv1a_64("abc"), fnv1a_64("abd"));
}

#include "ztredact/pattern_rules.h"

#include <gtest/gtest.h>

using namespace ztredact;

TEST(Validators, Iban) {
    EXPECT_TRUE(valid_iban("DE89 3704 0044 0532 0130 00"));
    EXPECT_TRUE(valid_iban("DE89370400440532013000"));
    EXPECT_FALSE(valid_iban("DE89 3704 0044 0532 0130 01"));
    EXPECT_FALSE(valid_iban("DE89"));
}

TEST(Validators, TaxId) {
    EXPECT_TRUE(valid_tax_id("86095742719"));
    EXPECT_TRUE(valid_tax_id("65929970489"));
    EXPECT_TRUE(valid_tax_id("57 549 285 017"));
    EXPECT_FALSE(valid_tax_id("86095742718"));   // check digit
    EXPECT_FALSE(valid_tax_id("12345678903"));   // no repeated digit
    EXPECT_FALSE(valid_tax_id("06095742719"));   // leading zero
}

TEST(Validators, IdCard) {
    EXPECT_TRUE(valid_id_card("T220001293"));
    EXPECT_TRUE(valid_id_card("L01X00T471"));
    EXPECT_FALSE(valid_id_card("T220001294"));
    EXPECT_FALSE(valid_id_card("T22000129"));
}

TEST(Validators, CaseNumber) {
    EXPECT_TRUE(valid_case_number("12 O 345/23"));
    EXPECT_TRUE(valid_case_number("3 Ca 1234/2022"));
    EXPECT_FALSE(valid_case_number("12 Q 345/23"));     // unknown register
    EXPECT_FALSE(valid_case_number("12 O 345/223"));
}

TEST(Validators, Date) {
    EXPECT_TRUE(valid_date("01.01.1980"));
    EXPECT_TRUE(valid_date("29.02.2024"));
    EXPECT_FALSE(valid_date("29.02.2023"));
    EXPECT_FALSE(valid_date("31.04.2020"));
    EXPECT_TRUE(valid_date("1980-01-01"));
    EXPECT_TRUE(valid_date("1. Januar 1980"));
    EXPECT_TRUE(valid_date("3. März 2021"));
}

TEST(Validators, Misc) {
    EXPECT_TRUE(valid_email("max.mustermann@example.de"));
    EXPECT_FALSE(valid_email("max..mustermann@example.de"));
    EXPECT_FALSE(valid_email("max@example"));
    EXPECT_TRUE(valid_phone("030 12345678"));
    EXPECT_FALSE(valid_phone("000 0000000"));
    EXPECT_TRUE(valid_postal_code("10115"));
    EXPECT_FALSE(valid_postal_code("00999"));
    EXPECT_TRUE(valid_street_address("Hauptstraße 5"));
    EXPECT_FALSE(valid_street_address("Hauptstraße 0"));
    EXPECT_TRUE(valid_amount("1.234,56 EUR"));
    EXPECT_FALSE(valid_amount("0,00 EUR"));
}

TEST(ContextKeywords, ShortKeywordsNeedWholeWord) {
    std::string text = "Termin am 01.02.2020";
    TextSpan span{10, 20};
    EXPECT_TRUE(has_context_keyword(text, span, 48, {"am"}));
    // "am" inside "Programm" does not count
    std::string text2 = "Programm 01.02.2020";
    EXPECT_FALSE(has_context_keyword(text2, TextSpan{9, 19}, 48, {"am"}));
}

TEST(ContextKeywords, LongKeywordsArePrefixes) {
    std::string text = "Steuerliche Identifikationsnummer 86095742719";
    TextSpan span{34, 45};
    EXPECT_TRUE(has_context_keyword(text, span, 48, {"steuer"}));
    EXPECT_FALSE(has_context_keyword(text, span, 5, {"steuer"}));
}

TEST(ScanPatterns, ContextIsOptional) {
    std::string text = "Nummer DE89 3704 0044 0532 0130 00";
    auto with = scan_patterns(text, default_pattern_rules(), true, 48);
    auto without = scan_patterns(text, default_pattern_rules(), false, 0);
    bool iban_with = false, iban_without = false;
    for (auto &m : with) iban_with = iban_with || m.rule->kind == EntityKind::IBAN;
    for (auto &m : without) iban_without = iban_without || m.rule->kind == EntityKind::IBAN;
    EXPECT_FALSE(iban_with);
    EXPECT_TRUE(iban_without);
}

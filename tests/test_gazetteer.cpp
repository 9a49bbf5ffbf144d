#include "ztredact/errors.h"
#include "ztredact/gazetteer.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace ztredact;
using ztredact::test_support::TempFile;

TEST(Gazetteer, AddNormalisesAndDeduplicates) {
    Gazetteer g;
    g.add("  Max   Mustermann ");
    g.add("Max Mustermann");
    g.add("Max Mustermann", EntityKind::ORG);
    g.add("   ");
    ASSERT_EQ(g.entries().size(), 2u);
    EXPECT_EQ(g.entries()[0].value, "Max Mustermann");
    EXPECT_EQ(g.entries()[0].kind, EntityKind::PERSON);
    EXPECT_EQ(g.entries()[1].kind, EntityKind::ORG);
}

TEST(Gazetteer, MergeKeepsUniqueEntries) {
    Gazetteer a, b;
    a.add("Max Mustermann");
    b.add("Max Mustermann");
    b.add("Berlin", EntityKind::LOCATION);
    a.merge(b);
    EXPECT_EQ(a.entries().size(), 2u);
}

TEST(Gazetteer, LoadsJson) {
    TempFile f("gazetteer.json");
    f.write(R"([ "Max Mustermann", {"value": "Musterstadt", "kind": "LOCATION"}, {"value": "ACME GmbH", "kind": "org"} ])");
    Gazetteer g = Gazetteer::load(f.path());
    ASSERT_EQ(g.entries().size(), 3u);
    EXPECT_EQ(g.entries()[0].kind, EntityKind::PERSON);
    EXPECT_EQ(g.entries()[1].kind, EntityKind::LOCATION);
    EXPECT_EQ(g.entries()[2].kind, EntityKind::ORG);
}

TEST(Gazetteer, LoadsText) {
    TempFile f("gazetteer.txt");
    f.write("# parties\nMax Mustermann\nLOCATION\tMusterstadt\n\n  Erika Musterfrau  \n");
    Gazetteer g = Gazetteer::load(f.path());
    ASSERT_EQ(g.entries().size(), 3u);
    EXPECT_EQ(g.entries()[1].value, "Musterstadt");
    EXPECT_EQ(g.entries()[1].kind, EntityKind::LOCATION);
    EXPECT_EQ(g.entries()[2].value, "Erika Musterfrau");
}

TEST(Gazetteer, RejectsBadInput) {
    TempFile bad_kind("gazetteer_bad_kind.txt");
    bad_kind.write("PLANET\tMars\n");
    EXPECT_THROW(Gazetteer::load(bad_kind.path()), ConfigError);

    TempFile bad_json("gazetteer_bad.json");
    bad_json.write("[ {\"kind\": \"PERSON\"} ]");
    EXPECT_THROW(Gazetteer::load(bad_json.path()), ConfigError);

    EXPECT_THROW(Gazetteer::load("/nonexistent/ztredact/gazetteer.json"), ConfigError);
}

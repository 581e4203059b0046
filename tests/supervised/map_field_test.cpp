// File: tests/supervised/map_field_test.cpp
#include "supervised/map_field.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace resonance;

TEST(MapFieldTest, EmptyByDefault) {
    MapField field;
    EXPECT_TRUE(field.IsEmpty());
    EXPECT_FALSE(field.Lookup(0).has_value());
    EXPECT_FALSE(field.Contains(0));
    EXPECT_EQ(0u, field.GetReinforcementCount(0));
}

TEST(MapFieldTest, AssociateAndLookup) {
    MapField field;
    EXPECT_TRUE(field.Associate(0, 7));
    EXPECT_TRUE(field.Associate(3, 7));
    EXPECT_TRUE(field.Associate(1, 9));

    ASSERT_TRUE(field.Lookup(3).has_value());
    EXPECT_EQ(7u, *field.Lookup(3));
    EXPECT_EQ(3u, field.Size());
    EXPECT_EQ(2u, field.TargetCount());
}

TEST(MapFieldTest, SameAssociationIsIdempotent) {
    MapField field;
    field.Associate(2, 5);
    EXPECT_FALSE(field.Associate(2, 5));
    EXPECT_EQ(1u, field.Size());
}

TEST(MapFieldTest, RemappingIsRejected) {
    MapField field;
    field.Associate(2, 5);
    EXPECT_THROW(field.Associate(2, 6), std::logic_error);
    EXPECT_EQ(5u, *field.Lookup(2));
    EXPECT_TRUE(field.GetSources(6).empty());
}

TEST(MapFieldTest, InverseListsSourcesInOrder) {
    MapField field;
    field.Associate(4, 1);
    field.Associate(0, 1);
    field.Associate(2, 1);
    field.Associate(3, 2);

    std::vector<CategoryIndex> expected{0, 2, 4};
    EXPECT_EQ(expected, field.GetSources(1));
    EXPECT_TRUE(field.GetSources(99).empty());
}

TEST(MapFieldTest, ReinforcementCounts) {
    MapField field;
    field.Associate(1, 1);
    field.Reinforce(1);
    field.Reinforce(1);
    EXPECT_EQ(2u, field.GetReinforcementCount(1));
    EXPECT_THROW(field.Reinforce(8), std::out_of_range);
}

TEST(MapFieldTest, EntriesAreSortedBySource) {
    MapField field;
    field.Associate(5, 50);
    field.Associate(1, 10);
    field.Associate(3, 30);

    auto entries = field.Entries();
    ASSERT_EQ(3u, entries.size());
    EXPECT_EQ(1u, entries[0].first);
    EXPECT_EQ(10u, entries[0].second);
    EXPECT_EQ(5u, entries[2].first);
}

TEST(MapFieldTest, ClearRemovesBothDirections) {
    MapField field;
    field.Associate(1, 1);
    field.Clear();
    EXPECT_TRUE(field.IsEmpty());
    EXPECT_TRUE(field.GetSources(1).empty());
    EXPECT_TRUE(field.Associate(1, 2));
}

TEST(MapFieldTest, RemapRenumbersAndDropsRemovedSources) {
    MapField field;
    field.Associate(0, 7);
    field.Associate(1, 8);
    field.Associate(2, 9);
    field.Reinforce(2);
    field.Reinforce(2);

    size_t dropped = field.Remap({0, kNoCategory, 1});

    EXPECT_EQ(1u, dropped);
    EXPECT_EQ(2u, field.Size());
    EXPECT_EQ(7u, *field.Lookup(0));
    EXPECT_EQ(9u, *field.Lookup(1));
    EXPECT_FALSE(field.Lookup(2).has_value());
    EXPECT_EQ(2u, field.GetReinforcementCount(1));
    EXPECT_TRUE(field.GetSources(8).empty());
    EXPECT_EQ(2u, field.TargetCount());
    EXPECT_EQ(std::vector<CategoryIndex>{1}, field.GetSources(9));
}

TEST(MapFieldTest, RemapRejectsSourceOutsideRemap) {
    MapField field;
    field.Associate(3, 1);
    EXPECT_THROW(field.Remap({0, 1}), std::out_of_range);
    EXPECT_EQ(1u, *field.Lookup(3));
}

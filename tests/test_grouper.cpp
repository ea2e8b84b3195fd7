#include <gtest/gtest.h>
#include "fixtures.hpp"
#include "prune/duplicate_grouper.hpp"

#include <algorithm>

using namespace profprune;
using namespace profprune::fixtures;

TEST(GrouperTest, SharedPathFormsOneGroup) {
    std::vector<ProfileEntry> entries = {
        makeEntry(DOMAIN_A + "-1001", "C:\\Users\\bob"),
        makeEntry(DOMAIN_B + "-1001", "C:\\Users\\bob"),
    };

    DuplicateGrouper grouper;
    auto groups = grouper.group(entries);
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups[0].image_path, "C:\\Users\\bob");
    ASSERT_EQ(groups[0].size(), 2);
    EXPECT_EQ(groups[0].members[0].identity, DOMAIN_A + "-1001");
    EXPECT_EQ(groups[0].members[1].identity, DOMAIN_B + "-1001");
}

TEST(GrouperTest, DistinctPathsYieldNoGroups) {
    std::vector<ProfileEntry> entries = {
        makeEntry(DOMAIN_A + "-1001", "C:\\Users\\bob"),
        makeEntry(DOMAIN_A + "-1002", "C:\\Users\\alice"),
    };
    DuplicateGrouper grouper;
    EXPECT_TRUE(grouper.group(entries).empty());
    EXPECT_TRUE(grouper.group({}).empty());
}

TEST(GrouperTest, MissingImagePathIsNeverGrouped) {
    std::vector<ProfileEntry> entries = {
        makeEntry(DOMAIN_A + "-1001", ""),
        makeEntry(DOMAIN_B + "-1001", ""),
        makeEntry(DOMAIN_B + "-1002", "C:\\Users\\bob"),
    };
    DuplicateGrouper grouper;
    EXPECT_FALSE(grouper.isGroupable(entries[0]));
    EXPECT_TRUE(grouper.isStandard(entries[0]));
    EXPECT_TRUE(grouper.group(entries).empty());
}

TEST(GrouperTest, PathComparisonIgnoresCase) {
    std::vector<ProfileEntry> entries = {
        makeEntry(DOMAIN_A + "-1001", "C:\\Users\\Bob"),
        makeEntry(DOMAIN_B + "-1001", "c:\\users\\BOB"),
    };
    DuplicateGrouper grouper;
    auto groups = grouper.group(entries);
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups[0].image_path, "C:\\Users\\Bob");  // first spelling wins
}

TEST(GrouperTest, SpecialIdentitiesNeverGrouped) {
    std::vector<ProfileEntry> entries = {
        makeEntry("S-1-5-18", "C:\\Users\\shared"),
        makeEntry(DOMAIN_A + "-1001.bak", "C:\\Users\\shared"),
        makeEntry(DOMAIN_A + "-1001", "C:\\Users\\shared"),
    };
    DuplicateGrouper grouper;
    // Only one standard member remains for the path.
    EXPECT_TRUE(grouper.group(entries).empty());
}

TEST(GrouperTest, GroupOrderFollowsFirstSeen) {
    std::vector<ProfileEntry> entries = {
        makeEntry(DOMAIN_A + "-1001", "C:\\Users\\zed"),
        makeEntry(DOMAIN_A + "-1002", "C:\\Users\\amy"),
        makeEntry(DOMAIN_B + "-1002", "C:\\Users\\amy"),
        makeEntry(DOMAIN_B + "-1001", "C:\\Users\\zed"),
        makeEntry(DOMAIN_C + "-1001", "C:\\Users\\zed"),
        makeEntry(DOMAIN_C + "-1009", "C:\\Users\\solo"),
    };
    DuplicateGrouper grouper;
    auto groups = grouper.group(entries);
    ASSERT_EQ(groups.size(), 2);
    EXPECT_EQ(groups[0].image_path, "C:\\Users\\zed");
    ASSERT_EQ(groups[0].size(), 3);
    EXPECT_EQ(groups[0].members[2].identity, DOMAIN_C + "-1001");
    EXPECT_EQ(groups[1].image_path, "C:\\Users\\amy");
    EXPECT_EQ(groups[1].size(), 2);
}

TEST(GrouperTest, GroupedEntriesAreExactlyTheSharedOnes) {
    std::vector<ProfileEntry> entries = {
        makeEntry(DOMAIN_A + "-1", "p1"),
        makeEntry(DOMAIN_A + "-2", "p2"),
        makeEntry(DOMAIN_A + "-3", "p1"),
        makeEntry(DOMAIN_A + "-4", "p3"),
        makeEntry(DOMAIN_A + "-5", "p2"),
        makeEntry(DOMAIN_A + "-6", "p4"),
    };
    DuplicateGrouper grouper;
    auto groups = grouper.group(entries);

    std::vector<std::string> grouped;
    for (const auto& g : groups) {
        for (const auto& m : g.members) grouped.push_back(m.identity);
    }
    std::sort(grouped.begin(), grouped.end());
    std::vector<std::string> expected = {
        DOMAIN_A + "-1", DOMAIN_A + "-2", DOMAIN_A + "-3", DOMAIN_A + "-5"};
    EXPECT_EQ(grouped, expected);

    // One representative per group has a unique path: nothing regroups.
    std::vector<ProfileEntry> representatives;
    for (const auto& g : groups) representatives.push_back(g.members.front());
    EXPECT_TRUE(grouper.group(representatives).empty());
}

#include <gtest/gtest.h>
#include "fixtures.hpp"
#include "profile/profile_repository.hpp"

using namespace profprune;
using namespace profprune::fixtures;

TEST(RepositoryTest, LoadsEntriesInEnumerationOrder) {
    MemoryStore store;
    addProfile(store, DOMAIN_B + "-1001", "C:\\Users\\bob", "{B}");
    addProfile(store, DOMAIN_A + "-1001", "C:\\Users\\bob", "{A}");
    addProfile(store, "S-1-5-18", "C:\\Windows\\system32\\config\\systemprofile");

    ProfileRepository repo(store);
    auto entries = repo.loadEntries();
    ASSERT_EQ(entries.size(), 3);

    EXPECT_EQ(entries[0].identity, "S-1-5-18");
    EXPECT_TRUE(entries[0].correlation_id.empty());
    EXPECT_EQ(entries[1].identity, DOMAIN_A + "-1001");
    EXPECT_EQ(entries[1].image_path, "C:\\Users\\bob");
    EXPECT_EQ(entries[1].correlation_id, "{A}");
    EXPECT_EQ(entries[1].location, repo.config().primary_root + "/" + DOMAIN_A + "-1001");
}

TEST(RepositoryTest, MissingPrimaryRootThrows) {
    MemoryStore store;
    ProfileRepository repo(store);
    EXPECT_THROW(repo.loadEntries(), StoreError);
}

TEST(RepositoryTest, SecondaryLookup) {
    MemoryStore store;
    addProfile(store, DOMAIN_A + "-1001", "C:\\Users\\a", "{A}");
    addProfile(store, DOMAIN_A + "-1002", "C:\\Users\\b", "{ORPHAN}", false);

    ProfileRepository repo(store);
    EXPECT_TRUE(repo.secondaryExists("{A}"));
    EXPECT_FALSE(repo.secondaryExists("{ORPHAN}"));
    EXPECT_FALSE(repo.secondaryExists(""));
    EXPECT_EQ(repo.secondaryPath("{A}"), repo.config().secondary_root + "/{A}");
}

TEST(RepositoryTest, PathLikeCorrelationIdsAreRejected) {
    MemoryStore store;
    RepositoryConfig cfg;
    store.setValue(KeyPath::child(cfg.secondary_root, "{A}"), "SidString", "x");
    store.setValue(KeyPath::child(cfg.secondary_root, "{A}/nested"), "SidString", "y");
    ProfileRepository repo(store, cfg);

    EXPECT_TRUE(ProfileRepository::isValidCorrelationId("{A}"));
    for (const std::string& id : {"", "/", "//", "{A}/", "/{A}", "{A}/nested", ".", ".."}) {
        EXPECT_FALSE(ProfileRepository::isValidCorrelationId(id)) << id;
        EXPECT_FALSE(repo.secondaryExists(id)) << id;
    }
}

TEST(RepositoryTest, CustomRootsAndValueNames) {
    RepositoryConfig cfg;
    cfg.primary_root = "profiles/list";
    cfg.secondary_root = "profiles/guid";
    cfg.image_path_value = "Home";
    cfg.correlation_value = "Id";

    MemoryStore store;
    addProfile(store, DOMAIN_C + "-500", "/home/admin", "g1", true, cfg);

    ProfileRepository repo(store, cfg);
    auto entries = repo.loadEntries();
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].image_path, "/home/admin");
    EXPECT_EQ(entries[0].correlation_id, "g1");
    EXPECT_EQ(entries[0].location, "profiles/list/" + DOMAIN_C + "-500");
    EXPECT_TRUE(repo.secondaryExists("g1"));
}

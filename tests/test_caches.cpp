#include "cache_fixture.hpp"
#include <cache/registry_caches.hpp>

// ── Layout ──────────────────────────────────────────────────

TEST(CachePathsTest, MissingRootFails) {
    auto r = CachePaths::from_root("/nonexistent/cratecache/root");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CacheRootMissing);
}

TEST_F(CacheFixture, PathsDerivedFromRoot) {
    auto p = paths();
    EXPECT_EQ(p.bin, root / "bin");
    EXPECT_EQ(p.registry_index, root / "registry" / "index");
    EXPECT_EQ(p.registry_cache, root / "registry" / "cache");
    EXPECT_EQ(p.registry_sources, root / "registry" / "src");
    EXPECT_EQ(p.git_db, root / "git" / "db");
    EXPECT_EQ(p.git_checkouts, root / "git" / "checkouts");
}

// ── Registry dir names ──────────────────────────────────────

TEST(RegistryNames, NameIsEverythingBeforeLastDash) {
    EXPECT_EQ(registry_name_of("github.com-1ecc6299db9ec823"), "github.com");
    EXPECT_EQ(registry_name_of("my-mirror-abcdef"), "my-mirror");
    EXPECT_EQ(registry_name_of("nodash"), "");
}

TEST(RegistryNames, Pattern) {
    EXPECT_TRUE(is_registry_dir_name("index.crates.io-6f17d22bba15001f"));
    EXPECT_FALSE(is_registry_dir_name("nodash"));
    EXPECT_FALSE(is_registry_dir_name("-abc"));
    EXPECT_FALSE(is_registry_dir_name("abc-"));
}

// ── Aggregates ──────────────────────────────────────────────

TEST_F(CacheFixture, MissingComponentsAreEmpty) {
    auto inv = inventory();
    for (auto kind : all_components()) {
        EXPECT_EQ(inv->component(kind).total_size(), 0u) << component_name(kind);
        EXPECT_TRUE(inv->component(kind).items().empty()) << component_name(kind);
    }
    EXPECT_EQ(inv->total_size(), 0u);
}

TEST_F(CacheFixture, BinaryItemsAreFiles) {
    write_file("bin/cargo-cache", 10);
    write_file("bin/rg", 20);
    auto inv = inventory();
    EXPECT_EQ(inv->bin().number_of_items(), 2u);
    EXPECT_EQ(inv->bin().total_size(), 30u);
}

TEST_F(CacheFixture, SymlinksAreItemsButCarryNoSize) {
    write_file("bin/cargo-cache", 100);
    make_dir("bin");
    fs::create_symlink(root / "bin/cargo-cache", root / "bin/cc");
    write_file("registry/src/reg-abcd/a-1.0.0/src/lib.rs", 40);
    fs::create_symlink("lib.rs", root / "registry/src/reg-abcd/a-1.0.0/src/alias.rs");
    auto inv = inventory();

    EXPECT_EQ(inv->bin().number_of_items(), 2u);
    EXPECT_EQ(inv->bin().total_size(), 100u);
    EXPECT_EQ(inv->registry_sources().total_size(), 40u);
    EXPECT_EQ(inv->total_size(), 140u);
}

TEST_F(CacheFixture, GitItemUnits) {
    write_file("git/db/serde-1234/HEAD", 5);
    write_file("git/db/serde-1234/objects/pack/a.pack", 100);
    write_file("git/checkouts/serde-1234/abc123/Cargo.toml", 7);
    write_file("git/checkouts/serde-1234/def456/Cargo.toml", 8);
    auto inv = inventory();

    EXPECT_EQ(inv->git_repos().number_of_items(), 1u);
    EXPECT_EQ(inv->git_repos().total_size(), 105u);
    EXPECT_EQ(inv->git_checkouts().number_of_items(), 2u);
    EXPECT_EQ(inv->git_checkouts().items_sorted().front(),
              root / "git/checkouts/serde-1234/abc123");
}

TEST_F(CacheFixture, RegistrySuperCacheSumsSubCaches) {
    write_file("registry/cache/github.com-1ecc/a-1.0.0.crate", 10);
    write_file("registry/cache/github.com-1ecc/b-1.0.0.crate", 20);
    write_file("registry/cache/mirror-9f9f/a-1.0.0.crate", 30);
    write_file("registry/src/github.com-1ecc/a-1.0.0/src/lib.rs", 40);
    write_file("registry/src/github.com-1ecc/a-1.0.0/Cargo.toml", 2);
    auto inv = inventory();

    auto& archives = inv->registry_archives();
    EXPECT_EQ(archives.number_of_subcaches(), 2u);
    EXPECT_EQ(archives.number_of_items(), 3u);
    EXPECT_EQ(archives.total_size(), 60u);
    EXPECT_EQ(archives.caches()[0].name(), "github.com");
    EXPECT_EQ(archives.caches()[1].name(), "mirror");

    auto& sources = inv->registry_sources();
    EXPECT_EQ(sources.number_of_items(), 1u);
    EXPECT_EQ(sources.total_number_of_files(), 2u);
    EXPECT_EQ(sources.total_size(), 42u);

    EXPECT_EQ(inv->total_size(), 102u);
}

TEST_F(CacheFixture, RegistryDirsWithoutDashAreSkipped) {
    write_file("registry/cache/stray/x-1.0.0.crate", 10);
    write_file("registry/cache/reg-abcd/y-1.0.0.crate", 5);
    auto inv = inventory();
    EXPECT_EQ(inv->registry_archives().number_of_subcaches(), 1u);
    EXPECT_EQ(inv->registry_archives().total_size(), 5u);
}

TEST_F(CacheFixture, MemoizedUntilInvalidated) {
    write_file("bin/a", 10);
    auto inv = inventory();
    EXPECT_EQ(inv->bin().total_size(), 10u);

    write_file("bin/b", 5);
    EXPECT_EQ(inv->bin().total_size(), 10u);

    inv->bin().invalidate();
    EXPECT_EQ(inv->bin().total_size(), 15u);
    EXPECT_EQ(inv->bin().number_of_items(), 2u);
}

TEST_F(CacheFixture, SuperCacheInvalidateRediscoversRegistries) {
    write_file("registry/index/reg-1111/config.json", 3);
    auto inv = inventory();
    EXPECT_EQ(inv->registry_index().number_of_subcaches(), 1u);

    write_file("registry/index/other-2222/config.json", 4);
    inv->registry_index().invalidate();
    EXPECT_EQ(inv->registry_index().number_of_subcaches(), 2u);
    EXPECT_EQ(inv->registry_index().total_size(), 7u);
}

TEST_F(CacheFixture, KnownToBeEmptySkipsDisk) {
    write_file("bin/a", 10);
    auto inv = inventory();
    inv->bin().known_to_be_empty();
    EXPECT_EQ(inv->bin().total_size(), 0u);
    EXPECT_TRUE(inv->bin().files().empty());
}

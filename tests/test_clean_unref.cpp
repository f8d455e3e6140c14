#include "cache_fixture.hpp"
#include <managers/clean_unref.hpp>

namespace {

// Stands in for `cargo metadata`.
class FakeResolver : public ManifestResolver {
public:
    ResolvedManifest answer;
    bool fail = false;
    int calls = 0;

    Result<ResolvedManifest> resolve(const fs::path&) override {
        calls++;
        if (fail) {
            return Result<ResolvedManifest>::Err(ErrorKind::UnparsableManifest, "broken manifest");
        }
        return Result<ResolvedManifest>::Ok(answer);
    }
};

} // namespace

// ── Source mapping ──────────────────────────────────────────

TEST_F(CacheFixture, RequiredSourceForCheckout) {
    auto r = required_source_for(paths(), root / "git/checkouts/serde-1234/abc/Cargo.toml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, root / "git/db/serde-1234");
}

TEST_F(CacheFixture, RequiredSourceForRegistrySource) {
    auto r = required_source_for(paths(),
                                 root / "registry/src/reg-abcd/used-1.0.0/Cargo.toml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, root / "registry/cache/reg-abcd/used-1.0.0.crate");
}

TEST_F(CacheFixture, RequiredSourceOutsideRootIsEmpty) {
    auto r = required_source_for(paths(), "/somewhere/else/Cargo.toml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST_F(CacheFixture, RequiredSourceSiblingWithSharedPrefixIsEmpty) {
    fs::path sibling = root.parent_path() / (root.filename().string() + "_project");
    auto r = required_source_for(paths(), sibling / "Cargo.toml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.empty());
}

TEST_F(CacheFixture, RequiredSourceUnknownLayoutFails) {
    auto r = required_source_for(paths(), root / "bin/Cargo.toml");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnknownSourcePath);
}

// ── Operator ────────────────────────────────────────────────

class CleanUnref : public CacheFixture {
protected:
    FakeResolver resolver;
    // The workspace being cleaned for lives beside the cargo home.
    fs::path project;
    fs::path manifest;

    void SetUp() override {
        CacheFixture::SetUp();
        project = root.parent_path() / (root.filename().string() + "_project");
        manifest = project / "Cargo.toml";
        fs::create_directories(project);
        std::ofstream(manifest) << "[package]\n";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(project, ec);
        CacheFixture::TearDown();
    }

    void seed() {
        write_file("registry/cache/reg-abcd/used-1.0.0.crate", 10);
        write_file("registry/cache/reg-abcd/unused-1.0.0.crate", 20);
        write_file("registry/src/reg-abcd/used-1.0.0/Cargo.toml", 5);
        write_file("git/db/kept-1111/HEAD", 3);
        write_file("git/db/dropped-2222/HEAD", 4);
        write_file("git/checkouts/kept-1111/abc/Cargo.toml", 6);

        resolver.answer.package_manifests = {
            root / "registry/src/reg-abcd/used-1.0.0/Cargo.toml",
            root / "git/checkouts/kept-1111/abc/Cargo.toml",
            manifest,
        };
    }
};

TEST_F(CleanUnref, RemovesUnreferencedAndRegenerable) {
    seed();
    auto inv = inventory();
    auto r = clean_unref(*inv, resolver, manifest, false, nullptr);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.ok());

    EXPECT_FALSE(exists(root / "registry/src"));
    EXPECT_FALSE(exists(root / "git/checkouts"));
    EXPECT_FALSE(exists(root / "registry/cache/reg-abcd/unused-1.0.0.crate"));
    EXPECT_FALSE(exists(root / "git/db/dropped-2222"));
    EXPECT_TRUE(exists(root / "registry/cache/reg-abcd/used-1.0.0.crate"));
    EXPECT_TRUE(exists(root / "git/db/kept-1111/HEAD"));
    EXPECT_TRUE(exists(manifest));

    EXPECT_EQ(inv->registry_sources().total_size(), 0u);
    EXPECT_EQ(inv->registry_archives().total_size(), 10u);
    EXPECT_EQ(inv->git_repos().number_of_items(), 1u);
}

TEST_F(CleanUnref, PlanRecordsReferences) {
    seed();
    auto inv = inventory();
    auto planned = plan_clean_unref(*inv, resolver.answer.package_manifests);
    ASSERT_TRUE(planned.is_ok()) << planned.error;
    EXPECT_EQ(planned.value.referenced_archives.size(), 1u);
    EXPECT_EQ(planned.value.referenced_repos.size(), 1u);
    // checkouts, sources, one repo, one archive
    EXPECT_EQ(planned.value.plan.size(), 4u);
}

TEST_F(CleanUnref, ResolverFailureLeavesCacheAlone) {
    seed();
    resolver.fail = true;
    auto inv = inventory();
    auto r = clean_unref(*inv, resolver, manifest, false, nullptr);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnparsableManifest);
    EXPECT_TRUE(exists(root / "registry/cache/reg-abcd/unused-1.0.0.crate"));
}

TEST_F(CleanUnref, UnknownSourceAbortsBeforeRemoval) {
    seed();
    resolver.answer.package_manifests.push_back(root / "registry/index/reg-abcd/Cargo.toml");
    auto inv = inventory();
    auto r = clean_unref(*inv, resolver, manifest, false, nullptr);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnknownSourcePath);
    EXPECT_TRUE(exists(root / "registry/src"));
    EXPECT_TRUE(exists(root / "git/db/dropped-2222"));
}

TEST_F(CleanUnref, DryRunKeepsEverything) {
    seed();
    auto inv = inventory();
    auto r = clean_unref(*inv, resolver, manifest, true, nullptr);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.removed, 4u);
    EXPECT_TRUE(exists(root / "registry/cache/reg-abcd/unused-1.0.0.crate"));
    EXPECT_TRUE(exists(root / "git/checkouts"));
}

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// What the package manager reports about a project.
struct ResolvedManifest {
    std::vector<fs::path> package_manifests;   // every dependency's Cargo.toml
    fs::path target_directory;
    fs::path workspace_root;
};

// Resolves a project manifest into its full dependency closure
// (all features enabled).
class ManifestResolver {
public:
    virtual ~ManifestResolver() = default;
    virtual Result<ResolvedManifest> resolve(const fs::path& manifest) = 0;
};

// Runs `<cargo> metadata --format-version 1 --all-features --manifest-path <P>`.
class CargoMetadataResolver : public ManifestResolver {
public:
    explicit CargoMetadataResolver(std::string cargo_program);

    Result<ResolvedManifest> resolve(const fs::path& manifest) override;

private:
    std::string cargo_program_;
};

// Parse the JSON printed by `cargo metadata --format-version 1`.
Result<ResolvedManifest> parse_metadata_json(const std::string& json);

// Walk upward from `start` until a directory holding Cargo.toml is found.
// Fails with NoCargoManifest.
Result<fs::path> find_manifest(const fs::path& start);

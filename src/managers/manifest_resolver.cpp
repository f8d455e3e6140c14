#include "manifest_resolver.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

CargoMetadataResolver::CargoMetadataResolver(std::string cargo_program)
    : cargo_program_(std::move(cargo_program)) {}

Result<ResolvedManifest> CargoMetadataResolver::resolve(const fs::path& manifest) {
    auto result = platform::run_capture(cargo_program_, {
        "metadata", "--format-version", "1", "--all-features",
        "--manifest-path", manifest.string(),
    });

    if (result.failed()) {
        std::string err = result.stderr_data;
        trim(err);
        return Result<ResolvedManifest>::Err(ErrorKind::UnparsableManifest,
            fmt::format("failed to parse manifest '{}': {}", manifest.string(),
                        err.empty() ? "cargo metadata failed" : err));
    }

    auto parsed = parse_metadata_json(result.stdout_data);
    if (parsed.is_ok()) {
        cc_log(fmt::format("metadata: {} package manifest(s) for {}",
                           parsed.value.package_manifests.size(), manifest.string()));
    }
    return parsed;
}

// JSON is a flow-style YAML document, so yaml-cpp reads it directly.
Result<ResolvedManifest> parse_metadata_json(const std::string& json) {
    try {
        YAML::Node root = YAML::Load(json);
        if (!root.IsMap() || !root["packages"] || !root["packages"].IsSequence()) {
            return Result<ResolvedManifest>::Err(ErrorKind::UnparsableManifest,
                "metadata has no package list");
        }

        ResolvedManifest resolved;
        for (const auto& pkg : root["packages"]) {
            std::string path = pkg["manifest_path"].as<std::string>("");
            if (!path.empty()) resolved.package_manifests.emplace_back(path);
        }
        resolved.target_directory = root["target_directory"].as<std::string>("");
        resolved.workspace_root = root["workspace_root"].as<std::string>("");

        return Result<ResolvedManifest>::Ok(resolved);
    } catch (const YAML::Exception& e) {
        return Result<ResolvedManifest>::Err(ErrorKind::UnparsableManifest,
            std::string("failed to parse metadata: ") + e.what());
    }
}

Result<fs::path> find_manifest(const fs::path& start) {
    fs::path dir = start;
    while (true) {
        fs::path candidate = dir / MANIFEST_FILE_NAME;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) return Result<fs::path>::Ok(candidate);

        fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) break;
        dir = parent;
    }
    return Result<fs::path>::Err(ErrorKind::NoCargoManifest,
        fmt::format("could not find {} in '{}' or any parent directory",
                    MANIFEST_FILE_NAME, start.string()));
}

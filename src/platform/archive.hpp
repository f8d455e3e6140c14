#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// One regular-file entry of an archive.
struct ArchiveEntry {
    std::string path;   // path inside the archive, e.g. "serde-1.0.0/src/lib.rs"
    uint64_t size;      // declared uncompressed size
};

// List the regular-file entries of a (gzipped) tar archive.
// Directory and link entries are skipped.
Result<std::vector<ArchiveEntry>> list_archive(const std::filesystem::path& archive_path);

// Write a gzipped tar archive at tar_path holding the given files, each a
// path relative to base_dir and stored under that name. Files that are not
// regular files are skipped.
Result<void> create_tar_gz(const std::filesystem::path& tar_path,
                           const std::filesystem::path& base_dir,
                           const std::vector<std::string>& files);

} // namespace platform

#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace platform {

Result<std::vector<ArchiveEntry>> list_archive(const fs::path& archive_path) {
    using R = Result<std::vector<ArchiveEntry>>;

    struct archive* a = archive_read_new();
    if (!a) return R::Err(ErrorKind::VerificationFailed, "Failed to create archive reader");

    archive_read_support_filter_all(a);
    archive_read_support_format_tar(a);

    if (archive_read_open_filename(a, archive_path.string().c_str(), 16384) != ARCHIVE_OK) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        return R::Err(ErrorKind::VerificationFailed,
                      fmt::format("Failed to open archive {}: {}", archive_path.string(), err));
    }

    std::vector<ArchiveEntry> entries;
    struct archive_entry* entry = nullptr;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
        if (archive_entry_filetype(entry) == AE_IFREG) {
            const char* name = archive_entry_pathname(entry);
            if (name) {
                entries.push_back({name, static_cast<uint64_t>(archive_entry_size(entry))});
            }
        }
        archive_read_data_skip(a);
    }

    if (rc != ARCHIVE_EOF) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        return R::Err(ErrorKind::VerificationFailed,
                      fmt::format("Failed to read archive {}: {}", archive_path.string(), err));
    }

    archive_read_close(a);
    archive_read_free(a);
    return R::Ok(std::move(entries));
}

Result<void> create_tar_gz(const fs::path& tar_path,
                           const fs::path& base_dir,
                           const std::vector<std::string>& files) {
    struct archive* a = archive_write_new();
    if (!a) return Result<void>::Err(ErrorKind::VerificationFailed, "Failed to create archive writer");

    auto fail = [&](const std::string& what) {
        const char* err = archive_error_string(a);
        std::string msg = fmt::format("{} {}: {}", what, tar_path.string(), err ? err : "unknown error");
        archive_write_free(a);
        return Result<void>::Err(ErrorKind::VerificationFailed, msg);
    };

    archive_write_add_filter_gzip(a);
    archive_write_set_format_ustar(a);
    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        return fail("Failed to open");
    }

    for (const auto& rel : files) {
        fs::path full = base_dir / rel;
        std::error_code ec;
        if (!fs::is_regular_file(full, ec)) continue;

        std::ifstream in(full, std::ios::binary);
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, rel.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        int rc = archive_write_header(a, entry);
        archive_entry_free(entry);
        if (rc != ARCHIVE_OK) return fail("Failed to add " + rel + " to");

        if (!data.empty() &&
            archive_write_data(a, data.data(), data.size()) < 0) {
            return fail("Failed to write " + rel + " to");
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) return fail("Failed to finish");
    archive_write_free(a);
    return Result<void>::Ok();
}

} // namespace platform

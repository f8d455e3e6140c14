#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

enum class RemoveOutcome {
    Removed,
    NotFound,
};

// Delete a directory and everything below it.
//
// Every operation is relative to a held directory descriptor (openat,
// unlinkat), so swapping an interior path component for a symlink cannot
// redirect the deletion outside the tree. Symlinks are unlinked, never
// followed. Permission bits are left alone.
//
// Returns NotFound if the path does not exist, fails with RemovalFailed
// naming the first entry that could not be removed (earlier entries stay
// removed), or fails if the path is not a directory. Each level of nesting
// keeps two descriptors open, so very deep trees can run into the process's
// open file limit; that failure is reported like any other.
Result<RemoveOutcome> remove_dir_all(const std::filesystem::path& dir);

// Delete whatever is at `p`: a directory tree via remove_dir_all, a file or
// symlink via unlink.
Result<RemoveOutcome> remove_path(const std::filesystem::path& p);

// Empty a directory but keep the directory itself.
Result<void> remove_dir_contents(const std::filesystem::path& dir);

} // namespace platform

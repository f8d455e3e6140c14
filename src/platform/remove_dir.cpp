#include "remove_dir.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace platform {

namespace {

// ── Descriptor guard ─────────────────────────────────────────

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

// Breadcrumbs for error messages: each level points at its parent, so the
// full path is only built when something goes wrong.
struct PathComponents {
    const PathComponents* parent;
    const fs::path* root;     // set only on the outermost level
    const char* name;

    std::string str() const {
        if (root) return root->string();
        return (fs::path(parent->str()) / name).string();
    }
};

constexpr int kDirOpenFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;

// Symlinks give ELOOP under O_NOFOLLOW; plain files give ENOTDIR.
bool is_not_a_directory(int err) {
    return err == ELOOP || err == ENOTDIR;
}

Result<void> removal_error(const PathComponents& at, const char* op, int err) {
    std::string msg = fmt::format("failed to {} '{}': {}", op, at.str(), std::strerror(err));
    if (err == EMFILE || err == ENFILE) {
        msg += " (directory nesting exceeds the open file limit)";
    }
    cc_log("remove: " + msg);
    return Result<void>::Err(ErrorKind::RemovalFailed, msg);
}

// Each nesting level holds two descriptors while its children are removed:
// the directory itself and the duplicate being read. Trees deeper than half
// the open file limit fail with EMFILE at the level that runs out.
Result<void> remove_contents_at(int dirfd, const PathComponents& crumbs) {
    // Reading and unlinking through the same descriptor would share the
    // kernel's directory cursor; iterate over a duplicate instead.
    int iter_fd = fcntl(dirfd, F_DUPFD_CLOEXEC, 0);
    if (iter_fd < 0) return removal_error(crumbs, "duplicate descriptor of", errno);

    DIR* dir = fdopendir(iter_fd);
    if (!dir) {
        int err = errno;
        ::close(iter_fd);
        return removal_error(crumbs, "read directory", err);
    }

    Result<void> result = Result<void>::Ok();
    errno = 0;
    while (struct dirent* ent = readdir(dir)) {
        const char* name = ent->d_name;
        if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) {
            errno = 0;
            continue;
        }
        PathComponents child{&crumbs, nullptr, name};

        FdGuard child_fd(openat(dirfd, name, kDirOpenFlags));
        if (!child_fd.valid()) {
            int err = errno;
            if (err == ENOENT) { errno = 0; continue; }
            if (!is_not_a_directory(err)) {
                result = removal_error(child, "open", err);
                break;
            }
            if (unlinkat(dirfd, name, 0) != 0 && errno != ENOENT) {
                result = removal_error(child, "unlink", errno);
                break;
            }
            errno = 0;
            continue;
        }

        auto sub = remove_contents_at(child_fd.get(), child);
        if (sub.is_err()) {
            result = sub;
            break;
        }
        if (unlinkat(dirfd, name, AT_REMOVEDIR) != 0 && errno != ENOENT) {
            result = removal_error(child, "remove directory", errno);
            break;
        }
        errno = 0;
    }
    if (result.is_ok() && errno != 0) {
        result = removal_error(crumbs, "read directory", errno);
    }

    closedir(dir);
    return result;
}

// Open the parent of `p` so the leaf can be removed with *at calls.
// Returns -1 with errno set on failure.
int open_parent(const fs::path& p) {
    fs::path parent = p.parent_path();
    if (parent.empty()) parent = ".";
    return ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

fs::path leaf_of(const fs::path& p) {
    fs::path leaf = p.filename();
    if (leaf.empty()) leaf = p.parent_path().filename();
    return leaf;
}

fs::path strip_trailing_separator(const fs::path& p) {
    if (p.has_filename() || !p.has_parent_path()) return p;
    return p.parent_path();
}

// Shared by remove_dir_all and remove_path.
Result<RemoveOutcome> remove_at_parent(const fs::path& raw, bool allow_non_directory) {
    using R = Result<RemoveOutcome>;

    fs::path p = strip_trailing_separator(raw);
    PathComponents top{nullptr, &p, nullptr};

    FdGuard parent_fd(open_parent(p));
    if (!parent_fd.valid()) {
        if (errno == ENOENT) return R::Ok(RemoveOutcome::NotFound);
        auto err = removal_error(top, "open parent of", errno);
        return R::Err(err.kind, err.error);
    }

    fs::path leaf = leaf_of(p);
    FdGuard dir_fd(openat(parent_fd.get(), leaf.c_str(), kDirOpenFlags));
    if (!dir_fd.valid()) {
        int err = errno;
        if (err == ENOENT) return R::Ok(RemoveOutcome::NotFound);
        if (is_not_a_directory(err) && allow_non_directory) {
            if (unlinkat(parent_fd.get(), leaf.c_str(), 0) != 0) {
                if (errno == ENOENT) return R::Ok(RemoveOutcome::NotFound);
                auto e = removal_error(top, "unlink", errno);
                return R::Err(e.kind, e.error);
            }
            return R::Ok(RemoveOutcome::Removed);
        }
        auto e = removal_error(top, "open directory", err);
        return R::Err(e.kind, e.error);
    }

    auto contents = remove_contents_at(dir_fd.get(), top);
    if (contents.is_err()) return R::Err(contents.kind, contents.error);

    if (unlinkat(parent_fd.get(), leaf.c_str(), AT_REMOVEDIR) != 0) {
        if (errno == ENOENT) return R::Ok(RemoveOutcome::Removed);
        auto e = removal_error(top, "remove directory", errno);
        return R::Err(e.kind, e.error);
    }
    return R::Ok(RemoveOutcome::Removed);
}

} // namespace

Result<RemoveOutcome> remove_dir_all(const fs::path& dir) {
    return remove_at_parent(dir, false);
}

Result<RemoveOutcome> remove_path(const fs::path& p) {
    return remove_at_parent(p, true);
}

Result<void> remove_dir_contents(const fs::path& dir) {
    fs::path p = strip_trailing_separator(dir);
    PathComponents top{nullptr, &p, nullptr};

    FdGuard fd(::open(p.c_str(), kDirOpenFlags));
    if (!fd.valid()) return removal_error(top, "open directory", errno);
    return remove_contents_at(fd.get(), top);
}

} // namespace platform

#include "git_gc.hpp"
#include <core/log.hpp>
#include <core/size_spec.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <platform/walker.hpp>
#include <fmt/format.h>

size_t GcSummary::failures() const {
    size_t n = 0;
    for (const auto& r : repos) {
        if (!r.ok) n++;
    }
    return n;
}

std::vector<fs::path> gc_targets(CacheInventory& inventory) {
    std::vector<fs::path> targets = inventory.git_repos().items_sorted();

    for (auto& index : inventory.registry_index().caches()) {
        std::error_code ec;
        if (fs::is_directory(index.path() / ".git", ec)) {
            targets.push_back(index.path());
        } else {
            cc_log("gc: registry index " + index.path().string() + " is not a git repo");
        }
    }
    return targets;
}

Result<void> gc_repo(const std::string& git_program, const fs::path& repo) {
    const std::vector<std::vector<std::string>> steps = {
        {"reflog", "expire", "--expire=now", "--all"},
        {"pack-refs", "--all", "--prune"},
        {"gc", "--aggressive", "--prune=now"},
    };

    for (const auto& args : steps) {
        auto result = platform::run_capture(git_program, args, repo);
        if (result.failed()) {
            std::string err = result.get_output();
            trim(err);
            return Result<void>::Err(ErrorKind::GitFailed,
                fmt::format("git {} failed in '{}': {}", args[0], repo.string(), err));
        }
    }
    return Result<void>::Ok();
}

GcSummary gc_everything(CacheInventory& inventory, const std::string& git_program,
                        bool dry_run, const StatusCallback& cb) {
    GcSummary summary;
    auto targets = gc_targets(inventory);

    if (cb) cb("Recompressing repositories. Please be patient...");
    for (const auto& repo : targets) {
        GcOutcome outcome;
        outcome.repo = repo;
        outcome.before = platform::tree_size(repo);

        if (dry_run) {
            outcome.after = outcome.before;
        } else {
            auto result = gc_repo(git_program, repo);
            if (result.is_err()) {
                outcome.ok = false;
                outcome.error = result.error;
                cc_log("gc: " + result.error);
            }
            outcome.after = platform::tree_size(repo);
        }

        if (cb) {
            if (outcome.ok) {
                cb(fmt::format("Recompressing '{}': {}", file_name_of(repo),
                               size_diff_format(outcome.before, outcome.after)));
            } else {
                cb(fmt::format("Warning, git gc failed, skipping '{}': {}",
                               repo.string(), outcome.error));
            }
        }

        summary.before += outcome.before;
        summary.after += outcome.after;
        summary.repos.push_back(std::move(outcome));
    }

    if (!dry_run) {
        inventory.git_repos().invalidate();
        inventory.registry_index().invalidate();
    }
    return summary;
}

#include "worktree_pool.hpp"
#include "logging.hpp"

#include <array>

namespace {
/// Checkout errors that would fail the same way on every attempt
bool is_permanent_checkout_failure(CR<checkout_error> err) {
    static const std::array<const char*, 3> markers{
        "reference is not a tree",
        "did not match any",
        "unknown revision"};
    for (const char* marker : markers) {
        if (err.stderr_text.find(marker) != Str::npos) { return true; }
    }
    return false;
}
} // namespace

WorktreePool::WorktreePool(
    VcsOracle&      _vcs,
    CR<Path>        _root,
    int             size,
    CR<RetryPolicy> checkout_retry,
    SPtr<Logger>    _logger)
    : vcs(_vcs)
    , root(_root)
    , requested(size)
    , retry(checkout_retry)
    , logger(std::move(_logger)) {}

WorktreePool::~WorktreePool() {
    if (active) {
        try {
            shutdown();
        } catch (std::exception& err) {
            LOG_E(logger) << "Worktree pool teardown failed: " << err.what();
        }
    }
}

void WorktreePool::remove_slot_dir(CR<Path> path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw setup_error(fmt::format(
            "Could not remove stale worktree directory {}: {}",
            path,
            ec.message()));
    }
}

void WorktreePool::init(CR<Str> initial_commit) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw setup_error(fmt::format(
            "Cannot create worktree root {}: {}", root, ec.message()));
    }

    // Slots of the interrupted or crashed run, including ones that were
    // created with larger pool size.
    Vec<Path> stale;
    for (const auto& entry : fs::directory_iterator{root}) {
        if (entry.path().filename().string().starts_with("wt_")) {
            stale.push_back(entry.path());
        }
    }

    for (const auto& path : stale) {
        LOG_W(logger) << fmt::format(
            "Worktree directory {} already exists, removing it", path);
        try {
            vcs.remove_worktree(path);
        } catch (checkout_error& err) {
            LOG_D(logger) << err.what() << " " << err.stderr_text;
        }

        remove_slot_dir(path);
    }

    vcs.prune_worktrees();

    for (int i = 0; i < requested; ++i) {
        auto slot   = std::make_unique<WorktreeSlot>();
        slot->index = i;
        slot->path  = root / fmt::format("wt_{}", i);
        LOG_I(logger) << fmt::format(
            "Creating worktree {} at {} linked to {:.8}",
            i,
            slot->path,
            initial_commit);

        try {
            vcs.add_worktree(slot->path, initial_commit);
        } catch (checkout_error& err) {
            throw setup_error(
                fmt::format("{}: {}", err.what(), err.stderr_text));
        }

        slot->commit = initial_commit;
        slots.push_back(std::move(slot));
        // Pool must be torn down even if creation of the later slots fails
        active = true;
    }
}

SlotLease WorktreePool::acquire(int slot_index) {
    return SlotLease{*slots.at(slot_index)};
}

Path WorktreePool::slot_path(int slot_index) const {
    return slots.at(slot_index)->path;
}

void WorktreePool::checkout(SlotLease& lease, CR<Str> commit) {
    WorktreeSlot& slot = lease.get();
    try {
        with_retry<checkout_error>(
            retry,
            [&](CR<checkout_error> err) {
                if (err.lock_artifact || vcs.lock_artifact(slot.path)) {
                    return RetryVerdict::Retryable;
                } else if (is_permanent_checkout_failure(err)) {
                    return RetryVerdict::Fatal;
                } else {
                    return RetryVerdict::Retryable;
                }
            },
            [&]() { vcs.checkout(slot.path, commit); },
            [&](CR<checkout_error> err, int attempt) {
                LOG_W(logger) << fmt::format(
                    "Checkout of {:.8} in wt_{} failed on attempt {}: {}",
                    commit,
                    slot.index,
                    attempt,
                    err.what());

                if (auto lock = vcs.lock_artifact(slot.path)) {
                    std::error_code ec;
                    fs::remove(*lock, ec);
                    if (ec) {
                        LOG_E(logger) << fmt::format(
                            "Could not remove lock artifact {}: {}",
                            *lock,
                            ec.message());
                    } else {
                        LOG_W(logger) << fmt::format(
                            "Removed stale lock artifact {}", *lock);
                    }
                }
            });
    } catch (checkout_error&) {
        slot.commit.clear();
        throw;
    }

    slot.commit = commit;
}

bool WorktreePool::reset(SlotLease& lease) {
    WorktreeSlot& slot = lease.get();
    try {
        vcs.reset(slot.path);
        return true;
    } catch (checkout_error& err) {
        LOG_E(logger) << fmt::format(
            "Could not reset wt_{}: {} {}",
            slot.index,
            err.what(),
            err.stderr_text);
        slot.commit.clear();
        return false;
    } catch (std::exception& err) {
        LOG_E(logger) << fmt::format(
            "Could not reset wt_{}: {}", slot.index, err.what());
        slot.commit.clear();
        return false;
    }
}

void WorktreePool::shutdown() {
    LOG_I(logger) << "Cleaning up worktrees...";
    for (auto& slot : slots) {
        // Wait for the worker that might still hold the slot
        std::scoped_lock lock{slot->checkout_mutex};
        try {
            vcs.remove_worktree(slot->path);
        } catch (checkout_error& err) {
            LOG_W(logger) << fmt::format(
                "Could not deregister worktree {}: {}", slot->path, err.what());
        }

        std::error_code ec;
        fs::remove_all(slot->path, ec);
        if (ec) {
            LOG_W(logger) << fmt::format(
                "Could not remove worktree directory {}: {}. Manual "
                "cleanup might be required.",
                slot->path,
                ec.message());
        }
    }

    vcs.prune_worktrees();
    slots.clear();
    active = false;
    LOG_I(logger) << "Worktree cleanup finished.";
}

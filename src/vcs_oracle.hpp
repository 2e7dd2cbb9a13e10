/// \file vcs_oracle.hpp \brief Version control operations needed by the
/// mining pipeline

#ifndef VCS_ORACLE_HPP
#define VCS_ORACLE_HPP

#include "common.hpp"
#include "commit_ir.hpp"

/// \brief Paths touched by the difference between two commits
struct PathDelta {
    Vec<Str> changed; ///< Added, modified, copied, type-changed, renamed-to
    Vec<Str> removed; ///< Deleted and renamed-from
};

/// \brief Version-control system as seen by the miner. Every call is
/// blocking. Implementations must tolerate concurrent calls for different
/// working trees.
class VcsOracle {
  public:
    virtual ~VcsOracle() = default;

    /// Chronologically ordered (oldest first) list of commits reachable
    /// from \arg ref
    virtual auto list_commits(CR<Str> ref) -> Vec<Str> = 0;

    /// Register new working tree at \arg path pinned to \arg commit
    virtual void add_worktree(CR<Path> path, CR<Str> commit) = 0;

    /// Deregister working tree and remove its directory
    virtual void remove_worktree(CR<Path> path) = 0;

    /// Drop registrations of working trees whose directories are gone
    virtual void prune_worktrees() = 0;

    /// Forcibly overwrite working tree content with the \arg commit tree.
    /// Throws `checkout_error` on failure.
    virtual void checkout(CR<Path> path, CR<Str> commit) = 0;

    /// Discard every uncommitted and untracked file in the working tree
    virtual void reset(CR<Path> path) = 0;

    /// Difference between two commits, paths relative to the tree root
    virtual auto changed_paths(CR<Str> from, CR<Str> to) -> PathDelta = 0;

    /// Content hash of the file on disk
    virtual auto fingerprint(CR<Path> file) -> ir::Fingerprint = 0;

    /// Path of the stale lock file that prevents checkout in \arg path
    virtual auto lock_artifact(CR<Path> path) -> Opt<Path> = 0;
};

#endif // VCS_ORACLE_HPP

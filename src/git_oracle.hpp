/// \file git_oracle.hpp \brief Git implementation of the version control
/// oracle

#ifndef GIT_ORACLE_HPP
#define GIT_ORACLE_HPP

#include <mutex>

#include "git_interface.hpp"
#include "program_state.hpp"
#include "vcs_oracle.hpp"

/// \brief Git backed oracle. History queries (commit walk, tree diff, blob
/// hashing) go through libgit2, working tree manipulation is delegated to
/// the `git` command line client.
class GitOracle : public VcsOracle {
  public:
    /// Open repository at \arg base_repo. Throws `setup_error` if it is not
    /// a git repository.
    GitOracle(CR<Path> base_repo, SPtr<Logger> logger);
    ~GitOracle() override;

    GitOracle(GitOracle const&)            = delete;
    GitOracle& operator=(GitOracle const&) = delete;

    auto list_commits(CR<Str> ref) -> Vec<Str> override;
    void add_worktree(CR<Path> path, CR<Str> commit) override;
    void remove_worktree(CR<Path> path) override;
    void prune_worktrees() override;
    void checkout(CR<Path> path, CR<Str> commit) override;
    void reset(CR<Path> path) override;
    auto changed_paths(CR<Str> from, CR<Str> to) -> PathDelta override;
    auto fingerprint(CR<Path> file) -> ir::Fingerprint override;
    auto lock_artifact(CR<Path> path) -> Opt<Path> override;

  private:
    auto tree_of(CR<Str> commit) -> git_tree*;

    Path            base_repo;
    git_repository* repo = nullptr;
    /// libgit2 repository object is shared between workers, so history
    /// queries are serialized.
    std::mutex   git_mutex;
    SPtr<Logger> logger;
};

#endif // GIT_ORACLE_HPP

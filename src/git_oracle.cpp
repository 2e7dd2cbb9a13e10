#include "git_oracle.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "subprocess.hpp"

#include <fstream>

GitOracle::GitOracle(CR<Path> _base_repo, SPtr<Logger> _logger)
    : base_repo(_base_repo), logger(std::move(_logger)) {
    git_libgit2_init();
    int code = git_repository_open_ext(
        &repo, base_repo.c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr);
    if (code < 0) {
        git::exception err{code, "git_repository_open_ext"};
        git_libgit2_shutdown();
        throw setup_error(fmt::format(
            "Cannot open repository at {}: {}", base_repo, err.what()));
    }
}

GitOracle::~GitOracle() {
    git_repository_free(repo);
    git_libgit2_shutdown();
}

Vec<Str> GitOracle::list_commits(CR<Str> ref) {
    std::scoped_lock lock{git_mutex};
    git_object*      target = nullptr;
    git_revwalk*     walker = nullptr;
    finally          close{[&]() {
        git_revwalk_free(walker);
        git_object_free(target);
    }};

    try {
        GIT_CALL(git_revparse_single, &target, repo, ref.c_str());
        GIT_CALL(git_revwalk_new, &walker, repo);
        // Oldest commit first, parents always before children
        GIT_CALL(
            git_revwalk_sorting,
            walker,
            GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME | GIT_SORT_REVERSE);
        GIT_CALL(git_revwalk_push, walker, git_object_id(target));
    } catch (git::exception& err) {
        throw setup_error(fmt::format(
            "Cannot walk history of '{}': {}", ref, err.what()));
    }

    Vec<Str> result;
    git_oid  oid;
    while (git_revwalk_next(&oid, walker) == 0) {
        result.push_back(oid_tostr(oid));
    }

    return result;
}

void GitOracle::add_worktree(CR<Path> path, CR<Str> commit) {
    auto res = run_git(
        {"worktree", "add", "--detach", "--force", path.string(), commit},
        base_repo);
    if (!res.ok()) {
        throw checkout_error(
            fmt::format(
                "git worktree add {} {} failed with code {}",
                path,
                commit,
                res.exit_code),
            res.err);
    }
}

void GitOracle::remove_worktree(CR<Path> path) {
    auto res = run_git(
        {"worktree", "remove", "--force", path.string()}, base_repo);
    if (!res.ok()) {
        throw checkout_error(
            fmt::format(
                "git worktree remove {} failed with code {}",
                path,
                res.exit_code),
            res.err);
    }
}

void GitOracle::prune_worktrees() {
    auto res = run_git({"worktree", "prune"}, base_repo);
    if (!res.ok()) {
        LOG_W(logger) << fmt::format(
            "git worktree prune failed with code {}: {}",
            res.exit_code,
            res.err);
    }
}

void GitOracle::checkout(CR<Path> path, CR<Str> commit) {
    auto res = run_git({"checkout", "--force", "--detach", commit}, path);
    if (!res.ok()) {
        throw checkout_error(
            fmt::format(
                "git checkout {} in {} failed with code {}",
                commit,
                path,
                res.exit_code),
            res.err);
    }
}

void GitOracle::reset(CR<Path> path) {
    for (CR<Vec<Str>> args : Vec<Vec<Str>>{
             {"reset", "--hard", "--quiet"}, {"clean", "-fdxq"}}) {
        auto res = run_git(args, path);
        if (!res.ok()) {
            throw checkout_error(
                fmt::format(
                    "git {} in {} failed with code {}",
                    args.front(),
                    path,
                    res.exit_code),
                res.err);
        }
    }
}

git_tree* GitOracle::tree_of(CR<Str> commit) {
    git_oid     oid = oid_fromstr(commit);
    git_commit* found;
    GIT_CALL(git_commit_lookup, &found, repo, &oid);
    finally   close{[found]() { git_commit_free(found); }};
    git_tree* tree;
    GIT_CALL(git_commit_tree, &tree, found);
    return tree;
}

PathDelta GitOracle::changed_paths(CR<Str> from, CR<Str> to) {
    std::scoped_lock lock{git_mutex};
    git_tree*        prev_tree = nullptr;
    git_tree*        this_tree = nullptr;
    git_diff*        diff      = nullptr;
    finally          close{[&]() {
        git_diff_free(diff);
        git_tree_free(this_tree);
        git_tree_free(prev_tree);
    }};

    prev_tree = tree_of(from);
    this_tree = tree_of(to);

    git_diff_options diffopts = GIT_DIFF_OPTIONS_INIT;
    GIT_CALL(
        git_diff_tree_to_tree, &diff, repo, prev_tree, this_tree, &diffopts);

    git_diff_find_options findopts = GIT_DIFF_FIND_OPTIONS_INIT;
    findopts.flags = GIT_DIFF_FIND_RENAMES | GIT_DIFF_FIND_COPIES;
    GIT_CALL(git_diff_find_similar, diff, &findopts);

    PathDelta result;
    size_t    deltas = git_diff_num_deltas(diff);
    for (size_t i = 0; i < deltas; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff, i);
        switch (delta->status) {
            case GIT_DELTA_ADDED:
            case GIT_DELTA_MODIFIED:
            case GIT_DELTA_COPIED:
            case GIT_DELTA_TYPECHANGE: {
                result.changed.push_back(delta->new_file.path);
                break;
            }
            case GIT_DELTA_RENAMED: {
                result.removed.push_back(delta->old_file.path);
                result.changed.push_back(delta->new_file.path);
                break;
            }
            case GIT_DELTA_DELETED: {
                result.removed.push_back(delta->old_file.path);
                break;
            }
            default: break;
        }
    }

    return result;
}

ir::Fingerprint GitOracle::fingerprint(CR<Path> file) {
    // Same hash git would assign to the blob, no repository access needed
    git_oid oid;
    GIT_CALL(git_odb_hashfile, &oid, file.c_str(), GIT_OBJECT_BLOB);
    return oid_tostr(oid);
}

Opt<Path> GitOracle::lock_artifact(CR<Path> path) {
    // Linked worktrees have `.git` file pointing to the private git
    // directory, where the index lock is located.
    Path          gitfile = path / ".git";
    std::ifstream in{gitfile};
    Str           line;
    Path          gitdir = base_repo / ".git";
    if (in && std::getline(in, line) && line.starts_with("gitdir: ")) {
        gitdir = Path{line.substr(8)};
        if (gitdir.is_relative()) { gitdir = path / gitdir; }
    }

    Path lock = gitdir / "index.lock";
    if (fs::exists(lock)) {
        return lock;
    } else {
        return std::nullopt;
    }
}

/// \file commit_processor.hpp \brief Processing of the single commit:
/// checkout, change resolution, cached and delegated analysis, record
/// persistence.

#ifndef COMMIT_PROCESSOR_HPP
#define COMMIT_PROCESSOR_HPP

#include <mutex>

#include "analyzer.hpp"
#include "change_resolver.hpp"
#include "content_cache.hpp"
#include "result_store.hpp"
#include "worktree_pool.hpp"

/// \brief State carried between consecutive commits of one slot
struct Lineage {
    /// Last commit of the lineage that was recorded successfully in this
    /// run. Differences are computed against it, so failed commits in
    /// between do not break the chain.
    Opt<Str> base_commit;
    /// Eligible files of the base commit with their fingerprints
    std::map<Str, ir::Fingerprint> files;
};

/// \brief Final state of the processed commit
struct CommitOutcome {
    ir::CommitTask        task;
    ir::CommitState       state;
    Opt<ir::FailureCause> cause;
    double                duration_sec = 0;
};

/// \brief Number of state transitions seen across all workers
class ProgressCounter {
  public:
    void transition(ir::CommitState state);
    int  count(ir::CommitState state) const;
    /// Commits that reached one of the terminal states
    int finished() const;

  private:
    mutable std::mutex              mutex;
    std::map<ir::CommitState, int> counts;
};

class CommitProcessor {
  public:
    CommitProcessor(
        CP<miner_config> config,
        VcsOracle&       vcs,
        WorktreePool&    pool,
        ChangeResolver&  resolver,
        ContentCache&    cache,
        Analyzer&        analyzer,
        ResultStore&     store,
        ProgressCounter& progress,
        SPtr<Logger>     logger);

    /// \brief Drive \arg task through the state machine. \arg lineage must
    /// belong to the task slot and is updated after successful recording.
    ///
    /// Checkout and analysis errors are converted into error records and
    /// reported through the outcome. Any other exception raised after the
    /// slot was acquired is recorded as the internal analysis failure.
    /// Failure to write the error record is propagated.
    auto process(CR<ir::CommitTask> task, Lineage& lineage) -> CommitOutcome;

  private:
    struct Merged {
        ir::CommitRecord               record;
        std::map<Str, ir::Fingerprint> files;
    };

    /// Fingerprint files, consult the cache and analyze the misses
    auto analyze(
        SlotLease&         lease,
        CR<ir::CommitTask> task,
        CR<ir::ChangeSet>  changes,
        CR<Lineage>        lineage) -> Merged;

    auto fail(
        CR<ir::CommitTask> task,
        ir::ErrorKind      kind,
        ir::FailureCause   cause,
        CR<Str>            message,
        double             duration) -> CommitOutcome;

    void step(CR<ir::CommitTask> task, ir::CommitState state);

    /// Discard partial artifacts left in the slot by the failed commit
    void reset_slot(SlotLease& lease, CR<ir::CommitTask> task);

    CP<miner_config> config;
    VcsOracle&       vcs;
    WorktreePool&    pool;
    ChangeResolver&  resolver;
    ContentCache&    cache;
    Analyzer&        analyzer;
    ResultStore&     store;
    ProgressCounter& progress;
    SPtr<Logger>     logger;
};

#endif // COMMIT_PROCESSOR_HPP

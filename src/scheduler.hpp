/// \file scheduler.hpp \brief Distribution of commits across the worker
/// lineages

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>

#include "analyzer.hpp"
#include "commit_processor.hpp"
#include "program_state.hpp"
#include "vcs_oracle.hpp"

/// \brief Outcome of the whole scheduling run
struct RunStats {
    ir::RunCounts counts;
    int           workers     = 0;
    bool          interrupted = false;
    std::map<Str, int> failure_causes;
};

/// \brief Owns the run-wide resources (working tree pool, content cache,
/// result store) and drives one worker per slot.
///
/// Commit with position `i` is always processed by the worker `i mod N`,
/// in increasing position order, so each worker forms a lineage with the
/// well-defined predecessor commit.
class CommitScheduler {
  public:
    /// \arg stop is polled by the workers before each commit
    CommitScheduler(
        CP<miner_config>         config,
        VcsOracle&               vcs,
        Analyzer&                analyzer,
        CR<std::atomic<bool>>    stop,
        SPtr<Logger>             logger);

    /// Number of workers used for \arg commit_count commits
    static int worker_count(int requested, int commit_count);

    /// \brief Process every commit from the chronologically ordered
    /// \arg commits list. Throws `setup_error` if the working tree pool
    /// cannot be created. Cache is persisted and the pool is removed
    /// before returning, including the interrupted runs.
    auto run(CR<Vec<Str>> commits) -> RunStats;

  private:
    void flush_cache(ContentCache& cache);

    CP<miner_config>      config;
    VcsOracle&            vcs;
    Analyzer&             analyzer;
    CR<std::atomic<bool>> stop;
    SPtr<Logger>          logger;
};

#endif // SCHEDULER_HPP

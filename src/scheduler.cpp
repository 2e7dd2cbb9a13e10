#include "scheduler.hpp"
#include "channel.hpp"
#include "logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

using namespace ir;

CommitScheduler::CommitScheduler(
    CP<miner_config>      _config,
    VcsOracle&            _vcs,
    Analyzer&             _analyzer,
    CR<std::atomic<bool>> _stop,
    SPtr<Logger>          _logger)
    : config(_config)
    , vcs(_vcs)
    , analyzer(_analyzer)
    , stop(_stop)
    , logger(std::move(_logger)) {}

int CommitScheduler::worker_count(int requested, int commit_count) {
    return std::max(1, std::min(requested, commit_count));
}

void CommitScheduler::flush_cache(ContentCache& cache) {
    try {
        cache.persist();
    } catch (cache_io_error& err) {
        LOG_W(logger) << err.what();
    }
}

RunStats CommitScheduler::run(CR<Vec<Str>> commits) {
    RunStats stats;
    const int total      = static_cast<int>(commits.size());
    stats.counts.total   = total;
    if (commits.empty()) { return stats; }

    const int workers = worker_count(config->workers, total);
    stats.workers     = workers;

    ResultStore  store{config->results_dir()};
    ContentCache cache{config->cache_file(), logger};
    try {
        auto loaded = cache.load();
        LOG_I(logger) << fmt::format("Loaded {} cached fingerprints", loaded);
    } catch (cache_io_error& err) {
        LOG_W(logger) << err.what() << ", starting with empty cache";
    }

    WorktreePool pool{
        vcs,
        config->worktree_dir(),
        workers,
        RetryPolicy{.attempts = std::max(1, config->checkout_retries)},
        logger};

    // Slots start from the oldest commit, the first checkout of every
    // lineage is the smallest possible change.
    pool.init(commits.front());

    ChangeResolver  resolver{vcs, config, logger};
    ProgressCounter progress;
    CommitProcessor processor{
        config,
        vcs,
        pool,
        resolver,
        cache,
        analyzer,
        store,
        progress,
        logger};

    LOG_I(logger) << fmt::format(
        "Processing {} commits with {} workers", total, workers);

    Channel<CommitOutcome> results{static_cast<std::size_t>(workers) * 2};
    std::atomic<int>       active{workers};

    boost::asio::thread_pool threads(workers);
    for (int slot = 0; slot < workers; ++slot) {
        boost::asio::post(threads, [&, slot]() {
            // Last finished worker closes the channel and unblocks drain
            finally done{[&]() {
                if (--active == 0) { results.close(); }
            }};

            Lineage lineage;
            for (int index = slot; index < total; index += workers) {
                if (stop.load()) {
                    LOG_D(logger) << fmt::format(
                        "Worker {} stopped before commit {}", slot, index);
                    break;
                }

                CommitTask task{
                    .commit = commits[index], .index = index, .slot = slot};
                CommitOutcome outcome;
                try {
                    outcome = processor.process(task, lineage);
                } catch (std::exception& err) {
                    LOG_E(logger) << fmt::format(
                        "Unexpected failure processing commit {} ({}): {}",
                        index,
                        task.commit,
                        err.what());
                    progress.transition(CommitState::Failed);
                    outcome = CommitOutcome{
                        .task  = task,
                        .state = CommitState::Failed,
                        .cause = FailureCause::Internal};
                }

                results.push(std::move(outcome));
            }
        });
    }

    // Drain the results on the calling thread while workers are running
    {
        ScopedBar bar{config, total, "commits"};
        int       since_flush = 0;
        int       finished    = 0;
        while (auto outcome = results.pop()) {
            bar.tick();
            ++finished;
            switch (outcome->state) {
                case CommitState::Recorded: ++stats.counts.analyzed; break;
                case CommitState::Skipped: ++stats.counts.skipped; break;
                case CommitState::Failed: {
                    ++stats.counts.failed;
                    ++stats.failure_causes[fmt::format(
                        "{}", outcome->cause.value_or(FailureCause::Internal))];
                    break;
                }
                default: break;
            }

            if (config->progress_interval > 0 &&
                finished % config->progress_interval == 0) {
                LOG_I(logger) << fmt::format(
                    "Progress {}/{}: {} analyzed, {} skipped, {} failed, "
                    "{} cached fingerprints",
                    finished,
                    total,
                    stats.counts.analyzed,
                    stats.counts.skipped,
                    stats.counts.failed,
                    cache.size());
            }

            if (outcome->state != CommitState::Skipped &&
                config->cache_flush_interval > 0 &&
                ++since_flush >= config->cache_flush_interval) {
                since_flush = 0;
                if (0 < cache.dirty()) { flush_cache(cache); }
            }
        }
    }

    threads.join();

    stats.counts.pending = total - stats.counts.analyzed -
                           stats.counts.skipped - stats.counts.failed;
    stats.interrupted = stop.load() && 0 < stats.counts.pending;
    if (stats.interrupted) {
        LOG_W(logger) << fmt::format(
            "Interrupted, {} commits were not dispatched",
            stats.counts.pending);
    }

    LOG_D(logger) << fmt::format(
        "Transitions: {} checked out, {} resolved, {} analyzed, {} recorded",
        progress.count(CommitState::CheckedOut),
        progress.count(CommitState::Resolved),
        progress.count(CommitState::Analyzed),
        progress.count(CommitState::Recorded));

    flush_cache(cache);
    pool.shutdown();

    LOG_I(logger) << fmt::format("Finished run: {}", stats.counts);
    return stats;
}

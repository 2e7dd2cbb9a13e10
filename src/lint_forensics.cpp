#include "common.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

#include <unistd.h>

#include "aggregator.hpp"
#include "analyzer.hpp"
#include "cli_options.hpp"
#include "errors.hpp"
#include "git_oracle.hpp"
#include "logging.hpp"
#include "repo_setup.hpp"
#include "scheduler.hpp"

namespace {
/// Set by the signal handler, polled by the workers before each commit
std::atomic<bool> stop_requested{false};

extern "C" void signal_handler(int signum) {
    const char message[] = "Interrupt received, finishing commits that are "
                           "already in progress\n";
    // Only async-signal-safe calls are allowed here
    [[maybe_unused]] auto written = ::write(
        STDERR_FILENO, message, sizeof(message) - 1);
    stop_requested.store(true);
}

/// Number of commits in the mined history, if the base clone is available
Opt<int> history_length(CR<miner_config> config, SPtr<Logger> logger) {
    if (!fs::exists(config.base_repo_dir())) { return std::nullopt; }
    try {
        GitOracle oracle{config.base_repo_dir(), logger};
        return static_cast<int>(oracle.list_commits(config.branch).size());
    } catch (setup_error& err) {
        LOG_W(logger) << "Cannot count commits: " << err.what();
        return std::nullopt;
    }
}

void report_summary(CR<ir::RunSummary> summary, SPtr<Logger> logger) {
    LOG_I(logger) << fmt::format(
        "Summary for {}: {} commits, {} analyzed, {} skipped, {} failed, {} "
        "pending",
        summary.location,
        summary.counts.total,
        summary.counts.analyzed,
        summary.counts.skipped,
        summary.counts.failed,
        summary.counts.pending);

    LOG_I(logger) << fmt::format(
        "Average {:.2f} source files and {:.2f} violations per commit",
        summary.avg_source_files,
        summary.avg_violations);

    for (const auto& [cause, count] : summary.failure_causes) {
        LOG_W(logger) << fmt::format("Failure cause {}: {}", cause, count);
    }
}

/// Derive summary from the record directory and write it. Returns false if
/// the summary file could not be written.
bool write_run_summary(
    CR<miner_config> config,
    int              total_commits,
    int              skipped,
    SPtr<Logger>     logger) {
    ResultStore store{config.results_dir()};
    auto        summary = summarize(
        store, config.repo, total_commits, skipped, logger);
    report_summary(summary, logger);
    try {
        write_summary(config.summary_file(), summary);
        LOG_I(logger) << fmt::format(
            "Summary written to {}", config.summary_file());
        return true;
    } catch (std::exception& err) {
        LOG_E(logger) << fmt::format(
            "Cannot write summary {}: {}", config.summary_file(), err.what());
        return false;
    }
}
} // namespace

auto main(int argc, const char** argv) -> int {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    miner_config config;
    try {
        auto vm = parse_cmdline(argc, argv);
        if (!vm) { return 0; }
        config = config_from_options(*vm);
    } catch (const po::error& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    boost::shared_ptr<sink_t> file_sink;
    try {
        file_sink = create_file_sink(config.log_file);
    } catch (std::system_error& err) {
        std::cerr << err.what() << "\n";
        return 1;
    }

    auto out_sink = create_std_sink();

    out_sink->set_filter(
        severity >= (config.verbose ? boost::log::severity::debug
                                    : boost::log::severity::info));

    finally close_out_sink{[&out_sink]() {
        out_sink->stop();
        out_sink->flush();
    }};

    finally close_file_sink{[&file_sink]() {
        file_sink->stop();
        file_sink->flush();
    }};

    auto logger = std::make_shared<Logger>();

    boost::log::core::get()->add_sink(file_sink);
    boost::log::core::get()->add_sink(out_sink);
    init_logger_properties();

    if (config.summary_only) {
        auto scan     = ResultStore{config.results_dir()}.scan();
        int  recorded = static_cast<int>(
            scan.succeeded.size() + scan.failed.size());
        int total = history_length(config, logger).value_or(recorded);
        return write_run_summary(config, total, 0, logger) ? 0 : 1;
    }

    try {
        validate_config(&config);
        Path base = prepare_repository(&config, logger);

        GitOracle oracle{base, logger};
        auto      commits = oracle.list_commits(config.branch);
        if (commits.empty()) {
            throw setup_error(fmt::format(
                "No commits found on '{}' in {}", config.branch, base));
        }

        LOG_I(logger) << fmt::format(
            "Found {} commits on '{}'", commits.size(), config.branch);

        auto analyzer = make_analyzer(&config, logger);

        CommitScheduler scheduler{
            &config, oracle, *analyzer, stop_requested, logger};
        RunStats stats = scheduler.run(commits);

        for (const auto& [cause, count] : stats.failure_causes) {
            LOG_D(logger) << fmt::format(
                "Failed in this run with {}: {}", cause, count);
        }

        if (stats.interrupted) {
            LOG_W(logger) << "Run was interrupted, restart with the same "
                             "output directory to process the rest";
        }

        bool written = write_run_summary(
            config,
            static_cast<int>(commits.size()),
            stats.counts.skipped,
            logger);
        return written ? 0 : 1;

    } catch (setup_error& err) {
        LOG_F(logger) << err.what();
        return 1;
    } catch (std::system_error& err) {
        LOG_F(logger) << "System error during setup: " << err.what();
        return 1;
    }
}

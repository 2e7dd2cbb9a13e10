/// \file analyzer.hpp \brief Static analysis backends

#ifndef ANALYZER_HPP
#define ANALYZER_HPP

#include <atomic>

#include "commit_ir.hpp"
#include "errors.hpp"
#include "program_state.hpp"

/// \brief Static analyzer applied to the working tree content.
///
/// Implementations are shared between all workers and must allow
/// concurrent calls for different roots.
class Analyzer {
  public:
    virtual ~Analyzer() = default;

    /// Analyze \arg files (paths relative to \arg root) in their current
    /// on-disk state. Files without violations may be absent from the
    /// returned report. Throws `analysis_error`.
    virtual auto analyze(CR<Path> root, CR<Vec<Str>> files)
        -> ir::AnalysisReport = 0;
};

/// \brief Runs `pmd check` subprocess for every request
class PmdCliAnalyzer : public Analyzer {
  public:
    /// \arg scratch_dir stores file lists and reports of the running
    /// invocations, it is created if missing.
    PmdCliAnalyzer(
        CP<miner_config> config,
        CR<Path>         scratch_dir,
        SPtr<Logger>     logger);

    auto analyze(CR<Path> root, CR<Vec<Str>> files)
        -> ir::AnalysisReport override;

  private:
    CP<miner_config> config;
    Path             scratch_dir;
    std::atomic<int> invocation{0};
    SPtr<Logger>     logger;
};

/// \brief Sends analysis requests to the long-lived PMD daemon over HTTP.
///
/// The daemon accepts `POST /analyze` with `{path, ruleset, auxClasspath,
/// files}` body and answers with the regular PMD JSON report, or with
/// `{error}` object and non-200 status.
class PmdDaemonAnalyzer : public Analyzer {
  public:
    PmdDaemonAnalyzer(
        CP<miner_config> config,
        CR<RetryPolicy>  transport_retry,
        SPtr<Logger>     logger);

    auto analyze(CR<Path> root, CR<Vec<Str>> files)
        -> ir::AnalysisReport override;

  private:
    auto request(CR<Str> body) -> Str;

    CP<miner_config> config;
    RetryPolicy      retry;
    SPtr<Logger>     logger;
};

/// \brief Construct analyzer selected by `config->analyzer`
UPtr<Analyzer> make_analyzer(CP<miner_config> config, SPtr<Logger> logger);

#endif // ANALYZER_HPP

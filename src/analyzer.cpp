#include "analyzer.hpp"
#include "logging.hpp"
#include "pmd_report.hpp"
#include "subprocess.hpp"

#include <fstream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using ir::FailureCause;

namespace {
/// Trailing part of the tool output for the error message
Str output_tail(CR<Str> text, std::size_t limit = 800) {
    if (text.size() <= limit) {
        return text;
    } else {
        return "..." + text.substr(text.size() - limit);
    }
}

void log_processing_errors(SPtr<Logger> logger, CR<PmdReport> report) {
    for (const auto& [file, message] : report.processing_errors) {
        LOG_W(logger) << fmt::format(
            "PMD could not process {}: {}", file, message);
    }
}
} // namespace

PmdCliAnalyzer::PmdCliAnalyzer(
    CP<miner_config> _config,
    CR<Path>         _scratch_dir,
    SPtr<Logger>     _logger)
    : config(_config), scratch_dir(_scratch_dir), logger(std::move(_logger)) {
    fs::create_directories(scratch_dir);
}

ir::AnalysisReport PmdCliAnalyzer::analyze(
    CR<Path>     root,
    CR<Vec<Str>> files) {
    if (files.empty()) { return {}; }

    Path abs_root    = fs::absolute(root);
    int  id          = invocation++;
    Path file_list   = scratch_dir / fmt::format("pmd-{}.files", id);
    Path report_file = scratch_dir / fmt::format("pmd-{}.json", id);
    finally cleanup{[&]() {
        std::error_code ec;
        fs::remove(file_list, ec);
        fs::remove(report_file, ec);
    }};

    {
        std::ofstream out{file_list};
        for (const auto& file : files) {
            out << (abs_root / file).string() << "\n";
        }

        if (!out) {
            throw analysis_error(
                FailureCause::Internal,
                fmt::format("Cannot write PMD file list {}", file_list));
        }
    }

    Vec<Str> args{
        "check",
        "--file-list",
        file_list.string(),
        "--rulesets",
        fs::absolute(config->ruleset).string(),
        "--format",
        "json",
        "--report-file",
        report_file.string(),
        "--relativize-paths-with",
        abs_root.string(),
        "--no-progress",
        "--no-cache"};

    if (!config->aux_classpath.empty()) {
        args.push_back("--aux-classpath");
        args.push_back(config->joined_classpath());
    }

    LOG_T(logger) << fmt::format(
        "Running {} for {} files in {}", config->pmd_path, files.size(), root);

    ProcessResult result;
    try {
        result = run_process(
            config->pmd_path,
            args,
            root,
            stime::duration_cast<stime::milliseconds>(
                config->analyzer_timeout));
    } catch (std::system_error& err) {
        throw analysis_error(
            FailureCause::ExitStatus,
            fmt::format("Cannot start {}: {}", config->pmd_path, err.what()));
    }

    if (result.timed_out) {
        throw analysis_error(
            FailureCause::Timeout,
            fmt::format(
                "PMD did not finish in {}s for {} files",
                config->analyzer_timeout.count(),
                files.size()));
    }

    // Exit code 4 means violations were found
    if (result.exit_code != 0 && result.exit_code != 4) {
        throw analysis_error(
            FailureCause::ExitStatus,
            fmt::format(
                "PMD exited with code {}: {}",
                result.exit_code,
                output_tail(result.err)));
    }

    std::ifstream in{report_file};
    if (!in) {
        throw analysis_error(
            FailureCause::MalformedReport,
            fmt::format("PMD did not produce report {}", report_file));
    }

    Str text{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    auto report = parse_pmd_report(text, abs_root);
    log_processing_errors(logger, report);
    return std::move(report.findings);
}

PmdDaemonAnalyzer::PmdDaemonAnalyzer(
    CP<miner_config> _config,
    CR<RetryPolicy>  transport_retry,
    SPtr<Logger>     _logger)
    : config(_config), retry(transport_retry), logger(std::move(_logger)) {}

Str PmdDaemonAnalyzer::request(CR<Str> body) {
    httplib::Client cli(config->daemon_host, config->daemon_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(config->analyzer_timeout.count());
    cli.set_write_timeout(30);

    auto res = cli.Post("/analyze", body, "application/json");
    if (!res) {
        auto error = res.error();
        throw analysis_error(
            error == httplib::Error::Read ? FailureCause::Timeout
                                          : FailureCause::Transport,
            fmt::format(
                "PMD daemon at {}:{} is not reachable: {}",
                config->daemon_host,
                config->daemon_port,
                httplib::to_string(error)));
    }

    if (res->status != 200) {
        Str message = res->body;
        try {
            message = json::parse(res->body).at("error").get<Str>();
        } catch (json::exception&) {
            // Body is not the daemon error object, report it verbatim
        }

        throw analysis_error(
            FailureCause::ExitStatus,
            fmt::format(
                "PMD daemon answered {}: {}",
                res->status,
                output_tail(message)));
    }

    return res->body;
}

ir::AnalysisReport PmdDaemonAnalyzer::analyze(
    CR<Path>     root,
    CR<Vec<Str>> files) {
    if (files.empty()) { return {}; }

    Path abs_root = fs::absolute(root);
    json body{
        {"path", abs_root.string()},
        {"ruleset", fs::absolute(config->ruleset).string()},
        {"auxClasspath", config->joined_classpath()},
        {"files", files}};

    Str text = with_retry<analysis_error>(
        retry,
        [](CR<analysis_error> err) {
            return err.retryable() ? RetryVerdict::Retryable
                                   : RetryVerdict::Fatal;
        },
        [&]() { return request(body.dump()); },
        [&](CR<analysis_error> err, int attempt) {
            LOG_W(logger) << fmt::format(
                "Daemon request attempt {} failed: {}", attempt, err.what());
        });

    auto report = parse_pmd_report(text, abs_root);
    log_processing_errors(logger, report);
    return std::move(report.findings);
}

UPtr<Analyzer> make_analyzer(CP<miner_config> config, SPtr<Logger> logger) {
    switch (config->analyzer) {
        case AnalyzerKind::Cli:
            return std::make_unique<PmdCliAnalyzer>(
                config, config->output_dir / "tmp", logger);
        case AnalyzerKind::Daemon:
            return std::make_unique<PmdDaemonAnalyzer>(
                config, RetryPolicy{}, logger);
    }

    throw setup_error(
        fmt::format("Unsupported analyzer kind {}", config->analyzer));
}

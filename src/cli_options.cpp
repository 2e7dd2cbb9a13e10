#include "cli_options.hpp"

#include <fstream>
#include <iostream>
#include <thread>

void validate(boost::any& v, CR<Vec<Str>> xs, BoolOption*, long) {
    // Flag given without the value
    if (xs.empty()) {
        v = BoolOption(true);
        return;
    }

    Str const& in = po::validators::get_single_string(xs);
    if (in == "true" || in == "on" || in == "1") {
        v = BoolOption(true);
    } else if (in == "false" || in == "off" || in == "0") {
        v = BoolOption(false);
    } else {
        throw validation_error(
            fmt::format("'{}' is not a boolean value", in));
    }
}

po::options_description make_options() {
    po::options_description desc{"Options"};
    const int               cpus = std::max(
        1, static_cast<int>(std::thread::hardware_concurrency()));

    desc.add_options()
        //
        ("help,h", "Help screen") //
        ("repo", po::value<Str>(), "Repository URL or local path") //
        ("ruleset", po::value<Str>(), "PMD ruleset XML file") //
        ("output-dir",
         po::value<Str>()->default_value("analysis_results"),
         "Directory for the base clone, working trees, per-commit "
         "records, fingerprint cache and summary") //
        ("workers",
         po::value<int>()->default_value(cpus),
         "Number of parallel workers and working trees") //
        ("aux-classpath",
         po::value<Vec<Str>>()->composing(),
         "Auxiliary classpath entry for the analyzer (can be specified "
         "more than once)") //
        ("verbose,v",
         po::value<BoolOption>()
             ->default_value(BoolOption(false), "false")
             ->implicit_value(BoolOption(true), "true"),
         "Print debug records to the standard output") //
        ("logfile",
         po::value<Str>()->default_value("/tmp/lint_forensics.log"),
         "Log file location") //
        ("branch",
         po::value<Str>()->default_value("HEAD"),
         "Branch or revision whose history is analyzed") //
        ("extension",
         po::value<Str>()->default_value(".java"),
         "Extension of the analyzed source files") //
        ("analyzer",
         po::value<EnumOption<AnalyzerKind>>()->default_value(
             EnumOption<AnalyzerKind>(AnalyzerKind::Cli), "Cli"),
         "Analyzer backend: 'Cli' runs PMD subprocess for each commit, "
         "'Daemon' sends requests to the running PMD daemon") //
        ("pmd-path",
         po::value<Str>()->default_value("pmd"),
         "PMD executable for the 'Cli' analyzer") //
        ("daemon-host",
         po::value<Str>()->default_value("127.0.0.1"),
         "PMD daemon host") //
        ("daemon-port",
         po::value<int>()->default_value(8000),
         "PMD daemon port") //
        ("analyzer-timeout",
         po::value<int>()->default_value(300),
         "Time limit of the single analyzer invocation, in seconds") //
        ("checkout-retries",
         po::value<int>()->default_value(3),
         "Number of checkout attempts before the commit is failed") //
        ("cache-flush-interval",
         po::value<int>()->default_value(50),
         "Number of processed commits between fingerprint cache "
         "snapshots") //
        ("progress-interval",
         po::value<int>()->default_value(100),
         "Number of finished commits between progress records") //
        ("log-progress",
         po::value<BoolOption>()
             ->default_value(BoolOption(false), "false")
             ->implicit_value(BoolOption(true), "true"),
         "Show dynamic progress bar for the commit processing") //
        ("summary-only",
         po::value<BoolOption>()
             ->default_value(BoolOption(false), "false")
             ->implicit_value(BoolOption(true), "true"),
         "Regenerate summary from the existing records and exit") //
        ("config",
         po::value<Vec<Str>>(),
         "Config file where options may be specified (can be specified "
         "more than once)") //
        ;

    return desc;
}

Opt<po::variables_map> parse_cmdline(int argc, const char** argv) {
    po::variables_map                  vm;
    po::options_description            desc = make_options();
    po::positional_options_description pos{};

    pos.add("repo", 1);

    store(
        po::command_line_parser(argc, argv)
            .options(desc)
            .positional(pos)
            .run(),
        vm);

    if (vm.count("help")) {
        std::cout << "Usage: lint_forensics [options] <repo>\n"
                  << desc << "\n";
        return std::nullopt;
    }

    if (vm.count("config") > 0) {
        for (const auto& config : vm["config"].as<Vec<Str>>()) {
            std::ifstream ifs{config};

            if (ifs.fail()) {
                throw validation_error(
                    fmt::format("cannot open config file '{}'", config));
            }

            store(parse_config_file(ifs, desc), vm);
        }
    }

    notify(vm);
    return vm;
}

miner_config config_from_options(CR<po::variables_map> vm) {
    miner_config config;

    if (!vm.count("repo")) {
        throw validation_error("repository location is required");
    }

    config.summary_only = vm["summary-only"].as<BoolOption>();
    // Summary is rebuilt from the records, analyzer is not used
    if (!vm.count("ruleset") && !config.summary_only) {
        throw validation_error("--ruleset is required");
    }

    config.repo = vm["repo"].as<Str>();
    if (vm.count("ruleset")) { config.ruleset = vm["ruleset"].as<Str>(); }
    config.output_dir = vm["output-dir"].as<Str>();
    config.workers    = vm["workers"].as<int>();
    if (vm.count("aux-classpath")) {
        config.aux_classpath = vm["aux-classpath"].as<Vec<Str>>();
    }

    config.verbose   = vm["verbose"].as<BoolOption>();
    config.log_file  = vm["logfile"].as<Str>();
    config.branch    = vm["branch"].as<Str>();
    config.extension = vm["extension"].as<Str>();
    config.analyzer  = vm["analyzer"].as<EnumOption<AnalyzerKind>>().get();
    config.pmd_path  = vm["pmd-path"].as<Str>();
    config.daemon_host      = vm["daemon-host"].as<Str>();
    config.daemon_port      = vm["daemon-port"].as<int>();
    config.analyzer_timeout = stime::seconds{
        vm["analyzer-timeout"].as<int>()};
    config.checkout_retries     = vm["checkout-retries"].as<int>();
    config.cache_flush_interval = vm["cache-flush-interval"].as<int>();
    config.progress_interval    = vm["progress-interval"].as<int>();
    config.log_progress_bars    = vm["log-progress"].as<BoolOption>();

    if (config.workers < 1) {
        throw validation_error(
            fmt::format("--workers must be positive, got {}", config.workers));
    }

    if (config.analyzer_timeout.count() < 1) {
        throw validation_error("--analyzer-timeout must be positive");
    }

    if (config.checkout_retries < 1) {
        throw validation_error("--checkout-retries must be at least 1");
    }

    if (!config.extension.starts_with(".")) {
        config.extension = "." + config.extension;
    }

    return config;
}

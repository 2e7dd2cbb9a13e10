#include "test_support.hpp"

#include "cli_options.hpp"

namespace {
Opt<po::variables_map> parse(Vec<const char*> args) {
    args.insert(args.begin(), "lint_forensics");
    return parse_cmdline(static_cast<int>(args.size()), args.data());
}

miner_config configure(CR<Vec<const char*>> args) {
    return config_from_options(parse(args).value());
}
} // namespace

class CliOptionsTest : public TempDirTest {};

TEST_F(CliOptionsTest, Defaults) {
    auto config = configure(
        {"https://example.com/repo.git", "--ruleset", "r.xml"});
    EXPECT_EQ(config.repo, "https://example.com/repo.git");
    EXPECT_EQ(config.ruleset.string(), "r.xml");
    EXPECT_EQ(config.output_dir.string(), "analysis_results");
    EXPECT_EQ(config.branch, "HEAD");
    EXPECT_EQ(config.extension, ".java");
    EXPECT_EQ(config.analyzer, AnalyzerKind::Cli);
    EXPECT_EQ(config.analyzer_timeout.count(), 300);
    EXPECT_EQ(config.checkout_retries, 3);
    EXPECT_EQ(config.cache_flush_interval, 50);
    EXPECT_GE(config.workers, 1);
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.summary_only);
    EXPECT_TRUE(config.aux_classpath.empty());
}

TEST_F(CliOptionsTest, ExplicitValues) {
    auto config = configure(
        {"repo",
         "--ruleset=rules.xml",
         "--output-dir",
         "out",
         "--workers",
         "3",
         "--aux-classpath",
         "lib/a.jar",
         "--aux-classpath",
         "lib/b.jar",
         "--analyzer",
         "Daemon",
         "--daemon-port",
         "9000",
         "--extension",
         "kt",
         "--verbose",
         "--log-progress=false"});

    EXPECT_EQ(config.workers, 3);
    EXPECT_EQ(config.analyzer, AnalyzerKind::Daemon);
    EXPECT_EQ(config.daemon_port, 9000);
    EXPECT_EQ(config.extension, ".kt");
    EXPECT_TRUE(config.verbose);
    EXPECT_FALSE(config.log_progress_bars);
    EXPECT_EQ(config.joined_classpath(), "lib/a.jar:lib/b.jar");
    EXPECT_EQ(config.results_dir().string(), "out/results");
}

TEST_F(CliOptionsTest, UnknownAnalyzerNameIsRejected) {
    try {
        parse({"repo", "--ruleset", "r.xml", "--analyzer", "Remote"});
        FAIL() << "analyzer name was accepted";
    } catch (po::error& err) {
        Str message = err.what();
        EXPECT_NE(message.find("Remote"), Str::npos) << message;
        EXPECT_NE(message.find("Cli, Daemon"), Str::npos) << message;
    }
}

TEST_F(CliOptionsTest, InvalidValues) {
    EXPECT_THROW(configure({"repo"}), validation_error);
    EXPECT_THROW(configure({"--ruleset", "r.xml"}), validation_error);
    EXPECT_THROW(
        configure({"repo", "--ruleset", "r.xml", "--workers", "0"}),
        validation_error);
    EXPECT_THROW(
        configure({"repo", "--ruleset", "r.xml", "--checkout-retries", "0"}),
        validation_error);
    EXPECT_THROW(parse({"repo", "--verbose=maybe"}), po::error);
    EXPECT_THROW(parse({"repo", "--no-such-option"}), po::error);
}

TEST_F(CliOptionsTest, SummaryOnlyDoesNotNeedRuleset) {
    auto config = configure({"repo", "--summary-only"});
    EXPECT_TRUE(config.summary_only);
    EXPECT_TRUE(config.ruleset.empty());
}

TEST_F(CliOptionsTest, ConfigFile) {
    Path file = temp_dir / "miner.cfg";
    write_file(
        file,
        "ruleset=from-config.xml\n"
        "workers=5\n"
        "branch=develop\n"
        "aux-classpath=lib/c.jar\n");

    Str  path   = file.string();
    auto config = configure(
        {"repo", "--config", path.c_str(), "--workers", "2"});

    // Command line wins over the config file
    EXPECT_EQ(config.workers, 2);
    EXPECT_EQ(config.ruleset.string(), "from-config.xml");
    EXPECT_EQ(config.branch, "develop");
    EXPECT_EQ(config.aux_classpath, Vec<Str>{"lib/c.jar"});
}

TEST_F(CliOptionsTest, MissingConfigFile) {
    EXPECT_THROW(
        parse({"repo", "--config", "/nonexistent/miner.cfg"}),
        validation_error);
}

TEST_F(CliOptionsTest, HelpReturnsNothing) {
    testing::internal::CaptureStdout();
    auto vm  = parse({"--help"});
    Str  out = testing::internal::GetCapturedStdout();
    EXPECT_FALSE(vm.has_value());
    EXPECT_NE(out.find("--ruleset"), Str::npos);
}

#include "repo_setup.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "subprocess.hpp"

void validate_config(CP<miner_config> config) {
    if (config->repo.empty()) {
        throw setup_error("Repository location is not specified");
    }

    if (!fs::is_regular_file(config->ruleset)) {
        throw setup_error(
            fmt::format("Ruleset file {} does not exist", config->ruleset));
    }

    if (config->extension.empty()) {
        throw setup_error("Source file extension must not be empty");
    }

    std::error_code ec;
    fs::create_directories(config->output_dir, ec);
    if (ec) {
        throw setup_error(fmt::format(
            "Cannot create output directory {}: {}",
            config->output_dir,
            ec.message()));
    }
}

Path prepare_repository(CP<miner_config> config, SPtr<Logger> logger) {
    Path base = fs::absolute(config->base_repo_dir());

    if (fs::exists(base / ".git")) {
        LOG_I(logger) << fmt::format(
            "Repository already cloned at {}, fetching updates", base);
        auto fetch = run_git({"fetch", "--all", "--prune"}, base);
        if (!fetch.ok()) {
            throw setup_error(fmt::format(
                "git fetch in {} failed with code {}: {}",
                base,
                fetch.exit_code,
                fetch.err));
        }

        return base;
    }

    if (fs::exists(base) && !fs::is_empty(base)) {
        throw setup_error(fmt::format(
            "{} exists and is not a git repository, remove it or choose "
            "another output directory",
            base));
    }

    // Local repositories are cloned by the absolute path, the clone is
    // executed from the output directory.
    Str source = config->repo;
    if (fs::exists(source)) { source = fs::absolute(source).string(); }

    LOG_I(logger) << fmt::format("Cloning {} into {}", source, base);
    auto clone = run_git(
        {"clone", "--quiet", source, base.string()},
        fs::absolute(config->output_dir));
    if (!clone.ok()) {
        throw setup_error(fmt::format(
            "git clone of {} failed with code {}: {}",
            source,
            clone.exit_code,
            clone.err));
    }

    return base;
}

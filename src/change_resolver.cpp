#include "change_resolver.hpp"
#include "logging.hpp"

#include <range/v3/all.hpp>

namespace rv = ranges::views;

ChangeResolver::ChangeResolver(
    VcsOracle&       _vcs,
    CP<miner_config> _config,
    SPtr<Logger>     _logger)
    : vcs(_vcs), config(_config), logger(std::move(_logger)) {}

ir::ChangeSet ChangeResolver::full_scan(CR<Path> root) const {
    ir::ChangeSet result;
    result.full_scan = true;

    auto it = fs::recursive_directory_iterator{root};
    for (; it != fs::recursive_directory_iterator{}; ++it) {
        Str name = it->path().filename().string();
        if (name.starts_with(".")) {
            if (it->is_directory()) { it.disable_recursion_pending(); }
            continue;
        }

        if (it->is_regular_file()) {
            Str relpath = it->path().lexically_relative(root).generic_string();
            if (config->is_eligible(relpath)) {
                result.changed.insert(relpath);
            }
        }
    }

    return result;
}

ir::ChangeSet ChangeResolver::resolve(
    CR<Path>     root,
    CR<Opt<Str>> base,
    CR<Str>      target) {
    if (!base) { return full_scan(root); }

    PathDelta delta;
    try {
        delta = vcs.changed_paths(*base, target);
    } catch (std::exception& err) {
        LOG_W(logger) << fmt::format(
            "Cannot diff {} against {}, scanning the whole tree: {}",
            target,
            *base,
            err.what());
        return full_scan(root);
    }

    auto eligible = [this](CR<Str> path) {
        return config->is_eligible(path);
    };

    ir::ChangeSet result;
    for (const auto& path : delta.changed | rv::filter(eligible)) {
        if (fs::is_regular_file(root / path)) {
            result.changed.insert(path);
        } else {
            LOG_W(logger) << fmt::format(
                "{} is listed as changed in {} but is missing from {}, "
                "treating it as removed",
                path,
                target,
                root);
            result.removed.insert(path);
        }
    }

    for (const auto& path : delta.removed | rv::filter(eligible)) {
        // Rename back and forth can list the same path on both sides
        if (!result.changed.contains(path)) { result.removed.insert(path); }
    }

    LOG_T(logger) << fmt::format(
        "{}..{}: {} changed, {} removed",
        *base,
        target,
        result.changed.size(),
        result.removed.size());

    return result;
}

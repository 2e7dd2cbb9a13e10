/// \file commit_processor.cpp \brief Per-commit processing state machine
#include "commit_processor.hpp"
#include "logging.hpp"

using namespace ir;

using SLock = std::scoped_lock<std::mutex>;

void ProgressCounter::transition(CommitState state) {
    SLock lock{mutex};
    ++counts[state];
}

int ProgressCounter::count(CommitState state) const {
    SLock lock{mutex};
    auto  found = counts.find(state);
    return found == counts.end() ? 0 : found->second;
}

int ProgressCounter::finished() const {
    SLock lock{mutex};
    int   result = 0;
    for (auto state :
         {CommitState::Recorded, CommitState::Skipped, CommitState::Failed}) {
        auto found = counts.find(state);
        if (found != counts.end()) { result += found->second; }
    }
    return result;
}

CommitProcessor::CommitProcessor(
    CP<miner_config> _config,
    VcsOracle&       _vcs,
    WorktreePool&    _pool,
    ChangeResolver&  _resolver,
    ContentCache&    _cache,
    Analyzer&        _analyzer,
    ResultStore&     _store,
    ProgressCounter& _progress,
    SPtr<Logger>     _logger)
    : config(_config)
    , vcs(_vcs)
    , pool(_pool)
    , resolver(_resolver)
    , cache(_cache)
    , analyzer(_analyzer)
    , store(_store)
    , progress(_progress)
    , logger(std::move(_logger)) {}

void CommitProcessor::step(CR<CommitTask> task, CommitState state) {
    progress.transition(state);
    LOG_T(logger) << fmt::format(
        "{:>5} {} [wt_{}] -> {}", task.index, task.commit, task.slot, state);
}

void CommitProcessor::reset_slot(SlotLease& lease, CR<CommitTask> task) {
    if (!pool.reset(lease)) {
        LOG_W(logger) << fmt::format(
            "Slot {} was not cleaned after failed commit {}",
            task.slot,
            task.commit);
    }
}

CommitOutcome CommitProcessor::fail(
    CR<CommitTask> task,
    ErrorKind      kind,
    FailureCause   cause,
    CR<Str>        message,
    double         duration) {
    LOG_E(logger) << fmt::format(
        "Commit {} ({}) failed with {}/{}: {}",
        task.index,
        task.commit,
        kind,
        cause,
        message);

    store.write(ErrorRecord{
        .commit       = task.commit,
        .index        = task.index,
        .slot         = task.slot,
        .kind         = kind,
        .cause        = cause,
        .message      = message,
        .duration_sec = duration});

    step(task, CommitState::Failed);
    return CommitOutcome{
        .task         = task,
        .state        = CommitState::Failed,
        .cause        = cause,
        .duration_sec = duration};
}

CommitProcessor::Merged CommitProcessor::analyze(
    SlotLease&     lease,
    CR<CommitTask> task,
    CR<ChangeSet>  changes,
    CR<Lineage>    lineage) {
    Merged result;
    // Files of the predecessor that were not touched keep their
    // fingerprints, full scan starts from the empty tree.
    if (!changes.full_scan) { result.files = lineage.files; }
    for (const auto& path : changes.removed) { result.files.erase(path); }

    CommitRecord& record = result.record;
    record.full_scan     = changes.full_scan;

    for (const auto& path : changes.changed) {
        try {
            result.files[path] = vcs.fingerprint(lease->path / path);
        } catch (std::exception& err) {
            throw analysis_error(
                FailureCause::Internal,
                fmt::format("Cannot fingerprint {}: {}", path, err.what()));
        }
    }

    std::unordered_map<Fingerprint, CacheEntry> entries;
    Vec<Str>                                    misses;
    for (const auto& [path, fingerprint] : result.files) {
        if (entries.contains(fingerprint)) { continue; }
        if (auto entry = cache.lookup(fingerprint)) {
            entries.emplace(fingerprint, *entry);
            if (changes.changed.contains(path)) { ++record.cache_hits; }
        } else {
            misses.push_back(path);
        }
    }

    if (!misses.empty()) {
        LOG_D(logger) << fmt::format(
            "Commit {} sends {} of {} files to the analyzer",
            task.commit,
            misses.size(),
            result.files.size());

        AnalysisReport report = analyzer.analyze(lease->path, misses);
        for (const auto& path : misses) {
            auto found = report.find(path);
            auto entry = found == report.end()
                           ? CacheEntry{}
                           : CacheEntry::from_violations(found->second);

            CR<Fingerprint> fingerprint = result.files.at(path);
            cache.store(fingerprint, entry);
            entries.emplace(fingerprint, entry);
        }
    }

    record.analyzed_files = static_cast<int>(misses.size());
    for (const auto& [path, fingerprint] : result.files) {
        CR<CacheEntry> entry = entries.at(fingerprint);
        record.num_source_files += entry.file_count;
        record.num_violations += entry.violation_count;
        for (const auto& [rule, count] : entry.rule_counts) {
            record.violations_by_rule[rule] += count;
        }
    }

    return result;
}

CommitOutcome CommitProcessor::process(
    CR<CommitTask> task,
    Lineage&       lineage) {
    auto start    = sc::steady_clock::now();
    auto duration = [&start]() {
        return sc::duration<double>(sc::steady_clock::now() - start).count();
    };

    if (store.has_record(task.commit)) {
        step(task, CommitState::Skipped);
        return CommitOutcome{.task = task, .state = CommitState::Skipped};
    }

    // Slot is held for the whole checkout and analysis window
    SlotLease lease = pool.acquire(task.slot);

    try {
        pool.checkout(lease, task.commit);
    } catch (checkout_error& err) {
        return fail(
            task,
            ErrorKind::CheckoutError,
            FailureCause::CheckoutStatus,
            err.stderr_text.empty()
                ? Str{err.what()}
                : fmt::format("{}: {}", err.what(), err.stderr_text),
            duration());
    } catch (std::exception& err) {
        reset_slot(lease, task);
        return fail(
            task,
            ErrorKind::CheckoutError,
            FailureCause::Internal,
            err.what(),
            duration());
    }

    step(task, CommitState::CheckedOut);

    Merged        merged;
    CommitRecord& record = merged.record;
    try {
        ChangeSet changes = resolver.resolve(
            lease->path, lineage.base_commit, task.commit);
        step(task, CommitState::Resolved);

        merged = analyze(lease, task, changes, lineage);
        step(task, CommitState::Analyzed);

        record.commit       = task.commit;
        record.index        = task.index;
        record.slot         = task.slot;
        record.duration_sec = duration();
        store.write(record);
    } catch (analysis_error& err) {
        reset_slot(lease, task);
        return fail(
            task,
            ErrorKind::AnalysisError,
            err.cause,
            err.what(),
            duration());
    } catch (std::exception& err) {
        reset_slot(lease, task);
        return fail(
            task,
            ErrorKind::AnalysisError,
            FailureCause::Internal,
            fmt::format("Unexpected failure: {}", err.what()),
            duration());
    }

    step(task, CommitState::Recorded);

    lineage.base_commit = task.commit;
    lineage.files       = std::move(merged.files);

    LOG_D(logger) << fmt::format(
        "Commit {} ({}): {} files, {} violations, {} analyzed, {} cache "
        "hits{}",
        task.index,
        task.commit,
        record.num_source_files,
        record.num_violations,
        record.analyzed_files,
        record.cache_hits,
        record.full_scan ? ", full scan" : "");

    return CommitOutcome{
        .task         = task,
        .state        = CommitState::Recorded,
        .duration_sec = record.duration_sec};
}

#include "aggregator.hpp"
#include "json_file.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

ir::RunSummary summarize(
    CR<ResultStore> store,
    CR<Str>         location,
    int             total_commits,
    int             skipped,
    SPtr<Logger>    logger) {
    auto scan = store.scan();
    for (const auto& [path, reason] : scan.unreadable) {
        LOG_W(logger) << fmt::format(
            "Ignoring unreadable record {}: {}", path, reason);
    }

    ir::RunSummary summary;
    summary.location       = location;
    summary.counts.total    = total_commits;
    summary.counts.analyzed = static_cast<int>(scan.succeeded.size());
    summary.counts.failed   = static_cast<int>(scan.failed.size());
    summary.counts.skipped  = skipped;
    summary.counts.pending  = std::max(
        0,
        total_commits - summary.counts.analyzed - summary.counts.failed);

    i64 source_files = 0;
    i64 violations   = 0;
    for (const auto& record : scan.succeeded) {
        source_files += record.num_source_files;
        violations += record.num_violations;
        for (const auto& [rule, count] : record.violations_by_rule) {
            summary.violations_by_rule[rule] += count;
        }
    }

    if (!scan.succeeded.empty()) {
        double count             = static_cast<double>(scan.succeeded.size());
        summary.avg_source_files = source_files / count;
        summary.avg_violations   = violations / count;
    }

    for (const auto& record : scan.failed) {
        ++summary.failure_causes[fmt::format(
            "{}:{}", record.kind, record.cause)];
    }

    return summary;
}

void write_summary(CR<Path> file, CR<ir::RunSummary> summary) {
    write_json_file(file, summary);
}

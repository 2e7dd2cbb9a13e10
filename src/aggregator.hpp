/// \file aggregator.hpp \brief Repository-wide summary derived from the
/// persisted commit records

#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include "commit_ir.hpp"
#include "program_state.hpp"
#include "result_store.hpp"

/// \brief Fold every record in \arg store into the run summary.
///
/// Statistics are computed from the files on disk only, so the summary can
/// be regenerated after interrupted or crashed runs. \arg total_commits is
/// the length of the mined history, commits without any record are
/// reported as pending. \arg skipped is the number of commits the last run
/// found already recorded, it is informational only. Unreadable records
/// are logged and ignored.
auto summarize(
    CR<ResultStore> store,
    CR<Str>         location,
    int             total_commits,
    int             skipped,
    SPtr<Logger>    logger) -> ir::RunSummary;

/// \brief Write \arg summary to \arg file atomically
void write_summary(CR<Path> file, CR<ir::RunSummary> summary);

#endif // AGGREGATOR_HPP

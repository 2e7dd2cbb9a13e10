/// \file commit_ir.hpp \brief Data model shared between the commit
/// processing stages: tasks, analyzer findings, cache entries and
/// persisted per-commit records.

#ifndef COMMIT_IR_HPP
#define COMMIT_IR_HPP

#include <map>
#include <set>

#include <boost/describe.hpp>
#include <nlohmann/json_fwd.hpp>

#include "common.hpp"

namespace ir {

/// \brief Stage of the single commit processing
enum class CommitState {
    Pending,    ///< Commit was dispatched but not touched yet
    CheckedOut, ///< Slot working tree reflects the commit
    Resolved,   ///< Set of changed files is known
    Analyzed,   ///< Cached and fresh findings are merged
    Recorded,   ///< Result record is on disk
    Skipped,    ///< Record existed from the previous run
    Failed      ///< Checkout or analysis error, error record is on disk
};

BOOST_DESCRIBE_ENUM(
    CommitState,
    Pending,
    CheckedOut,
    Resolved,
    Analyzed,
    Recorded,
    Skipped,
    Failed);

/// \brief Per-commit error class stored in the error record
enum class ErrorKind { CheckoutError, AnalysisError };

BOOST_DESCRIBE_ENUM(ErrorKind, CheckoutError, AnalysisError);

/// \brief Refinement of the error kind used for the failure histogram
enum class FailureCause {
    CheckoutStatus,  ///< `git checkout` reported non-zero status
    ExitStatus,      ///< Analyzer process exited with unexpected code
    Timeout,         ///< Analyzer did not finish in the allowed time
    Transport,       ///< Analyzer daemon could not be reached
    MalformedReport, ///< Analyzer output could not be parsed
    Internal         ///< Unexpected exception in the processing code
};

BOOST_DESCRIBE_ENUM(
    FailureCause,
    CheckoutStatus,
    ExitStatus,
    Timeout,
    Transport,
    MalformedReport,
    Internal);

/// \brief Content hash of a single source file
using Fingerprint = Str;

/// \brief Single rule violation reported by the static analyzer
struct Violation {
    Str rule;
    Str ruleset;
    int priority = 0;
    int line     = 0;
    Str message;
};

/// \brief Analyzer output keyed by the path relative to the analyzed root
using AnalysisReport = std::map<Str, Vec<Violation>>;

/// \brief Memoized analyzer findings for one fingerprint
struct CacheEntry {
    std::map<Str, int> rule_counts;
    int                violation_count = 0;
    /// Contribution of the file to the commit file count
    int file_count = 1;

    static CacheEntry from_violations(CR<Vec<Violation>> violations);

    auto operator==(CR<CacheEntry> other) const -> bool = default;
};

/// \brief Unit of work handed to a worker
struct CommitTask {
    Str commit; ///< Commit hash
    int index;  ///< Position in the chronological commit list
    int slot;   ///< Working tree slot (`index mod pool size`)
};

/// \brief Result of change resolution between two commits of a lineage
struct ChangeSet {
    std::set<Str> changed; ///< Eligible files that must be fingerprinted
    std::set<Str> removed; ///< Files that no longer exist in the tree
    bool          full_scan = false;
};

/// \brief Persisted record for the successfully analyzed commit
struct CommitRecord {
    Str                commit;
    int                index            = 0;
    int                slot             = 0;
    int                num_source_files = 0;
    int                num_violations   = 0;
    std::map<Str, int> violations_by_rule;
    int                analyzed_files = 0; ///< Files sent to the analyzer
    int                cache_hits     = 0;
    bool               full_scan      = false;
    double             duration_sec   = 0;
};

/// \brief Persisted record for the commit that failed to process
struct ErrorRecord {
    Str          commit;
    int          index = 0;
    int          slot  = 0;
    ErrorKind    kind  = ErrorKind::AnalysisError;
    FailureCause cause = FailureCause::Internal;
    Str          message;
    double       duration_sec = 0;
};

/// \brief Commit counters of the whole run
struct RunCounts {
    int total    = 0;
    int analyzed = 0;
    int skipped  = 0;
    int failed   = 0;
    int pending  = 0;
};

BOOST_DESCRIBE_STRUCT(
    RunCounts,
    (),
    (total, analyzed, skipped, failed, pending));

/// \brief Repository-wide statistics derived from the persisted records
struct RunSummary {
    Str                location;
    RunCounts          counts;
    double             avg_source_files = 0;
    double             avg_violations   = 0;
    std::map<Str, int> violations_by_rule;
    std::map<Str, int> failure_causes;
};

void to_json(nlohmann::json& j, CR<Violation> v);
void from_json(CR<nlohmann::json> j, Violation& v);
void to_json(nlohmann::json& j, CR<CacheEntry> e);
void from_json(CR<nlohmann::json> j, CacheEntry& e);
void to_json(nlohmann::json& j, CR<CommitRecord> r);
void from_json(CR<nlohmann::json> j, CommitRecord& r);
void to_json(nlohmann::json& j, CR<ErrorRecord> r);
void from_json(CR<nlohmann::json> j, ErrorRecord& r);
void to_json(nlohmann::json& j, CR<RunSummary> s);

} // namespace ir

#endif // COMMIT_IR_HPP

/// \file result_store.hpp \brief Per-commit result records on disk

#ifndef RESULT_STORE_HPP
#define RESULT_STORE_HPP

#include "commit_ir.hpp"

/// \brief Directory of `<commit>.json` (success) and
/// `<commit>.error.json` (failure) records. Existence of either record
/// marks the commit as done for the resumed runs.
class ResultStore {
  public:
    /// Records found by the directory scan
    struct Scan {
        Vec<ir::CommitRecord> succeeded;
        Vec<ir::ErrorRecord>  failed;
        /// Record files that could not be parsed, with the reason
        Vec<Pair<Path, Str>> unreadable;
    };

    /// Create \arg dir if it does not exist
    explicit ResultStore(CR<Path> dir);

    bool has_record(CR<Str> commit) const;

    void write(CR<ir::CommitRecord> record) const;
    void write(CR<ir::ErrorRecord> record) const;

    auto success_path(CR<Str> commit) const -> Path;
    auto error_path(CR<Str> commit) const -> Path;

    /// Read every record in the directory
    auto scan() const -> Scan;

    auto dir() const -> CR<Path> { return root; }

  private:
    Path root;
};

#endif // RESULT_STORE_HPP

/// \file content_cache.hpp \brief Fingerprint-keyed memo of the analyzer
/// findings shared by all workers

#ifndef CONTENT_CACHE_HPP
#define CONTENT_CACHE_HPP

#include <atomic>
#include <shared_mutex>
#include <unordered_map>

#include "commit_ir.hpp"
#include "program_state.hpp"

/// \brief Concurrent fingerprint -> findings map with whole-snapshot
/// persistence.
///
/// Entries are never evicted or invalidated during the run, the ruleset
/// does not change. Lock is held only for the map access itself.
class ContentCache {
  public:
    ContentCache(CR<Path> snapshot_file, SPtr<Logger> logger);

    auto lookup(CR<ir::Fingerprint> fingerprint) const
        -> Opt<ir::CacheEntry>;

    /// Insert new entry. Existing entry for the same fingerprint is kept,
    /// both are results of analyzing identical content.
    void store(CR<ir::Fingerprint> fingerprint, CR<ir::CacheEntry> entry);

    std::size_t size() const;

    /// Number of entries stored since the last snapshot
    int dirty() const { return unsaved.load(); }

    /// Replace content with the snapshot file, if it exists. Returns
    /// number of loaded entries. Throws `cache_io_error` if the snapshot
    /// is unreadable, the cache is left empty in that case.
    std::size_t load();

    /// Write whole cache to the snapshot file atomically. Throws
    /// `cache_io_error`.
    void persist();

  private:
    Path snapshot_file;
    mutable std::shared_mutex                            mutex;
    std::unordered_map<ir::Fingerprint, ir::CacheEntry> entries;
    std::atomic<int>                                     unsaved{0};
    SPtr<Logger>                                         logger;
};

#endif // CONTENT_CACHE_HPP

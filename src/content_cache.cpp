#include "content_cache.hpp"
#include "errors.hpp"
#include "json_file.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

ContentCache::ContentCache(CR<Path> _snapshot_file, SPtr<Logger> _logger)
    : snapshot_file(_snapshot_file), logger(std::move(_logger)) {}

Opt<ir::CacheEntry> ContentCache::lookup(
    CR<ir::Fingerprint> fingerprint) const {
    std::shared_lock lock{mutex};
    auto             found = entries.find(fingerprint);
    if (found != entries.end()) {
        return found->second;
    } else {
        return std::nullopt;
    }
}

void ContentCache::store(
    CR<ir::Fingerprint> fingerprint,
    CR<ir::CacheEntry>  entry) {
    std::unique_lock lock{mutex};
    if (entries.emplace(fingerprint, entry).second) { ++unsaved; }
}

std::size_t ContentCache::size() const {
    std::shared_lock lock{mutex};
    return entries.size();
}

std::size_t ContentCache::load() {
    if (!fs::exists(snapshot_file)) {
        LOG_I(logger) << fmt::format(
            "No cache snapshot at {}, starting with empty cache",
            snapshot_file);
        return 0;
    }

    std::unordered_map<ir::Fingerprint, ir::CacheEntry> loaded;
    try {
        json data = read_json_file(snapshot_file);
        for (const auto& [fingerprint, entry] : data.at("entries").items()) {
            loaded.emplace(fingerprint, entry.get<ir::CacheEntry>());
        }
    } catch (std::exception& err) {
        throw cache_io_error(fmt::format(
            "Cannot load cache snapshot {}: {}", snapshot_file, err.what()));
    }

    std::unique_lock lock{mutex};
    entries = std::move(loaded);
    unsaved = 0;
    return entries.size();
}

void ContentCache::persist() {
    json data;
    int  written;
    {
        std::shared_lock lock{mutex};
        json             out = json::object();
        for (const auto& [fingerprint, entry] : entries) {
            out[fingerprint] = entry;
        }
        data    = json{{"version", 1}, {"entries", std::move(out)}};
        written = unsaved.load();
    }

    try {
        write_json_file(snapshot_file, data);
    } catch (std::exception& err) {
        throw cache_io_error(fmt::format(
            "Cannot write cache snapshot {}: {}", snapshot_file, err.what()));
    }

    unsaved -= written;
    LOG_D(logger) << fmt::format(
        "Cache snapshot with {} entries written to {}",
        data["entries"].size(),
        snapshot_file);
}

#include "result_store.hpp"
#include "json_file.hpp"

namespace {
const Str success_suffix = ".json";
const Str error_suffix   = ".error.json";
} // namespace

ResultStore::ResultStore(CR<Path> dir) : root(dir) {
    fs::create_directories(root);
}

Path ResultStore::success_path(CR<Str> commit) const {
    return root / (commit + success_suffix);
}

Path ResultStore::error_path(CR<Str> commit) const {
    return root / (commit + error_suffix);
}

bool ResultStore::has_record(CR<Str> commit) const {
    return fs::exists(success_path(commit)) ||
           fs::exists(error_path(commit));
}

void ResultStore::write(CR<ir::CommitRecord> record) const {
    write_json_file(success_path(record.commit), record);
}

void ResultStore::write(CR<ir::ErrorRecord> record) const {
    write_json_file(error_path(record.commit), record);
}

ResultStore::Scan ResultStore::scan() const {
    Scan result;
    if (!fs::exists(root)) { return result; }

    for (const auto& entry : fs::directory_iterator{root}) {
        if (!entry.is_regular_file()) { continue; }
        Str name = entry.path().filename().string();
        try {
            if (name.ends_with(error_suffix)) {
                result.failed.push_back(
                    read_json_file(entry.path()).get<ir::ErrorRecord>());
            } else if (name.ends_with(success_suffix)) {
                result.succeeded.push_back(
                    read_json_file(entry.path()).get<ir::CommitRecord>());
            }
        } catch (std::exception& err) {
            result.unreadable.push_back({entry.path(), err.what()});
        }
    }

    // Directory iteration order is unspecified
    std::sort(
        result.succeeded.begin(),
        result.succeeded.end(),
        [](CR<ir::CommitRecord> a, CR<ir::CommitRecord> b) {
            return a.index < b.index;
        });
    std::sort(
        result.failed.begin(),
        result.failed.end(),
        [](CR<ir::ErrorRecord> a, CR<ir::ErrorRecord> b) {
            return a.index < b.index;
        });

    return result;
}

#include "commit_ir.hpp"

#include <cmath>
#include <stdexcept>

#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
template <typename E>
Str enum_name(E value) {
    return Str{boost::describe::enum_to_string(value, "Unknown")};
}

template <typename E>
E enum_value(CR<Str> name) {
    E result;
    if (!boost::describe::enum_from_string(name.c_str(), result)) {
        throw std::invalid_argument(
            fmt::format("unknown enumerator '{}'", name));
    }
    return result;
}

/// Round average values the same way for every report
double round2(double value) { return std::round(value * 100.0) / 100.0; }
} // namespace

namespace ir {

CacheEntry CacheEntry::from_violations(CR<Vec<Violation>> violations) {
    CacheEntry result;
    for (const auto& violation : violations) {
        ++result.violation_count;
        if (!violation.rule.empty()) {
            ++result.rule_counts[violation.rule];
        }
    }
    return result;
}

void to_json(json& j, CR<Violation> v) {
    j = json{
        {"rule", v.rule},
        {"ruleset", v.ruleset},
        {"priority", v.priority},
        {"beginline", v.line},
        {"description", v.message}};
}

void from_json(CR<json> j, Violation& v) {
    v.rule     = j.value("rule", "");
    v.ruleset  = j.value("ruleset", "");
    v.priority = j.value("priority", 0);
    v.line     = j.value("beginline", 0);
    v.message  = j.value("description", "");
}

void to_json(json& j, CR<CacheEntry> e) {
    j = json{
        {"rules", e.rule_counts},
        {"violations", e.violation_count},
        {"files", e.file_count}};
}

void from_json(CR<json> j, CacheEntry& e) {
    e.rule_counts     = j.at("rules").get<std::map<Str, int>>();
    e.violation_count = j.at("violations").get<int>();
    e.file_count      = j.value("files", 1);
}

void to_json(json& j, CR<CommitRecord> r) {
    j = json{
        {"commit", r.commit},
        {"index", r.index},
        {"slot", r.slot},
        {"status", "success"},
        {"num_source_files", r.num_source_files},
        {"num_violations", r.num_violations},
        {"violations_by_rule", r.violations_by_rule},
        {"analyzed_files", r.analyzed_files},
        {"cache_hits", r.cache_hits},
        {"full_scan", r.full_scan},
        {"duration_sec", r.duration_sec}};
}

void from_json(CR<json> j, CommitRecord& r) {
    r.commit             = j.at("commit").get<Str>();
    r.index              = j.value("index", 0);
    r.slot               = j.value("slot", 0);
    r.num_source_files   = j.at("num_source_files").get<int>();
    r.num_violations     = j.at("num_violations").get<int>();
    r.violations_by_rule = j.value(
        "violations_by_rule", std::map<Str, int>{});
    r.analyzed_files = j.value("analyzed_files", 0);
    r.cache_hits     = j.value("cache_hits", 0);
    r.full_scan      = j.value("full_scan", false);
    r.duration_sec   = j.value("duration_sec", 0.0);
}

void to_json(json& j, CR<ErrorRecord> r) {
    j = json{
        {"commit", r.commit},
        {"index", r.index},
        {"slot", r.slot},
        {"status", "failed"},
        {"cause", enum_name(r.kind)},
        {"detail", enum_name(r.cause)},
        {"message", r.message},
        {"duration_sec", r.duration_sec}};
}

void from_json(CR<json> j, ErrorRecord& r) {
    r.commit       = j.at("commit").get<Str>();
    r.index        = j.value("index", 0);
    r.slot         = j.value("slot", 0);
    r.kind         = enum_value<ErrorKind>(j.at("cause").get<Str>());
    r.cause        = enum_value<FailureCause>(j.value("detail", "Internal"));
    r.message      = j.value("message", "");
    r.duration_sec = j.value("duration_sec", 0.0);
}

void to_json(json& j, CR<RunSummary> s) {
    j = json{
        {"location", s.location},
        {"stat_of_repository",
         {{"total_commits_in_repo", s.counts.total},
          {"number_of_commits_analyzed_successfully", s.counts.analyzed},
          {"number_of_commits_failed", s.counts.failed},
          {"number_of_commits_skipped", s.counts.skipped},
          {"number_of_commits_pending", s.counts.pending},
          {"avg_of_num_source_files", round2(s.avg_source_files)},
          {"avg_of_num_warnings", round2(s.avg_violations)}}},
        {"stat_of_warnings", s.violations_by_rule},
        {"failure_causes", s.failure_causes}};
}

} // namespace ir

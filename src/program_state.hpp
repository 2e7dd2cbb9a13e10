/// \file program_state.hpp \brief Main mining configuration and
/// reflection-based formatting helpers

#ifndef PROGRAM_STATE_HPP
#define PROGRAM_STATE_HPP

#include <algorithm>
#include <chrono>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/describe.hpp>
#include <boost/mp11.hpp>

#include "common.hpp"
#include "commit_ir.hpp"

using Logger = boost::log::sources::severity_logger_mt<
    boost::log::trivial::severity_level>;

using PTime     = boost::posix_time::ptime;
namespace stime = std::chrono;
namespace bd    = boost::describe;

template <class T>
struct fmt::formatter<
    T,
    char,
    std::enable_if_t<
        boost::describe::has_describe_bases<T>::value &&
        boost::describe::has_describe_members<T>::value &&
        !std::is_union<T>::value>> {
    constexpr auto parse(format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();

        if (it != end && *it != '}') {
            ctx.error_handler().on_error("invalid format");
        }

        return it;
    }

    auto format(T const& t, format_context& ctx) const {
        using namespace boost::describe;

        using Bd = describe_bases<T, mod_any_access>;
        using Md = describe_members<T, mod_any_access>;

        auto out = ctx.out();

        *out++ = '{';

        bool first = true;

        boost::mp11::mp_for_each<Bd>([&](auto D) {
            if (!first) { *out++ = ','; }

            first = false;

            out = fmt::format_to(
                out, " {}", (typename decltype(D)::type const&)t);
        });

        boost::mp11::mp_for_each<Md>([&](auto D) {
            if (!first) { *out++ = ','; }

            first = false;

            out = fmt::format_to(out, " .{}={}", D.name, t.*D.pointer);
        });

        if (!first) { *out++ = ' '; }

        *out++ = '}';

        return out;
    }
};

template <class T>
struct fmt::formatter<
    T,
    char,
    std::enable_if_t<
        boost::describe::has_describe_enumerators<T>::value>> {
  private:
    using U = std::underlying_type_t<T>;

    fmt::formatter<fmt::string_view, char> sf_;
    fmt::formatter<U, char>                nf_;

  public:
    constexpr auto parse(format_parse_context& ctx) {
        auto i1 = sf_.parse(ctx);
        auto i2 = nf_.parse(ctx);

        if (i1 != i2) { ctx.error_handler().on_error("invalid format"); }

        return i1;
    }

    auto format(T const& t, format_context& ctx) const {
        char const* s = boost::describe::enum_to_string(t, 0);

        if (s) {
            return sf_.format(s, ctx);
        } else {
            return nf_.format(static_cast<U>(t), ctx);
        }
    }
};

/// Backend used to run the static analysis
enum class AnalyzerKind {
    Cli,   /// One-shot `pmd check` subprocess per commit
    Daemon /// Long-lived HTTP analysis service
};

BOOST_DESCRIBE_ENUM(AnalyzerKind, Cli, Daemon);

template <typename E>
concept IsDescribedEnum = bd::has_describe_enumerators<E>::value;

template <>
struct fmt::formatter<PTime> : fmt::formatter<Str> {
    auto format(CR<PTime> time, fmt::format_context& ctx) const {
        return fmt::formatter<Str>::format(
            boost::posix_time::to_iso_extended_string(time), ctx);
    }
};

/// Immutable configuration of the whole mining run, assembled from the
/// command line and config files.
struct miner_config {
    /// Repository URL or local path that gets cloned into the output
    /// directory
    Str repo;
    /// Branch or revision whose history is mined
    Str  branch = "HEAD";
    Path ruleset;
    /// Root of all produced artifacts. Contains the base clone, working
    /// tree slots, per-commit records, cache snapshot and summary.
    Path output_dir;
    /// Requested worker count, clamped by the number of commits
    int      workers = 1;
    Vec<Str> aux_classpath;
    /// Extension of the files that are handed to the analyzer
    Str extension = ".java";

    AnalyzerKind analyzer  = AnalyzerKind::Cli;
    Str          pmd_path  = "pmd";
    Str          daemon_host = "127.0.0.1";
    int          daemon_port = 8000;
    /// Upper bound of the single analyzer invocation
    stime::seconds analyzer_timeout{300};

    int checkout_retries = 3;
    /// Number of finished commits between cache snapshots
    int cache_flush_interval = 50;
    /// Number of finished commits between progress log records
    int progress_interval = 100;

    bool verbose           = false;
    bool log_progress_bars = false;
    /// Only regenerate the summary from the existing records
    bool summary_only = false;
    Path log_file;

    Path base_repo_dir() const { return output_dir / "repo_base"; }
    Path worktree_dir() const { return output_dir / "worktrees"; }
    Path results_dir() const { return output_dir / "results"; }
    Path cache_file() const { return output_dir / "fingerprint_cache.json"; }
    Path summary_file() const { return output_dir / "summary.json"; }

    /// Aux classpath entries in the form accepted by the analyzer
    Str joined_classpath() const {
        return fmt::format("{}", fmt::join(aux_classpath, ":"));
    }

    /// Check whether relative path should be handed to the analyzer
    bool is_eligible(CR<Str> relpath) const {
        return relpath.size() > extension.size() &&
               relpath.ends_with(extension);
    }
};

#endif // PROGRAM_STATE_HPP

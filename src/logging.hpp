/// \file logging.hpp \brief Boost.Log sinks, record formatting and the
/// console progress bar of the mining run

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <chrono>
#include <fstream>

#include <boost/log/trivial.hpp>
#include <boost/log/common.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/record_ordering.hpp>
#include <boost/core/null_deleter.hpp>

#include <fmt/color.h>

#include "common.hpp"
#include "program_state.hpp"

#include <indicators/block_progress_bar.hpp>
#include <indicators/cursor_control.hpp>

namespace logging = boost::log;

namespace boost::log {
namespace expr  = logging::expressions;
namespace attrs = logging::attributes;
using severity  = logging::trivial::severity_level;
}; // namespace boost::log

namespace sc = std::chrono;

/// Commit progress bar, drawn only when the progress output was requested
/// in the configuration. Must be ticked from a single thread.
class ScopedBar {
  public:
    ScopedBar(
        CP<miner_config> config,
        int              max,
        CR<Str>          annotation,
        int              width = 40);

    ~ScopedBar();

    /// Advance by one finished item. Postfix shows average time per item,
    /// estimated remaining time and the elapsed time, in seconds.
    void tick();

  private:
    int                          count = 0;
    int                          max;
    Str                          annotation;
    bool                         enabled;
    indicators::BlockProgressBar bar;
    sc::steady_clock::time_point start;
};

/// \defgroup all_logging logging macros
/// Shorthand macros to write an output to the logger
/// @{

/// Attach source location to the record. Location is stored in the record
/// itself, so the concurrent workers never observe each other's values.
#define CUSTOM_LOG(logger, sev)                                           \
    BOOST_LOG_SEV(logger, sev)                                            \
        << logging::add_value("File", source_file_name(__FILE__))         \
        << logging::add_value("Line", __LINE__)

inline auto get_logger(CR<SPtr<Logger>> in) -> Logger& { return *in; }

#define LOG_T(state)                                                      \
    CUSTOM_LOG((get_logger(state)), logging::severity::trace)
#define LOG_D(state)                                                      \
    CUSTOM_LOG((get_logger(state)), logging::severity::debug)
#define LOG_I(state)                                                      \
    CUSTOM_LOG((get_logger(state)), logging::severity::info)
#define LOG_W(state)                                                      \
    CUSTOM_LOG((get_logger(state)), logging::severity::warning)
#define LOG_E(state)                                                      \
    CUSTOM_LOG((get_logger(state)), logging::severity::error)
#define LOG_F(state)                                                      \
    CUSTOM_LOG((get_logger(state)), logging::severity::fatal)
/// @}

/// File name part of the `__FILE__` value
constexpr const char* source_file_name(const char* path) {
    const char* result = path;
    for (const char* it = path; *it != '\0'; ++it) {
        if (*it == '/') { result = it + 1; }
    }
    return result;
}

using backend_t = logging::sinks::text_ostream_backend;
using sink_t    = logging::sinks::asynchronous_sink<
    backend_t,
    logging::sinks::unbounded_ordering_queue<
        logging::attribute_value_ordering<
            unsigned int,
            std::less<unsigned int>>>>;

BOOST_LOG_ATTRIBUTE_KEYWORD(
    severity,
    "Severity",
    logging::trivial::severity_level)

/// Full record for the log file: time, record number, thread, severity
/// and source location
void log_formatter(
    logging::record_view const&  rec,
    logging::formatting_ostream& strm);

/// Short colored record for the terminal
void out_formatter(
    logging::record_view const&  rec,
    logging::formatting_ostream& strm);

/// Asynchronous sink writing into \arg outfile, truncated on start
boost::shared_ptr<sink_t> create_file_sink(CR<Path> outfile);

boost::shared_ptr<sink_t> create_std_sink();

/// Register global attributes used by the formatters and the sink
/// ordering. Must be called once before the first log record.
void init_logger_properties();

#endif // LOGGING_HPP

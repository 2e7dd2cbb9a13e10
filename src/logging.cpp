#include "logging.hpp"

#include <iomanip>
#include <iostream>

namespace {
indicators::BlockProgressBar make_bar(int max, int width) {
    using namespace indicators;
    return BlockProgressBar{
        option::BarWidth{width},
        option::ForegroundColor{Color::white},
        option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
        option::MaxProgress{max}};
}

Pair<char, fmt::text_style> format_style(logging::severity level) {
    switch (level) {
        case logging::severity::warning:
            return {'W', fmt::fg(fmt::color::yellow)};
        case logging::severity::info:
            return {'I', fmt::fg(fmt::color::cyan)};
        case logging::severity::fatal:
            return {
                'F', fmt::emphasis::bold | fmt::fg(fmt::color::magenta)};
        case logging::severity::error:
            return {'E', fmt::emphasis::bold | fmt::fg(fmt::color::red)};
        case logging::severity::trace:
            return {'T', fmt::fg(fmt::color::white)};
        case logging::severity::debug:
            return {'D', fmt::fg(fmt::color::white)};
        default: return {'?', fmt::fg(fmt::color::white)};
    }
}

/// Both sinks are drained by their own threads, records from different
/// workers are written in the order they were made.
boost::shared_ptr<sink_t> make_ordered_sink(
    boost::shared_ptr<std::ostream> stream) {
    auto backend = boost::make_shared<backend_t>();
    backend->auto_flush(true);
    boost::shared_ptr<sink_t> sink(new sink_t(
        backend,
        logging::keywords::order = logging::make_attr_ordering<
            unsigned int>("RecordID", std::less<unsigned int>())));
    sink->locked_backend()->add_stream(stream);
    return sink;
}
} // namespace

ScopedBar::ScopedBar(
    CP<miner_config> config,
    int              _max,
    CR<Str>          _annotation,
    int              width)
    : max(_max)
    , annotation(_annotation)
    , enabled(config->log_progress_bars)
    , bar(make_bar(_max, width))
    , start(sc::steady_clock::now()) {
    if (enabled) {
        // Avoid overlap of the progress bar and the stdout logging.
        logging::core::get()->flush();
    }
}

ScopedBar::~ScopedBar() {
    if (enabled) { bar.mark_as_completed(); }
}

void ScopedBar::tick() {
    ++count;
    if (!enabled) { return; }

    sc::duration<double> elapsed  = sc::steady_clock::now() - start;
    double               per_item = elapsed.count() / count;
    bar.set_option(indicators::option::PostfixText{fmt::format(
        "{}/{} {} {:1.4f}/{:4.2f}/{:4.2f}",
        count,
        max,
        annotation,
        per_item,
        (max - count) * per_item,
        elapsed.count())});
    bar.tick();
}

void log_formatter(
    const boost::log::record_view&  rec,
    boost::log::formatting_ostream& strm) {
    strm << fmt::format(
        "[{}]", logging::extract<PTime>("TimeStamp", rec).get());

    strm << std::setw(5)
         << logging::extract<unsigned int>("RecordID", rec) //
         << " " << logging::extract<logging::attrs::current_thread_id::value_type>(
                       "ThreadID", rec)
         << " " << std::setw(7) << rec[logging::trivial::severity];

    auto file = logging::extract<const char*>("File", rec);
    if (file) {
        strm << fmt::format(
            " {}:{}",
            file.get(),
            logging::extract<int>("Line", rec).get_value_or(0));
    }

    strm << " " << rec[logging::expr::smessage];
}

void out_formatter(
    const boost::log::record_view&  rec,
    boost::log::formatting_ostream& strm) {
    auto [letter, style] = format_style(
        rec[logging::trivial::severity].get());
    strm << fmt::format("[{}] ", fmt::styled(letter, style));
    strm << rec[logging::expr::smessage];
}

boost::shared_ptr<sink_t> create_file_sink(CR<Path> outfile) {
    boost::shared_ptr<std::ostream> log_stream{
        new std::ofstream(outfile, std::ios::trunc)};
    if (!*log_stream) {
        throw std::system_error(
            errno,
            std::generic_category(),
            fmt::format("Cannot open log file {}", outfile));
    }

    auto sink = make_ordered_sink(log_stream);
    sink->set_formatter(&log_formatter);
    return sink;
}

boost::shared_ptr<sink_t> create_std_sink() {
    // Stream is owned elsewhere, sink only needs non-owning pointer
    boost::shared_ptr<std::ostream> log_stream{
        &std::cout, boost::null_deleter()};
    auto sink = make_ordered_sink(log_stream);
    sink->set_formatter(&out_formatter);
    return sink;
}

void init_logger_properties() {
    auto core = logging::core::get();
    core->add_global_attribute("TimeStamp", logging::attrs::local_clock());
    core->add_global_attribute(
        "RecordID", logging::attrs::counter<unsigned int>());
    core->add_global_attribute(
        "ThreadID", logging::attrs::current_thread_id());
}

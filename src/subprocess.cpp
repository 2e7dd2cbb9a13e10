#include "subprocess.hpp"

#include <algorithm>
#include <csignal>
#include <future>

#include <sys/types.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>

namespace bp = boost::process;

namespace {
/// Child is moved into its own process group, so the terminal interrupt
/// sent to the miner does not reach analyzer and git processes.
struct own_process_group : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
    }
};

/// Kill the whole group started by \arg child and reap the child itself
void kill_group(bp::child& child) {
    ::kill(-child.id(), SIGKILL);
    std::error_code ec;
    child.terminate(ec);
}
} // namespace

ProcessResult run_process(
    CR<Str>                        program,
    CR<Vec<Str>>                   args,
    CR<Path>                       start_dir,
    Opt<std::chrono::milliseconds> timeout) {
    // Bare names are looked up the same way shell would do it, explicit
    // paths are used as-is.
    boost::filesystem::path executable = program.find('/') == Str::npos
                                           ? bp::search_path(program)
                                           : boost::filesystem::path{program};

    boost::asio::io_context  ios;
    std::future<std::string> out;
    std::future<std::string> err;

    bp::child child{
        executable,
        bp::args(args),
        bp::std_in.close(),
        bp::std_out > out,
        bp::std_err > err,
        bp::start_dir(start_dir.string()),
        own_process_group{},
        ios};

    ProcessResult result;
    if (timeout) {
        auto deadline = std::chrono::steady_clock::now() + *timeout;
        // Returns early once both pipes are closed, the child may still be
        // running at this point.
        ios.run_until(deadline);
        bool drained = ios.stopped();
        auto left    = std::max(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()),
            std::chrono::milliseconds{0});

        if (!drained || !child.wait_for(left)) {
            kill_group(child);
            result.timed_out = true;
            return result;
        }
    } else {
        ios.run();
    }

    child.wait();
    result.exit_code = child.exit_code();
    result.out       = out.get();
    result.err       = err.get();
    return result;
}

ProcessResult run_git(CR<Vec<Str>> args, CR<Path> start_dir) {
    return run_process("git", args, start_dir);
}

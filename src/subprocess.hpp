/// \file subprocess.hpp \brief Blocking child process execution with
/// captured output

#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <chrono>

#include "common.hpp"

struct ProcessResult {
    int  exit_code = -1;
    Str  out;
    Str  err;
    bool timed_out = false;

    bool ok() const { return !timed_out && exit_code == 0; }
};

/// \brief Run \arg program (resolved through `PATH` unless it contains a
/// directory separator) with \arg args in \arg start_dir and wait for the
/// completion. Child is started in its own process group. When \arg timeout
/// elapses before the child exits the whole group is killed and `timed_out`
/// is set.
///
/// Throws `std::system_error` if the process could not be started.
ProcessResult run_process(
    CR<Str>                              program,
    CR<Vec<Str>>                         args,
    CR<Path>                             start_dir,
    Opt<std::chrono::milliseconds> timeout = std::nullopt);

/// \brief Shorthand for `git <args>` executed in \arg start_dir
ProcessResult run_git(CR<Vec<Str>> args, CR<Path> start_dir);

#endif // SUBPROCESS_HPP

/// \file errors.hpp \brief Error taxonomy of the mining run and the
/// bounded retry helper used for the external calls.

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <thread>

#include "common.hpp"
#include "commit_ir.hpp"
#include "logging.hpp"

/// \brief Base of all errors raised by the mining components
struct miner_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// \brief Clone, fetch, commit listing or configuration failure. Aborts
/// the run before scheduling.
struct setup_error : public miner_error {
    using miner_error::miner_error;
};

/// \brief Working tree could not be switched to the requested commit.
struct checkout_error : public miner_error {
    Str  stderr_text; ///< Captured output of the failed command
    bool lock_artifact = false; ///< Failure caused by the stale lock file

    inline checkout_error(CR<Str> message, CR<Str> _stderr = "")
        : miner_error(message)
        , stderr_text(_stderr)
        , lock_artifact(_stderr.find(".lock") != Str::npos) {}
};

/// \brief Analyzer invocation failed or timed out
struct analysis_error : public miner_error {
    ir::FailureCause cause;

    inline analysis_error(ir::FailureCause _cause, CR<Str> message)
        : miner_error(message), cause(_cause) {}

    /// Transport errors are transient, everything else is reported by the
    /// analyzer itself and would fail again.
    bool retryable() const { return cause == ir::FailureCause::Transport; }
};

/// \brief Cache snapshot could not be read or written. Never fatal.
struct cache_io_error : public miner_error {
    using miner_error::miner_error;
};

enum class RetryVerdict { Retryable, Fatal };

BOOST_DESCRIBE_ENUM(RetryVerdict, Retryable, Fatal);

/// \brief Bounded retry with exponential backoff
struct RetryPolicy {
    int attempts = 3; ///< Total number of attempts, including the first
    sc::milliseconds initial_delay{200};
    double           multiplier = 2.0;

    sc::milliseconds delay_for(int attempt) const {
        double scaled = initial_delay.count();
        for (int i = 1; i < attempt; ++i) { scaled *= multiplier; }
        return sc::milliseconds{static_cast<i64>(scaled)};
    }
};

/// \brief Execute \arg action until it succeeds, \arg classify reports a
/// fatal error, or the attempts are exhausted. The last caught exception
/// is rethrown.
///
/// \arg on_retry is called with the caught exception before sleeping, it
/// can remove artifacts that made the previous attempt fail.
template <typename Exc, typename Action>
auto with_retry(
    CR<RetryPolicy>                    policy,
    CR<Func<RetryVerdict(CR<Exc>)>>    classify,
    Action&&                           action,
    CR<Func<void(CR<Exc>, int)>>       on_retry = {})
    -> decltype(action()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return action();
        } catch (Exc const& err) {
            if (attempt >= policy.attempts ||
                classify(err) == RetryVerdict::Fatal) {
                throw;
            }

            if (on_retry) { on_retry(err, attempt); }
            std::this_thread::sleep_for(policy.delay_for(attempt));
        }
    }
}

#endif // ERRORS_HPP

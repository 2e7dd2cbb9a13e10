/// \file common.hpp \brief Type aliases and small helpers shared by all
/// parts of the project

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

using Str = std::string;
using i64 = std::int64_t;

template <typename T>
using Vec = std::vector<T>;

template <typename T>
using Opt = std::optional<T>;

/// Shorthand for the const reference argument
template <typename T>
using CR = T const&;

/// Shorthand for the const pointer
template <typename T>
using CP = T const*;

template <typename T>
using SPtr = std::shared_ptr<T>;

template <typename T>
using UPtr = std::unique_ptr<T>;

template <typename F>
using Func = std::function<F>;

template <typename A, typename B>
using Pair = std::pair<A, B>;

namespace fs = std::filesystem;
using Path   = fs::path;

/// \brief Execute stored callback when the scope is exited
class finally {
    Func<void()> action;

  public:
    explicit finally(Func<void()> _action) : action(std::move(_action)) {}

    finally(finally const&)            = delete;
    finally& operator=(finally const&) = delete;

    ~finally() {
        if (action) { action(); }
    }
};

#endif // COMMON_HPP

/// \file git_interface.hpp This file provides helper types and wrappers
/// for the libgit API
#ifndef GIT_INTERFACE_HPP
#define GIT_INTERFACE_HPP

#include <git2.h>
#include "common.hpp"
#include <fmt/core.h>

#include <array>

/// \brief C++ wrapper for the libgit2 library
namespace git {
struct exception : public std::exception {
    Str message;
    inline exception(int error, const char* funcname) {
        const git_error* e = git_error_last();
        message            = fmt::format(
            "Error {} while calling {}: {}",
            error,
            funcname,
            e != nullptr ? e->message : "no error information");
    }

    const char* what() const noexcept override { return message.c_str(); }
};

/// \brief Throw git::exception when libgit2 call reports failure
inline void check(int code, const char* funcname) {
    if (code < 0) { throw git::exception(code, funcname); }
}
} // namespace git

/// Call libgit2 function and throw if it returns error code
#define GIT_CALL(function, ...) git::check(function(__VA_ARGS__), #function)

/// \brief Convert git ID object to it's string representation
inline Str oid_tostr(git_oid oid) {
    std::array<char, GIT_OID_HEXSZ + 1> result;
    git_oid_tostr(result.data(), sizeof(result), &oid);
    return Str{result.data(), result.size() - 1};
}

/// \brief Parse full hexadecimal commit hash
inline git_oid oid_fromstr(CR<Str> str) {
    git_oid oid;
    GIT_CALL(git_oid_fromstr, &oid, str.c_str());
    return oid;
}

#endif // GIT_INTERFACE_HPP

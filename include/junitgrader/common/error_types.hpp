#pragma once

#include <junitgrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>

#include <string_view>

namespace junitgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Process / operation surpassed its timeout
    SyscallFailure, ///< A Linux syscall failed
    UnknownError,   ///< As named; use this as little as possible
};

constexpr std::string_view format_as(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::UnknownError:
        return "UnknownError";
    default:
        return "<unknown>";
    }
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace junitgrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::junitgrader::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident)                                                                                           \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            return ident.error();                                                                                      \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))

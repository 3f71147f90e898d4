#pragma once

#include <testconsole/common/expected.hpp>
#include <testconsole/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>

namespace testconsole {

// NOLINTNEXTLINE
enum class ErrorKind {
    ClassNotFound,   ///< No test class is registered under the requested name
    LinkageError,    ///< The class is known, but failed to resolve / link its dependencies
    StaticInitError, ///< Inspecting the class' static metadata raised an error
    SyscallFailure,  ///< A Linux syscall failed
    UnknownError,    ///< As named; use this as little as possible
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace testconsole

FMT_SERIALIZE_ENUM(::testconsole::ErrorKind, ClassNotFound, LinkageError, StaticInitError, SyscallFailure,
                   UnknownError);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::testconsole::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))

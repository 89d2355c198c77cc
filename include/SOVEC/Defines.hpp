#pragma once

#include <cstdio>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#define SOVEC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SOVEC_UNLIKELY(x) (x)
#endif

namespace SOVEC
{
    namespace detail
    {
        /// @brief Terminates the process after reporting an unrecoverable condition.
        /// @details Used for contract violations and allocation failures that containers cannot recover from.
        [[noreturn]] inline void FatalError(const char* message, const char* file, int line) noexcept
        {
            std::fprintf(stderr, "[SOVEC] fatal: %s (%s:%d)\n", message, file, line);
            std::fflush(stderr);
            std::abort();
        }
    }// namespace detail

}// namespace SOVEC

/// Contract-fatal policy: SOVEC_ABORT always terminates, SOVEC_ASSERT only checks in debug builds.
#define SOVEC_ABORT(message) ::SOVEC::detail::FatalError((message), __FILE__, __LINE__)

#if defined(SOVEC_DEBUG) || !defined(NDEBUG)
#define SOVEC_ASSERT(expr)                                            \
    do                                                                \
    {                                                                 \
        if (SOVEC_UNLIKELY(!(expr)))                                  \
            ::SOVEC::detail::FatalError("assertion failed: " #expr,   \
                                        __FILE__, __LINE__);          \
    } while (false)
#else
#define SOVEC_ASSERT(expr) ((void) 0)
#endif

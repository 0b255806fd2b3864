#pragma once

#include <cstdio>
#include <cstdlib>

#if defined(_MSC_VER) && !defined(__clang__)
#define TANDEM_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define TANDEM_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define TANDEM_ALWAYS_INLINE inline
#endif

namespace Tandem
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

    namespace detail
    {
        /// @brief Reports a broken internal invariant and terminates the process.
        [[noreturn]] inline void ContractFailure(const char* message, const char* file, int line) noexcept
        {
            std::fprintf(stderr, "%s:%d: Tandem contract violation: %s\n", file, line, message);
            std::fflush(stderr);
            std::abort();
        }
    }// namespace detail

}// namespace Tandem

/// @brief Contract-fatal policy: print the location and message to stderr, then abort.
#define TANDEM_CONTRACT_FAIL(message) ::Tandem::detail::ContractFailure((message), __FILE__, __LINE__)

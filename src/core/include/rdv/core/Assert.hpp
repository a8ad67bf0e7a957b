/**
 * @file Assert.hpp
 * @brief Debug assertions for internal invariants.
 *
 * RDV_ASSERT is compiled only in debug builds (RDV_DEBUG) and RDV_VERIFY
 * is always evaluated.  Both guard invariants the library itself
 * maintains; runtime failures are reported through Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_CORE_ASSERT_HPP
    #define RDV_CORE_ASSERT_HPP

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

    #if defined(__GNUC__) || defined(__clang__)
        #define RDV_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define RDV_UNLIKELY(x) (x)
    #endif

namespace rdv::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[RDV ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rdv::core::detail

    #ifdef RDV_DEBUG
        #define RDV_ASSERT(cond)                                          \
            do {                                                           \
                if (RDV_UNLIKELY(!(cond)))                                 \
                    ::rdv::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define RDV_ASSERT(cond) ((void)0)
    #endif

    #define RDV_VERIFY(cond)                                              \
        do {                                                               \
            if (RDV_UNLIKELY(!(cond)))                                     \
                ::rdv::core::detail::assertFail(#cond);                    \
        } while (false)

#endif // RDV_CORE_ASSERT_HPP

/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * DZ_ASSERT is compiled in only when DZ_DEBUG is defined. DZ_VERIFY is
 * always evaluated.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_CORE_ASSERT_HPP
    #define DZ_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace dz::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[DZ ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace dz::core::detail

    #ifdef DZ_DEBUG
        #define DZ_ASSERT(cond)                                            \
            do {                                                           \
                if (DZ_UNLIKELY(!(cond)))                                  \
                    ::dz::core::detail::assertFail(#cond);                 \
            } while (false)
    #else
        #define DZ_ASSERT(cond) ((void)0)
    #endif

    #define DZ_VERIFY(cond)                                                \
        do {                                                               \
            if (DZ_UNLIKELY(!(cond)))                                      \
                ::dz::core::detail::assertFail(#cond);                     \
        } while (false)

#endif // DZ_CORE_ASSERT_HPP

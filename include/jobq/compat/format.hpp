/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a unified formatting entry point that works whether or not the
 * standard library ships <format>. Detection relies on the
 * __cpp_lib_format feature test macro, with fallbacks for toolchains that
 * support std::format without advertising it.
 *
 * Usage:
 *   #include <jobq/compat/format.hpp>
 *   auto s = jobq::compat::format("job {} queued", id);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define JOBQ_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define JOBQ_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define JOBQ_HAS_STD_FORMAT 1
#else
    #define JOBQ_HAS_STD_FORMAT 0
#endif

#if JOBQ_HAS_STD_FORMAT
    #include <format>
    namespace jobq::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // fmt fallback for standard libraries without <format>
    #include <fmt/format.h>
    namespace jobq::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

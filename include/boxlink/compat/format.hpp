/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Usage:
 *   #include <boxlink/compat/format.hpp>
 *   auto s = boxlink::compat::format("Box {} is {}", name, state);
 */

#pragma once

#include <version>

// libstdc++ before GCC 13 ships C++20 without <format>; fall back to {fmt}.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define BOXLINK_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define BOXLINK_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define BOXLINK_HAS_STD_FORMAT 1
#else
    #define BOXLINK_HAS_STD_FORMAT 0
#endif

#if BOXLINK_HAS_STD_FORMAT
    #include <format>
    namespace boxlink::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace boxlink::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Selects std::format when the standard library provides it and the fmt
 * library otherwise, so log messages can be formatted the same way on
 * every toolchain.
 *
 * Usage:
 *   #include <csa/compat/format.hpp>
 *   auto s = csa::compat::format("tag {} at offset {}", name, offset);
 */

#pragma once

#include <version>  // For feature test macros

// Detect std::format availability
//
// 1. __cpp_lib_format feature test macro (libstdc++ and libc++)
// 2. Apple Clang 15+ with libc++ (may not define __cpp_lib_format)
// 3. MSVC 19.29+ in C++20 mode
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define CSA_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define CSA_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define CSA_HAS_STD_FORMAT 1
#else
    #define CSA_HAS_STD_FORMAT 0
#endif

#if CSA_HAS_STD_FORMAT
    #include <format>
    namespace csa::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // Use fmt library as fallback
    #include <fmt/format.h>
    namespace csa::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

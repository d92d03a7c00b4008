/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro. Toolchains
 * whose standard library lacks <format> fall back to the fmt library.
 *
 * Usage:
 *   #include <dde/compat/format.hpp>
 *   auto s = dde::compat::format("Form {} reconciled", form_id);
 */

#pragma once

#include <version>  // For feature test macros

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DDE_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    // Apple Clang 15+ with libc++ supports std::format
    #define DDE_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define DDE_HAS_STD_FORMAT 1
#else
    #define DDE_HAS_STD_FORMAT 0
#endif

#if DDE_HAS_STD_FORMAT
    #include <format>
    namespace dde::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace dde::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

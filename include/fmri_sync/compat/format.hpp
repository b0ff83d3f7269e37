/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Selects std::format when the standard library provides it (checked
 * through the __cpp_lib_format feature test macro) and falls back to the
 * fmt library otherwise.
 *
 * Usage:
 *   #include <fmri_sync/compat/format.hpp>
 *   auto s = fmri_sync::compat::format("series {} confirmed", dir);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define FMRI_SYNC_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define FMRI_SYNC_HAS_STD_FORMAT 1
#else
    #define FMRI_SYNC_HAS_STD_FORMAT 0
#endif

#if FMRI_SYNC_HAS_STD_FORMAT
    #include <format>
    namespace fmri_sync::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace fmri_sync::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

/**
 * @file export.hpp
 * @brief Symbol visibility macros for idforge_core shared library.
 *
 * This header provides the IDFORGE_CORE_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(IDFORGE_CORE_BUILD)
        #define IDFORGE_CORE_API __declspec(dllexport)
    #else
        #define IDFORGE_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(IDFORGE_CORE_BUILD)
        #define IDFORGE_CORE_API __attribute__((visibility("default")))
    #else
        #define IDFORGE_CORE_API
    #endif
#else
    #define IDFORGE_CORE_API
#endif

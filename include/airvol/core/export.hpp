/**
 * @file export.hpp
 * @brief Symbol visibility macros for airvol_core shared library.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(AIRVOL_CORE_BUILD)
        #define AIRVOL_CORE_API __declspec(dllexport)
    #else
        #define AIRVOL_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(AIRVOL_CORE_BUILD)
        #define AIRVOL_CORE_API __attribute__((visibility("default")))
    #else
        #define AIRVOL_CORE_API
    #endif
#else
    #define AIRVOL_CORE_API
#endif

/**
 * @file export.hpp
 * @brief Symbol visibility macros for the mmbind_utils library.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MMBIND_UTILS_BUILD)
        #define MMBIND_UTILS_API __declspec(dllexport)
    #else
        #define MMBIND_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MMBIND_UTILS_BUILD)
        #define MMBIND_UTILS_API __attribute__((visibility("default")))
    #else
        #define MMBIND_UTILS_API
    #endif
#else
    #define MMBIND_UTILS_API
#endif

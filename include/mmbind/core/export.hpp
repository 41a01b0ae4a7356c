/**
 * @file export.hpp
 * @brief Symbol visibility macros for the mmbind_core library.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MMBIND_CORE_BUILD)
        #define MMBIND_CORE_API __declspec(dllexport)
    #else
        #define MMBIND_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MMBIND_CORE_BUILD)
        #define MMBIND_CORE_API __attribute__((visibility("default")))
    #else
        #define MMBIND_CORE_API
    #endif
#else
    #define MMBIND_CORE_API
#endif

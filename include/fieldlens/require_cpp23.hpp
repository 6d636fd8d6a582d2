#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time check of the C++23 library features fieldlens relies on
 *
 * Include early in a translation unit (tools/fieldlens/main.cpp does) to get
 * a readable error on an insufficient toolchain instead of a cascade of
 * template errors.
 */

#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "fieldlens requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::expected: every fallible boundary returns Result<T>
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "fieldlens requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// std::format: diagnostics, timestamps and CLI output
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "fieldlens requires std::format (__cpp_lib_format >= 202110L)."
#endif

// std::ranges: sorting and deduplication of analysis output
#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "fieldlens requires std::ranges (__cpp_lib_ranges >= 202110L)."
#endif

// std::shared_mutex: query cache
#if !defined(__cpp_lib_shared_mutex) || __cpp_lib_shared_mutex < 201'505L
    #error "fieldlens requires std::shared_mutex (__cpp_lib_shared_mutex >= 201505L)."
#endif

#define FIELDLENS_CPP23_FEATURES_VERIFIED 1

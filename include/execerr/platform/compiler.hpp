#pragma once

/** \file compiler.hpp
 *  \brief Compiler detection and the few attributes the library relies on.
 *
 * - printf-style format checking for the formatted error constructors
 * - cold-path marking for the throwing bridge
 */

// Compiler detection
#if defined(_MSC_VER)
    #define EXECERR_COMPILER_MSVC 1
#elif defined(__clang__)
    #define EXECERR_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define EXECERR_COMPILER_GCC 1
#else
    #define EXECERR_COMPILER_UNKNOWN 1
#endif

// printf format checking; fmt_idx and first_arg are 1-based parameter positions
#if defined(EXECERR_COMPILER_GCC) || defined(EXECERR_COMPILER_CLANG)
    #define EXECERR_PRINTF_FORMAT(fmt_idx, first_arg) \
        __attribute__((format(printf, fmt_idx, first_arg)))
#else
    #define EXECERR_PRINTF_FORMAT(fmt_idx, first_arg)
#endif

// Cold path hint
#if defined(EXECERR_COMPILER_GCC) || defined(EXECERR_COMPILER_CLANG)
    #define EXECERR_COLD __attribute__((cold))
#else
    #define EXECERR_COLD
#endif


#pragma once

/**
@file
@brief Macros for managing function inlining and flattening.

This header defines the following macros:
- `FORCE_INLINE`: Forces function inlining and marks the function `inline`
- `FLATTEN`: Flattens the function

In Debug builds these macros have no effect so that the per-tick code stays easy to step through. Inlining can also be
disabled by defining `VgaSync_DISABLE_FORCE_INLINE`.

Note that `FORCE_INLINE` always marks the function `inline` even when disabled.
*/

/**
@def FORCE_INLINE
@brief Forces function inlining and marks the function `inline`.
*/

/**
@def FLATTEN
@brief Flattens the function.

Essentially inlines all functions called by the flattened function.
*/

#if !defined(NDEBUG) || defined(VgaSync_DISABLE_FORCE_INLINE)
    #define FORCE_INLINE inline
    #define FLATTEN
#elif defined(__clang__)
    #define FORCE_INLINE [[gnu::always_inline]] inline
    #define FLATTEN [[gnu::flatten]]
#elif (defined(__GNUC__) || defined(__GNUG__))
    #define FORCE_INLINE [[gnu::always_inline]] inline
    #define FLATTEN // GCC does not cope well with [[gnu::flatten]] on large call trees
#elif defined(_MSC_VER)
    #define FORCE_INLINE [[msvc::forceinline]] inline
    #define FLATTEN [[msvc::flatten]]
#else
    #define FORCE_INLINE inline
    #define FLATTEN
#endif
